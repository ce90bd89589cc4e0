#include "container/entry.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <type_traits>

namespace blobkit::container {

EntryRecord& record(Entry& entry) noexcept
{
    return std::visit([](auto& alternative) -> EntryRecord& { return alternative.record; }, entry);
}

const EntryRecord& record(const Entry& entry) noexcept
{
    return std::visit([](const auto& alternative) -> const EntryRecord& { return alternative.record; }, entry);
}

ContainerKind kindOf(const Entry& entry) noexcept
{
    return std::visit([](const auto& alternative) {
        using T = std::decay_t<decltype(alternative)>;
        if constexpr (std::is_same_v<T, ApplicationEntry>) {
            return ContainerKind::Application;
        } else if constexpr (std::is_same_v<T, BinaryEntry>) {
            return ContainerKind::Binary;
        } else {
            return ContainerKind::UserData;
        }
    }, entry);
}

std::string displayVersion(const Entry& entry)
{
    return std::visit([](const auto& alternative) -> std::string {
        using T = std::decay_t<decltype(alternative)>;
        if constexpr (std::is_same_v<T, UserRecord>) {
            return "v" + std::to_string(alternative.revision);
        } else {
            return alternative.version;
        }
    }, entry);
}

Entry makeEntry(ContainerKind kind, std::string key)
{
    switch (kind) {
    case ContainerKind::Application: {
        ApplicationEntry entry {};
        entry.record.key = key;
        entry.name = std::move(key);
        return entry;
    }
    case ContainerKind::Binary: {
        BinaryEntry entry {};
        entry.record.key = std::move(key);
        return entry;
    }
    case ContainerKind::UserData: {
        UserRecord entry {};
        entry.record.key = std::move(key);
        return entry;
    }
    }
    return ApplicationEntry {};
}

double compressionRatio(const EntryRecord& record) noexcept
{
    if (record.compressedSize == 0U) {
        return 0.0;
    }
    return static_cast<double>(record.size) / static_cast<double>(record.compressedSize);
}

std::string currentTimestamp()
{
    const auto now = std::chrono::system_clock::now();
    const auto seconds = std::chrono::system_clock::to_time_t(now);
    const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(now.time_since_epoch()).count() % 1000000;

    std::tm local {};
    localtime_r(&seconds, &local);

    std::ostringstream output;
    output << std::put_time(&local, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(6) << std::setfill('0') << micros;
    return output.str();
}

} // namespace blobkit::container
