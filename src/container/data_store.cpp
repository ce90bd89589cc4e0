#include "container/data_store.hpp"

#include "core/errors.hpp"
#include "filesystem/resource_context.hpp"
#include "utils/file_lock.hpp"
#include "utils/log.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>
#include <variant>

namespace blobkit::container {

UpdateMode parseUpdateMode(const std::string& name)
{
    std::string lowered = name;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (lowered == "replace") {
        return UpdateMode::Replace;
    }
    if (lowered == "merge") {
        return UpdateMode::Merge;
    }
    throw std::invalid_argument("Unknown update mode: " + name);
}

const char* updateModeName(UpdateMode mode) noexcept
{
    return mode == UpdateMode::Merge ? "merge" : "replace";
}

DataStore::DataStore(ContainerWriter writer)
    : writer_(std::move(writer))
{
}

DataStore DataStore::create(const std::filesystem::path& path, int compressionLevel)
{
    return DataStore(ContainerWriter(ContainerKind::UserData, path, compressionLevel));
}

DataStore DataStore::open(const std::filesystem::path& path, int compressionLevel)
{
    return DataStore(ContainerWriter::loadExisting(path, ContainerKind::UserData, compressionLevel));
}

const UserRecord& DataStore::add(const std::string& userId, const std::filesystem::path& source,
                                 const std::string& description, std::optional<std::uint64_t> quotaMb)
{
    UserRecord prototype {};
    prototype.record.key = userId;
    prototype.record.description = description;
    prototype.quotaMb = quotaMb;
    return std::get<UserRecord>(writer_.addEntry(userId, source, std::move(prototype)));
}

const UserRecord& DataStore::update(const std::string& userId, const std::filesystem::path& source, UpdateMode mode)
{
    // Unlike a fresh add, description, quota, dependencies and createdAt carry
    // over; only Merge touches the revision.
    auto prototype = getRecord(userId);
    if (mode == UpdateMode::Merge) {
        ++prototype.revision;
    }

    const auto& updated = std::get<UserRecord>(writer_.replaceEntry(userId, source, std::move(prototype)));
    utils::logInfo("Updated user '" + userId + "' (" + updateModeName(mode) + "), now v" + std::to_string(updated.revision));
    return updated;
}

void DataStore::remove(const std::string& userId)
{
    writer_.removeEntry(userId);
}

void DataStore::checkpoint(const std::filesystem::path& destination) const
{
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path(), ec)) {
        throw std::filesystem::filesystem_error("Cannot checkpoint a container that was never built", path(),
                                                std::make_error_code(std::errc::no_such_file_or_directory));
    }

    utils::FileLock lock(path(), utils::LockMode::Shared);
    filesystem::FileContext(path()).copyTo(destination);
    utils::logInfo("Checkpoint of '" + path().string() + "' written to " + destination.string());
}

BuildSummary DataStore::build()
{
    return writer_.build();
}

std::uint64_t DataStore::compact()
{
    return writer_.compact();
}

std::vector<std::string> DataStore::listUsers() const
{
    return writer_.listKeys();
}

const UserRecord& DataStore::getRecord(const std::string& userId) const
{
    return std::get<UserRecord>(writer_.getMetadata(userId));
}

} // namespace blobkit::container
