#include "archive/tree_archive.hpp"

#include "core/errors.hpp"
#include "filesystem/resource_context.hpp"
#include "utils/byte_order.hpp"
#include "utils/file_io.hpp"
#include "utils/log.hpp"

#include <cstddef>
#include <cstring>
#include <iterator>
#include <limits>
#include <stdexcept>
#include <string>
#include <system_error>
#include <unordered_set>
#include <utility>

namespace blobkit::archive {
namespace {

constexpr std::uint32_t kModeMask = 07777;
constexpr std::uint32_t kDefaultDirectoryMode = 0755;
constexpr std::uint32_t kSymlinkMode = 0777;

std::uint32_t toMode(std::filesystem::perms permissions)
{
    return static_cast<std::uint32_t>(permissions) & kModeMask;
}

std::string recordPath(const std::filesystem::path& relative)
{
    return std::string(kRootPath) + "/" + relative.generic_string();
}

// link is relative to the archive root. The target has to be relative, with
// every ".." leading and no more of them than link has parent directories.
void checkLinkTarget(const std::filesystem::path& link, const std::string& target)
{
    const std::filesystem::path targetPath(target);
    if (target.empty() || targetPath.has_root_path()) {
        throw ArchiveError("Symlink " + link.generic_string() + " has an absolute or empty target: " + target);
    }

    std::size_t ascents = 0;
    bool descended = false;
    for (const auto& component : targetPath) {
        if (component == "..") {
            if (descended) {
                throw ArchiveError("Symlink " + link.generic_string() + " climbs back up inside its target: " + target);
            }
            ++ascents;
        } else if (!component.empty() && component != ".") {
            descended = true;
        }
    }

    const auto parent = link.parent_path();
    const auto depth = static_cast<std::size_t>(std::distance(parent.begin(), parent.end()));
    if (ascents > depth) {
        throw ArchiveError("Symlink " + link.generic_string() + " points outside the archive root: " + target);
    }
}

ArchiveRecord makeFileRecord(const std::string& path, const filesystem::FileDescriptor& descriptor)
{
    ArchiveRecord record {};
    record.path = path;
    record.type = RecordType::File;
    record.mode = toMode(descriptor.permissions);
    record.data = filesystem::FileContext(descriptor.absolutePath).readAll();
    return record;
}

std::vector<ArchiveRecord> collectRecords(const std::filesystem::path& source)
{
    const auto root = filesystem::describePath(source);

    std::vector<ArchiveRecord> records;

    ArchiveRecord rootRecord {};
    rootRecord.path = kRootPath;
    rootRecord.type = RecordType::Directory;
    rootRecord.mode = root.type == filesystem::EntryType::Directory ? toMode(root.permissions) : kDefaultDirectoryMode;
    records.push_back(std::move(rootRecord));

    if (root.type == filesystem::EntryType::File) {
        std::error_code ec;
        if (!std::filesystem::is_regular_file(source, ec)) {
            throw ArchiveError("Source is neither a directory nor a regular file: " + source.string());
        }
        records.push_back(makeFileRecord(recordPath(root.relativePath), root));
        return records;
    }

    filesystem::DirectoryContext directory(source);
    for (const auto& descriptor : directory.listEntries(true, true)) {
        if (descriptor.isSymlink) {
            const auto target = std::filesystem::read_symlink(descriptor.absolutePath).string();
            try {
                checkLinkTarget(descriptor.relativePath, target);
            } catch (const ArchiveError& error) {
                utils::logWarning(std::string("Skipping ") + error.what());
                continue;
            }

            ArchiveRecord record {};
            record.path = recordPath(descriptor.relativePath);
            record.type = RecordType::Symlink;
            record.mode = kSymlinkMode;
            record.data.assign(target.begin(), target.end());
            records.push_back(std::move(record));
            continue;
        }

        if (descriptor.type == filesystem::EntryType::Directory) {
            ArchiveRecord record {};
            record.path = recordPath(descriptor.relativePath);
            record.type = RecordType::Directory;
            record.mode = toMode(descriptor.permissions);
            records.push_back(std::move(record));
            continue;
        }

        std::error_code ec;
        if (!std::filesystem::is_regular_file(descriptor.absolutePath, ec)) {
            continue;
        }
        records.push_back(makeFileRecord(recordPath(descriptor.relativePath), descriptor));
    }

    return records;
}

template <class T>
T readField(const std::vector<std::uint8_t>& bytes, std::size_t& cursor, const char* what)
{
    T value {};
    if (!utils::readLittleEndian(bytes, cursor, value)) {
        throw ArchiveError(std::string("Truncated archive stream while reading ") + what);
    }
    return value;
}

// Maps an archived path onto a relative filesystem path, rejecting anything
// that could land outside the destination.
std::filesystem::path resolveRecordPath(const std::string& path)
{
    if (path == kRootPath) {
        return {};
    }

    const std::string prefix = std::string(kRootPath) + "/";
    if (path.compare(0, prefix.size(), prefix) != 0 || path.size() == prefix.size()) {
        throw ArchiveError("Archive record path is not rooted at '.': " + path);
    }

    const std::filesystem::path relative(path.substr(prefix.size()));
    if (relative.is_absolute() || relative.has_root_path()) {
        throw ArchiveError("Archive record path is absolute: " + path);
    }
    for (const auto& component : relative) {
        if (component == "..") {
            throw ArchiveError("Archive record path escapes the destination: " + path);
        }
    }
    return relative.lexically_normal();
}

void applyMode(const std::filesystem::path& path, std::uint32_t mode)
{
    std::error_code ec;
    std::filesystem::permissions(path, static_cast<std::filesystem::perms>(mode & kModeMask), ec);
    if (ec) {
        throw std::filesystem::filesystem_error("permissions", path, ec);
    }
}

} // namespace

std::vector<std::uint8_t> packTree(const std::filesystem::path& source)
{
    std::error_code ec;
    if (!std::filesystem::exists(std::filesystem::symlink_status(source, ec))) {
        throw SourceNotFoundError("Source path not found: " + source.string());
    }

    try {
        return serializeRecords(collectRecords(source));
    } catch (const std::filesystem::filesystem_error& error) {
        throw ArchiveError("Failed to archive '" + source.string() + "': " + error.what());
    } catch (const std::invalid_argument& error) {
        throw ArchiveError("Failed to archive '" + source.string() + "': " + error.what());
    } catch (const ContainerError&) {
        throw;
    } catch (const std::runtime_error& error) {
        throw ArchiveError("Failed to archive '" + source.string() + "': " + error.what());
    }
}

std::vector<std::uint8_t> serializeRecords(const std::vector<ArchiveRecord>& records)
{
    if (records.size() > static_cast<std::size_t>(std::numeric_limits<std::uint32_t>::max())) {
        throw ArchiveError("Too many records for a single archive");
    }

    std::vector<std::uint8_t> output(kArchiveMagic, kArchiveMagic + sizeof(kArchiveMagic));
    utils::appendLittleEndian(output, kFormatVersion);
    output.insert(output.end(), 3, 0);
    utils::appendLittleEndian(output, static_cast<std::uint32_t>(records.size()));

    for (const auto& record : records) {
        if (record.path.size() > static_cast<std::size_t>(std::numeric_limits<std::uint32_t>::max())) {
            throw ArchiveError("Relative path exceeds maximum supported length");
        }

        utils::appendLittleEndian(output, static_cast<std::uint32_t>(record.path.size()));
        output.insert(output.end(), record.path.begin(), record.path.end());
        utils::appendLittleEndian(output, static_cast<std::uint8_t>(record.type));
        utils::appendLittleEndian(output, record.mode);
        utils::appendLittleEndian(output, static_cast<std::uint64_t>(record.data.size()));
        output.insert(output.end(), record.data.begin(), record.data.end());
    }

    return output;
}

std::vector<ArchiveRecord> parseRecords(const std::vector<std::uint8_t>& bytes)
{
    if (bytes.size() < sizeof(kArchiveMagic) || std::memcmp(bytes.data(), kArchiveMagic, sizeof(kArchiveMagic)) != 0) {
        throw ArchiveError("Invalid archive magic");
    }

    std::size_t cursor = sizeof(kArchiveMagic);
    const auto version = readField<std::uint8_t>(bytes, cursor, "version");
    if (version != kFormatVersion) {
        throw ArchiveError("Unsupported archive version: " + std::to_string(version));
    }
    if (bytes.size() - cursor < 3U) {
        throw ArchiveError("Truncated archive stream while reading padding");
    }
    cursor += 3U;

    const auto recordCount = readField<std::uint32_t>(bytes, cursor, "record count");

    std::vector<ArchiveRecord> records;
    for (std::uint32_t index = 0; index < recordCount; ++index) {
        ArchiveRecord record {};

        const auto pathSize = readField<std::uint32_t>(bytes, cursor, "path length");
        if (bytes.size() - cursor < pathSize) {
            throw ArchiveError("Truncated archive stream while reading path");
        }
        record.path.assign(reinterpret_cast<const char*>(bytes.data() + cursor), pathSize);
        cursor += pathSize;

        const auto type = readField<std::uint8_t>(bytes, cursor, "record type");
        if (type != static_cast<std::uint8_t>(RecordType::Directory) && type != static_cast<std::uint8_t>(RecordType::File)
            && type != static_cast<std::uint8_t>(RecordType::Symlink)) {
            throw ArchiveError("Unknown archive record type " + std::to_string(type) + " for " + record.path);
        }
        record.type = static_cast<RecordType>(type);
        record.mode = readField<std::uint32_t>(bytes, cursor, "mode");

        const auto dataSize = readField<std::uint64_t>(bytes, cursor, "data size");
        if (static_cast<std::uint64_t>(bytes.size() - cursor) < dataSize) {
            throw ArchiveError("Truncated archive stream while reading data of " + record.path);
        }
        if (record.type == RecordType::Directory && dataSize != 0U) {
            throw ArchiveError("Directory record carries data: " + record.path);
        }
        const auto begin = bytes.begin() + static_cast<std::ptrdiff_t>(cursor);
        record.data.assign(begin, begin + static_cast<std::ptrdiff_t>(dataSize));
        cursor += static_cast<std::size_t>(dataSize);

        const auto relative = resolveRecordPath(record.path);
        if (record.type == RecordType::Symlink) {
            if (relative.empty()) {
                throw ArchiveError("Archive root cannot be a symlink");
            }
            checkLinkTarget(relative, std::string(record.data.begin(), record.data.end()));
        }
        records.push_back(std::move(record));
    }

    if (cursor != bytes.size()) {
        throw ArchiveError("Trailing bytes after the last archive record");
    }

    std::unordered_set<std::string> links;
    for (const auto& record : records) {
        if (record.type == RecordType::Symlink) {
            links.insert(resolveRecordPath(record.path).generic_string());
        }
    }
    if (!links.empty()) {
        for (const auto& record : records) {
            for (auto parent = resolveRecordPath(record.path).parent_path(); !parent.empty(); parent = parent.parent_path()) {
                if (links.count(parent.generic_string()) != 0U) {
                    throw ArchiveError("Archive record lies below a symlink: " + record.path);
                }
            }
        }
    }

    return records;
}

void unpackTree(const std::vector<std::uint8_t>& bytes, const std::filesystem::path& destination)
{
    const auto records = parseRecords(bytes);

    try {
        std::error_code ec;
        std::filesystem::create_directories(destination, ec);
        if (ec) {
            throw std::filesystem::filesystem_error("create_directories", destination, ec);
        }

        std::vector<std::pair<std::filesystem::path, std::uint32_t>> directoryModes;

        for (const auto& record : records) {
            const auto relative = resolveRecordPath(record.path);
            const auto target = relative.empty() ? destination : destination / relative;

            if (record.type == RecordType::Directory) {
                std::filesystem::create_directories(target, ec);
                if (ec) {
                    throw std::filesystem::filesystem_error("create_directories", target, ec);
                }
                if (!relative.empty()) {
                    directoryModes.emplace_back(target, record.mode);
                }
                continue;
            }

            if (record.type == RecordType::Symlink) {
                utils::ensureParentDirectory(target);
                const auto existing = std::filesystem::symlink_status(target, ec);
                if (std::filesystem::exists(existing) && !std::filesystem::is_directory(existing)) {
                    std::filesystem::remove(target, ec);
                    if (ec) {
                        throw std::filesystem::filesystem_error("remove", target, ec);
                    }
                }
                std::filesystem::create_symlink(std::string(record.data.begin(), record.data.end()), target, ec);
                if (ec) {
                    throw std::filesystem::filesystem_error("create_symlink", target, ec);
                }
                continue;
            }

            utils::writeBufferToFile(target, record.data);
            applyMode(target, record.mode);
        }

        // Deepest first, and never lock the owner out of a directory.
        for (auto it = directoryModes.rbegin(); it != directoryModes.rend(); ++it) {
            applyMode(it->first, it->second | 0700U);
        }
    } catch (const std::filesystem::filesystem_error& error) {
        throw ArchiveError("Failed to unpack into '" + destination.string() + "': " + error.what());
    } catch (const ContainerError&) {
        throw;
    } catch (const std::runtime_error& error) {
        throw ArchiveError("Failed to unpack into '" + destination.string() + "': " + error.what());
    }
}

} // namespace blobkit::archive
