#include "container/container_reader.hpp"

#include "archive/tree_archive.hpp"
#include "compression/deflate.hpp"
#include "core/errors.hpp"
#include "integrity/sha256.hpp"
#include "utils/file_lock.hpp"
#include "utils/log.hpp"

#include <algorithm>
#include <exception>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace blobkit::container {
namespace {

// Entry keys become directory names below the extraction root.
std::filesystem::path destinationFor(const std::filesystem::path& destDir, const std::string& key)
{
    const std::filesystem::path relative(key);
    if (key.empty() || key == "." || key == ".." || relative.has_root_path() || ++relative.begin() != relative.end()) {
        throw ArchiveError("Entry key cannot be used as a directory name: " + key);
    }
    return destDir / relative;
}

} // namespace

bool ExtractionReport::succeeded() const noexcept
{
    return std::all_of(results.begin(), results.end(), [](const ExtractionResult& result) { return result.success; });
}

const ExtractionResult* ExtractionReport::find(const std::string& key) const noexcept
{
    const auto it = std::find_if(results.begin(), results.end(), [&key](const ExtractionResult& result) {
        return result.key == key;
    });
    return it == results.end() ? nullptr : &*it;
}

bool VerificationReport::allValid() const noexcept
{
    return std::all_of(results.begin(), results.end(), [](const VerificationResult& result) { return result.valid; });
}

ContainerReader::ContainerReader(std::filesystem::path path, ContainerKind expectedKind)
    : path_(std::move(path))
{
    open(expectedKind);
}

ContainerReader::ContainerReader(std::filesystem::path path)
    : path_(std::move(path))
{
    open(std::nullopt);
}

void ContainerReader::open(const std::optional<ContainerKind>& expectedKind)
{
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path_, ec)) {
        throw std::filesystem::filesystem_error("Blob file not found", path_,
                                                std::make_error_code(std::errc::no_such_file_or_directory));
    }

    utils::FileLock lock(path_, utils::LockMode::Shared);

    input_.open(path_, std::ios::binary);
    if (!input_) {
        throw std::runtime_error("Failed to open file for reading: " + path_.string());
    }

    input_.seekg(0, std::ios::end);
    const auto endPosition = input_.tellg();
    if (endPosition < 0) {
        throw std::runtime_error("Failed to determine file size: " + path_.string());
    }
    fileSize_ = static_cast<std::uint64_t>(endPosition);
    input_.seekg(0, std::ios::beg);

    header_ = expectedKind ? readHeader(input_, *expectedKind) : readHeader(input_);
    auto parsed = parseIndex(header_.kind, readIndexBlock(input_, header_));
    index_ = std::move(parsed.index);
    createdAt_ = std::move(parsed.createdAt);

    utils::logDebug("Opened " + kindName(header_.kind) + " '" + path_.string() + "' with " + std::to_string(index_.size())
                    + " entries");
}

std::vector<std::string> ContainerReader::listKeys() const
{
    return index_.keys();
}

const Entry& ContainerReader::getMetadata(const std::string& key) const
{
    return index_.at(key);
}

const Entry* ContainerReader::find(const std::string& key) const noexcept
{
    return index_.find(key);
}

std::vector<std::uint8_t> ContainerReader::readSlice(const EntryRecord& record)
{
    const auto payloadSize = fileSize_ - payloadOffset();
    if (record.offset > payloadSize || record.compressedSize > payloadSize - record.offset) {
        throw IntegrityError("Payload of '" + record.key + "' runs past the end of " + path_.string());
    }

    std::vector<std::uint8_t> bytes(static_cast<std::size_t>(record.compressedSize));
    input_.clear();
    input_.seekg(static_cast<std::streamoff>(payloadOffset() + record.offset), std::ios::beg);
    if (!bytes.empty()) {
        input_.read(reinterpret_cast<char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    }
    if (!input_ || input_.gcount() != static_cast<std::streamsize>(bytes.size())) {
        throw IntegrityError("Short read of '" + record.key + "' payload from " + path_.string());
    }
    return bytes;
}

std::vector<std::uint8_t> ContainerReader::loadArchive(const EntryRecord& record, bool verify)
{
    auto archiveBytes = compression::decompress(readSlice(record), static_cast<std::size_t>(record.size));
    if (verify) {
        const auto actual = integrity::sha256Hex(archiveBytes);
        if (actual != record.checksum) {
            throw IntegrityError("Checksum mismatch for '" + record.key + "': expected " + record.checksum + ", got "
                                 + actual);
        }
    }
    return archiveBytes;
}

std::filesystem::path ContainerReader::extract(const std::string& key, const std::filesystem::path& destDir, bool verify)
{
    const auto& entry = record(index_.at(key));
    const auto destination = destinationFor(destDir, key);
    const auto archiveBytes = loadArchive(entry, verify);
    archive::unpackTree(archiveBytes, destination);
    utils::logInfo("Extracted '" + key + "' to " + destination.string());
    return destination;
}

std::vector<std::uint8_t> ContainerReader::extractToMemory(const std::string& key)
{
    return loadArchive(record(index_.at(key)), true);
}

ExtractionReport ContainerReader::extractMany(const std::vector<std::string>& keys, const std::filesystem::path& destDir,
                                              bool resolveDeps, bool verify)
{
    ExtractionReport report {};
    report.requested = keys;

    std::vector<std::string> targets;
    if (resolveDeps) {
        report.resolution = resolveDependencies(keys);
        targets = report.resolution.keys;
        // A requested key that is absent is a failure, not just a warning.
        for (const auto& missing : report.resolution.missing) {
            if (std::find(keys.begin(), keys.end(), missing) != keys.end()) {
                targets.push_back(missing);
            }
        }
    } else {
        targets = keys;
        report.resolution.keys = keys;
    }

    for (const auto& key : targets) {
        ExtractionResult result {};
        result.key = key;
        try {
            result.destination = extract(key, destDir, verify);
            result.success = true;
        } catch (const std::exception& error) {
            result.message = error.what();
        }
        if (!result.success) {
            utils::logWarning("Failed to extract '" + key + "': " + result.message);
        }
        report.results.push_back(std::move(result));
    }

    return report;
}

Resolution ContainerReader::resolveDependencies(const std::vector<std::string>& keys) const
{
    return container::resolveDependencies(index_, keys);
}

void ContainerReader::verify(const std::string& key)
{
    loadArchive(record(index_.at(key)), true);
}

VerificationReport ContainerReader::verifyAll()
{
    VerificationReport report {};
    for (const auto& entry : index_) {
        VerificationResult result {};
        result.key = record(entry).key;
        try {
            loadArchive(record(entry), true);
            result.valid = true;
            result.message = "OK";
        } catch (const std::exception& error) {
            result.message = error.what();
        }
        report.results.push_back(std::move(result));
    }
    return report;
}

} // namespace blobkit::container
