#include "container/container_writer.hpp"

#include "archive/manifest.hpp"
#include "archive/tree_archive.hpp"
#include "container/layout.hpp"
#include "core/errors.hpp"
#include "integrity/sha256.hpp"
#include "utils/file_io.hpp"
#include "utils/file_lock.hpp"
#include "utils/log.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>
#include <limits>
#include <stdexcept>
#include <system_error>
#include <type_traits>
#include <utility>
#include <variant>

namespace blobkit::container {
namespace {

std::vector<std::uint8_t> readRemaining(std::istream& input)
{
    std::vector<std::uint8_t> bytes;
    std::transform(std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>(), std::back_inserter(bytes),
                   [](char ch) { return static_cast<std::uint8_t>(ch); });
    return bytes;
}

void fillKindFields(Entry& entry, const std::vector<archive::ManifestFile>& manifest)
{
    std::visit([&manifest](auto& alternative) {
        using T = std::decay_t<decltype(alternative)>;
        if constexpr (std::is_same_v<T, BinaryEntry>) {
            auto classification = archive::classifyBinaries(manifest);
            alternative.executables = std::move(classification.executables);
            alternative.libraries = std::move(classification.libraries);
            if (alternative.provides.empty()) {
                utils::logWarning("Binary '" + alternative.record.key + "' does not declare any provided commands");
            }
        } else if constexpr (std::is_same_v<T, UserRecord>) {
            alternative.fileCount = manifest.size();
            alternative.updatedAt = currentTimestamp();
        }
    }, entry);
}

} // namespace

ContainerWriter::ContainerWriter(ContainerKind kind, std::filesystem::path outputPath, int compressionLevel)
    : kind_(kind)
    , outputPath_(std::move(outputPath))
    , compressionLevel_(compressionLevel)
    , createdAt_(currentTimestamp())
{
    if (compressionLevel_ < compression::kMinCompressionLevel || compressionLevel_ > compression::kMaxCompressionLevel) {
        throw std::invalid_argument("Compression level must be between 0 and 9, got " + std::to_string(compressionLevel_));
    }
}

ContainerWriter ContainerWriter::loadExisting(const std::filesystem::path& path, ContainerKind kind, int compressionLevel)
{
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        throw std::filesystem::filesystem_error("Blob file not found", path,
                                                std::make_error_code(std::errc::no_such_file_or_directory));
    }

    utils::FileLock lock(path, utils::LockMode::Shared);

    std::ifstream input(path, std::ios::binary);
    if (!input) {
        throw std::runtime_error("Failed to open file for reading: " + path.string());
    }

    const auto header = readHeader(input, kind);
    auto parsed = parseIndex(kind, readIndexBlock(input, header));

    ContainerWriter writer(kind, path, compressionLevel);
    if (!parsed.createdAt.empty()) {
        writer.createdAt_ = std::move(parsed.createdAt);
    }
    writer.index_ = std::move(parsed.index);
    writer.arena_ = PayloadArena(readRemaining(input));
    if (input.bad()) {
        throw std::runtime_error("Failed to read payload region: " + path.string());
    }

    utils::logDebug("Loaded " + kindName(kind) + " '" + path.string() + "' with " + std::to_string(writer.index_.size())
                    + " entries");
    return writer;
}

Entry ContainerWriter::packEntry(const std::string& key, const std::filesystem::path& source, Entry prototype,
                                 std::vector<std::uint8_t>& compressed) const
{
    if (kindOf(prototype) != kind_) {
        throw std::invalid_argument("Entry '" + key + "' does not belong in a " + kindName(kind_));
    }

    const auto archiveBytes = archive::packTree(source);
    auto manifest = archive::collectManifest(source);
    compressed = compression::compress(archiveBytes, compressionLevel_);

    auto& common = record(prototype);
    common.key = key;
    common.size = archiveBytes.size();
    common.compressedSize = compressed.size();
    common.checksum = integrity::sha256Hex(archiveBytes);
    if (common.createdAt.empty()) {
        common.createdAt = currentTimestamp();
    }
    fillKindFields(prototype, manifest);
    common.files = std::move(manifest);
    return prototype;
}

const Entry& ContainerWriter::addEntry(const std::string& key, const std::filesystem::path& source, Entry prototype)
{
    if (index_.contains(key)) {
        throw DuplicateKeyError("Entry '" + key + "' already exists in the " + kindName(kind_));
    }

    std::vector<std::uint8_t> compressed;
    auto entry = packEntry(key, source, std::move(prototype), compressed);
    auto& common = record(entry);
    common.offset = arena_.append(compressed);

    utils::logInfo("Added '" + key + "': " + std::to_string(common.size) + " bytes -> " + std::to_string(common.compressedSize)
                   + " bytes compressed");
    return index_.insert(std::move(entry));
}

const Entry& ContainerWriter::replaceEntry(const std::string& key, const std::filesystem::path& source, Entry prototype)
{
    if (!index_.contains(key)) {
        throw NotFoundError("Entry '" + key + "' not found");
    }

    std::vector<std::uint8_t> compressed;
    auto entry = packEntry(key, source, std::move(prototype), compressed);
    auto& common = record(entry);
    common.offset = arena_.append(compressed);

    utils::logInfo("Replaced '" + key + "': " + std::to_string(common.size) + " bytes -> "
                   + std::to_string(common.compressedSize) + " bytes compressed");
    return index_.replace(std::move(entry));
}

void ContainerWriter::removeEntry(const std::string& key)
{
    index_.erase(key);
    utils::logInfo("Removed '" + key + "' from the index");
}

BuildSummary ContainerWriter::build()
{
    const auto indexText = serializeIndex(index_, kind_, createdAt_);
    if (indexText.size() > static_cast<std::size_t>(std::numeric_limits<std::uint32_t>::max())) {
        throw std::runtime_error("Index block exceeds the 4 GiB header limit");
    }

    utils::ensureParentDirectory(outputPath_);
    utils::FileLock lock(outputPath_, utils::LockMode::Exclusive);
    utils::AtomicFileWriter file(outputPath_);

    auto& output = file.stream();
    writeHeader(output, kind_, static_cast<std::uint32_t>(indexText.size()));
    output.write(indexText.data(), static_cast<std::streamsize>(indexText.size()));
    const auto& payload = arena_.bytes();
    if (!payload.empty()) {
        output.write(reinterpret_cast<const char*>(payload.data()), static_cast<std::streamsize>(payload.size()));
    }
    if (!output) {
        throw std::runtime_error("Failed to write container: " + file.temporaryPath().string());
    }
    file.commit();

    BuildSummary summary {};
    summary.indexSize = indexText.size();
    summary.dataSize = arena_.size();
    summary.totalSize = kHeaderSize + summary.indexSize + summary.dataSize;
    summary.entryCount = index_.size();
    summary.orphanedBytes = orphanedBytes();

    utils::logInfo("Built " + kindName(kind_) + " '" + outputPath_.string() + "': " + std::to_string(summary.entryCount)
                   + " entries, " + std::to_string(summary.totalSize) + " bytes");
    return summary;
}

std::uint64_t ContainerWriter::compact()
{
    std::vector<PayloadSlice> live;
    live.reserve(index_.size());
    for (const auto& entry : index_) {
        live.push_back({record(entry).offset, record(entry).compressedSize});
    }

    std::vector<std::uint64_t> relocated;
    auto fresh = arena_.compacted(live, relocated);

    std::size_t position = 0;
    for (const auto& key : index_.keys()) {
        record(*index_.find(key)).offset = relocated[position++];
    }

    const auto reclaimed = arena_.size() - fresh.size();
    arena_ = std::move(fresh);
    utils::logInfo("Compacted '" + outputPath_.string() + "': reclaimed " + std::to_string(reclaimed) + " bytes");
    return reclaimed;
}

std::vector<std::string> ContainerWriter::listKeys() const
{
    return index_.keys();
}

const Entry& ContainerWriter::getMetadata(const std::string& key) const
{
    return index_.at(key);
}

std::uint64_t ContainerWriter::orphanedBytes() const noexcept
{
    std::uint64_t live = 0;
    for (const auto& entry : index_) {
        live += record(entry).compressedSize;
    }
    return live >= arena_.size() ? 0 : arena_.size() - live;
}

} // namespace blobkit::container
