#pragma once

#include "container/container_kind.hpp"
#include "container/container_writer.hpp"
#include "container/entry.hpp"
#include "container/entry_index.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace blobkit::config {

// One entry of a batch document: where to read it from and the metadata to
// record for it.
struct BatchRecord {
    std::string key;
    std::filesystem::path source;
    container::Entry prototype;
};

struct BatchBuildResult {
    container::BuildSummary summary;
    container::EntryIndex index;
    std::vector<std::string> added;
    std::vector<std::string> skipped;
};

// Application documents hold {"applications": [...]}, binary documents
// {"binaries": [...]}. Throws std::invalid_argument naming the offending record.
std::vector<BatchRecord> parseBatchConfig(const std::string& text, container::ContainerKind kind);
std::vector<BatchRecord> loadBatchConfig(const std::filesystem::path& path, container::ContainerKind kind);

// Records whose source is missing are skipped with a warning.
BatchBuildResult buildFromConfig(container::ContainerKind kind, const std::filesystem::path& configPath,
                                 const std::filesystem::path& outputPath,
                                 int compressionLevel = compression::kDefaultCompressionLevel);

void writeSampleConfig(container::ContainerKind kind, const std::filesystem::path& path);

} // namespace blobkit::config
