#pragma once

#include "archive/types.hpp"

#include <cstdint>
#include <filesystem>
#include <vector>

namespace blobkit::archive {

// Symlinks are stored as links; ones pointing outside source are skipped with
// a warning.
std::vector<std::uint8_t> packTree(const std::filesystem::path& source);

std::vector<std::uint8_t> serializeRecords(const std::vector<ArchiveRecord>& records);
std::vector<ArchiveRecord> parseRecords(const std::vector<std::uint8_t>& bytes);

// Parses the whole stream before writing anything below destination. Symlink
// targets must stay inside the destination, and no record may sit below a
// symlink.
void unpackTree(const std::vector<std::uint8_t>& bytes, const std::filesystem::path& destination);

} // namespace blobkit::archive
