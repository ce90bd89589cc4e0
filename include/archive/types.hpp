#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace blobkit::archive {

inline constexpr char kArchiveMagic[4] = {'B', 'K', 'A', 'R'};
inline constexpr std::uint8_t kFormatVersion = 1;
inline constexpr char kRootPath[] = ".";

enum class RecordType : std::uint8_t {
    Directory = 0,
    File = 1,
    // data holds the link target, relative to the link's directory.
    Symlink = 2
};

struct ArchiveRecord {
    // "." for the root, "./<generic relative path>" for everything below it.
    std::string path;
    RecordType type {RecordType::File};
    std::uint32_t mode {0};
    std::vector<std::uint8_t> data;
};

struct ManifestFile {
    std::string path;
    std::uint64_t size {0};
    bool executable {false};
};

struct BinaryClassification {
    std::vector<std::string> executables;
    std::vector<std::string> libraries;
};

} // namespace blobkit::archive
