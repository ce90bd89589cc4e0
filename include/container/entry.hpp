#pragma once

#include "archive/types.hpp"
#include "container/container_kind.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace blobkit::container {

// Fields every entry carries regardless of container kind. size, offset,
// compressedSize and checksum are owned by the writer.
struct EntryRecord {
    std::string key;
    std::string description;
    std::uint64_t size {0};
    std::uint64_t compressedSize {0};
    std::uint64_t offset {0};
    std::string checksum;
    std::vector<std::string> dependencies;
    std::vector<archive::ManifestFile> files;
    std::string createdAt;
};

struct ApplicationEntry {
    EntryRecord record;
    std::string name;
    std::string version {"1.0.0"};
};

using EnvironmentVariables = std::vector<std::pair<std::string, std::string>>;

struct BinaryEntry {
    EntryRecord record;
    std::string version {"1.0.0"};
    std::vector<std::string> provides;
    std::vector<std::string> executables;
    std::vector<std::string> libraries;
    EnvironmentVariables envVars;
    std::string architecture {"x86_64"};
    std::string osType {"linux"};
};

struct UserRecord {
    EntryRecord record;
    // Version counter; bumped by a merge update.
    std::uint64_t revision {1};
    // Advisory only, never enforced.
    std::optional<std::uint64_t> quotaMb;
    std::string updatedAt;
    std::uint64_t fileCount {0};
};

using Entry = std::variant<ApplicationEntry, BinaryEntry, UserRecord>;

EntryRecord& record(Entry& entry) noexcept;
const EntryRecord& record(const Entry& entry) noexcept;
ContainerKind kindOf(const Entry& entry) noexcept;

// Catalog version string, or "v<revision>" for user records.
std::string displayVersion(const Entry& entry);

// Empty prototype of the alternative matching kind.
Entry makeEntry(ContainerKind kind, std::string key);

// size / compressedSize, 0 when nothing was compressed.
double compressionRatio(const EntryRecord& record) noexcept;

// Local time, ISO-8601 with microseconds.
std::string currentTimestamp();

} // namespace blobkit::container
