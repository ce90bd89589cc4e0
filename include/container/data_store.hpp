#pragma once

#include "container/container_writer.hpp"
#include "container/entry.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace blobkit::container {

enum class UpdateMode {
    // Fresh payload, revision unchanged.
    Replace,
    // Replace-with-version-bump: the same replacement plus revision + 1. No
    // content-level merge takes place.
    Merge
};

UpdateMode parseUpdateMode(const std::string& name);
const char* updateModeName(UpdateMode mode) noexcept;

// Read-write user data container. Edits stay in memory until build(); removed
// and replaced payloads remain as orphaned bytes until compact().
class DataStore {
public:
    static DataStore create(const std::filesystem::path& path,
                            int compressionLevel = compression::kDefaultCompressionLevel);
    static DataStore open(const std::filesystem::path& path,
                          int compressionLevel = compression::kDefaultCompressionLevel);

    const UserRecord& add(const std::string& userId, const std::filesystem::path& source, const std::string& description = {},
                          std::optional<std::uint64_t> quotaMb = std::nullopt);
    const UserRecord& update(const std::string& userId, const std::filesystem::path& source,
                             UpdateMode mode = UpdateMode::Replace);
    void remove(const std::string& userId);

    // Copies the container as it is on disk, ignoring pending edits.
    void checkpoint(const std::filesystem::path& destination) const;

    BuildSummary build();
    std::uint64_t compact();

    std::vector<std::string> listUsers() const;
    const UserRecord& getRecord(const std::string& userId) const;

    const std::filesystem::path& path() const noexcept { return writer_.outputPath(); }
    const ContainerWriter& writer() const noexcept { return writer_; }

private:
    explicit DataStore(ContainerWriter writer);

    ContainerWriter writer_;
};

} // namespace blobkit::container
