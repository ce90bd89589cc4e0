#pragma once

#include "compression/deflate.hpp"
#include "container/container_kind.hpp"
#include "container/entry.hpp"
#include "container/entry_index.hpp"
#include "container/payload_arena.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace blobkit::container {

struct BuildSummary {
    std::uint64_t totalSize {0};
    std::uint64_t indexSize {0};
    std::uint64_t dataSize {0};
    std::size_t entryCount {0};
    std::uint64_t orphanedBytes {0};
};

// Accumulates entries in memory; nothing touches the disk until build().
class ContainerWriter {
public:
    ContainerWriter(ContainerKind kind, std::filesystem::path outputPath,
                    int compressionLevel = compression::kDefaultCompressionLevel);

    // Rehydrates a writer from a built container. Any structural error aborts
    // the load.
    static ContainerWriter loadExisting(const std::filesystem::path& path, ContainerKind kind,
                                        int compressionLevel = compression::kDefaultCompressionLevel);

    // Packs, compresses and hashes source, appending it at the end of the
    // payload. The writer owns size, compressedSize, offset, checksum and
    // files; a non-empty createdAt on the prototype is kept.
    const Entry& addEntry(const std::string& key, const std::filesystem::path& source, Entry prototype);

    // Same packing as addEntry for an existing key. The old entry stays in the
    // index until the new payload has been packed and appended; its bytes
    // become orphaned.
    const Entry& replaceEntry(const std::string& key, const std::filesystem::path& source, Entry prototype);

    // Index-only; the payload bytes stay behind as orphaned bytes.
    void removeEntry(const std::string& key);

    BuildSummary build();

    // Drops orphaned bytes and relocates every live entry. Returns the number
    // of bytes reclaimed.
    std::uint64_t compact();

    ContainerKind kind() const noexcept { return kind_; }
    const std::filesystem::path& outputPath() const noexcept { return outputPath_; }
    const EntryIndex& index() const noexcept { return index_; }
    const std::string& createdAt() const noexcept { return createdAt_; }

    std::vector<std::string> listKeys() const;
    const Entry& getMetadata(const std::string& key) const;

    std::uint64_t payloadSize() const noexcept { return arena_.size(); }
    std::uint64_t orphanedBytes() const noexcept;

private:
    // Fills the writer-owned fields of prototype; appends nothing.
    Entry packEntry(const std::string& key, const std::filesystem::path& source, Entry prototype,
                    std::vector<std::uint8_t>& compressed) const;

    ContainerKind kind_;
    std::filesystem::path outputPath_;
    int compressionLevel_;
    std::string createdAt_;
    EntryIndex index_;
    PayloadArena arena_;
};

} // namespace blobkit::container
