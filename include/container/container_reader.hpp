#pragma once

#include "container/container_kind.hpp"
#include "container/dependency_resolver.hpp"
#include "container/entry.hpp"
#include "container/entry_index.hpp"
#include "container/layout.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <vector>

namespace blobkit::container {

struct ExtractionResult {
    std::string key;
    bool success {false};
    std::string message;
    std::filesystem::path destination;
};

struct ExtractionReport {
    std::vector<std::string> requested;
    Resolution resolution;
    std::vector<ExtractionResult> results;

    bool succeeded() const noexcept;
    const ExtractionResult* find(const std::string& key) const noexcept;
};

struct VerificationResult {
    std::string key;
    bool valid {false};
    std::string message;
};

struct VerificationReport {
    std::vector<VerificationResult> results;

    bool allValid() const noexcept;
};

// Validates header and index on construction and keeps the file open, so every
// read comes from the file that was indexed even if it is replaced on disk.
class ContainerReader {
public:
    ContainerReader(std::filesystem::path path, ContainerKind expectedKind);
    explicit ContainerReader(std::filesystem::path path);

    ContainerKind kind() const noexcept { return header_.kind; }
    const std::filesystem::path& path() const noexcept { return path_; }
    const std::string& createdAt() const noexcept { return createdAt_; }
    const EntryIndex& index() const noexcept { return index_; }
    std::uint64_t payloadOffset() const noexcept { return header_.payloadOffset(); }
    std::uint64_t fileSize() const noexcept { return fileSize_; }

    std::vector<std::string> listKeys() const;
    const Entry& getMetadata(const std::string& key) const;
    const Entry* find(const std::string& key) const noexcept;

    // Unpacks into destDir/key. On a checksum mismatch nothing is written.
    std::filesystem::path extract(const std::string& key, const std::filesystem::path& destDir, bool verify = true);

    // Decompressed archive bytes, always verified.
    std::vector<std::uint8_t> extractToMemory(const std::string& key);

    ExtractionReport extractMany(const std::vector<std::string>& keys, const std::filesystem::path& destDir,
                                 bool resolveDeps = true, bool verify = true);

    Resolution resolveDependencies(const std::vector<std::string>& keys) const;

    // Throws IntegrityError or CompressionError when the entry is damaged.
    void verify(const std::string& key);
    VerificationReport verifyAll();

private:
    void open(const std::optional<ContainerKind>& expectedKind);
    std::vector<std::uint8_t> readSlice(const EntryRecord& record);
    std::vector<std::uint8_t> loadArchive(const EntryRecord& record, bool verify);

    std::filesystem::path path_;
    std::ifstream input_;
    ContainerHeader header_ {};
    std::uint64_t fileSize_ {0};
    std::string createdAt_;
    EntryIndex index_;
};

} // namespace blobkit::container
