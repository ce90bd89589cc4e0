#pragma once

#include <cstdint>
#include <filesystem>
#include <vector>

namespace blobkit::filesystem {

enum class EntryType {
    File,
    Directory
};

struct FileDescriptor {
    std::filesystem::path absolutePath;
    std::filesystem::path relativePath;
    EntryType type {EntryType::File};
    std::uintmax_t size {0};
    std::filesystem::perms permissions {std::filesystem::perms::none};
    bool isSymlink {false};
};

bool isOwnerExecutable(const FileDescriptor& descriptor) noexcept;

FileDescriptor describePath(const std::filesystem::path& path);

class FileContext {
public:
    explicit FileContext(std::filesystem::path sourcePath);

    const FileDescriptor& descriptor() const noexcept;

    std::vector<std::uint8_t> readAll() const;
    void copyTo(const std::filesystem::path& destinationPath) const;

private:
    FileDescriptor descriptor_;
};

class DirectoryContext {
public:
    explicit DirectoryContext(std::filesystem::path rootPath);

    // Entries are sorted by relative path. Symlinks are reported but never
    // descended into.
    std::vector<FileDescriptor> listEntries(bool recursive = true, bool includeDirectories = true) const;

private:
    FileDescriptor buildDescriptor(const std::filesystem::directory_entry& entry) const;

    std::filesystem::path rootPath_;
};

} // namespace blobkit::filesystem
