#include "filesystem/resource_context.hpp"

#include "utils/file_io.hpp"

#include <algorithm>
#include <fstream>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace blobkit::filesystem {

namespace {

std::filesystem::path makeAbsolute(const std::filesystem::path& path)
{
    std::error_code ec;
    auto absolute = std::filesystem::weakly_canonical(path, ec);
    if (!ec) {
        return absolute;
    }

    absolute = std::filesystem::absolute(path, ec);
    if (!ec) {
        return absolute;
    }

    return path;
}

EntryType resolveType(const std::filesystem::file_status& status)
{
    if (std::filesystem::is_directory(status)) {
        return EntryType::Directory;
    }

    return EntryType::File;
}

std::uintmax_t safeFileSize(const std::filesystem::path& path)
{
    std::error_code ec;
    const auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        return 0;
    }
    return size;
}

} // namespace

bool isOwnerExecutable(const FileDescriptor& descriptor) noexcept
{
    return descriptor.type == EntryType::File
        && (descriptor.permissions & std::filesystem::perms::owner_exec) != std::filesystem::perms::none;
}

FileDescriptor describePath(const std::filesystem::path& path)
{
    if (path.empty()) {
        throw std::invalid_argument("Provided path is empty");
    }

    std::error_code ec;
    const auto linkStatus = std::filesystem::symlink_status(path, ec);
    if (ec || !std::filesystem::exists(linkStatus)) {
        throw std::filesystem::filesystem_error(
            "describe path", path, ec ? ec : std::make_error_code(std::errc::no_such_file_or_directory));
    }

    const auto status = std::filesystem::status(path, ec);

    FileDescriptor descriptor {};
    descriptor.absolutePath = makeAbsolute(path);
    descriptor.relativePath = path.filename().empty() ? descriptor.absolutePath.filename() : path.filename();
    descriptor.isSymlink = std::filesystem::is_symlink(linkStatus);
    descriptor.type = ec ? EntryType::File : resolveType(status);
    descriptor.permissions = (ec ? linkStatus : status).permissions();

    if (descriptor.type == EntryType::Directory) {
        descriptor.size = 0;
    } else {
        descriptor.size = safeFileSize(path);
    }

    return descriptor;
}

FileContext::FileContext(std::filesystem::path sourcePath)
    : descriptor_(describePath(std::move(sourcePath)))
{
    if (descriptor_.type != EntryType::File) {
        throw std::invalid_argument("FileContext requires a regular file");
    }
}

const FileDescriptor& FileContext::descriptor() const noexcept
{
    return descriptor_;
}

std::vector<std::uint8_t> FileContext::readAll() const
{
    return utils::readFileBytes(descriptor_.absolutePath);
}

void FileContext::copyTo(const std::filesystem::path& destinationPath) const
{
    if (destinationPath.empty()) {
        throw std::invalid_argument("Destination path is empty");
    }

    const auto absoluteDestination = makeAbsolute(destinationPath);
    utils::ensureParentDirectory(absoluteDestination);

    std::error_code copyError;
    std::filesystem::copy_file(
        descriptor_.absolutePath,
        absoluteDestination,
        std::filesystem::copy_options::overwrite_existing,
        copyError);

    if (copyError) {
        throw std::filesystem::filesystem_error("copy_file", descriptor_.absolutePath, absoluteDestination, copyError);
    }
}

DirectoryContext::DirectoryContext(std::filesystem::path rootPath)
    : rootPath_(makeAbsolute(std::move(rootPath)))
{
    std::error_code ec;
    if (!std::filesystem::exists(rootPath_, ec) || !std::filesystem::is_directory(rootPath_, ec)) {
        throw std::invalid_argument("DirectoryContext requires an existing directory");
    }
}

std::vector<FileDescriptor> DirectoryContext::listEntries(bool recursive, bool includeDirectories) const
{
    std::vector<FileDescriptor> entries;

    const auto collect = [&](const std::filesystem::directory_entry& entry) {
        auto descriptor = buildDescriptor(entry);
        if (!includeDirectories && descriptor.type == EntryType::Directory) {
            return;
        }
        entries.push_back(std::move(descriptor));
    };

    std::error_code ec;

    if (!recursive) {
        std::filesystem::directory_iterator iterator(rootPath_, ec);
        if (ec) {
            throw std::filesystem::filesystem_error("directory_iterator", rootPath_, ec);
        }

        for (const auto& entry : iterator) {
            collect(entry);
        }
    } else {
        std::filesystem::recursive_directory_iterator iterator(rootPath_, ec);
        if (ec) {
            throw std::filesystem::filesystem_error("recursive_directory_iterator", rootPath_, ec);
        }

        for (const auto& entry : iterator) {
            collect(entry);
        }
    }

    std::sort(entries.begin(), entries.end(), [](const FileDescriptor& lhs, const FileDescriptor& rhs) {
        return lhs.relativePath.generic_string() < rhs.relativePath.generic_string();
    });

    return entries;
}

FileDescriptor DirectoryContext::buildDescriptor(const std::filesystem::directory_entry& entry) const
{
    std::error_code ec;
    const auto linkStatus = entry.symlink_status(ec);
    const bool isSymlink = !ec && std::filesystem::is_symlink(linkStatus);

    FileDescriptor descriptor {};
    descriptor.absolutePath = entry.path();
    descriptor.relativePath = entry.path().lexically_relative(rootPath_);
    if (descriptor.relativePath.empty()) {
        descriptor.relativePath = entry.path().filename();
    }
    descriptor.isSymlink = isSymlink;

    const auto status = isSymlink ? linkStatus : entry.status(ec);
    descriptor.type = ec ? EntryType::File : resolveType(status);
    descriptor.permissions = status.permissions();

    if (descriptor.type == EntryType::File && !isSymlink) {
        descriptor.size = safeFileSize(entry.path());
    }

    return descriptor;
}

} // namespace blobkit::filesystem
