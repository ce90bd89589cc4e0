#include "archive/manifest.hpp"

#include "core/errors.hpp"
#include "filesystem/resource_context.hpp"

#include <array>
#include <system_error>

namespace blobkit::archive {

std::vector<ManifestFile> collectManifest(const std::filesystem::path& source)
{
    std::error_code ec;
    if (!std::filesystem::exists(source, ec)) {
        throw SourceNotFoundError("Source path not found: " + source.string());
    }

    std::vector<ManifestFile> manifest;

    if (!std::filesystem::is_directory(source, ec)) {
        const auto descriptor = filesystem::describePath(source);
        manifest.push_back({descriptor.relativePath.generic_string(), descriptor.size, filesystem::isOwnerExecutable(descriptor)});
        return manifest;
    }

    filesystem::DirectoryContext directory(source);
    for (const auto& descriptor : directory.listEntries(true, false)) {
        if (descriptor.isSymlink || !std::filesystem::is_regular_file(descriptor.absolutePath, ec)) {
            continue;
        }
        manifest.push_back({descriptor.relativePath.generic_string(), descriptor.size, filesystem::isOwnerExecutable(descriptor)});
    }
    return manifest;
}

bool isSharedLibraryName(const std::string& filename)
{
    const std::string suffix = ".so";
    if (filename.size() >= suffix.size()
        && filename.compare(filename.size() - suffix.size(), suffix.size(), suffix) == 0) {
        return true;
    }
    return filename.find(".so.") != std::string::npos;
}

BinaryClassification classifyBinaries(const std::vector<ManifestFile>& manifest)
{
    BinaryClassification classification {};
    for (const auto& file : manifest) {
        const auto filename = std::filesystem::path(file.path).filename().string();
        const bool library = isSharedLibraryName(filename);

        if (file.executable && !library) {
            classification.executables.push_back(file.path);
        }
        if (library) {
            classification.libraries.push_back(file.path);
        }
    }
    return classification;
}

std::vector<std::string> detectProvides(const std::filesystem::path& source)
{
    static constexpr std::array<const char*, 4> kBinaryDirectories = {"bin", "sbin", "usr/bin", "usr/sbin"};

    std::vector<std::string> provides;
    for (const auto* relative : kBinaryDirectories) {
        const auto candidate = source / relative;
        std::error_code ec;
        if (!std::filesystem::is_directory(candidate, ec)) {
            continue;
        }

        filesystem::DirectoryContext directory(candidate);
        for (const auto& descriptor : directory.listEntries(false, false)) {
            if (!std::filesystem::is_regular_file(descriptor.absolutePath, ec)) {
                continue;
            }
            if (filesystem::isOwnerExecutable(descriptor)) {
                provides.push_back(descriptor.relativePath.filename().string());
            }
        }
    }
    return provides;
}

} // namespace blobkit::archive
