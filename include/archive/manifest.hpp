#pragma once

#include "archive/types.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace blobkit::archive {

std::vector<ManifestFile> collectManifest(const std::filesystem::path& source);
BinaryClassification classifyBinaries(const std::vector<ManifestFile>& manifest);
bool isSharedLibraryName(const std::string& filename);

// Executable regular files found directly inside bin, sbin, usr/bin, usr/sbin.
std::vector<std::string> detectProvides(const std::filesystem::path& source);

} // namespace blobkit::archive
