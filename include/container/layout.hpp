#pragma once

#include "container/container_kind.hpp"

#include <cstdint>
#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>

namespace blobkit::container {

// [MagicTag 8][FormatVersion u16][IndexLength u32][Index][Payload region]
inline constexpr std::uint64_t kHeaderSize = kMagicSize + sizeof(std::uint16_t) + sizeof(std::uint32_t);

struct ContainerHeader {
    ContainerKind kind {ContainerKind::Application};
    std::uint16_t formatVersion {kFormatVersion};
    std::uint32_t indexLength {0};

    std::uint64_t payloadOffset() const noexcept { return kHeaderSize + indexLength; }
};

void writeHeader(std::ostream& output, ContainerKind kind, std::uint32_t indexLength);

// FormatError on a short header or a foreign magic tag, UnsupportedVersionError
// on any version but kFormatVersion.
ContainerHeader readHeader(std::istream& input, ContainerKind expectedKind);
ContainerHeader readHeader(std::istream& input);

// Reads the indexLength bytes that follow the header.
std::string readIndexBlock(std::istream& input, const ContainerHeader& header);

// Kind named by the file's magic tag, or nullopt when it is not a container.
std::optional<ContainerKind> sniffKind(const std::filesystem::path& path);

} // namespace blobkit::container
