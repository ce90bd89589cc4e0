#include "container/layout.hpp"

#include "core/errors.hpp"
#include "utils/byte_order.hpp"

#include <fstream>
#include <istream>
#include <ostream>
#include <stdexcept>
#include <string>

namespace blobkit::container {
namespace {

ContainerHeader readHeaderAs(std::istream& input, const std::optional<ContainerKind>& expectedKind)
{
    char magic[kMagicSize] = {};
    input.read(magic, sizeof(magic));
    if (input.gcount() != static_cast<std::streamsize>(sizeof(magic))) {
        throw FormatError("File is too short to hold a container header");
    }

    const auto kind = kindFromMagic(magic);
    if (!kind) {
        throw FormatError("Invalid blob file format: unrecognised magic tag");
    }
    if (expectedKind && *kind != *expectedKind) {
        throw FormatError("Invalid blob file format: expected a " + kindName(*expectedKind) + " but found a "
                          + kindName(*kind));
    }

    ContainerHeader header {};
    header.kind = *kind;
    if (!utils::readLittleEndian(input, header.formatVersion)) {
        throw FormatError("File is too short to hold a container header");
    }
    if (header.formatVersion != kFormatVersion) {
        throw UnsupportedVersionError("Unsupported blob version: " + std::to_string(header.formatVersion));
    }
    if (!utils::readLittleEndian(input, header.indexLength)) {
        throw FormatError("File is too short to hold a container header");
    }
    return header;
}

} // namespace

void writeHeader(std::ostream& output, ContainerKind kind, std::uint32_t indexLength)
{
    output.write(magicTag(kind), static_cast<std::streamsize>(kMagicSize));
    if (!output) {
        throw std::runtime_error("Failed to write container magic");
    }
    utils::writeLittleEndian(output, kFormatVersion);
    utils::writeLittleEndian(output, indexLength);
}

ContainerHeader readHeader(std::istream& input, ContainerKind expectedKind)
{
    return readHeaderAs(input, expectedKind);
}

ContainerHeader readHeader(std::istream& input)
{
    return readHeaderAs(input, std::nullopt);
}

std::string readIndexBlock(std::istream& input, const ContainerHeader& header)
{
    const auto start = static_cast<std::streamoff>(input.tellg());
    if (start >= 0) {
        input.seekg(0, std::ios::end);
        const auto end = static_cast<std::streamoff>(input.tellg());
        input.seekg(start, std::ios::beg);
        if (end < start || static_cast<std::uint64_t>(end - start) < header.indexLength) {
            throw FormatError("Truncated index block: expected " + std::to_string(header.indexLength) + " bytes");
        }
    }

    std::string text(header.indexLength, '\0');
    if (!text.empty()) {
        input.read(text.data(), static_cast<std::streamsize>(text.size()));
        if (input.gcount() != static_cast<std::streamsize>(text.size())) {
            throw FormatError("Truncated index block: expected " + std::to_string(header.indexLength) + " bytes");
        }
    }
    return text;
}

std::optional<ContainerKind> sniffKind(const std::filesystem::path& path)
{
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        throw std::runtime_error("Failed to open file to inspect magic: " + path.string());
    }

    char magic[kMagicSize] = {};
    input.read(magic, sizeof(magic));
    if (input.gcount() != static_cast<std::streamsize>(sizeof(magic))) {
        return std::nullopt;
    }
    return kindFromMagic(magic);
}

} // namespace blobkit::container
