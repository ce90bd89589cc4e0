#include "compression/deflate.hpp"

#include "core/errors.hpp"

#include <zlib.h>

#include <algorithm>
#include <limits>
#include <stdexcept>
#include <string>

namespace blobkit::compression {
namespace {

constexpr std::size_t kChunkSize = 64 * 1024;
// Upper bound of what DEFLATE can expand a single input byte into.
constexpr std::size_t kMaxExpansion = 1032;

std::string zlibMessage(const z_stream& stream, int code)
{
    if (stream.msg != nullptr) {
        return std::string(stream.msg) + " (zlib error " + std::to_string(code) + ")";
    }
    return "zlib error " + std::to_string(code);
}

} // namespace

std::vector<std::uint8_t> compress(const std::vector<std::uint8_t>& input, int level)
{
    if (level < kMinCompressionLevel || level > kMaxCompressionLevel) {
        throw std::invalid_argument("Compression level must be between 0 and 9, got " + std::to_string(level));
    }
    if (input.size() > static_cast<std::size_t>(std::numeric_limits<uLong>::max())) {
        throw CompressionError("Input too large to compress in one call");
    }

    uLongf bound = compressBound(static_cast<uLong>(input.size()));
    std::vector<std::uint8_t> output(bound);

    const int result = compress2(output.data(), &bound, input.data(), static_cast<uLong>(input.size()), level);
    if (result != Z_OK) {
        throw CompressionError("Failed to compress payload: zlib error " + std::to_string(result));
    }
    output.resize(bound);
    return output;
}

std::vector<std::uint8_t> decompress(const std::vector<std::uint8_t>& input, std::size_t expectedSize)
{
    if (input.empty()) {
        throw CompressionError("Failed to decompress payload: empty input");
    }

    z_stream stream {};
    int status = inflateInit(&stream);
    if (status != Z_OK) {
        throw CompressionError("Failed to initialise inflate: " + zlibMessage(stream, status));
    }

    std::vector<std::uint8_t> output;
    const auto bound = input.size() > std::numeric_limits<std::size_t>::max() / kMaxExpansion
        ? std::numeric_limits<std::size_t>::max()
        : input.size() * kMaxExpansion;
    output.reserve(std::max(std::min(expectedSize, bound), kChunkSize));

    std::size_t consumed = 0;
    std::uint8_t chunk[kChunkSize];

    do {
        if (stream.avail_in == 0U && consumed < input.size()) {
            const auto available = std::min<std::size_t>(input.size() - consumed, std::numeric_limits<uInt>::max());
            stream.next_in = const_cast<Bytef*>(input.data() + consumed);
            stream.avail_in = static_cast<uInt>(available);
            consumed += available;
        }

        stream.next_out = chunk;
        stream.avail_out = static_cast<uInt>(kChunkSize);

        status = inflate(&stream, Z_NO_FLUSH);
        if (status != Z_OK && status != Z_STREAM_END) {
            const auto message = zlibMessage(stream, status);
            inflateEnd(&stream);
            throw CompressionError("Failed to decompress payload: " + message);
        }

        output.insert(output.end(), chunk, chunk + (kChunkSize - stream.avail_out));

        if (status == Z_OK && stream.avail_in == 0U && consumed == input.size() && stream.avail_out != 0U) {
            inflateEnd(&stream);
            throw CompressionError("Failed to decompress payload: truncated stream");
        }
    } while (status != Z_STREAM_END);

    const bool trailing = stream.avail_in != 0U || consumed != input.size();
    inflateEnd(&stream);

    if (trailing) {
        throw CompressionError("Failed to decompress payload: trailing bytes after end of stream");
    }
    return output;
}

} // namespace blobkit::compression
