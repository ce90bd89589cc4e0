#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace blobkit::compression {

inline constexpr int kMinCompressionLevel = 0;
inline constexpr int kMaxCompressionLevel = 9;
inline constexpr int kDefaultCompressionLevel = 6;

// zlib stream format; output is deterministic for a given input and level.
std::vector<std::uint8_t> compress(const std::vector<std::uint8_t>& input, int level = kDefaultCompressionLevel);

// expectedSize only sizes the initial buffer and is clamped to what the input
// could possibly inflate to. Throws CompressionError on a
// malformed, truncated or over-long stream.
std::vector<std::uint8_t> decompress(const std::vector<std::uint8_t>& input, std::size_t expectedSize = 0);

} // namespace blobkit::compression
