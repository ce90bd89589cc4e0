#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace blobkit::integrity {

inline constexpr std::size_t kDigestHexLength = 64;

// Lowercase hex SHA-256 of data.
std::string sha256Hex(const std::vector<std::uint8_t>& data);

} // namespace blobkit::integrity
