#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace blobkit::container {

enum class ContainerKind {
    Application,
    Binary,
    UserData
};

inline constexpr std::size_t kMagicSize = 8;
inline constexpr std::uint16_t kFormatVersion = 1;

// 8-byte tag at offset 0 of every container of this kind.
const char* magicTag(ContainerKind kind) noexcept;

// "applications", "binaries", "userdata": the index's blob_type.
const char* blobTypeName(ContainerKind kind) noexcept;

// "apps", "binaries", "users": the index member holding the entries.
const char* collectionName(ContainerKind kind) noexcept;

std::string kindName(ContainerKind kind);
std::optional<ContainerKind> kindFromMagic(const char* magic) noexcept;

} // namespace blobkit::container
