#include "container/container_kind.hpp"

#include <array>
#include <cstring>

namespace blobkit::container {
namespace {

constexpr std::array<ContainerKind, 3> kAllKinds = {
    ContainerKind::Application,
    ContainerKind::Binary,
    ContainerKind::UserData,
};

} // namespace

const char* magicTag(ContainerKind kind) noexcept
{
    switch (kind) {
    case ContainerKind::Application: return "APPBLOB1";
    case ContainerKind::Binary: return "BINBLOB1";
    case ContainerKind::UserData: return "USERBLOB";
    }
    return "";
}

const char* blobTypeName(ContainerKind kind) noexcept
{
    switch (kind) {
    case ContainerKind::Application: return "applications";
    case ContainerKind::Binary: return "binaries";
    case ContainerKind::UserData: return "userdata";
    }
    return "";
}

const char* collectionName(ContainerKind kind) noexcept
{
    switch (kind) {
    case ContainerKind::Application: return "apps";
    case ContainerKind::Binary: return "binaries";
    case ContainerKind::UserData: return "users";
    }
    return "";
}

std::string kindName(ContainerKind kind)
{
    switch (kind) {
    case ContainerKind::Application: return "application catalog";
    case ContainerKind::Binary: return "binary catalog";
    case ContainerKind::UserData: return "user data store";
    }
    return "unknown";
}

std::optional<ContainerKind> kindFromMagic(const char* magic) noexcept
{
    for (const auto kind : kAllKinds) {
        if (std::memcmp(magic, magicTag(kind), kMagicSize) == 0) {
            return kind;
        }
    }
    return std::nullopt;
}

} // namespace blobkit::container
