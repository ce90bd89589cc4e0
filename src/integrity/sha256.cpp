#include "integrity/sha256.hpp"

#include <openssl/evp.h>

#include <memory>
#include <stdexcept>

namespace blobkit::integrity {
namespace {

struct DigestContextDeleter {
    void operator()(EVP_MD_CTX* context) const noexcept { EVP_MD_CTX_free(context); }
};

using DigestContext = std::unique_ptr<EVP_MD_CTX, DigestContextDeleter>;

std::string toHex(const unsigned char* digest, unsigned int length)
{
    static constexpr char kHexDigits[] = "0123456789abcdef";

    std::string hex;
    hex.reserve(static_cast<std::size_t>(length) * 2U);
    for (unsigned int index = 0; index < length; ++index) {
        hex.push_back(kHexDigits[(digest[index] >> 4U) & 0x0FU]);
        hex.push_back(kHexDigits[digest[index] & 0x0FU]);
    }
    return hex;
}

} // namespace

std::string sha256Hex(const std::vector<std::uint8_t>& data)
{
    DigestContext context(EVP_MD_CTX_new());
    if (!context) {
        throw std::runtime_error("Failed to allocate digest context");
    }

    if (EVP_DigestInit_ex(context.get(), EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("Failed to initialise SHA-256 digest");
    }
    if (!data.empty() && EVP_DigestUpdate(context.get(), data.data(), data.size()) != 1) {
        throw std::runtime_error("Failed to update SHA-256 digest");
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(context.get(), digest, &length) != 1) {
        throw std::runtime_error("Failed to finalise SHA-256 digest");
    }

    return toHex(digest, length);
}

} // namespace blobkit::integrity
