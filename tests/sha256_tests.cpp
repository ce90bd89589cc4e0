#include "integrity/sha256.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <string>
#include <vector>

namespace {

std::string digestOf(const std::string& text)
{
    return blobkit::integrity::sha256Hex(std::vector<std::uint8_t>(text.begin(), text.end()));
}

} // namespace

TEST(Sha256Test, KnownVectors)
{
    EXPECT_EQ(digestOf(""), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    EXPECT_EQ(digestOf("abc"), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    EXPECT_EQ(digestOf("abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq"),
              "248d6a61d20638b8e5c026930c3e6039a33ce45964ff2167f6ecedd419db06c1");
}

TEST(Sha256Test, DigestIsLowercaseHex)
{
    const auto digest = digestOf("The quick brown fox jumps over the lazy dog");
    ASSERT_EQ(digest.size(), blobkit::integrity::kDigestHexLength);
    for (const char ch : digest) {
        EXPECT_TRUE((ch >= '0' && ch <= '9') || (ch >= 'a' && ch <= 'f')) << ch;
    }
    EXPECT_NE(digest, digestOf("The quick brown fox jumps over the lazy cog"));
}
