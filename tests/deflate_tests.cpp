#include "compression/deflate.hpp"
#include "core/errors.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

std::vector<std::uint8_t> toBytes(const std::string& text)
{
    return std::vector<std::uint8_t>(text.begin(), text.end());
}

std::vector<std::uint8_t> repetitivePayload()
{
    std::string text;
    for (int line = 0; line < 2000; ++line) {
        text += "line " + std::to_string(line % 17) + ": the quick brown fox jumps over the lazy dog\n";
    }
    return toBytes(text);
}

} // namespace

TEST(DeflateTest, CompressAndDecompress)
{
    const auto payload = repetitivePayload();

    for (int level = blobkit::compression::kMinCompressionLevel; level <= blobkit::compression::kMaxCompressionLevel; ++level) {
        const auto compressed = blobkit::compression::compress(payload, level);
        EXPECT_EQ(blobkit::compression::decompress(compressed, payload.size()), payload) << "level " << level;
    }

    EXPECT_LT(blobkit::compression::compress(payload).size(), payload.size());
}

TEST(DeflateTest, OutputIsDeterministicPerLevel)
{
    const auto payload = repetitivePayload();
    EXPECT_EQ(blobkit::compression::compress(payload, 6), blobkit::compression::compress(payload, 6));
    EXPECT_EQ(blobkit::compression::compress(payload, 9), blobkit::compression::compress(payload, 9));
}

TEST(DeflateTest, EmptyInputRoundTrips)
{
    const std::vector<std::uint8_t> empty;
    const auto compressed = blobkit::compression::compress(empty);
    EXPECT_FALSE(compressed.empty());
    EXPECT_TRUE(blobkit::compression::decompress(compressed).empty());
}

TEST(DeflateTest, RejectsOutOfRangeLevel)
{
    const auto payload = toBytes("abc");
    EXPECT_THROW(blobkit::compression::compress(payload, -1), std::invalid_argument);
    EXPECT_THROW(blobkit::compression::compress(payload, 10), std::invalid_argument);
}

TEST(DeflateTest, MalformedInputThrowsCompressionError)
{
    EXPECT_THROW(blobkit::compression::decompress({}), blobkit::CompressionError);
    EXPECT_THROW(blobkit::compression::decompress(toBytes("definitely not zlib")), blobkit::CompressionError);

    const auto compressed = blobkit::compression::compress(repetitivePayload());
    const std::vector<std::uint8_t> truncated(compressed.begin(), compressed.begin() + compressed.size() / 2);
    EXPECT_THROW(blobkit::compression::decompress(truncated), blobkit::CompressionError);

    auto trailing = compressed;
    trailing.push_back(0x42);
    EXPECT_THROW(blobkit::compression::decompress(trailing), blobkit::CompressionError);
}

TEST(DeflateTest, OversizedExpectedSizeIsOnlyAHint)
{
    const auto payload = repetitivePayload();
    const auto compressed = blobkit::compression::compress(payload);
    EXPECT_EQ(blobkit::compression::decompress(compressed, std::numeric_limits<std::size_t>::max()), payload);
    EXPECT_EQ(blobkit::compression::decompress(compressed, 1), payload);
}
