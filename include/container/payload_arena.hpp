#pragma once

#include <cstdint>
#include <vector>

namespace blobkit::container {

struct PayloadSlice {
    std::uint64_t offset {0};
    std::uint64_t length {0};
};

// Growable byte arena with a monotonically increasing write cursor. Bytes are
// only ever appended; nothing already written is edited in place.
class PayloadArena {
public:
    PayloadArena() = default;
    explicit PayloadArena(std::vector<std::uint8_t> bytes);

    // Returns the offset the bytes were written at.
    std::uint64_t append(const std::vector<std::uint8_t>& bytes);

    std::vector<std::uint8_t> slice(std::uint64_t offset, std::uint64_t length) const;
    bool contains(const PayloadSlice& slice) const noexcept;

    std::uint64_t size() const noexcept { return static_cast<std::uint64_t>(bytes_.size()); }
    const std::vector<std::uint8_t>& bytes() const noexcept { return bytes_; }

    // Fresh arena holding only the given slices, back to back; relocated[i] is
    // the new offset of slices[i].
    PayloadArena compacted(const std::vector<PayloadSlice>& slices, std::vector<std::uint64_t>& relocated) const;

private:
    std::vector<std::uint8_t> bytes_;
};

} // namespace blobkit::container
