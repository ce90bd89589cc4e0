#include "container/payload_arena.hpp"

#include "core/errors.hpp"

#include <cstddef>
#include <string>
#include <utility>

namespace blobkit::container {

PayloadArena::PayloadArena(std::vector<std::uint8_t> bytes)
    : bytes_(std::move(bytes))
{
}

std::uint64_t PayloadArena::append(const std::vector<std::uint8_t>& bytes)
{
    const auto offset = size();
    bytes_.insert(bytes_.end(), bytes.begin(), bytes.end());
    return offset;
}

bool PayloadArena::contains(const PayloadSlice& slice) const noexcept
{
    return slice.offset <= size() && slice.length <= size() - slice.offset;
}

std::vector<std::uint8_t> PayloadArena::slice(std::uint64_t offset, std::uint64_t length) const
{
    if (!contains({offset, length})) {
        throw IntegrityError("Payload slice [" + std::to_string(offset) + ", +" + std::to_string(length)
                             + ") lies outside the " + std::to_string(size()) + "-byte payload region");
    }
    const auto begin = bytes_.begin() + static_cast<std::ptrdiff_t>(offset);
    return std::vector<std::uint8_t>(begin, begin + static_cast<std::ptrdiff_t>(length));
}

PayloadArena PayloadArena::compacted(const std::vector<PayloadSlice>& slices, std::vector<std::uint64_t>& relocated) const
{
    PayloadArena result;
    relocated.clear();
    relocated.reserve(slices.size());
    for (const auto& live : slices) {
        relocated.push_back(result.append(slice(live.offset, live.length)));
    }
    return result;
}

} // namespace blobkit::container
