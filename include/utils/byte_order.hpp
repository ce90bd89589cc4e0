#pragma once

#include <cstddef>
#include <cstdint>
#include <istream>
#include <ostream>
#include <stdexcept>
#include <type_traits>
#include <vector>

namespace blobkit::utils {

// All multi-byte integers on disk are little-endian regardless of host order.

template <class T>
void writeLittleEndian(std::ostream& output, T value)
{
    static_assert(std::is_unsigned_v<T>, "writeLittleEndian expects an unsigned integer");

    char bytes[sizeof(T)];
    for (std::size_t index = 0; index < sizeof(T); ++index) {
        bytes[index] = static_cast<char>((value >> (8U * index)) & 0xFFU);
    }
    output.write(bytes, sizeof(T));
    if (!output) {
        throw std::runtime_error("Failed to write binary value");
    }
}

template <class T>
void appendLittleEndian(std::vector<std::uint8_t>& output, T value)
{
    static_assert(std::is_unsigned_v<T>, "appendLittleEndian expects an unsigned integer");

    for (std::size_t index = 0; index < sizeof(T); ++index) {
        output.push_back(static_cast<std::uint8_t>((value >> (8U * index)) & 0xFFU));
    }
}

// Returns false when the stream ends before sizeof(T) bytes were read.
template <class T>
bool readLittleEndian(std::istream& input, T& value)
{
    static_assert(std::is_unsigned_v<T>, "readLittleEndian expects an unsigned integer");

    unsigned char bytes[sizeof(T)];
    input.read(reinterpret_cast<char*>(bytes), sizeof(T));
    if (input.gcount() != static_cast<std::streamsize>(sizeof(T))) {
        return false;
    }

    T result {0};
    for (std::size_t index = 0; index < sizeof(T); ++index) {
        result = static_cast<T>(result | (static_cast<T>(bytes[index]) << (8U * index)));
    }
    value = result;
    return true;
}

// Cursor-based variant for in-memory buffers; returns false on underflow.
template <class T>
bool readLittleEndian(const std::vector<std::uint8_t>& input, std::size_t& cursor, T& value)
{
    static_assert(std::is_unsigned_v<T>, "readLittleEndian expects an unsigned integer");

    if (cursor > input.size() || input.size() - cursor < sizeof(T)) {
        return false;
    }

    T result {0};
    for (std::size_t index = 0; index < sizeof(T); ++index) {
        result = static_cast<T>(result | (static_cast<T>(input[cursor + index]) << (8U * index)));
    }
    cursor += sizeof(T);
    value = result;
    return true;
}

} // namespace blobkit::utils
