#pragma once

#include <libveil/zkp/Types.h>

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <type_traits>

namespace veil {
namespace zkp {

// Fixed-width little-endian fields for account layouts and operation
// payloads. Readers assume the caller has checked the buffer length.

template <class Integer>
void
putLE(std::uint8_t* dest, Integer value)
{
    using U = std::make_unsigned_t<Integer>;
    auto const v = static_cast<U>(value);
    for (std::size_t i = 0; i < sizeof(Integer); ++i)
        dest[i] = static_cast<std::uint8_t>((v >> (i * 8)) & 0xFF);
}

template <class Integer>
Integer
getLE(std::uint8_t const* src)
{
    using U = std::make_unsigned_t<Integer>;
    U v = 0;
    for (std::size_t i = 0; i < sizeof(Integer); ++i)
        v |= static_cast<U>(src[i]) << (i * 8);
    return static_cast<Integer>(v);
}

template <class Integer>
void
appendLE(Blob& out, Integer value)
{
    std::uint8_t bytes[sizeof(Integer)];
    putLE(bytes, value);
    out.insert(out.end(), bytes, bytes + sizeof(Integer));
}

inline void
putHash(std::uint8_t* dest, uint256 const& value)
{
    std::memcpy(dest, value.data(), uint256::bytes);
}

inline uint256
getHash(std::uint8_t const* src)
{
    uint256 value;
    std::memcpy(value.data(), src, uint256::bytes);
    return value;
}

} // namespace zkp
} // namespace veil
