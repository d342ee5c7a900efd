#pragma once
////////////////////////////////////////////////////////////////////////////////
// Possibly-uninitialized bytes
//
// UninitByte is the element type of every "may not be initialized yet" view
// in the library. It is trivial, so `std::array<UninitByte, N> buf;` and
// `make_unique_for_overwrite<UninitByte[]>(n)` leave the storage untouched.
// Reading one through `.value` before it was written is undefined behaviour;
// only ReadBuf / ReadBufs decide when a prefix may be viewed as std::byte.
////////////////////////////////////////////////////////////////////////////////

#include <cstddef>
#include <span>
#include <type_traits>

namespace readbuf
{

struct UninitByte
{
    std::byte value;
};

static_assert(sizeof(UninitByte) == 1 && alignof(UninitByte) == 1);
static_assert(std::is_trivial_v<UninitByte> && std::is_standard_layout_v<UninitByte>);

/// @brief Views initialized bytes as possibly-uninitialized ones. Always safe.
inline std::span<UninitByte> AsUninitBytes(std::span<std::byte> bytes)
{
    return {reinterpret_cast<UninitByte*>(bytes.data()), bytes.size()};
}

namespace detail
{

/// Caller guarantees every byte of `bytes` has been written.
inline std::span<std::byte> AssumeInit(std::span<UninitByte> bytes)
{
    return {reinterpret_cast<std::byte*>(bytes.data()), bytes.size()};
}

inline std::span<const std::byte> AssumeInit(std::span<const UninitByte> bytes)
{
    return {reinterpret_cast<const std::byte*>(bytes.data()), bytes.size()};
}

}  // namespace detail

}  // namespace readbuf
