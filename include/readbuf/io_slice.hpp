#pragma once
////////////////////////////////////////////////////////////////////////////////
// Vectored I/O descriptors
//
// IoSliceMut and UninitIoSlice both wrap a single `struct iovec` and nothing
// else, so an array of either can be handed to readv(2) as-is. They differ
// only in what the library lets you do with the bytes they point at.
////////////////////////////////////////////////////////////////////////////////

#include <cstddef>
#include <span>
#include <type_traits>

#include <sys/uio.h>

#include "readbuf/uninit.hpp"

namespace readbuf
{

/// @brief An iovec over initialized, writable bytes.
class IoSliceMut
{
    iovec iov_;

public:
    explicit IoSliceMut(std::span<std::byte> buf) : iov_{.iov_base = buf.data(), .iov_len = buf.size()} {}

    [[nodiscard]] size_t Len() const { return iov_.iov_len; }

    [[nodiscard]] std::span<std::byte> Span() const { return {static_cast<std::byte*>(iov_.iov_base), iov_.iov_len}; }
};

/// @brief An iovec over possibly-uninitialized bytes.
///
/// Same layout and ABI as `struct iovec` (and IoSliceMut), which is the whole
/// reason it exists: a span of them goes to readv(2) without being copied.
class UninitIoSlice
{
    iovec iov_;

public:
    explicit UninitIoSlice(std::span<UninitByte> buf) : iov_{.iov_base = buf.data(), .iov_len = buf.size()} {}

    [[nodiscard]] size_t Len() const { return iov_.iov_len; }

    [[nodiscard]] std::span<UninitByte> AsUninit() const
    {
        return {static_cast<UninitByte*>(iov_.iov_base), iov_.iov_len};
    }
};

static_assert(sizeof(IoSliceMut) == sizeof(iovec) && alignof(IoSliceMut) == alignof(iovec));
static_assert(sizeof(UninitIoSlice) == sizeof(iovec) && alignof(UninitIoSlice) == alignof(iovec));
static_assert(std::is_standard_layout_v<IoSliceMut> && std::is_standard_layout_v<UninitIoSlice>);
static_assert(std::is_trivially_copyable_v<IoSliceMut> && std::is_trivially_copyable_v<UninitIoSlice>);

// Reinterpretations between the descriptor types. Only the buffer types and the
// fd layer call these.
namespace detail
{

inline std::span<UninitIoSlice> AsUninitSlices(std::span<IoSliceMut> bufs)
{
    return {reinterpret_cast<UninitIoSlice*>(bufs.data()), bufs.size()};
}

/// Caller guarantees every byte covered by `bufs` has been written.
inline std::span<IoSliceMut> AssumeInitSlices(std::span<UninitIoSlice> bufs)
{
    return {reinterpret_cast<IoSliceMut*>(bufs.data()), bufs.size()};
}

inline iovec* AsIoVecs(std::span<UninitIoSlice> bufs)
{
    return reinterpret_cast<iovec*>(bufs.data());
}

inline iovec* AsIoVecs(std::span<IoSliceMut> bufs)
{
    return reinterpret_cast<iovec*>(bufs.data());
}

}  // namespace detail

}  // namespace readbuf
