#pragma once

#include <cstddef>
#include <span>
#include <utility>

#include "readbuf/check.hpp"
#include "readbuf/uninit.hpp"

namespace readbuf
{
/**
 * @brief A borrowed byte region that is initialized incrementally, front to back.
 *
 * Tracks how many leading bytes are known to hold written data. Safe accessors
 * only ever hand out that prefix as `std::byte`; everything past it stays typed
 * as UninitByte. The count only grows.
 *
 * Memory layout:
 * [initialized bytes | possibly-uninitialized bytes]
 *                    ^Initialized()                ^Len()
 *
 * Example usage:
 * ```cpp
 * std::array<UninitByte, 4096> storage;  // not zero-filled
 * auto buf = ReadBuf::Uninit(storage);
 *
 * auto raw = buf.AsUninit();
 * ssize_t n = ::read(fd, raw.data(), raw.size());
 * if (n > 0) buf.AssumeInitialized(n);
 *
 * auto [filled, rest] = buf.AsSlices();
 * ```
 *
 * Does not own the memory; the region must outlive the ReadBuf.
 */
class ReadBuf
{
    std::span<UninitByte> buf_;
    size_t initialized_ = 0;

    ReadBuf(std::span<UninitByte> buf, size_t initialized) : buf_(buf), initialized_(initialized) {}

public:
    /// @brief Wraps a fully initialized region: Initialized() == Len().
    static ReadBuf FromInit(std::span<std::byte> buf) { return {AsUninitBytes(buf), buf.size()}; }

    /// @brief Wraps a region with no known-initialized bytes: Initialized() == 0.
    /// Use AssumeInitialized() if a prefix is already known to be written.
    static ReadBuf Uninit(std::span<UninitByte> buf) { return {buf, 0}; }

    ReadBuf(ReadBuf&& other) noexcept
        : buf_(std::exchange(other.buf_, {})), initialized_(std::exchange(other.initialized_, 0))
    {
    }
    ReadBuf& operator=(ReadBuf&& other) noexcept
    {
        buf_ = std::exchange(other.buf_, {});
        initialized_ = std::exchange(other.initialized_, 0);
        return *this;
    }

    ReadBuf(const ReadBuf&) = delete;
    ReadBuf& operator=(const ReadBuf&) = delete;

    [[nodiscard]] size_t Len() const { return buf_.size(); }

    /// @brief Number of bytes at the start of the region known to be initialized.
    [[nodiscard]] size_t Initialized() const { return initialized_; }

    /**
     * @brief Declares that the first `n` bytes have been written.
     *
     * Never lowers the count: a smaller `n` is a no-op. Terminates the process
     * if `n > Len()`.
     *
     * @warning The caller must really have written those bytes; nothing checks it.
     */
    void AssumeInitialized(size_t n)
    {
        READBUF_CHECK(n <= buf_.size(), "ReadBuf::AssumeInitialized() beyond buffer length");
        if (n > initialized_)
        {
            initialized_ = n;
        }
    }

    /**
     * @brief The whole region as possibly-uninitialized bytes, for handing to a syscall.
     * @warning Writing indeterminate data over bytes below Initialized() breaks the invariant.
     */
    [[nodiscard]] std::span<UninitByte> AsUninit() const { return buf_; }

    /**
     * @brief Splits the region at Initialized().
     * @return {initialized prefix, remaining tail}; adjacent, together covering Len() bytes.
     */
    [[nodiscard]] std::pair<std::span<std::byte>, std::span<UninitByte>> AsSlices() const
    {
        return {detail::AssumeInit(buf_.first(initialized_)), buf_.subspan(initialized_)};
    }

    /// @brief The whole region, zero-filling whatever is not yet initialized.
    std::span<std::byte> AsInit() { return AsInitTo(buf_.size()); }

    /**
     * @brief The first `len` bytes, zero-filling [Initialized(), len) if needed.
     *
     * Expensive only the first time a byte is covered; already-initialized
     * bytes are never rewritten.
     *
     * Terminates the process if `len > Len()`.
     */
    std::span<std::byte> AsInitTo(size_t len);
};
}  // namespace readbuf
