#pragma once

#include <cstddef>
#include <span>
#include <utility>

#include "readbuf/io_slice.hpp"

namespace readbuf
{
/**
 * @brief A borrowed sequence of regions, initialized incrementally as one stream.
 *
 * The initialized count is a cumulative offset: walk the slices in order and
 * that many leading bytes across all of them are known to be written. Slices
 * are never handed out half-initialized: AsSlices() leaves a partially covered
 * slice on the uninitialized side, and AsInitTo() rounds up to the end of the
 * slice it stops in.
 *
 * @code
 *   std::array<UninitByte, 16> head;
 *   std::array<UninitByte, 4096> body;
 *   std::array slices{UninitIoSlice{head}, UninitIoSlice{body}};
 *   auto bufs = ReadBufs::Uninit(slices);
 *   auto n = socket.ReadIntoBufs(bufs);  // one readv(2), no zero-fill
 * @endcode
 */
class ReadBufs
{
    std::span<UninitIoSlice> bufs_;
    size_t initialized_ = 0;

    ReadBufs(std::span<UninitIoSlice> bufs, size_t initialized) : bufs_(bufs), initialized_(initialized) {}

public:
    /// @brief Wraps fully initialized slices: Initialized() == TotalLen().
    static ReadBufs FromInit(std::span<IoSliceMut> bufs);

    /// @brief Wraps slices with no known-initialized bytes: Initialized() == 0.
    static ReadBufs Uninit(std::span<UninitIoSlice> bufs) { return {bufs, 0}; }

    ReadBufs(ReadBufs&& other) noexcept
        : bufs_(std::exchange(other.bufs_, {})), initialized_(std::exchange(other.initialized_, 0))
    {
    }
    ReadBufs& operator=(ReadBufs&& other) noexcept
    {
        bufs_ = std::exchange(other.bufs_, {});
        initialized_ = std::exchange(other.initialized_, 0);
        return *this;
    }

    ReadBufs(const ReadBufs&) = delete;
    ReadBufs& operator=(const ReadBufs&) = delete;

    /// @brief Number of slices (not bytes).
    [[nodiscard]] size_t Count() const { return bufs_.size(); }

    /// @brief Sum of all slice lengths.
    [[nodiscard]] size_t TotalLen() const;

    [[nodiscard]] size_t Initialized() const { return initialized_; }

    /// @brief Declares the first `n` bytes (across slices) written. Never lowers the count.
    /// @warning The caller must really have written those bytes.
    void AssumeInitialized(size_t n);

    /// @warning Writing indeterminate data over initialized bytes breaks the invariant.
    [[nodiscard]] std::span<UninitIoSlice> AsUninit() const { return bufs_; }

    /**
     * @brief Splits the slices at the initialized count.
     *
     * A slice the count lands strictly inside goes to the second half, so the
     * first half may under-report how much is initialized.
     */
    [[nodiscard]] std::pair<std::span<IoSliceMut>, std::span<UninitIoSlice>> AsSlices() const;

    /// @brief All slices, zero-filling anything not yet initialized.
    std::span<IoSliceMut> AsInit() { return AsInitTo(TotalLen()); }

    /**
     * @brief The leading slices that hold at least `len` bytes, initializing as needed.
     *
     * Rounds up to a slice boundary: stops at the first slice whose cumulative
     * end reaches `len`, zero-fills the uninitialized part of every slice up to
     * and including it, and raises Initialized() to the bytes those slices
     * cover. The result can hold more than `len` bytes, never fewer.
     *
     * Terminates the process if `len > TotalLen()`.
     */
    std::span<IoSliceMut> AsInitTo(size_t len);
};
}  // namespace readbuf
