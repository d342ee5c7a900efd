#pragma once

#include <concepts>
#include <cstddef>
#include <memory>
#include <span>
#include <utility>

#include "readbuf/uninit.hpp"

namespace readbuf
{
/**
 * @brief A growable byte array whose unused capacity is never zero-filled.
 *
 * Memory layout:
 * [initialized content | spare capacity (uninitialized)]
 *                      ^Len()                          ^Capacity()
 *
 * Unlike std::vector<std::byte>, the spare capacity is reachable (as
 * UninitByte) so a reader can fill it in place and then move Len() forward.
 *
 * Example usage:
 * ```cpp
 * ByteVec vec;
 * vec.Reserve(4096);
 *
 * auto spare = vec.SpareCapacityMut();
 * ssize_t n = ::read(fd, spare.data(), spare.size());
 * if (n > 0) vec.SetLen(vec.Len() + n);  // only after the bytes were written
 * ```
 */
class ByteVec
{
    std::unique_ptr<UninitByte[]> data_;
    size_t len_ = 0;
    size_t capacity_ = 0;

public:
    ByteVec() = default;

    /// @brief An empty vector with room for at least `capacity` bytes.
    explicit ByteVec(size_t capacity) { Reserve(capacity); }

    ByteVec(ByteVec&& other) noexcept
        : data_(std::move(other.data_)),
          len_(std::exchange(other.len_, 0)),
          capacity_(std::exchange(other.capacity_, 0))
    {
    }
    ByteVec& operator=(ByteVec&& other) noexcept
    {
        if (this != &other)
        {
            data_ = std::move(other.data_);
            len_ = std::exchange(other.len_, 0);
            capacity_ = std::exchange(other.capacity_, 0);
        }
        return *this;
    }

    ByteVec(const ByteVec&) = delete;
    ByteVec& operator=(const ByteVec&) = delete;

    [[nodiscard]] size_t Len() const { return len_; }
    [[nodiscard]] size_t Capacity() const { return capacity_; }
    [[nodiscard]] bool Empty() const { return len_ == 0; }

    /// @brief The initialized content, [0, Len()).
    [[nodiscard]] std::span<std::byte> Span() { return detail::AssumeInit(std::span{data_.get(), len_}); }
    [[nodiscard]] std::span<const std::byte> Span() const
    {
        return detail::AssumeInit(std::span<const UninitByte>{data_.get(), len_});
    }

    /// @brief [Len(), Capacity()) as possibly-uninitialized bytes.
    [[nodiscard]] std::span<const UninitByte> SpareCapacity() const
    {
        return {data_.get() + len_, capacity_ - len_};
    }

    /// @brief [Len(), Capacity()) as possibly-uninitialized bytes, writable.
    [[nodiscard]] std::span<UninitByte> SpareCapacityMut() { return {data_.get() + len_, capacity_ - len_}; }

    /**
     * @brief Ensures room for at least `additional` more bytes past Len().
     *
     * Grows to max(2 * Capacity(), Len() + additional) and copies only the
     * Len() initialized bytes; whatever was written into the old spare
     * capacity is not carried over.
     */
    void Reserve(size_t additional);

    /**
     * @brief Sets the logical length.
     *
     * @warning Every byte in [0, n) must already be initialized.
     * Terminates the process if `n > Capacity()`.
     */
    void SetLen(size_t n);

    void Append(std::span<const std::byte> bytes);

    void Clear() { len_ = 0; }
};

/// @brief What ReadToEnd needs from a growable array.
template <typename T>
concept GrowableBytes = requires(T& v, const T& cv, size_t n) {
    { cv.Len() } -> std::convertible_to<size_t>;
    { cv.Capacity() } -> std::convertible_to<size_t>;
    { v.Reserve(n) };
    { v.SpareCapacityMut() } -> std::same_as<std::span<UninitByte>>;
    { v.SetLen(n) };
};

static_assert(GrowableBytes<ByteVec>);
}  // namespace readbuf
