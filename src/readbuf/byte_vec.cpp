#include "readbuf/byte_vec.hpp"

#include <algorithm>
#include <cstring>

#include "readbuf/check.hpp"

namespace readbuf
{
void ByteVec::Reserve(size_t additional)
{
    if (capacity_ - len_ >= additional)
    {
        return;
    }

    const size_t new_capacity = std::max(capacity_ * 2, len_ + additional);
    auto new_data = std::make_unique_for_overwrite<UninitByte[]>(new_capacity);

    if (len_ > 0)
    {
        std::memcpy(new_data.get(), data_.get(), len_);
    }

    data_ = std::move(new_data);
    capacity_ = new_capacity;
}

void ByteVec::SetLen(size_t n)
{
    READBUF_CHECK(n <= capacity_, "ByteVec::SetLen() beyond capacity");
    len_ = n;
}

void ByteVec::Append(std::span<const std::byte> bytes)
{
    if (bytes.empty())
    {
        return;
    }
    Reserve(bytes.size());
    std::memcpy(data_.get() + len_, bytes.data(), bytes.size());
    len_ += bytes.size();
}
}  // namespace readbuf
