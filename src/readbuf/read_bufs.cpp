#include "readbuf/read_bufs.hpp"

#include <cstring>

#include "readbuf/check.hpp"

namespace readbuf
{
namespace
{
size_t SumLen(std::span<const UninitIoSlice> bufs)
{
    size_t total = 0;
    for (const auto& buf : bufs)
    {
        total += buf.Len();
    }
    return total;
}
}  // namespace

ReadBufs ReadBufs::FromInit(std::span<IoSliceMut> bufs)
{
    auto uninit = detail::AsUninitSlices(bufs);
    return {uninit, SumLen(uninit)};
}

size_t ReadBufs::TotalLen() const
{
    return SumLen(bufs_);
}

void ReadBufs::AssumeInitialized(size_t n)
{
    READBUF_CHECK(n <= TotalLen(), "ReadBufs::AssumeInitialized() beyond total length");
    if (n > initialized_)
    {
        initialized_ = n;
    }
}

std::pair<std::span<IoSliceMut>, std::span<UninitIoSlice>> ReadBufs::AsSlices() const
{
    size_t remaining = initialized_;
    size_t split = 0;
    for (; split < bufs_.size(); ++split)
    {
        if (remaining < bufs_[split].Len())
        {
            break;
        }
        remaining -= bufs_[split].Len();
    }

    // Walked every slice with bytes left over: the count overshoots the slices.
    READBUF_CHECK(split < bufs_.size() || remaining == 0, "ReadBufs initialized count exceeds total length");

    return {detail::AssumeInitSlices(bufs_.first(split)), bufs_.subspan(split)};
}

std::span<IoSliceMut> ReadBufs::AsInitTo(size_t len)
{
    if (bufs_.empty())
    {
        READBUF_CHECK(len == 0, "ReadBufs::AsInitTo() beyond total length");
        return {};
    }

    size_t seen = 0;
    size_t cutoff = 0;
    for (; cutoff < bufs_.size(); ++cutoff)
    {
        const auto slice = bufs_[cutoff].AsUninit();
        // Zero only the part of this slice past the initialized count.
        if (const size_t from = initialized_ > seen ? initialized_ - seen : 0; from < slice.size())
        {
            std::memset(slice.data() + from, 0, slice.size() - from);
        }
        seen += slice.size();

        if (seen >= len)
        {
            break;
        }
    }

    READBUF_CHECK(cutoff < bufs_.size(), "ReadBufs::AsInitTo() beyond total length");

    AssumeInitialized(seen);
    return detail::AssumeInitSlices(bufs_.first(cutoff + 1));
}
}  // namespace readbuf
