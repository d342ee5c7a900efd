#include "readbuf/read.hpp"

#include <algorithm>
#include <array>
#include <cstring>

#include "readbuf/logger.hpp"

namespace readbuf
{

// ----------------------------------------------------------------------------
// Reader defaults
// ----------------------------------------------------------------------------

Result<size_t> Reader::ReadVectored(std::span<IoSliceMut> bufs)
{
    const auto it = std::ranges::find_if(bufs, [](const IoSliceMut& b) { return b.Len() > 0; });
    if (it == bufs.end())
    {
        return Read({});
    }
    return Read(it->Span());
}

Result<size_t> Reader::ReadIntoBuf(ReadBuf& buf)
{
    return Read(buf.AsInit());
}

Result<size_t> Reader::ReadIntoBufs(ReadBufs& bufs)
{
    return ReadVectored(bufs.AsInit());
}

Result<> Reader::ReadBufExact(ReadBuf& buf)
{
    size_t base = 0;
    while (buf.Len() > base)
    {
        // The reader sees only the unread tail; carry over what is already initialized in it.
        READBUF_CHECK(buf.Initialized() >= base, "ReadBuf initialized count behind bytes read");
        auto tail = ReadBuf::Uninit(buf.AsUninit().subspan(base));
        tail.AssumeInitialized(buf.Initialized() - base);

        auto nread = ReadIntoBuf(tail);
        if (!nread)
        {
            buf.AssumeInitialized(base + tail.Initialized());
            return std::unexpected(nread.error());
        }

        if (*nread == 0)
        {
            return Error(Errc::UnexpectedEof);
        }

        READBUF_CHECK(*nread <= tail.Initialized(), "reader reported more bytes than it initialized");

        buf.AssumeInitialized(base + tail.Initialized());
        base += *nread;
    }

    return {};
}

// ----------------------------------------------------------------------------
// Writer
// ----------------------------------------------------------------------------

Result<> Writer::WriteAll(std::span<const std::byte> data)
{
    while (!data.empty())
    {
        auto written = Write(data);
        if (!written)
        {
            if (IsInterrupted(written.error()))
            {
                continue;
            }
            return std::unexpected(written.error());
        }

        if (*written == 0)
        {
            return Error(Errc::WriteZero);
        }

        data = data.subspan(*written);
    }
    return {};
}

// ----------------------------------------------------------------------------
// In-memory implementations
// ----------------------------------------------------------------------------

Result<size_t> SliceReader::Read(std::span<std::byte> buf)
{
    const size_t n = std::min(buf.size(), data_.size());
    if (n > 0)
    {
        std::memcpy(buf.data(), data_.data(), n);
    }
    data_ = data_.subspan(n);
    return n;
}

Result<size_t> SliceReader::ReadVectored(std::span<IoSliceMut> bufs)
{
    size_t total = 0;
    for (const auto& buf : bufs)
    {
        if (data_.empty())
        {
            break;
        }
        total += READBUF_TRY(Read(buf.Span()));
    }
    return total;
}

Result<size_t> SliceReader::ReadIntoBuf(ReadBuf& buf)
{
    const auto raw = buf.AsUninit();
    const size_t n = std::min(raw.size(), data_.size());
    if (n > 0)
    {
        std::memcpy(raw.data(), data_.data(), n);
    }
    data_ = data_.subspan(n);
    buf.AssumeInitialized(n);
    return n;
}

Result<size_t> VecWriter::Write(std::span<const std::byte> data)
{
    out_.Append(data);
    return data.size();
}

// ----------------------------------------------------------------------------
// Copy
// ----------------------------------------------------------------------------

Result<uint64_t> Copy(Reader& reader, Writer& writer)
{
    std::array<UninitByte, kCopyBufferSize> storage;  // left uninitialized
    auto buf = ReadBuf::Uninit(storage);
    uint64_t len = 0;

    while (true)
    {
        auto nread = reader.ReadIntoBuf(buf);
        if (!nread)
        {
            READBUF_LOG_DEBUG("copy: read failed after {} bytes: {}", len, nread.error().message());
            return std::unexpected(nread.error());
        }

        if (*nread == 0)
        {
            READBUF_LOG_DEBUG("copy: end of stream after {} bytes", len);
            return len;
        }

        READBUF_CHECK(*nread <= buf.Initialized(), "reader reported more bytes than it initialized");

        len += *nread;
        READBUF_TRY(writer.WriteAll(buf.AsSlices().first.first(*nread)));
    }
}

}  // namespace readbuf
