#pragma once
////////////////////////////////////////////////////////////////////////////////
// Readers and writers over uninitialized buffers
//
// Reader is a blocking byte source. Implementations provide Read(); the
// buffer-taking entry points (ReadIntoBuf, ReadIntoBufs) have portable
// defaults that zero-fill through ReadBuf::AsInit() and are overridden by
// sources that can fill uninitialized memory directly (see FileDesc).
// ReadBufExact, ReadToEnd and Copy are written only against those entry
// points, so they never zero-fill when the source does not need it.
////////////////////////////////////////////////////////////////////////////////

#include <cstddef>
#include <cstdint>
#include <span>

#include "readbuf/byte_vec.hpp"
#include "readbuf/check.hpp"
#include "readbuf/read_buf.hpp"
#include "readbuf/read_bufs.hpp"
#include "readbuf/result.hpp"

namespace readbuf
{

struct ReadToEndOptions
{
    /// Bytes reserved each time the spare capacity runs out. Must be non-zero.
    size_t min_grow = 32;
};

/// Size of the uninitialized stack region Copy() reads into.
constexpr size_t kCopyBufferSize = 4096;

class Reader
{
public:
    virtual ~Reader() = default;

    /// @brief Pulls up to buf.size() bytes. 0 means end of stream.
    virtual Result<size_t> Read(std::span<std::byte> buf) = 0;

    /// @brief Vectored Read(). The default reads into the first non-empty slice only.
    virtual Result<size_t> ReadVectored(std::span<IoSliceMut> bufs);

    /**
     * @brief Read() into a ReadBuf, starting at its beginning.
     *
     * On success the first N bytes of the region hold data and buf.Initialized()
     * is at least N. The default zero-fills the whole region via AsInit() and
     * delegates to Read().
     */
    virtual Result<size_t> ReadIntoBuf(ReadBuf& buf);

    /// @brief ReadVectored() into a ReadBufs. The default delegates over AsInit().
    virtual Result<size_t> ReadIntoBufs(ReadBufs& bufs);

    /**
     * @brief Reads exactly buf.Len() bytes, looping on partial reads.
     *
     * @return Errc::UnexpectedEof if the stream ends first, or the reader's
     *         error (EINTR included) unchanged. Either way the bytes read
     *         before it stay in the buffer and are counted in buf.Initialized().
     */
    Result<> ReadBufExact(ReadBuf& buf);

    /// @brief Appends everything up to end of stream to `buf`.
    /// @return Number of bytes appended by this call. Any read error, EINTR
    ///         included, is returned at once; bytes appended before it stay in `buf`.
    template <GrowableBytes V>
    Result<size_t> ReadToEnd(V& buf, const ReadToEndOptions& options = {});

protected:
    Reader() = default;
    Reader(const Reader&) = default;
    Reader(Reader&&) = default;
    Reader& operator=(const Reader&) = default;
    Reader& operator=(Reader&&) = default;
};

class Writer
{
public:
    virtual ~Writer() = default;

    /// @brief Pushes up to data.size() bytes; may write fewer.
    virtual Result<size_t> Write(std::span<const std::byte> data) = 0;

    virtual Result<> Flush() { return {}; }

    /**
     * @brief Writes all of `data`, looping on partial writes.
     * @return Errc::WriteZero if the sink stops accepting bytes.
     */
    Result<> WriteAll(std::span<const std::byte> data);

protected:
    Writer() = default;
    Writer(const Writer&) = default;
    Writer(Writer&&) = default;
    Writer& operator=(const Writer&) = default;
    Writer& operator=(Writer&&) = default;
};

/// @brief Reads from a borrowed byte span; copies straight into uninitialized memory.
class SliceReader final : public Reader
{
    std::span<const std::byte> data_;

public:
    explicit SliceReader(std::span<const std::byte> data) : data_(data) {}

    [[nodiscard]] size_t Remaining() const { return data_.size(); }

    Result<size_t> Read(std::span<std::byte> buf) override;
    Result<size_t> ReadVectored(std::span<IoSliceMut> bufs) override;
    Result<size_t> ReadIntoBuf(ReadBuf& buf) override;
};

/// @brief Appends everything written to a ByteVec.
class VecWriter final : public Writer
{
    ByteVec& out_;

public:
    explicit VecWriter(ByteVec& out) : out_(out) {}

    Result<size_t> Write(std::span<const std::byte> data) override;
};

/**
 * @brief Moves everything from `reader` to `writer` until end of stream.
 *
 * Reads into a kCopyBufferSize stack region that is never zero-filled when
 * the reader overrides ReadIntoBuf().
 *
 * @return Total bytes copied. A failed write is returned as-is; the count
 *         copied before it is not reported.
 */
Result<uint64_t> Copy(Reader& reader, Writer& writer);

// -----------------------------------------------------------------------------
// Template implementation
// -----------------------------------------------------------------------------

template <GrowableBytes V>
Result<size_t> Reader::ReadToEnd(V& buf, const ReadToEndOptions& options)
{
    READBUF_CHECK(options.min_grow > 0, "ReadToEndOptions::min_grow must be non-zero");
    const size_t initial_len = buf.Len();

    // Bytes past Len() initialized by an earlier over-read; they are reused, not re-zeroed.
    size_t initialized = 0;
    while (true)
    {
        if (buf.Len() == buf.Capacity())
        {
            buf.Reserve(options.min_grow);
        }

        auto read_buf = ReadBuf::Uninit(buf.SpareCapacityMut());
        read_buf.AssumeInitialized(initialized);

        auto nread = ReadIntoBuf(read_buf);
        if (!nread)
        {
            return std::unexpected(nread.error());
        }

        if (*nread == 0)
        {
            return buf.Len() - initial_len;
        }

        READBUF_CHECK(*nread <= read_buf.Initialized(), "reader reported more bytes than it initialized");

        initialized = read_buf.Initialized() - *nread;
        buf.SetLen(buf.Len() + *nread);
    }
}

}  // namespace readbuf
