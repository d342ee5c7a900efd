#pragma once
// tests/readbuf/test_helpers.hpp
// Common test utilities for readbuf tests

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <deque>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <variant>
#include <vector>

#include <fcntl.h>
#include <unistd.h>

#include "readbuf/fd.hpp"
#include "readbuf/read.hpp"

namespace readbuf::test
{

// -----------------------------------------------------------------------------
// File descriptor utilities
// -----------------------------------------------------------------------------

/// Creates a temporary file (unlinked, so it disappears on close)
inline File MakeTempFile()
{
    char path[] = "/tmp/readbuf_testXXXXXX";
    int fd = ::mkstemp(path);
    if (fd >= 0)
    {
        ::unlink(path);
    }
    return File{fd};
}

/// Creates a temporary file with initial content, positioned at offset 0
inline File MakeTempFileWithContent(std::span<const std::byte> content)
{
    File file = MakeTempFile();
    if (file.IsValid() && !content.empty())
    {
        [[maybe_unused]] auto written = ::write(file.Get(), content.data(), content.size());
        ::lseek(file.Get(), 0, SEEK_SET);
    }
    return file;
}

// -----------------------------------------------------------------------------
// Data utilities
// -----------------------------------------------------------------------------

/// Convert string to byte span
inline std::span<const std::byte> AsBytes(std::string_view sv)
{
    return {reinterpret_cast<const std::byte*>(sv.data()), sv.size()};
}

/// Convert byte span to string
inline std::string AsString(std::span<const std::byte> bytes)
{
    return {reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

inline bool SpansEqual(std::span<const std::byte> a, std::span<const std::byte> b)
{
    if (a.size() != b.size()) return false;
    return a.empty() || std::memcmp(a.data(), b.data(), a.size()) == 0;
}

inline bool AllEqual(std::span<const std::byte> bytes, std::byte value)
{
    for (const auto b : bytes)
    {
        if (b != value) return false;
    }
    return true;
}

/// Generate deterministic test data
inline std::vector<std::byte> GenerateTestData(size_t size, uint8_t seed = 0)
{
    std::vector<std::byte> data(size);
    for (size_t i = 0; i < size; ++i)
    {
        data[i] = std::byte{static_cast<uint8_t>((i + seed) & 0xFF)};
    }
    return data;
}

// -----------------------------------------------------------------------------
// Scripted reader / recording writer
// -----------------------------------------------------------------------------

/// Returns one scripted step per read call: a chunk of bytes (clipped to the
/// buffer) or an error. Once the script is exhausted every read returns 0.
/// Only Read() is implemented, so the buffer paths go through the Reader defaults.
class ScriptedReader : public Reader
{
public:
    using Step = std::variant<std::vector<std::byte>, std::error_code>;

    ScriptedReader() = default;

    ScriptedReader& Chunk(std::vector<std::byte> bytes)
    {
        steps_.emplace_back(std::move(bytes));
        return *this;
    }

    ScriptedReader& Chunk(size_t n, std::byte fill)
    {
        return Chunk(std::vector<std::byte>(n, fill));
    }

    ScriptedReader& Fail(std::error_code ec)
    {
        steps_.emplace_back(ec);
        return *this;
    }

    Result<size_t> Read(std::span<std::byte> buf) override
    {
        ++calls_;
        if (steps_.empty())
        {
            return 0;
        }

        Step step = std::move(steps_.front());
        steps_.pop_front();

        if (auto* ec = std::get_if<std::error_code>(&step))
        {
            return std::unexpected(*ec);
        }

        auto& bytes = std::get<std::vector<std::byte>>(step);
        const size_t n = std::min(buf.size(), bytes.size());
        if (n > 0)
        {
            std::memcpy(buf.data(), bytes.data(), n);
        }
        if (n < bytes.size())
        {
            // Put the rest back for the next call.
            steps_.emplace_front(std::vector<std::byte>(bytes.begin() + static_cast<std::ptrdiff_t>(n), bytes.end()));
        }
        return n;
    }

    [[nodiscard]] size_t Calls() const { return calls_; }

private:
    std::deque<Step> steps_;
    size_t calls_ = 0;
};

/// Same script, but fills ReadBuf's uninitialized memory directly and only
/// declares what it wrote, like a syscall-backed source.
class ScriptedUninitReader : public ScriptedReader
{
public:
    Result<size_t> ReadIntoBuf(ReadBuf& buf) override
    {
        const auto raw = buf.AsUninit();
        auto n = Read(detail::AssumeInit(raw));  // only the bytes Read() reports get written
        if (n)
        {
            buf.AssumeInitialized(*n);
        }
        return n;
    }
};

/// Records every Write() call. Optionally accepts at most `max_chunk` bytes per
/// call, and fails the `fail_on`-th call (1-based) with `error`.
class RecordingWriter : public Writer
{
public:
    size_t max_chunk = SIZE_MAX;
    size_t fail_on = 0;
    std::error_code error = std::make_error_code(std::errc::broken_pipe);
    bool accept_zero = false;

    Result<size_t> Write(std::span<const std::byte> data) override
    {
        ++calls_;
        if (fail_on != 0 && calls_ == fail_on)
        {
            return std::unexpected(error);
        }
        if (accept_zero)
        {
            return 0;
        }
        const size_t n = std::min(max_chunk, data.size());
        writes_.emplace_back(data.begin(), data.begin() + static_cast<std::ptrdiff_t>(n));
        bytes_.insert(bytes_.end(), data.begin(), data.begin() + static_cast<std::ptrdiff_t>(n));
        return n;
    }

    [[nodiscard]] const std::vector<std::vector<std::byte>>& Writes() const { return writes_; }
    [[nodiscard]] const std::vector<std::byte>& Bytes() const { return bytes_; }
    [[nodiscard]] size_t Calls() const { return calls_; }

private:
    std::vector<std::vector<std::byte>> writes_;
    std::vector<std::byte> bytes_;
    size_t calls_ = 0;
};

}  // namespace readbuf::test
