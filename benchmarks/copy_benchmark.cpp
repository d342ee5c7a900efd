// benchmarks/copy_benchmark.cpp
// Copy() over a fresh uninitialized buffer vs. a loop that zero-fills its buffer on every read.

#include <algorithm>
#include <array>
#include <cstring>

#include <benchmark/benchmark.h>
#include <spdlog/spdlog.h>

#include "readbuf/byte_vec.hpp"
#include "readbuf/read.hpp"

using namespace readbuf;

namespace
{
/// Never-ending source that fills whatever it is handed with one byte value.
class PatternReader final : public Reader
{
public:
    explicit PatternReader(size_t total) : remaining_(total) {}

    Result<size_t> Read(std::span<std::byte> buf) override
    {
        const size_t n = std::min(buf.size(), remaining_);
        std::memset(buf.data(), 'k', n);
        remaining_ -= n;
        return n;
    }

    Result<size_t> ReadIntoBuf(ReadBuf& buf) override
    {
        const auto raw = buf.AsUninit();
        const size_t n = std::min(raw.size(), remaining_);
        std::memset(raw.data(), 'k', n);
        remaining_ -= n;
        buf.AssumeInitialized(n);
        return n;
    }

private:
    size_t remaining_;
};

class NullWriter final : public Writer
{
public:
    Result<size_t> Write(std::span<const std::byte> data) override
    {
        benchmark::DoNotOptimize(data.data());
        return data.size();
    }
};

Result<uint64_t> ZeroFillingCopy(Reader& reader, Writer& writer)
{
    std::array<std::byte, kCopyBufferSize> buf;
    uint64_t len = 0;
    while (true)
    {
        buf.fill(std::byte{0});
        const size_t n = READBUF_TRY(reader.Read(buf));
        if (n == 0)
            return len;
        len += n;
        READBUF_TRY(writer.WriteAll(std::span(buf).first(n)));
    }
}
}  // namespace

static void BM_CopyUninit(benchmark::State& state)
{
    const auto total = static_cast<size_t>(state.range(0));
    for (auto _ : state)
    {
        PatternReader reader(total);
        NullWriter writer;
        auto copied = Copy(reader, writer);
        if (!copied)
        {
            spdlog::error("copy failed: {}", copied.error().message());
            state.SkipWithError("copy failed");
            break;
        }
        benchmark::DoNotOptimize(*copied);
    }
    state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(total));
}
BENCHMARK(BM_CopyUninit)->Range(4 << 10, 16 << 20);

static void BM_CopyZeroFill(benchmark::State& state)
{
    const auto total = static_cast<size_t>(state.range(0));
    for (auto _ : state)
    {
        PatternReader reader(total);
        NullWriter writer;
        auto copied = ZeroFillingCopy(reader, writer);
        if (!copied)
        {
            spdlog::error("copy failed: {}", copied.error().message());
            state.SkipWithError("copy failed");
            break;
        }
        benchmark::DoNotOptimize(*copied);
    }
    state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(total));
}
BENCHMARK(BM_CopyZeroFill)->Range(4 << 10, 16 << 20);

static void BM_ReadToEnd(benchmark::State& state)
{
    const auto total = static_cast<size_t>(state.range(0));
    for (auto _ : state)
    {
        PatternReader reader(total);
        ByteVec out;
        auto n = reader.ReadToEnd(out);
        if (!n)
        {
            state.SkipWithError("read_to_end failed");
            break;
        }
        benchmark::DoNotOptimize(out.Span().data());
    }
    state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(total));
}
BENCHMARK(BM_ReadToEnd)->Range(4 << 10, 16 << 20);

BENCHMARK_MAIN();
