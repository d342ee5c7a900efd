// examples/readbuf/01_file_copy.cpp
// Demonstrates: File::Open, Copy, ReadToEnd + WriteAll, Result handling
//
//   readbuf_copy --src=in.bin --dst=out.bin
//   cat in.bin | readbuf_copy --src=- --dst=- --mode=slurp > out.bin

#include <fcntl.h>

#include <gflags/gflags.h>

#include "readbuf/byte_vec.hpp"
#include "readbuf/fd.hpp"
#include "readbuf/logger.hpp"
#include "readbuf/read.hpp"

DEFINE_string(src, "-", "Source file, '-' for stdin");
DEFINE_string(dst, "-", "Destination file, '-' for stdout");
DEFINE_string(mode, "stream", "stream: fixed-buffer Copy; slurp: ReadToEnd then WriteAll");
DEFINE_string(log_level, "info", "debug, info, warn, error, critical or off");

namespace
{
readbuf::Result<readbuf::File> OpenSource(const std::string& path)
{
    if (path == "-")
        return readbuf::File::DupStdin();
    return readbuf::File::Open(path, O_RDONLY);
}

readbuf::Result<readbuf::File> OpenDestination(const std::string& path)
{
    if (path == "-")
        return readbuf::File::DupStdout();
    return readbuf::File::Open(path, O_WRONLY | O_CREAT | O_TRUNC, 0644);
}

readbuf::Result<uint64_t> Slurp(readbuf::File& src, readbuf::File& dst)
{
    readbuf::ByteVec contents;
    const size_t n = READBUF_TRY(src.ReadToEnd(contents));
    READBUF_TRY(dst.WriteAll(contents.Span()));
    return n;
}

readbuf::Result<uint64_t> CopyFile(const std::string& src_path, const std::string& dst_path, bool slurp)
{
    auto src = OpenSource(src_path);
    if (!src)
    {
        READBUF_LOG_ERROR("Failed to open source {}: {}", src_path, src.error().message());
        return std::unexpected(src.error());
    }

    auto dst = OpenDestination(dst_path);
    if (!dst)
    {
        READBUF_LOG_ERROR("Failed to open destination {}: {}", dst_path, dst.error().message());
        return std::unexpected(dst.error());
    }

    return slurp ? Slurp(*src, *dst) : readbuf::Copy(*src, *dst);
}
}  // namespace

int main(int argc, char** argv)
{
    gflags::SetUsageMessage("copy bytes between files or stdin/stdout");
    gflags::ParseCommandLineFlags(&argc, &argv, true);

    const auto level = readbuf::log::ParseLevel(FLAGS_log_level);
    if (!level)
    {
        READBUF_LOG_ERROR("Unknown log level: {}", FLAGS_log_level);
        return 2;
    }
    readbuf::log::SetLevel(*level);

    if (FLAGS_mode != "stream" && FLAGS_mode != "slurp")
    {
        READBUF_LOG_ERROR("Unknown mode: {}", FLAGS_mode);
        return 2;
    }

    READBUF_LOG_INFO("Copying {} -> {} ({})", FLAGS_src, FLAGS_dst, FLAGS_mode);

    auto result = CopyFile(FLAGS_src, FLAGS_dst, FLAGS_mode == "slurp");
    if (!result)
    {
        READBUF_LOG_ERROR("Copy failed: {}", result.error().message());
        return 1;
    }

    READBUF_LOG_INFO("Copied {} bytes", *result);
    return 0;
}
