#include "readbuf/fd.hpp"

#include <algorithm>
#include <cerrno>
#include <climits>

#include <sys/uio.h>

#include "readbuf/logger.hpp"

namespace readbuf
{

namespace
{
int ClampIovCount(size_t count)
{
    return static_cast<int>(std::min<size_t>(count, IOV_MAX));
}

Result<File> Dup(int fd)
{
    const int copy = ::fcntl(fd, F_DUPFD_CLOEXEC, 0);
    if (copy < 0)
    {
        return ErrorFromErrno(errno);
    }
    return File(copy);
}
}  // namespace

// ----------------------------------------------------------------------------
// FileDesc Implementation
// ----------------------------------------------------------------------------

void FileDesc::Close()
{
    if (fd_ >= 0)
    {
        ::close(fd_);
        fd_ = -1;
    }
}

Result<size_t> FileDesc::Read(std::span<std::byte> buf)
{
    const ssize_t ret = ::read(fd_, buf.data(), buf.size());
    if (ret < 0)
        return ErrorFromErrno(errno);
    return static_cast<size_t>(ret);
}

Result<size_t> FileDesc::ReadVectored(std::span<IoSliceMut> bufs)
{
    const ssize_t ret = ::readv(fd_, detail::AsIoVecs(bufs), ClampIovCount(bufs.size()));
    if (ret < 0)
        return ErrorFromErrno(errno);
    return static_cast<size_t>(ret);
}

Result<size_t> FileDesc::ReadIntoBuf(ReadBuf& buf)
{
    const auto raw = buf.AsUninit();
    const ssize_t ret = ::read(fd_, raw.data(), raw.size());
    if (ret < 0)
        return ErrorFromErrno(errno);

    const auto len = static_cast<size_t>(ret);
    buf.AssumeInitialized(len);
    return len;
}

Result<size_t> FileDesc::ReadIntoBufs(ReadBufs& bufs)
{
    const auto raw = bufs.AsUninit();
    const ssize_t ret = ::readv(fd_, detail::AsIoVecs(raw), ClampIovCount(raw.size()));
    if (ret < 0)
        return ErrorFromErrno(errno);

    const auto len = static_cast<size_t>(ret);
    bufs.AssumeInitialized(len);
    return len;
}

Result<size_t> FileDesc::Write(std::span<const std::byte> data)
{
    const ssize_t ret = ::write(fd_, data.data(), data.size());
    if (ret < 0)
        return ErrorFromErrno(errno);
    return static_cast<size_t>(ret);
}

// ----------------------------------------------------------------------------
// File Implementation
// ----------------------------------------------------------------------------

Result<File> File::Open(const std::filesystem::path& path, int flags, mode_t mode)
{
    const int fd = ::open(path.c_str(), flags | O_CLOEXEC, mode);
    if (fd < 0)
    {
        const int err = errno;
        READBUF_LOG_DEBUG("open({}) failed: {}", path.string(), std::system_category().message(err));
        return ErrorFromErrno(err);
    }
    READBUF_LOG_DEBUG("opened {} as fd {}", path.string(), fd);
    return File(fd);
}

Result<File> File::DupStdin()
{
    return Dup(STDIN_FILENO);
}

Result<File> File::DupStdout()
{
    return Dup(STDOUT_FILENO);
}

Result<> File::Sync() const
{
    if (::fsync(Get()) < 0)
        return ErrorFromErrno(errno);
    return {};
}

}  // namespace readbuf
