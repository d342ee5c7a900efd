#pragma once
////////////////////////////////////////////////////////////////////////////////
// File descriptor reader/writer
//
// FileDesc owns a blocking descriptor and reads straight into uninitialized
// memory: ReadIntoBuf is one read(2) into ReadBuf::AsUninit(), ReadIntoBufs
// one readv(2) over the UninitIoSlice array. Only the byte count the kernel
// reports is declared initialized.
////////////////////////////////////////////////////////////////////////////////

#include <filesystem>
#include <span>
#include <utility>

#include <fcntl.h>
#include <unistd.h>

#include <sys/types.h>

#include "readbuf/read.hpp"
#include "readbuf/result.hpp"

namespace readbuf
{

/// @brief RAII owner of a file descriptor. Move-only to prevent double-close bugs.
///
/// @code
///   auto in = File::Open("input.bin", O_RDONLY);
///   if (!in) return std::unexpected(in.error());
///   ByteVec contents;
///   auto n = in->ReadToEnd(contents);
/// @endcode
class FileDesc : public Reader, public Writer
{
    int fd_ = -1;

public:
    FileDesc() = default;
    explicit FileDesc(int fd) : fd_(fd) {}

    ~FileDesc() noexcept override
    {
        if (fd_ >= 0)
            ::close(fd_);
    }

    FileDesc(FileDesc&& other) noexcept : fd_(std::exchange(other.fd_, -1)) {}
    FileDesc& operator=(FileDesc&& other) noexcept
    {
        if (this != &other)
        {
            if (fd_ >= 0)
                ::close(fd_);
            fd_ = std::exchange(other.fd_, -1);
        }
        return *this;
    }

    FileDesc(const FileDesc&) = delete;
    FileDesc& operator=(const FileDesc&) = delete;

    /// @brief Returns the raw file descriptor. The FileDesc retains ownership.
    [[nodiscard]] int Get() const { return fd_; }

    [[nodiscard]] bool IsValid() const { return fd_ >= 0; }

    explicit operator bool() const { return IsValid(); }

    /// @brief Releases ownership. The caller is responsible for closing the fd.
    int Release() { return std::exchange(fd_, -1); }

    /// @brief Closes the descriptor now. Safe to call multiple times.
    void Close();

    Result<size_t> Read(std::span<std::byte> buf) override;
    Result<size_t> ReadVectored(std::span<IoSliceMut> bufs) override;
    Result<size_t> ReadIntoBuf(ReadBuf& buf) override;
    Result<size_t> ReadIntoBufs(ReadBufs& bufs) override;

    Result<size_t> Write(std::span<const std::byte> data) override;
};

class File : public FileDesc
{
public:
    using FileDesc::FileDesc;

    /// @brief open(2) with O_CLOEXEC added.
    static Result<File> Open(const std::filesystem::path& path, int flags, mode_t mode = 0644);

    /// @brief A private duplicate of stdin / stdout, closed independently of fd 0 / fd 1.
    static Result<File> DupStdin();
    static Result<File> DupStdout();

    /// @brief fsync(2).
    Result<> Sync() const;
};

}  // namespace readbuf
