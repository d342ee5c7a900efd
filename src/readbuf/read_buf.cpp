#include "readbuf/read_buf.hpp"

#include <cstring>

#include "readbuf/check.hpp"

namespace readbuf
{
std::span<std::byte> ReadBuf::AsInitTo(size_t len)
{
    READBUF_CHECK(len <= buf_.size(), "ReadBuf::AsInitTo() beyond buffer length");

    if (len > initialized_)
    {
        std::memset(buf_.data() + initialized_, 0, len - initialized_);
        initialized_ = len;
    }
    return detail::AssumeInit(buf_.first(len));
}
}  // namespace readbuf
