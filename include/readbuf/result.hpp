#pragma once
////////////////////////////////////////////////////////////////////////////////
// Standardized Error Handling
//
// Unifies the library on std::expected<T, std::error_code>.
// Allows usage of Result<size_t> or Result<> (defaults to void).
////////////////////////////////////////////////////////////////////////////////

#include <cerrno>
#include <expected>
#include <string>
#include <system_error>
#include <type_traits>
#include <utility>

namespace readbuf
{
template <typename T = void>
using Result = std::expected<T, std::error_code>;

/// @brief Conditions raised by the library itself (never by the OS).
enum class Errc : int
{
    /// A read returned 0 bytes before the requested length was filled.
    UnexpectedEof = 1,
    /// A sink accepted 0 bytes while there was still data to write.
    WriteZero = 2,
};

namespace detail
{

struct readbuf_category_t final : std::error_category
{
    const char* name() const noexcept override { return "readbuf"; }

    std::string message(const int ev) const override
    {
        switch (static_cast<Errc>(ev))
        {
            case Errc::UnexpectedEof:
                return "unexpected end of input";
            case Errc::WriteZero:
                return "failed to write whole buffer";
        }
        return "unknown readbuf error";
    }
};

}  // namespace detail

inline const std::error_category& readbuf_category()
{
    static detail::readbuf_category_t cat;
    return cat;
}

inline std::error_code make_error_code(Errc e)
{
    return {static_cast<int>(e), readbuf_category()};
}

inline std::unexpected<std::error_code> ErrorFromErrno(int err)
{
    return std::unexpected(std::error_code(err, std::system_category()));
}

inline std::error_code MakeErrorCode(int err)
{
    return std::error_code{err > 0 ? err : -err, std::system_category()};
}

inline std::unexpected<std::error_code> Error(Errc e)
{
    return std::unexpected(make_error_code(e));
}

/// @brief True for the one OS error every blocking loop retries.
inline bool IsInterrupted(const std::error_code& ec)
{
    return ec == std::errc::interrupted;
}

}  // namespace readbuf

template <>
struct std::is_error_code_enum<readbuf::Errc> : std::true_type
{
};

// -------------------------------------------------------------------------
// READBUF_TRY Macro
// -------------------------------------------------------------------------

namespace readbuf_try_internal
{
template <typename Exp>
auto readbuf_try_unwrap_impl(Exp&& exp)
{
    using ValueT = typename std::decay_t<Exp>::value_type;

    if constexpr (!std::is_void_v<ValueT>)
    {
        return std::move(*std::forward<Exp>(exp));
    }
    // else: void return, no-op
}
}  // namespace readbuf_try_internal

#define READBUF_TRY(expr)                                                     \
    ({                                                                        \
        auto __readbuf_internal_res = (expr);                                 \
        if (!__readbuf_internal_res)                                          \
        {                                                                     \
            return std::unexpected(__readbuf_internal_res.error());           \
        }                                                                     \
        ::readbuf_try_internal::readbuf_try_unwrap_impl(__readbuf_internal_res); \
    })
