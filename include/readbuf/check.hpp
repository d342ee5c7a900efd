#pragma once
////////////////////////////////////////////////////////////////////////////////
// Contract checks
//
// A failed check means the initialization bookkeeping can no longer be
// trusted, so continuing could expose uninitialized memory. There is no
// recovery: the violation is logged and the process terminates.
////////////////////////////////////////////////////////////////////////////////

#include <source_location>

namespace readbuf::detail
{

[[noreturn]] void ContractViolation(const char* what, std::source_location loc);

}  // namespace readbuf::detail

#define READBUF_CHECK(cond, what)                                                      \
    do                                                                                 \
    {                                                                                  \
        if (!(cond)) [[unlikely]]                                                      \
            ::readbuf::detail::ContractViolation((what), std::source_location::current()); \
    } while (0)
