#pragma once

#include <sstream>
#include <stdexcept>
#include <string>

namespace common
{

class InvariantViolation : public std::logic_error
{
public:
    using std::logic_error::logic_error;
};

namespace detail
{

[[noreturn]] inline void enforceFail(const char* expr,
                                     const char* file,
                                     int line,
                                     const char* message)
{
    std::ostringstream oss;
    oss << "ENFORCE failed: " << (message ? message : "no message")
        << " [" << expr << "] @" << file << ':' << line;
    throw InvariantViolation(oss.str());
}

} // namespace detail

} // namespace common

#define ENFORCE(expr, message)                                                             \
    do                                                                                    \
    {                                                                                     \
        if (!(expr))                                                                      \
        {                                                                                 \
            ::common::detail::enforceFail(#expr, __FILE__, __LINE__, (message));          \
        }                                                                                 \
    } while (false)

// Hot-path variant: checked in debug builds only.
#if defined(NDEBUG)
#    define DEBUG_ENFORCE(expr, message) (void)sizeof(expr)
#else
#    define DEBUG_ENFORCE(expr, message) ENFORCE(expr, message)
#endif
