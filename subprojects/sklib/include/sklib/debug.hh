#pragma once

#include <cerrno>
#include <exception>
#include <sklib/logger.hh>
#include <sklib/macros/throw.hh>
#include <string>

#define throw_assert(expr)                                                                  \
    ((expr) ? (void)0                                                                       \
            : throw std::runtime_error(concat_tostr(                                        \
                  __FILE__ ":" SKLIB_STRINGIZE(__LINE__) ": ",                             \
                  __PRETTY_FUNCTION__,                                                      \
                  ": Assertion `" #expr "` failed."                                         \
              )))

namespace sklib_debug {

constexpr bool is_va_empty() { return true; }

template <class T1, class... T>
constexpr bool is_va_empty(T1&& /*unused*/, T&&... /*unused*/) {
    return false;
}

constexpr const char* what_of() { return ""; }

inline const char* what_of(const std::exception& e) { return e.what(); }

} // namespace sklib_debug

// Returns " - <description of errnum> (os error <errnum>)"
std::string errmsg(int errnum);

inline std::string errmsg() { return errmsg(errno); }

#define ERRLOG_CATCH(...)                                                 \
    errlog(                                                               \
        __FILE__ ":" SKLIB_STRINGIZE(__LINE__) ": Caught exception",      \
        ::sklib_debug::is_va_empty(__VA_ARGS__) ? "" : " -> ",            \
        ::sklib_debug::what_of(__VA_ARGS__)                               \
    )
