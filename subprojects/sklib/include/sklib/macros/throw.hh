#pragma once

#include <sklib/concat_tostr.hh>
#include <stdexcept>

#define SKLIB_STRINGIZE2(x) #x
#define SKLIB_STRINGIZE(x) SKLIB_STRINGIZE2(x)

// Includes exception origin
#define THROW(...)                                                                           \
    throw std::runtime_error(                                                                \
        concat_tostr(__VA_ARGS__, " (thrown at " __FILE__ ":" SKLIB_STRINGIZE(__LINE__) ")") \
    )
