#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace detail {

template <class T>
constexpr inline bool is_char_like = std::is_same_v<std::remove_cvref_t<T>, char>;

} // namespace detail

inline size_t string_length(std::string_view str) noexcept { return str.size(); }

inline size_t string_length(const std::string& str) noexcept { return str.size(); }

inline size_t string_length(const char* str) noexcept {
    return std::char_traits<char>::length(str);
}

inline size_t string_length(char /*unused*/) noexcept { return 1; }

// Integers are converted to their decimal representation, chars are kept as
// characters, everything else has to be string-like
template <class T>
decltype(auto) stringify(T&& x) {
    using DT = std::remove_cvref_t<T>;
    if constexpr (detail::is_char_like<DT>) {
        return static_cast<char>(x);
    } else if constexpr (std::is_same_v<DT, bool>) {
        return std::string_view{x ? "true" : "false"};
    } else if constexpr (std::is_integral_v<DT>) {
        return std::to_string(x);
    } else {
        return std::forward<T>(x);
    }
}

namespace detail {

template <class T, class = decltype(string_length(stringify(std::declval<T>())))>
constexpr auto is_string_argument(int) -> std::true_type;

template <class>
constexpr auto is_string_argument(...) -> std::false_type;

} // namespace detail

template <class T>
constexpr inline bool is_string_argument = decltype(detail::is_string_argument<T>(0))::value;

template <class... Args, std::enable_if_t<(is_string_argument<Args> and ...), int> = 0>
std::string concat_tostr(Args&&... args) {
    return [](auto&&... str) {
        size_t total_length = (0 + ... + string_length(str));
        std::string res;
        res.reserve(total_length);
        (void)(res += ... += std::forward<decltype(str)>(str));
        return res;
    }(stringify(std::forward<Args>(args))...);
}

template <class... Args, std::enable_if_t<(is_string_argument<Args> and ...), int> = 0>
std::string& back_insert(std::string& str, Args&&... args) {
    return [&str](auto&&... xx) -> std::string& {
        str.reserve(str.size() + (0 + ... + string_length(xx)));
        return (str += ... += std::forward<decltype(xx)>(xx));
    }(stringify(std::forward<Args>(args))...);
}
