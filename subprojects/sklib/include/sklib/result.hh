#pragma once

#include <type_traits>
#include <utility>
#include <variant>

template <class T>
struct Ok {
    T val;

    constexpr explicit Ok(T val) noexcept(std::is_nothrow_move_constructible_v<T>)
    : val{std::move(val)} {}

    template <class U, std::enable_if_t<std::is_constructible_v<T, U&&>, int> = 0>
    // NOLINTNEXTLINE(google-explicit-constructor)
    constexpr Ok(Ok<U>&& other)
    : val{std::move(other.val)} {}
};

template <>
struct Ok<void> {
    constexpr Ok() noexcept = default;
};

Ok() -> Ok<void>;

template <class T>
struct Err {
    T err;

    constexpr explicit Err(T err) noexcept(std::is_nothrow_move_constructible_v<T>)
    : err{std::move(err)} {}

    template <class U, std::enable_if_t<std::is_constructible_v<T, U&&>, int> = 0>
    // NOLINTNEXTLINE(google-explicit-constructor)
    constexpr Err(Err<U>&& other)
    : err{std::move(other.err)} {}
};

template <>
struct Err<void> {
    constexpr Err() noexcept = default;
};

Err() -> Err<void>;

template <class A, class B>
constexpr bool operator==(const Ok<A>& a, const Ok<B>& b) {
    if constexpr (std::is_same_v<A, void> && std::is_same_v<B, void>) {
        return true;
    } else if constexpr (std::is_same_v<A, void> || std::is_same_v<B, void>) {
        return false;
    } else {
        return a.val == b.val;
    }
}

template <class A, class B>
constexpr bool operator==(const Err<A>& a, const Err<B>& b) {
    if constexpr (std::is_same_v<A, void> && std::is_same_v<B, void>) {
        return true;
    } else if constexpr (std::is_same_v<A, void> || std::is_same_v<B, void>) {
        return false;
    } else {
        return a.err == b.err;
    }
}

template <class T, class E>
struct Result : std::variant<Ok<T>, Err<E>> {
    // NOLINTNEXTLINE(google-explicit-constructor)
    constexpr Result(Ok<T> ok)
    : std::variant<Ok<T>, Err<E>>{std::move(ok)} {}

    // NOLINTNEXTLINE(google-explicit-constructor)
    constexpr Result(Err<E> err)
    : std::variant<Ok<T>, Err<E>>{std::move(err)} {}

    [[nodiscard]] constexpr bool is_ok() const noexcept {
        return std::holds_alternative<Ok<T>>(*this);
    }

    [[nodiscard]] constexpr bool is_err() const noexcept {
        return std::holds_alternative<Err<E>>(*this);
    }

    constexpr T unwrap() && {
        if constexpr (std::is_same_v<T, void>) {
            (void)std::get<Ok<T>>(*this);
        } else {
            return std::get<Ok<T>>(std::move(*this)).val;
        }
    }

    constexpr E unwrap_err() && {
        if constexpr (std::is_same_v<E, void>) {
            (void)std::get<Err<E>>(*this);
        } else {
            return std::get<Err<E>>(std::move(*this)).err;
        }
    }

    // Valid only if is_err()
    template <class U = E, std::enable_if_t<!std::is_same_v<U, void>, int> = 0>
    [[nodiscard]] constexpr const U& err() const& {
        return std::get<Err<E>>(*this).err;
    }

    // Valid only if is_ok()
    template <class U = T, std::enable_if_t<!std::is_same_v<U, void>, int> = 0>
    [[nodiscard]] constexpr const U& val() const& {
        return std::get<Ok<T>>(*this).val;
    }
};

template <class T, class E, class X>
constexpr bool operator==(const Result<T, E>& r, const Ok<X>& x) {
    return r.is_ok() and std::get<Ok<T>>(r) == x;
}

template <class T, class E, class X>
constexpr bool operator==(const Result<T, E>& r, const Err<X>& x) {
    return r.is_err() and std::get<Err<E>>(r) == x;
}
