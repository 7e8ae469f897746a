#pragma once

#include <mutex>
#include <type_traits>
#include <utility>

namespace concurrent {

// Value accessible only under its own mutex
template <class T>
class MutexedValue {
    mutable std::mutex mtx_;
    T value_;

public:
    template <class... Args>
    explicit MutexedValue(Args&&... args)
    : value_(std::forward<Args>(args)...) {}

    MutexedValue(const MutexedValue&) = delete;
    MutexedValue(MutexedValue&&) = delete;
    MutexedValue& operator=(const MutexedValue&) = delete;
    MutexedValue& operator=(MutexedValue&&) = delete;

    ~MutexedValue() = default;

    // Runs @p operation on the value with the mutex held and returns its result
    template <class Func>
    decltype(auto) perform(Func&& operation) {
        static_assert(std::is_invocable_v<Func&&, T&>);
        std::lock_guard guard(mtx_);
        return std::forward<Func>(operation)(value_);
    }

    // Snapshot of the value
    [[nodiscard]] T copy() const {
        std::lock_guard guard(mtx_);
        return value_;
    }
};

} // namespace concurrent
