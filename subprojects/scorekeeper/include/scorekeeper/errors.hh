#pragma once

#include <sklib/concat_tostr.hh>
#include <stdexcept>

namespace scorekeeper {

// Rejected input (score out of range, malformed CSV row, conflicting team
// data). Nothing is applied when it is raised.
class ValidationError : public std::runtime_error {
public:
    template <class... Args, std::enable_if_t<(is_string_argument<Args> and ...), int> = 0>
    explicit ValidationError(Args&&... args)
    : std::runtime_error(concat_tostr(std::forward<Args>(args)...)) {}
};

// Failure of the event database: I/O error, schema mismatch or misuse of a
// closed store. The attempted operation is rolled back as a whole.
class PersistenceError : public std::runtime_error {
public:
    template <class... Args, std::enable_if_t<(is_string_argument<Args> and ...), int> = 0>
    explicit PersistenceError(Args&&... args)
    : std::runtime_error(concat_tostr(std::forward<Args>(args)...)) {}
};

// Failure to deliver a message to the reflector
class SyncDeliveryError : public std::runtime_error {
public:
    template <class... Args, std::enable_if_t<(is_string_argument<Args> and ...), int> = 0>
    explicit SyncDeliveryError(Args&&... args)
    : std::runtime_error(concat_tostr(std::forward<Args>(args)...)) {}
};

} // namespace scorekeeper
