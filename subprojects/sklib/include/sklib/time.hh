#pragma once

#include <chrono>
#include <cstdint>
#include <ctime>
#include <optional>
#include <string>

int64_t microtime() noexcept;

// Seconds since the Unix epoch with microsecond precision
inline double unix_time_seconds() noexcept { return static_cast<double>(microtime()) / 1e6; }

// Returns UTC date in format of @p format (format like in strftime(3)), if
// @p curr_time >= 0 uses @p curr_time, otherwise uses the current time
std::string date(const std::string& format, time_t curr_time = -1);

// Returns local date in format of @p format (format like in strftime(3)), if
// @p curr_time >= 0 uses @p curr_time, otherwise uses the current time
std::string localdate(const std::string& format, time_t curr_time = -1);

// Returns local date in format of "%Y-%m-%d %H:%M:%S"
inline std::string mysql_localdate(time_t curr_time = -1) {
    return localdate("%Y-%m-%d %H:%M:%S", curr_time);
}

// Parses a "YYYYMMDD" string; returns std::nullopt if it is not a valid date
std::optional<std::tm> parse_compact_date(const std::string& str);
