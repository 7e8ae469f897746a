#include <algorithm>
#include <sklib/debug.hh>
#include <sklib/time.hh>
#include <sys/time.h>

int64_t microtime() noexcept {
    timeval mtime{};
    (void)gettimeofday(&mtime, nullptr);
    return (mtime.tv_sec * static_cast<int64_t>(1000000)) + mtime.tv_usec;
}

template <class F>
static std::string date_impl(const std::string& format, time_t curr_time, F func) {
    if (curr_time < 0) {
        time(&curr_time);
    }

    std::string buff(format.size() + 1 + std::count(format.begin(), format.end(), '%') * 25, '0');

    tm ptm{};
    if (not func(&curr_time, &ptm)) {
        THROW("Failed to convert time");
    }

    size_t rc = strftime(buff.data(), buff.size(), format.c_str(), &ptm);
    buff.resize(rc);
    return buff;
}

std::string date(const std::string& format, time_t curr_time) {
    return date_impl(format, curr_time, gmtime_r);
}

std::string localdate(const std::string& format, time_t curr_time) {
    return date_impl(format, curr_time, localtime_r);
}

std::optional<std::tm> parse_compact_date(const std::string& str) {
    if (str.size() != 8 or not std::all_of(str.begin(), str.end(), [](char c) {
            return c >= '0' and c <= '9';
        }))
    {
        return std::nullopt;
    }

    std::tm t{};
    t.tm_year = std::stoi(str.substr(0, 4)) - 1900;
    t.tm_mon = std::stoi(str.substr(4, 2)) - 1;
    t.tm_mday = std::stoi(str.substr(6, 2));
    t.tm_hour = 12; // Avoids DST edge cases when normalizing
    t.tm_isdst = -1;

    // mktime() normalizes out-of-range fields, so a changed field means the
    // date does not exist (e.g. 20250230)
    std::tm normalized = t;
    if (mktime(&normalized) == -1 or normalized.tm_mday != t.tm_mday or
        normalized.tm_mon != t.tm_mon or normalized.tm_year != t.tm_year)
    {
        return std::nullopt;
    }
    return normalized;
}
