#include <cmath>
#include <scorekeeper/cycle_time_report.hh>
#include <sklib/concat_tostr.hh>
#include <sklib/time.hh>

namespace scorekeeper {

namespace {

constexpr size_t REPORT_WIDTH = 60;

std::string pad_right(std::string str, size_t width) {
    if (str.size() < width) {
        str.append(width - str.size(), ' ');
    }
    return str;
}

std::string format_cycle_time(int64_t seconds) {
    std::string res;
    if (seconds < 0) {
        res = "-";
        seconds = -seconds;
    }
    int64_t secs = seconds % 60;
    back_insert(res, seconds / 60, 'm', secs < 10 ? "0" : "", secs, 's');
    return res;
}

} // namespace

std::vector<CycleTimeRow> build_cycle_time_report(const std::vector<MatchStart>& match_starts) {
    std::vector<CycleTimeRow> rows;
    rows.reserve(match_starts.size());
    const MatchStart* prev = nullptr;
    for (const auto& start : match_starts) {
        auto start_time = localdate("%I:%M %p", static_cast<time_t>(start.timestamp));
        if (start_time.starts_with('0')) {
            start_time.erase(0, 1);
        }

        rows.push_back({
            .match = start.match,
            .start_time = std::move(start_time),
            .cycle_time = (prev == nullptr
                               ? std::string{"N/A"}
                               : format_cycle_time(static_cast<int64_t>(
                                     std::trunc(start.timestamp - prev->timestamp)
                                 ))),
        });
        prev = &start;
    }
    return rows;
}

std::string format_cycle_time_report(const std::vector<CycleTimeRow>& rows) {
    std::string res = "Cycle Time Report\n";
    back_insert(res, std::string(REPORT_WIDTH, '='), '\n');
    back_insert(
        res, pad_right("Match", 10), pad_right("Start Time", 20), pad_right("Cycle Time", 20), '\n'
    );
    back_insert(res, std::string(REPORT_WIDTH, '-'), '\n');
    for (const auto& row : rows) {
        back_insert(
            res,
            pad_right(std::to_string(row.match), 10),
            pad_right(row.start_time, 20),
            pad_right(row.cycle_time, 20),
            '\n'
        );
    }
    back_insert(res, std::string(REPORT_WIDTH, '='));
    return res;
}

} // namespace scorekeeper
