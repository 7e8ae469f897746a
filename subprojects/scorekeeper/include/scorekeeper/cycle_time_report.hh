#pragma once

#include <cstdint>
#include <scorekeeper/score_store.hh>
#include <string>
#include <vector>

namespace scorekeeper {

struct CycleTimeRow {
    int64_t match;
    std::string start_time; // local time, e.g. "9:05 AM"
    std::string cycle_time; // since the previous row's start, e.g. "7m05s", "N/A" in the first row
};

std::vector<CycleTimeRow> build_cycle_time_report(const std::vector<MatchStart>& match_starts);

// Plain-text table with a title, one row per match
std::string format_cycle_time_report(const std::vector<CycleTimeRow>& rows);

} // namespace scorekeeper
