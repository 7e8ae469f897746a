#include <algorithm>
#include <scorekeeper/ranking.hh>
#include <tuple>

namespace scorekeeper {

bool ranks_before(const Team& a, const Team& b) noexcept {
    if (a.played_any() != b.played_any()) {
        return a.played_any();
    }
    // -number turns "lower number wins" into a descending comparison
    return std::tuple{a.high_score, a.second_highest, a.third_highest, -a.number} >
        std::tuple{b.high_score, b.second_highest, b.third_highest, -b.number};
}

void rank_teams(std::vector<Team>& teams) {
    std::sort(teams.begin(), teams.end(), ranks_before);

    int64_t next_rank = 1;
    for (auto& team : teams) {
        team.rank = (team.played_any() ? next_rank++ : NOT_PLACED_RANK);
    }
}

} // namespace scorekeeper
