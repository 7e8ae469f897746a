#pragma once

#include <scorekeeper/team.hh>
#include <vector>

namespace scorekeeper {

/**
 * @brief Sorts @p teams into ranking order and assigns Team::rank
 * @details Teams are ordered descending by (high_score, second_highest,
 *   third_highest) with the lower team number winning ties, which makes the
 *   order total. Ranks are 1-based positions. Teams that have not played any
 *   round get NOT_PLACED_RANK and are placed after every ranked team, ordered
 *   by team number.
 */
void rank_teams(std::vector<Team>& teams);

// Returns true iff @p a goes before @p b in the ranking order
[[nodiscard]] bool ranks_before(const Team& a, const Team& b) noexcept;

} // namespace scorekeeper
