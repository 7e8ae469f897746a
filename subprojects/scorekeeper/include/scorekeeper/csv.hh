#pragma once

#include <istream>
#include <ostream>
#include <scorekeeper/team.hh>
#include <vector>

namespace scorekeeper {

/**
 * @brief Reads teams from a CSV file with a header row
 * @details Columns are located by header name: "Team Name" and
 *   "Team Number" are required, "Pit #" is optional and with @p with_scores
 *   so are "Round 1 Score" .. "Round 3 Score". A blank, non-numeric or
 *   non-positive round score means the round was not played. Blank rows are
 *   skipped.
 *
 * @errors Throws ValidationError naming the line of the first bad row
 */
std::vector<Team> parse_teams_csv(std::istream& in, bool with_scores);

// Writes "Pit #,Team Name,Team Number,Round 1 Score,...", ordered by pit,
// teams without a pit are placed by their number
void write_teams_csv(std::ostream& out, std::vector<Team> teams);

} // namespace scorekeeper
