#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace scorekeeper {

constexpr int ROUNDS_NUM = 3;
constexpr int UNPLAYED_SCORE = -1;
constexpr int MAX_SCORE = 999;
// Rank of a team that has not played any round, displayed as "NP"
constexpr int64_t NOT_PLACED_RANK = 10'000'000'000;

struct Team {
    int64_t number;
    std::string name;
    int64_t pit = 0; // 0 means not assigned
    // scores[i] is the score of round i + 1 or UNPLAYED_SCORE
    std::array<int, ROUNDS_NUM> scores{UNPLAYED_SCORE, UNPLAYED_SCORE, UNPLAYED_SCORE};

    // Derived from scores by recompute_derived()
    int high_score = UNPLAYED_SCORE;
    int second_highest = UNPLAYED_SCORE;
    int third_highest = UNPLAYED_SCORE;
    int high_score_index = 0; // lowest round index achieving high_score

    // Assigned only by rank_teams()
    int64_t rank = NOT_PLACED_RANK;

    Team(int64_t number, std::string name, int64_t pit = 0);

    // @p round is in [1, ROUNDS_NUM], the caller validates the score
    void set_score(int round, int score);

    [[nodiscard]] int score(int round) const { return scores.at(round - 1); }

    [[nodiscard]] bool played_any() const noexcept;

    // First round without a score, or the last round if all were played
    [[nodiscard]] int next_round_to_enter() const noexcept;

    void recompute_derived() noexcept;
};

[[nodiscard]] constexpr bool is_valid_round(int round) noexcept {
    return round >= 1 and round <= ROUNDS_NUM;
}

[[nodiscard]] constexpr bool is_valid_score(int score) noexcept {
    return score == UNPLAYED_SCORE or (score >= 0 and score <= MAX_SCORE);
}

// "NP" for NOT_PLACED_RANK, the number otherwise
std::string rank_label(int64_t rank);

} // namespace scorekeeper
