#include <algorithm>
#include <functional>
#include <utility>
#include <scorekeeper/team.hh>

namespace scorekeeper {

Team::Team(int64_t number, std::string name, int64_t pit)
: number(number)
, name(std::move(name))
, pit(pit) {}

void Team::set_score(int round, int score) {
    scores.at(round - 1) = score;
    recompute_derived();
}

bool Team::played_any() const noexcept {
    return std::any_of(scores.begin(), scores.end(), [](int s) { return s != UNPLAYED_SCORE; });
}

int Team::next_round_to_enter() const noexcept {
    auto it = std::find(scores.begin(), scores.end(), UNPLAYED_SCORE);
    if (it == scores.end()) {
        return ROUNDS_NUM;
    }
    return static_cast<int>(it - scores.begin()) + 1;
}

void Team::recompute_derived() noexcept {
    auto sorted = scores;
    std::sort(sorted.begin(), sorted.end(), std::greater<>());
    high_score = sorted[0];
    second_highest = sorted[1];
    third_highest = sorted[2];
    // std::find returns the first occurrence, so ties go to the lowest round
    high_score_index = static_cast<int>(
        std::find(scores.begin(), scores.end(), high_score) - scores.begin()
    );
}

std::string rank_label(int64_t rank) {
    if (rank >= NOT_PLACED_RANK) {
        return "NP";
    }
    return std::to_string(rank);
}

} // namespace scorekeeper
