#include <algorithm>
#include <map>
#include <scorekeeper/event_controller.hh>
#include <scorekeeper/ranking.hh>
#include <sklib/debug.hh>
#include <utility>

namespace scorekeeper {

namespace {

void validate_team_identity(int64_t number, const std::string& name, int64_t pit) {
    if (number <= 0) {
        throw ValidationError("Invalid team number: ", number);
    }
    if (name.empty()) {
        throw ValidationError("Team ", number, " has an empty name");
    }
    if (pit < 0) {
        throw ValidationError("Team ", number, " has a negative pit: ", pit);
    }
}

void validate_score(int round, int score) {
    if (not is_valid_round(round)) {
        throw ValidationError("Invalid round: ", round, " (expected 1..", ROUNDS_NUM, ')');
    }
    if (not is_valid_score(score)) {
        throw ValidationError(
            "Invalid score: ", score, " (expected 0..", MAX_SCORE, " or ", UNPLAYED_SCORE, ')'
        );
    }
}

void validate_match(int64_t match) {
    if (match < 1) {
        throw ValidationError("Invalid match number: ", match);
    }
}

} // namespace

EventController::EventController(ScoreStore& store, sync::SyncDispatcher& dispatcher)
: store_(store)
, dispatcher_(dispatcher) {}

template <class Func>
Result<std::invoke_result_t<Func&&>, ControllerError> EventController::mutate(Func&& func) {
    using R = std::invoke_result_t<Func&&>;
    try {
        if constexpr (std::is_void_v<R>) {
            std::forward<Func>(func)();
            notify_listeners();
            return Ok{};
        } else {
            R res = std::forward<Func>(func)();
            notify_listeners();
            return Ok{std::move(res)};
        }
    } catch (const ValidationError& e) {
        return Err{ControllerError{.kind = ControllerError::Kind::VALIDATION, .message = e.what()}};
    } catch (const PersistenceError& e) {
        errlog("event: ", e.what());
        return Err{ControllerError{.kind = ControllerError::Kind::PERSISTENCE, .message = e.what()}
        };
    }
}

Team* EventController::find_team_mut(int64_t number) noexcept {
    auto it = std::find_if(teams_.begin(), teams_.end(), [number](const Team& team) {
        return team.number == number;
    });
    return (it == teams_.end() ? nullptr : &*it);
}

const Team* EventController::find_team(int64_t number) const noexcept {
    auto it = std::find_if(teams_.begin(), teams_.end(), [number](const Team& team) {
        return team.number == number;
    });
    return (it == teams_.end() ? nullptr : &*it);
}

Team& EventController::team_or_throw(int64_t number) {
    Team* team = find_team_mut(number);
    if (team == nullptr) {
        throw ValidationError("No team with number ", number);
    }
    return *team;
}

void EventController::rerank() { rank_teams(teams_); }

void EventController::notify_listeners() {
    for (const auto& listener : listeners_) {
        listener();
    }
}

void EventController::enqueue_teams_snapshot() {
    sync::TeamsSnapshot snapshot;
    snapshot.teams.reserve(teams_.size());
    for (const auto& team : teams_by_number()) {
        snapshot.teams.push_back({.name = team.name, .number = team.number, .pit = team.pit});
    }
    dispatcher_.enqueue(std::move(snapshot));
}

void EventController::add_change_listener(std::function<void()> listener) {
    listeners_.emplace_back(std::move(listener));
}

std::vector<Team> EventController::teams_by_number() const {
    auto res = teams_;
    std::sort(res.begin(), res.end(), [](const Team& a, const Team& b) {
        return a.number < b.number;
    });
    return res;
}

Result<void, ControllerError> EventController::load_from_store() {
    return mutate([&] {
        std::vector<Team> teams;
        std::map<int64_t, size_t> idx_of; // team number => index in teams
        for (auto& record : store_.load_teams()) {
            idx_of.emplace(record.number, teams.size());
            teams.emplace_back(record.number, std::move(record.name), record.pit);
        }

        for (const auto& score : store_.load_scores()) {
            auto it = idx_of.find(score.teamnumber);
            if (it == idx_of.end() or not is_valid_round(score.round) or
                not is_valid_score(score.score))
            {
                errlog(
                    "event: ignoring stored score ",
                    score.score,
                    " of team ",
                    score.teamnumber,
                    " round ",
                    score.round
                );
                continue;
            }
            teams[it->second].set_score(score.round, score.score);
        }

        teams_ = std::move(teams);
        rerank();
        stdlog("event: loaded ", teams_.size(), " team(s) from ", store_.path());
    });
}

Result<void, ControllerError>
EventController::add_team(int64_t number, const std::string& name, int64_t pit) {
    return mutate([&] {
        validate_team_identity(number, name, pit);
        if (const Team* existing = find_team_mut(number)) {
            if (existing->name == name and existing->pit == pit) {
                return; // Already there
            }
            throw ValidationError(
                "Team ", number, " already exists as \"", existing->name, "\" (pit ", existing->pit, ')'
            );
        }

        store_.upsert_team(number, name, pit);
        teams_.emplace_back(number, name, pit);
        rerank();
        enqueue_teams_snapshot();
    });
}

Result<size_t, ControllerError>
EventController::add_teams(const std::vector<Team>& teams, bool with_scores) {
    return mutate([&] {
        std::map<int64_t, const Team*> seen;
        std::vector<const Team*> to_add;
        for (const auto& team : teams) {
            validate_team_identity(team.number, team.name, team.pit);
            if (with_scores) {
                for (int round = 1; round <= ROUNDS_NUM; ++round) {
                    validate_score(round, team.score(round));
                }
            }

            auto [it, inserted] = seen.emplace(team.number, &team);
            if (not inserted) {
                if (it->second->name != team.name or it->second->pit != team.pit) {
                    throw ValidationError("Team ", team.number, " is listed twice with different data");
                }
                continue;
            }

            if (const Team* existing = find_team_mut(team.number)) {
                if (existing->name != team.name or existing->pit != team.pit) {
                    throw ValidationError(
                        "Team ", team.number, " already exists as \"", existing->name, '"'
                    );
                }
                continue;
            }
            to_add.emplace_back(&team);
        }

        // Every write is its own transaction, teams written before a failure
        // stay added and are relayed like a successful import
        size_t written = 0;
        try {
            for (const Team* team : to_add) {
                store_.upsert_team(team->number, team->name, team->pit);
                ++written;
                auto& added = teams_.emplace_back(team->number, team->name, team->pit);
                if (not with_scores) {
                    continue;
                }
                for (int round = 1; round <= ROUNDS_NUM; ++round) {
                    if (team->score(round) != UNPLAYED_SCORE) {
                        store_.upsert_score(team->number, round, team->score(round));
                        added.set_score(round, team->score(round));
                    }
                }
            }
        } catch (const PersistenceError&) {
            rerank();
            if (written > 0) {
                enqueue_teams_snapshot();
                notify_listeners();
            }
            throw;
        }

        rerank();
        if (not to_add.empty()) {
            enqueue_teams_snapshot();
        }
        return to_add.size();
    });
}

Result<void, ControllerError>
EventController::update_team(int64_t number, const std::string& name, int64_t pit) {
    return mutate([&] {
        validate_team_identity(number, name, pit);
        Team& team = team_or_throw(number);
        store_.upsert_team(number, name, pit);
        team.name = name;
        team.pit = pit;
        enqueue_teams_snapshot();
    });
}

Result<void, ControllerError>
EventController::set_score(int64_t number, int round, int score, const std::string& comments) {
    return mutate([&] {
        validate_score(round, score);
        team_or_throw(number);
        store_.upsert_score(number, round, score, comments);
        // Reranking reorders teams_, so the team is looked up after the write
        team_or_throw(number).set_score(round, score);
        rerank();
        dispatcher_.enqueue(sync::ScoreUpdate{.team = number, .round = round, .score = score});
    });
}

Result<void, ControllerError> EventController::submit_scoresheet(
    int64_t number, int round, int score, const std::string& scoresheet
) {
    return mutate([&] {
        validate_score(round, score);
        team_or_throw(number);
        (void)store_.upsert_score_with_scoresheet(number, round, score, scoresheet);
        team_or_throw(number).set_score(round, score);
        rerank();
        dispatcher_.enqueue(sync::ScoreUpdate{.team = number, .round = round, .score = score});
    });
}

Result<void, ControllerError> EventController::delete_team(int64_t number) {
    return mutate([&] {
        team_or_throw(number);
        store_.delete_team(number);
        teams_.erase(std::remove_if(teams_.begin(), teams_.end(), [number](const Team& team) {
            return team.number == number;
        }), teams_.end());
        rerank();
        enqueue_teams_snapshot();
    });
}

Result<void, ControllerError> EventController::start_match(int64_t match) {
    return mutate([&] {
        validate_match(match);
        store_.write_log_entry(MATCH_START_LOG_TAG, std::to_string(match));
        dispatcher_.enqueue(sync::MatchStatus{
            .match = match, .status = std::string{sync::STATUS_RUNNING}});
    });
}

Result<void, ControllerError> EventController::abort_match(int64_t match) {
    return mutate([&] {
        validate_match(match);
        dispatcher_.enqueue(sync::MatchStatus{
            .match = match, .status = std::string{sync::STATUS_ABORTED}});
    });
}

Result<int64_t, ControllerError> EventController::complete_match(int64_t match) {
    return mutate([&] {
        validate_match(match);
        int64_t next_match = match + 1;
        dispatcher_.enqueue(sync::MatchStatus{
            .match = next_match, .status = std::string{sync::STATUS_QUEUEING}});
        return next_match;
    });
}

Result<void, SyncDeliveryError> EventController::force_sync(int64_t match, std::string status) {
    sync::EventSnapshot snapshot{.match = match, .status = std::move(status), .teams = {}};
    snapshot.teams.reserve(teams_.size());
    for (const auto& team : teams_) {
        snapshot.teams.push_back({
            .name = team.name,
            .number = team.number,
            .pit = team.pit,
            .scores = team.scores,
        });
    }
    return dispatcher_.force_sync(snapshot);
}

} // namespace scorekeeper
