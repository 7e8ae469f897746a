#pragma once

#include <cstdint>
#include <functional>
#include <scorekeeper/errors.hh>
#include <scorekeeper/score_store.hh>
#include <scorekeeper/sync/sync_dispatcher.hh>
#include <scorekeeper/team.hh>
#include <sklib/result.hh>
#include <string>
#include <type_traits>
#include <vector>

namespace scorekeeper {

struct ControllerError {
    enum class Kind {
        VALIDATION,
        PERSISTENCE,
    };

    Kind kind;
    std::string message;
};

/**
 * @brief Owns the in-memory team set and applies every mutation to it
 * @details A mutation is first written through the ScoreStore, then applied
 *   to the in-memory teams, which are reranked, then relayed to the
 *   reflector and finally announced to the change listeners. A rejected or
 *   failed mutation leaves the in-memory state untouched.
 *
 *   Must be used from the thread that opened the store.
 */
class EventController {
    ScoreStore& store_;
    sync::SyncDispatcher& dispatcher_;
    std::vector<Team> teams_; // in rank order
    std::vector<std::function<void()>> listeners_;

    template <class Func>
    Result<std::invoke_result_t<Func&&>, ControllerError> mutate(Func&& func);

    Team* find_team_mut(int64_t number) noexcept;

    Team& team_or_throw(int64_t number);

    void rerank();

    void notify_listeners();

    void enqueue_teams_snapshot();

public:
    EventController(ScoreStore& store, sync::SyncDispatcher& dispatcher);

    // Rebuilds the teams from the store. Writes no audit entries.
    Result<void, ControllerError> load_from_store();

    /**
     * @brief Adds a new team
     * @details Adding a team that already exists with the same name and pit
     *   changes nothing. A different name or pit is a validation error,
     *   update_team() is the way to change them.
     */
    Result<void, ControllerError> add_team(int64_t number, const std::string& name, int64_t pit = 0);

    /**
     * @brief Adds many teams at once (CSV import)
     * @details All teams are validated before anything is written. With
     *   @p with_scores every played round of an imported team is recorded as
     *   well. A single TeamsSnapshot is relayed.
     *
     * @return number of teams added
     */
    Result<size_t, ControllerError> add_teams(const std::vector<Team>& teams, bool with_scores);

    // Renames the team and/or changes its pit
    Result<void, ControllerError>
    update_team(int64_t number, const std::string& name, int64_t pit);

    // @p score is in [0, MAX_SCORE], or UNPLAYED_SCORE to clear the round
    Result<void, ControllerError>
    set_score(int64_t number, int round, int score, const std::string& comments = "");

    // Like set_score() but also stores the opaque scoresheet payload
    Result<void, ControllerError>
    submit_scoresheet(int64_t number, int round, int score, const std::string& scoresheet);

    Result<void, ControllerError> delete_team(int64_t number);

    // Logs the match start (cycle-time report) and relays "running"
    Result<void, ControllerError> start_match(int64_t match);

    Result<void, ControllerError> abort_match(int64_t match);

    // Relays "queueing" for the next match and returns its number
    Result<int64_t, ControllerError> complete_match(int64_t match);

    // Sends the whole event state to the reflector right away, unordered with
    // respect to the queued messages
    Result<void, SyncDeliveryError> force_sync(int64_t match, std::string status);

    [[nodiscard]] const std::vector<Team>& teams() const noexcept { return teams_; }

    [[nodiscard]] std::vector<Team> teams_by_number() const;

    [[nodiscard]] const Team* find_team(int64_t number) const noexcept;

    // @p listener is called after every successful mutation
    void add_change_listener(std::function<void()> listener);
};

} // namespace scorekeeper
