#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace scorekeeper::audit {

struct StoreCreated {
    std::string app_version;
};

struct StoreOpened {
    std::string app_version;
};

struct StoreClosed {};

struct TeamAdded {
    int64_t teamnumber;
    std::string name;
    int64_t pit;
};

struct TeamUpdated {
    int64_t teamnumber;
    std::string old_name;
    std::string new_name;
    int64_t old_pit;
    int64_t new_pit;
};

struct TeamDeleted {
    int64_t teamnumber;
};

struct ScoreUpdated {
    int64_t teamnumber;
    int round;
    std::optional<int> old_score; // std::nullopt if the round had no score row
    int new_score;
};

struct ScoreDeleted {
    int64_t teamnumber;
    int round;
    int old_score;
};

struct ScoresheetUpdated {
    int64_t teamnumber;
    int round;
    std::optional<std::string> old_scoresheet;
    std::string new_scoresheet;
};

struct ScoresheetDeleted {
    int64_t teamnumber;
    int round;
    std::string old_scoresheet;
};

using Event = std::variant<
    StoreCreated,
    StoreOpened,
    StoreClosed,
    TeamAdded,
    TeamUpdated,
    TeamDeleted,
    ScoreUpdated,
    ScoreDeleted,
    ScoresheetUpdated,
    ScoresheetDeleted>;

// Tag stored in the audit table, e.g. "score_update"
[[nodiscard]] std::string_view tag_of(const Event& event) noexcept;

// Serializes @p event into the JSON object kept in the audit table's data
// column. The object always holds "timestamp" and "tag" after the
// event-specific fields.
[[nodiscard]] std::string to_json(const Event& event, double timestamp);

} // namespace scorekeeper::audit
