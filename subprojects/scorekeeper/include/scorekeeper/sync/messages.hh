#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace scorekeeper::sync {

// Match status labels understood by the reflector
constexpr std::string_view STATUS_QUEUEING = "queueing";
constexpr std::string_view STATUS_RUNNING = "running";
constexpr std::string_view STATUS_ABORTED = "aborted";

struct TeamsSnapshot {
    struct Entry {
        std::string name;
        int64_t number;
        int64_t pit;
    };

    std::vector<Entry> teams;
};

struct MatchStatus {
    int64_t match;
    std::string status;
};

struct ScoreUpdate {
    int64_t team;
    int round;
    int score;
};

// Ends the worker loop
struct Stop {};

using Message = std::variant<TeamsSnapshot, MatchStatus, ScoreUpdate, Stop>;

// Body of the out-of-band POST /sync request
struct EventSnapshot {
    struct Entry {
        std::string name;
        int64_t number;
        int64_t pit;
        std::array<int, 3> scores;
    };

    int64_t match;
    std::string status;
    std::vector<Entry> teams;
};

// Endpoint path relative to the event's base URL, e.g. "/teams". Empty for
// Stop.
[[nodiscard]] std::string_view endpoint_of(const Message& msg) noexcept;

[[nodiscard]] std::string to_json(const TeamsSnapshot& msg);
[[nodiscard]] std::string to_json(const MatchStatus& msg);
[[nodiscard]] std::string to_json(const ScoreUpdate& msg);
[[nodiscard]] std::string to_json(const EventSnapshot& snapshot);

} // namespace scorekeeper::sync
