#include <scorekeeper/sync/messages.hh>
#include <sklib/json_str/json_str.hh>

namespace scorekeeper::sync {

std::string_view endpoint_of(const Message& msg) noexcept {
    switch (msg.index()) {
    case 0: return "/teams";
    case 1: return "/match";
    case 2: return "/scores";
    default: return "";
    }
}

std::string to_json(const TeamsSnapshot& msg) {
    json_str::Array arr;
    for (const auto& team : msg.teams) {
        arr.val_obj([&](auto& obj) {
            obj.prop("name", team.name);
            obj.prop("number", team.number);
            obj.prop("pit", team.pit);
        });
    }
    return std::move(arr).into_str();
}

std::string to_json(const MatchStatus& msg) {
    json_str::Object obj;
    obj.prop("match", msg.match);
    obj.prop("status", msg.status);
    return std::move(obj).into_str();
}

std::string to_json(const ScoreUpdate& msg) {
    json_str::Object obj;
    obj.prop("team", msg.team);
    obj.prop("match", msg.round);
    obj.prop("score", msg.score);
    return std::move(obj).into_str();
}

std::string to_json(const EventSnapshot& snapshot) {
    json_str::Object obj;
    obj.prop("match", snapshot.match);
    obj.prop("status", snapshot.status);
    obj.prop_arr("teams", [&](auto& arr) {
        for (const auto& team : snapshot.teams) {
            arr.val_obj([&](auto& team_obj) {
                team_obj.prop("name", team.name);
                team_obj.prop("teamnumber", team.number);
                team_obj.prop("pit", team.pit);
                team_obj.prop("round1", team.scores[0]);
                team_obj.prop("round2", team.scores[1]);
                team_obj.prop("round3", team.scores[2]);
            });
        }
    });
    return std::move(obj).into_str();
}

} // namespace scorekeeper::sync
