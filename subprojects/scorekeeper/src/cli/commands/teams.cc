#include "commands.hh"

#include <cstdio>
#include <optional>
#include <scorekeeper/team.hh>
#include <sklib/logger.hh>
#include <string>

namespace commands {

void add_team(Session& session, ArgvParser args) {
    auto number = extract_number_arg<int64_t>(args, "add-team", "number");
    auto name = extract_arg(args, "add-team", "name");
    int64_t pit = (args.size() > 0 ? extract_number_arg<int64_t>(args, "add-team", "pit") : 0);
    expect_no_more_args(args, "add-team");

    unwrap_or_throw(session.controller().add_team(number, std::string{name}, pit));
    stdlog("Added team ", number, ": ", name);
}

void update_team(Session& session, ArgvParser args) {
    auto number = extract_number_arg<int64_t>(args, "update-team", "number");
    auto name = extract_arg(args, "update-team", "name");
    std::optional<int64_t> pit;
    if (args.size() > 0) {
        pit = extract_number_arg<int64_t>(args, "update-team", "pit");
    }
    expect_no_more_args(args, "update-team");

    const auto* team = session.controller().find_team(number);
    if (team == nullptr) {
        throw CliError("update-team: no team with number ", number);
    }
    unwrap_or_throw(
        session.controller().update_team(number, std::string{name}, pit.value_or(team->pit))
    );
}

void delete_team(Session& session, ArgvParser args) {
    auto number = extract_number_arg<int64_t>(args, "delete-team", "number");
    expect_no_more_args(args, "delete-team");

    unwrap_or_throw(session.controller().delete_team(number));
    stdlog("Deleted team ", number);
}

void set_score(Session& session, ArgvParser args) {
    auto number = extract_number_arg<int64_t>(args, "set-score", "number");
    auto round = extract_number_arg<int>(args, "set-score", "round");
    auto score = extract_number_arg<int>(args, "set-score", "score");
    std::string comments;
    if (args.size() > 0) {
        comments = args.extract_next();
    }
    expect_no_more_args(args, "set-score");

    unwrap_or_throw(session.controller().set_score(number, round, score, comments));
}

void rankings(Session& session, ArgvParser args) {
    expect_no_more_args(args, "rankings");

    printf("%-6s %-8s %-30s %-5s %6s %6s %6s\n", "Rank", "Number", "Name", "Pit", "R1", "R2", "R3");
    for (const auto& team : session.controller().teams()) {
        printf(
            "%-6s %-8lld %-30s %-5lld %6d %6d %6d\n",
            scorekeeper::rank_label(team.rank).c_str(),
            static_cast<long long>(team.number),
            team.name.c_str(),
            static_cast<long long>(team.pit),
            team.scores[0],
            team.scores[1],
            team.scores[2]
        );
    }
}

} // namespace commands
