#include "commands.hh"

#include <fstream>
#include <scorekeeper/csv.hh>
#include <scorekeeper/errors.hh>
#include <sklib/logger.hh>
#include <string>
#include <vector>

namespace commands {

void import_csv(Session& session, ArgvParser args) {
    auto path = std::string{extract_arg(args, "import-csv", "file")};
    bool with_scores = false;
    if (args.next() == "--with-scores") {
        (void)args.extract_next();
        with_scores = true;
    }
    expect_no_more_args(args, "import-csv");

    std::ifstream in(path, std::ios::binary);
    if (not in) {
        throw CliError("import-csv: cannot open ", path);
    }

    std::vector<scorekeeper::Team> teams;
    try {
        teams = scorekeeper::parse_teams_csv(in, with_scores);
    } catch (const scorekeeper::ValidationError& e) {
        throw CliError("import-csv: ", path, ": ", e.what());
    }

    auto added = unwrap_or_throw(session.controller().add_teams(teams, with_scores));
    stdlog("Imported ", added, " new team(s) out of ", teams.size(), " from ", path);
}

void export_csv(Session& session, ArgvParser args) {
    auto path = std::string{extract_arg(args, "export-csv", "file")};
    expect_no_more_args(args, "export-csv");

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (not out) {
        throw CliError("export-csv: cannot open ", path);
    }
    scorekeeper::write_teams_csv(out, session.controller().teams());
    out.close();
    if (not out) {
        throw CliError("export-csv: failed to write ", path);
    }
    stdlog("Exported ", session.controller().teams().size(), " team(s) to ", path);
}

} // namespace commands
