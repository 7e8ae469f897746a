#include "commands.hh"

#include <cstdio>
#include <scorekeeper/cycle_time_report.hh>

namespace commands {

void cycle_times(Session& session, ArgvParser args) {
    expect_no_more_args(args, "cycle-times");
    auto rows = scorekeeper::build_cycle_time_report(session.store().query_match_start_times());
    puts(scorekeeper::format_cycle_time_report(rows).c_str());
}

void audit(Session& session, ArgvParser args) {
    expect_no_more_args(args, "audit");
    for (const auto& entry : session.store().load_audit_entries()) {
        printf("%.6f\t%s\t%s\n", entry.timestamp, entry.tag.c_str(), entry.data.c_str());
    }
}

} // namespace commands
