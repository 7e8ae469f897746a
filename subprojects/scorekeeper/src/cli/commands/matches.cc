#include "commands.hh"

#include <cstdio>
#include <scorekeeper/sync/messages.hh>
#include <sklib/logger.hh>
#include <string>

namespace commands {

void start_match(Session& session, ArgvParser args) {
    auto match = extract_number_arg<int64_t>(args, "start-match", "match");
    expect_no_more_args(args, "start-match");
    unwrap_or_throw(session.controller().start_match(match));
}

void abort_match(Session& session, ArgvParser args) {
    auto match = extract_number_arg<int64_t>(args, "abort-match", "match");
    expect_no_more_args(args, "abort-match");
    unwrap_or_throw(session.controller().abort_match(match));
}

void complete_match(Session& session, ArgvParser args) {
    auto match = extract_number_arg<int64_t>(args, "complete-match", "match");
    expect_no_more_args(args, "complete-match");
    auto next_match = unwrap_or_throw(session.controller().complete_match(match));
    printf("Next match: %lld\n", static_cast<long long>(next_match));
}

void force_sync(Session& session, ArgvParser args) {
    auto match = extract_number_arg<int64_t>(args, "force-sync", "match");
    std::string status{scorekeeper::sync::STATUS_QUEUEING};
    if (args.size() > 0) {
        status = args.extract_next();
    }
    expect_no_more_args(args, "force-sync");

    auto res = session.controller().force_sync(match, std::move(status));
    if (res.is_err()) {
        throw CliError("force-sync: ", res.err().what());
    }
    stdlog("Event state sent to the reflector");
}

} // namespace commands
