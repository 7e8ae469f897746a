#include "session.hh"

#include <ctime>
#include <memory>
#include <scorekeeper/sync/http_client.hh>
#include <scorekeeper/version.hh>
#include <sklib/logger.hh>

namespace {

std::string event_database_path(const scorekeeper::Settings& settings) {
    time_t now = time(nullptr);
    std::tm today{};
    if (localtime_r(&now, &today) == nullptr) {
        throw CliError("localtime_r() failed");
    }
    return scorekeeper::ScoreStore::resolve_event_database(settings.data_dir, today);
}

} // namespace

Session::Session(const scorekeeper::Settings& settings)
: store_(event_database_path(settings), scorekeeper::VERSION)
, dispatcher_(
      std::make_unique<scorekeeper::sync::CurlHttpClient>(),
      settings.sync_timeout,
      settings.sync_queue_limit
  )
, controller_(store_, dispatcher_) {
    if (settings.sync_credentials) {
        dispatcher_.configure(*settings.sync_credentials);
    } else {
        stdlog("sync: no reflector credentials configured, changes are not relayed");
    }
    unwrap_or_throw(controller_.load_from_store());
}

std::string_view
extract_arg(ArgvParser& args, std::string_view command, std::string_view what) {
    if (args.size() == 0) {
        throw CliError(command, ": missing argument <", what, '>');
    }
    return args.extract_next();
}

void expect_no_more_args(const ArgvParser& args, std::string_view command) {
    if (args.size() > 0) {
        throw CliError(command, ": unexpected argument: ", args.next());
    }
}
