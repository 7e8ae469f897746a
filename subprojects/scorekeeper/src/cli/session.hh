#pragma once

#include "cli_error.hh"

#include <charconv>
#include <scorekeeper/event_controller.hh>
#include <scorekeeper/score_store.hh>
#include <scorekeeper/settings.hh>
#include <scorekeeper/sync/sync_dispatcher.hh>
#include <sklib/argv_parser.hh>
#include <sklib/result.hh>
#include <string_view>

// The open event: store, sync dispatcher and controller. Destruction flushes
// the queued sync messages and closes the store.
class Session {
    scorekeeper::ScoreStore store_;
    scorekeeper::sync::SyncDispatcher dispatcher_;
    scorekeeper::EventController controller_;

public:
    explicit Session(const scorekeeper::Settings& settings);

    Session(const Session&) = delete;
    Session(Session&&) = delete;
    Session& operator=(const Session&) = delete;
    Session& operator=(Session&&) = delete;

    ~Session() = default;

    scorekeeper::ScoreStore& store() noexcept { return store_; }

    scorekeeper::sync::SyncDispatcher& dispatcher() noexcept { return dispatcher_; }

    scorekeeper::EventController& controller() noexcept { return controller_; }
};

// Extracts the next argument, @p what names it in the error message
std::string_view extract_arg(ArgvParser& args, std::string_view command, std::string_view what);

template <class T>
T extract_number_arg(ArgvParser& args, std::string_view command, std::string_view what) {
    auto str = extract_arg(args, command, what);
    T res{};
    auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), res);
    if (ec != std::errc{} or ptr != str.data() + str.size()) {
        throw CliError(command, ": invalid ", what, ": ", str);
    }
    return res;
}

void expect_no_more_args(const ArgvParser& args, std::string_view command);

template <class T>
T unwrap_or_throw(Result<T, scorekeeper::ControllerError>&& res) {
    if (res.is_err()) {
        throw CliError(res.err().message);
    }
    return std::move(res).unwrap();
}
