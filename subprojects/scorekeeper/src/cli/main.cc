#include "cli_error.hh"
#include "commands/commands.hh"
#include "options.hh"
#include "session.hh"

#include <cstdio>
#include <filesystem>
#include <scorekeeper/errors.hh>
#include <scorekeeper/settings.hh>
#include <sklib/argv_parser.hh>
#include <sklib/config_file.hh>
#include <sklib/debug.hh>
#include <sklib/logger.hh>
#include <string>
#include <unistd.h>

namespace {

scorekeeper::Settings load_settings(const Options& options) {
    if (options.config_file) {
        return scorekeeper::load_settings_from_file(*options.config_file);
    }
    if (std::filesystem::exists(scorekeeper::DEFAULT_CONFIG_FILE)) {
        return scorekeeper::load_settings_from_file(scorekeeper::DEFAULT_CONFIG_FILE);
    }
    return scorekeeper::Settings{};
}

void setup_loggers(const scorekeeper::Settings& settings) {
    if (not settings.log_file.empty()) {
        stdlog.open(settings.log_file);
    }
    if (not settings.error_log_file.empty()) {
        errlog.open(settings.error_log_file);
    }
}

void run_command(int argc, char** argv, const scorekeeper::Settings& settings) {
    ArgvParser args(argc - 1, argv + 1);
    std::string_view command = args.extract_next();

    // Commands that do not need the event
    if (command == "help") {
        return commands::help(argv[0]);
    }
    if (command == "version") {
        return commands::version();
    }

    using CommandFn = void (*)(Session&, ArgvParser);
    CommandFn fn = nullptr;
    if (command == "add-team") {
        fn = commands::add_team;
    } else if (command == "update-team") {
        fn = commands::update_team;
    } else if (command == "delete-team") {
        fn = commands::delete_team;
    } else if (command == "set-score") {
        fn = commands::set_score;
    } else if (command == "rankings") {
        fn = commands::rankings;
    } else if (command == "import-csv") {
        fn = commands::import_csv;
    } else if (command == "export-csv") {
        fn = commands::export_csv;
    } else if (command == "start-match") {
        fn = commands::start_match;
    } else if (command == "abort-match") {
        fn = commands::abort_match;
    } else if (command == "complete-match") {
        fn = commands::complete_match;
    } else if (command == "force-sync") {
        fn = commands::force_sync;
    } else if (command == "cycle-times") {
        fn = commands::cycle_times;
    } else if (command == "audit") {
        fn = commands::audit;
    } else {
        throw CliError("unknown command: ", command);
    }

    Session session(settings);
    fn(session, args);
}

int real_main(int argc, char** argv) {
    try {
        auto options = parse_options(argc, argv);
        for (const auto& option : options.unknown_options) {
            (void)fprintf(stderr, "Unknown option: '%s'\n", option.c_str());
        }
        if (options.help) {
            commands::help(argv[0]);
            return 0;
        }
        if (options.version) {
            commands::version();
            return 0;
        }
        if (options.working_dir and chdir(options.working_dir->c_str()) == -1) {
            throw CliError("chdir('", *options.working_dir, "')", errmsg());
        }
        if (argc < 2) {
            commands::help(argv[0]);
            return 1;
        }

        auto settings = load_settings(options);
        setup_loggers(settings);
        run_command(argc, argv, settings);
    } catch (const CliError& e) {
        errlog("\033[1;31mError\033[m: ", e.what());
        return 1;
    } catch (const ConfigFile::ParseError& e) {
        errlog("\033[1;31mError\033[m: config: ", e.what());
        return 1;
    } catch (const scorekeeper::PersistenceError& e) {
        errlog("\033[1;31mError\033[m: ", e.what());
        return 1;
    } catch (const std::exception& e) {
        ERRLOG_CATCH(e);
        return 1;
    }

    return 0;
}

} // namespace

int main(int argc, char** argv) { return real_main(argc, argv); }
