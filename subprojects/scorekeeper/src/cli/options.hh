#pragma once

#include <optional>
#include <string>
#include <vector>

struct Options {
    std::optional<std::string> config_file;
    std::optional<std::string> working_dir;
    bool help = false;
    bool version = false;
    std::vector<std::string> unknown_options;
};

/**
 * Parses the global options, i.e. the arguments before the command name.
 * "--" also ends them. The command and its arguments are kept in @p argv
 * unchanged, so command arguments such as a score of -1 are not taken for
 * options.
 * @param argc like in main (will be modified to hold the number of non-option
 * parameters)
 * @param argv like in main (holds arguments)
 */
Options parse_options(int& argc, char** argv);
