#include "options.hh"

#include <cstring>

Options parse_options(int& argc, char** argv) {
    Options options;
    int i = 1;
    for (; i < argc and argv[i][0] == '-'; ++i) {
        if (0 == strcmp(argv[i], "--")) {
            ++i;
            break;
        }

        if (0 == strcmp(argv[i], "-c") and i + 1 < argc) {
            options.config_file = argv[++i];
        } else if (0 == strcmp(argv[i], "-C") and i + 1 < argc) {
            options.working_dir = argv[++i];
        } else if (0 == strcmp(argv[i], "-h") or 0 == strcmp(argv[i], "--help")) {
            options.help = true;
        } else if (0 == strcmp(argv[i], "-V") or 0 == strcmp(argv[i], "--version")) {
            options.version = true;
        } else {
            options.unknown_options.emplace_back(argv[i]);
        }
    }

    // Shift the command with its arguments right after the program name
    int new_argc = 1;
    for (; i < argc; ++i) {
        argv[new_argc++] = argv[i];
    }
    argc = new_argc;
    argv[argc] = nullptr;
    return options;
}
