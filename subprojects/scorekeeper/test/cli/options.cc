#include "options.hh"

#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace {

struct ParsedArgs {
    Options options;
    std::vector<std::string> args; // without the program name
};

ParsedArgs parse(std::vector<std::string> args) {
    std::vector<char*> argv;
    for (auto& arg : args) {
        argv.emplace_back(arg.data());
    }
    argv.emplace_back(nullptr);

    int argc = static_cast<int>(args.size());
    ParsedArgs res;
    res.options = parse_options(argc, argv.data());
    for (int i = 1; i < argc; ++i) {
        res.args.emplace_back(argv[i]);
    }
    EXPECT_EQ(argv[argc], nullptr);
    return res;
}

} // namespace

// NOLINTNEXTLINE
TEST(parse_options, command_arguments_may_start_with_dash) {
    auto parsed = parse({"scorekeeper", "set-score", "101", "1", "-1"});
    EXPECT_TRUE(parsed.options.unknown_options.empty());
    EXPECT_EQ(parsed.args, (std::vector<std::string>{"set-score", "101", "1", "-1"}));
}

// NOLINTNEXTLINE
TEST(parse_options, global_options_precede_the_command) {
    auto parsed = parse(
        {"scorekeeper", "-c", "event.conf", "-C", "/srv/event", "import-csv", "teams.csv", "--with-scores"}
    );
    EXPECT_EQ(parsed.options.config_file, "event.conf");
    EXPECT_EQ(parsed.options.working_dir, "/srv/event");
    EXPECT_FALSE(parsed.options.help);
    EXPECT_FALSE(parsed.options.version);
    EXPECT_EQ(
        parsed.args, (std::vector<std::string>{"import-csv", "teams.csv", "--with-scores"})
    );
}

// NOLINTNEXTLINE
TEST(parse_options, double_dash_ends_options) {
    auto parsed = parse({"scorekeeper", "-V", "--", "-h"});
    EXPECT_TRUE(parsed.options.version);
    EXPECT_FALSE(parsed.options.help);
    EXPECT_EQ(parsed.args, (std::vector<std::string>{"-h"}));
}

// NOLINTNEXTLINE
TEST(parse_options, unknown_options_are_reported) {
    auto parsed = parse({"scorekeeper", "--verbose", "-c"});
    EXPECT_EQ(parsed.options.unknown_options, (std::vector<std::string>{"--verbose", "-c"}));
    EXPECT_FALSE(parsed.options.config_file.has_value());
    EXPECT_TRUE(parsed.args.empty());
}

// NOLINTNEXTLINE
TEST(parse_options, help) {
    auto parsed = parse({"scorekeeper", "--help", "rankings"});
    EXPECT_TRUE(parsed.options.help);
    EXPECT_EQ(parsed.args, (std::vector<std::string>{"rankings"}));
}
