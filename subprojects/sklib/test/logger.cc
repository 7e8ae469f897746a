#include "intercept_logger.hh"

#include <gmock/gmock-matchers.h>
#include <gtest/gtest.h>
#include <sklib/logger.hh>
#include <thread>

using ::testing::MatchesRegex;

// NOLINTNEXTLINE
TEST(Logger, appender_concatenates_arguments) {
    Logger logger(stderr);
    auto logged = intercept_logger(logger, [&] {
        logger("answer: ", 42, ' ', true);
        auto app = logger("multi");
        app(" part");
        app << " line";
    });
    EXPECT_EQ(logged, "answer: 42 true\nmulti part line\n");
}

// NOLINTNEXTLINE
TEST(Logger, label_prefixes_date) {
    Logger logger(stderr);
    auto logged = intercept_logger(logger, [&] {
        logger.label(true);
        logger("labeled");
    });
    EXPECT_THAT(logged, MatchesRegex(R"(\[ [0-9-]+ [0-9:]+ \] labeled
)"));
}

// NOLINTNEXTLINE
TEST(Logger, dummy_logger_discards) {
    Logger logger(nullptr);
    logger("nothing happens");
    SUCCEED();
}

// NOLINTNEXTLINE
TEST(Logger, concurrent_lines_are_not_interleaved) {
    Logger logger(stderr);
    auto logged = intercept_logger(logger, [&] {
        auto log_many = [&](char c) {
            for (int i = 0; i < 200; ++i) {
                logger(std::string(50, c));
            }
        };
        std::thread a(log_many, 'a');
        std::thread b(log_many, 'b');
        a.join();
        b.join();
    });

    size_t lines = 0;
    size_t beg = 0;
    while (beg < logged.size()) {
        auto end = logged.find('\n', beg);
        ASSERT_NE(end, std::string::npos);
        auto line = logged.substr(beg, end - beg);
        EXPECT_TRUE(line == std::string(50, 'a') or line == std::string(50, 'b')) << line;
        ++lines;
        beg = end + 1;
    }
    EXPECT_EQ(lines, 400U);
}
