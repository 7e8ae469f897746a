#include <gtest/gtest.h>
#include <sklib/result.hh>
#include <string>

namespace {

Result<int, std::string> parse_digit(char c) {
    if (c >= '0' and c <= '9') {
        return Ok{c - '0'};
    }
    return Err{std::string{"not a digit: "} + c};
}

} // namespace

// NOLINTNEXTLINE
TEST(Result, ok_and_err) {
    auto ok = parse_digit('7');
    EXPECT_TRUE(ok.is_ok());
    EXPECT_FALSE(ok.is_err());
    EXPECT_EQ(ok.val(), 7);
    EXPECT_TRUE(ok == Ok{7});
    EXPECT_FALSE(ok == Err{std::string{"x"}});
    EXPECT_EQ(std::move(ok).unwrap(), 7);

    auto err = parse_digit('x');
    EXPECT_TRUE(err.is_err());
    EXPECT_EQ(err.err(), "not a digit: x");
    EXPECT_TRUE(err == Err{std::string{"not a digit: x"}});
    EXPECT_EQ(std::move(err).unwrap_err(), "not a digit: x");
}

// NOLINTNEXTLINE
TEST(Result, void_alternatives) {
    Result<void, int> ok = Ok{};
    EXPECT_TRUE(ok.is_ok());
    EXPECT_TRUE(ok == Ok{});
    std::move(ok).unwrap();

    Result<int, void> err = Err{};
    EXPECT_TRUE(err.is_err());
    EXPECT_TRUE(err == Err{});
    EXPECT_THROW((void)std::move(err).unwrap(), std::bad_variant_access);
}
