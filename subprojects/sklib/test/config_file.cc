#include <gtest/gtest.h>
#include <sklib/config_file.hh>

// NOLINTNEXTLINE
TEST(ConfigFile, literals_and_comments) {
    ConfigFile cf;
    cf.add_vars("a", "b", "c", "missing");
    cf.load_config_from_string("# comment\n"
                               "a: foo bar   # trailing comment\n"
                               "  b = 42\n"
                               "\n"
                               "c:\n");

    EXPECT_TRUE(cf["a"].is_set());
    EXPECT_EQ(cf["a"].as_string(), "foo bar");
    EXPECT_EQ(cf["a"].line(), 2U);
    EXPECT_EQ(cf["b"].as<int>(), 42);
    EXPECT_TRUE(cf["c"].is_set());
    EXPECT_EQ(cf["c"].as_string(), "");
    EXPECT_FALSE(cf["missing"].is_set());
    EXPECT_FALSE(cf["not-added"].is_set());
}

// NOLINTNEXTLINE
TEST(ConfigFile, quoted_strings) {
    ConfigFile cf;
    cf.add_vars("single", "double");
    cf.load_config_from_string("single: 'it''s # not a comment'\n"
                               "double: \"tab\\tquote\\\" end\"\n");
    EXPECT_EQ(cf["single"].as_string(), "it's # not a comment");
    EXPECT_EQ(cf["double"].as_string(), "tab\tquote\" end");
}

// NOLINTNEXTLINE
TEST(ConfigFile, as_integer) {
    ConfigFile cf;
    cf.add_vars("num", "neg", "text", "flag");
    cf.load_config_from_string("num: 5000\nneg: -3\ntext: 12ab\nflag: true\n");
    EXPECT_EQ(cf["num"].as<int64_t>(), 5000);
    EXPECT_EQ(cf["neg"].as<int>(), -3);
    EXPECT_EQ(cf["neg"].as<unsigned>(), std::nullopt);
    EXPECT_EQ(cf["text"].as<int>(), std::nullopt);
    EXPECT_TRUE(cf["flag"].as_bool());
    EXPECT_FALSE(cf["num"].as_bool());
}

// NOLINTNEXTLINE
TEST(ConfigFile, load_all) {
    ConfigFile cf;
    cf.load_config_from_string("x: 1\ny: 2\n", true);
    EXPECT_EQ(cf.get_vars().size(), 2U);
    EXPECT_EQ(cf["y"].as_string(), "2");
}

// NOLINTNEXTLINE
TEST(ConfigFile, parse_errors) {
    ConfigFile cf;
    cf.add_vars("a");
    EXPECT_THROW(cf.load_config_from_string("a 1\n"), ConfigFile::ParseError);
    EXPECT_THROW(cf.load_config_from_string("a: 'unterminated\n"), ConfigFile::ParseError);
    EXPECT_THROW(cf.load_config_from_string("a: \"bad \\q escape\"\n"), ConfigFile::ParseError);
    EXPECT_THROW(cf.load_config_from_string("a: 'x' garbage\n"), ConfigFile::ParseError);
    EXPECT_THROW(cf.load_config_from_string(": value\n"), ConfigFile::ParseError);

    try {
        cf.load_config_from_string("\na: 'x' y\n");
        FAIL() << "expected ParseError";
    } catch (const ConfigFile::ParseError& e) {
        EXPECT_EQ(std::string{e.what()}, "line 2:8: Unexpected character after the value: `y`");
        EXPECT_EQ(e.diagnostics(), "a: 'x' y\n       ^");
    }
}

// NOLINTNEXTLINE
TEST(ConfigFile, escape_string) {
    EXPECT_EQ(ConfigFile::escape_string("plain"), "plain");
    EXPECT_EQ(ConfigFile::escape_string(""), "\"\"");
    EXPECT_EQ(ConfigFile::escape_string(" padded"), "\" padded\"");
    EXPECT_EQ(ConfigFile::escape_string("a#b"), "\"a#b\"");
    EXPECT_EQ(ConfigFile::escape_string("say \"hi\"\n"), "\"say \\\"hi\\\"\\n\"");

    ConfigFile cf;
    cf.add_vars("v");
    cf.load_config_from_string(concat_tostr("v: ", ConfigFile::escape_string("say \"hi\"\n"), '\n'));
    EXPECT_EQ(cf["v"].as_string(), "say \"hi\"\n");
}
