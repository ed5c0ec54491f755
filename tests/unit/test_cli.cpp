#include <gtest/gtest.h>
#include "ed2kwire/core/cli.hpp"
#include <sstream>

using namespace ed2kwire::core;

class CommandLineParserTest : public ::testing::Test {
protected:
    CommandLineParser parser{"ed2kwire-dump"};
};

TEST_F(CommandLineParserTest, CapturesOnly) {
    ASSERT_TRUE(parser.parse({"a.bin", "b.bin"}));

    const auto& options = parser.options();
    ASSERT_EQ(options.captures.size(), 2u);
    EXPECT_EQ(options.captures[0], "a.bin");
    EXPECT_EQ(options.captures[1], "b.bin");
    EXPECT_FALSE(options.hex_input.has_value());
    EXPECT_FALSE(options.config_file.has_value());
    EXPECT_FALSE(options.verbose);
}

TEST_F(CommandLineParserTest, FlagsAndValues) {
    ASSERT_TRUE(parser.parse({"--verbose", "-x", "-c", "dump.ini", "--log-file=out.log", "capture.hex"}));

    const auto& options = parser.options();
    EXPECT_TRUE(options.verbose);
    EXPECT_EQ(options.hex_input, true);
    EXPECT_EQ(options.config_file, "dump.ini");
    EXPECT_EQ(options.log_file, "out.log");
    ASSERT_EQ(options.captures.size(), 1u);
}

TEST_F(CommandLineParserTest, ArgvEntryPoint) {
    char program[] = "ed2kwire-dump";
    char raw[] = "--raw";
    char capture[] = "capture.bin";
    char* argv[] = {program, raw, capture};

    ASSERT_TRUE(parser.parse(3, argv));
    EXPECT_EQ(parser.options().hex_input, false);
    EXPECT_EQ(parser.options().captures, std::vector<std::string>{"capture.bin"});
}

TEST_F(CommandLineParserTest, DoubleDashEndsOptions) {
    ASSERT_TRUE(parser.parse({"--", "-odd-name.bin", "--hex"}));

    EXPECT_FALSE(parser.options().hex_input.has_value());
    EXPECT_EQ(parser.options().captures, (std::vector<std::string>{"-odd-name.bin", "--hex"}));
}

TEST_F(CommandLineParserTest, HelpAndVersionNeedNoCaptures) {
    EXPECT_TRUE(parser.parse({"-h"}));
    EXPECT_TRUE(parser.options().show_help);

    EXPECT_TRUE(parser.parse({"--version"}));
    EXPECT_TRUE(parser.options().show_version);
    EXPECT_FALSE(parser.options().show_help);
}

TEST_F(CommandLineParserTest, RejectsInvalidCommandLines) {
    struct Case {
        std::vector<std::string> args;
        std::string error;
    };
    std::vector<Case> cases = {
        {{}, "No capture files given"},
        {{"--verbose"}, "No capture files given"},
        {{"--bogus", "a.bin"}, "Unknown option: --bogus"},
        {{"-xv", "a.bin"}, "Unknown option: -xv"},
        {{"-cdump.ini", "a.bin"}, "Unknown option: -cdump.ini"},
        {{"a.bin", "--config"}, "Option --config requires a value"},
        {{"--log-file=", "a.bin"}, "Option --log-file has an empty value"},
        {{"--hex=yes", "a.bin"}, "Option --hex does not take a value"},
        {{"--hex", "--raw", "a.bin"}, "Options --hex and --raw are mutually exclusive"},
        {{"-c", "a.ini", "--config=b.ini", "a.bin"}, "Option --config given more than once"}
    };

    for (const auto& test_case : cases) {
        EXPECT_FALSE(parser.parse(test_case.args)) << test_case.error;
        EXPECT_EQ(parser.get_error(), test_case.error);
    }
}

TEST_F(CommandLineParserTest, HelpListsOptions) {
    std::ostringstream out;
    parser.print_help(out);

    EXPECT_NE(out.str().find("Usage: ed2kwire-dump"), std::string::npos);
    EXPECT_NE(out.str().find("-x, --hex"), std::string::npos);
    EXPECT_NE(out.str().find("--log-file FILE"), std::string::npos);

    std::ostringstream version;
    parser.print_version(version);
    EXPECT_EQ(version.str(), "ed2kwire-dump version 1.0.0\n");
}
