#include <gtest/gtest.h>

#include "vanityssh/cli.hpp"
#include "vanityssh/errors.hpp"
#include "vanityssh/version.hpp"

using namespace VanitySsh;

TEST(CliTest, PatternOnlyUsesDefaults) {
    CliOptions options = parse_args({"^abc"});

    EXPECT_EQ(options.config.pattern, "^abc");
    EXPECT_FALSE(options.config.streaming);
    EXPECT_FALSE(options.config.case_sensitive);
    EXPECT_TRUE(options.config.comment.empty());
    EXPECT_FALSE(options.config.thread_count.has_value());
    EXPECT_EQ(options.config.progress_interval, CLI_PROGRESS_INTERVAL);
    EXPECT_FALSE(options.show_help);
}

TEST(CliTest, AllOptions) {
    CliOptions options =
        parse_args({"--streaming", "--comment", "me@host", "FOO", "--case-sensitive", "--threads", "8"});

    EXPECT_EQ(options.config.pattern, "FOO");
    EXPECT_TRUE(options.config.streaming);
    EXPECT_TRUE(options.config.case_sensitive);
    EXPECT_EQ(options.config.comment, "me@host");
    ASSERT_TRUE(options.config.thread_count.has_value());
    EXPECT_EQ(*options.config.thread_count, 8u);
}

TEST(CliTest, HelpAndVersionNeedNoPattern) {
    EXPECT_TRUE(parse_args({"--help"}).show_help);
    EXPECT_TRUE(parse_args({"--version"}).show_version);
    EXPECT_EQ(version_string(), "1.0");
}

TEST(CliTest, Errors) {
    EXPECT_THROW(parse_args({}), InvalidArgument);
    EXPECT_THROW(parse_args({"a", "b"}), InvalidArgument);
    EXPECT_THROW(parse_args({"a", "--bogus"}), InvalidArgument);
    EXPECT_THROW(parse_args({"a", "--comment"}), InvalidArgument);
    EXPECT_THROW(parse_args({"a", "--threads"}), InvalidArgument);
    EXPECT_THROW(parse_args({"a", "--threads", "0"}), InvalidThreadCount);
    EXPECT_THROW(parse_args({"a", "--threads", "-2"}), InvalidThreadCount);
    EXPECT_THROW(parse_args({"a", "--threads", "four"}), InvalidThreadCount);
}

TEST(CliTest, UsageMentionsEveryOption) {
    std::string text = usage("vanityssh");
    for (const char* option : {"--streaming", "--comment", "--case-sensitive", "--threads", "--help", "--version"}) {
        EXPECT_NE(text.find(option), std::string::npos) << option;
    }
    EXPECT_NE(text.find("Usage: vanityssh <pattern>"), std::string::npos);
}

TEST(CliTest, UsageNamesThePatternDialect) {
    EXPECT_NE(usage("vanityssh").find("ECMAScript regex"), std::string::npos);
}
