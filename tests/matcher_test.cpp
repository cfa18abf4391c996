#include <gtest/gtest.h>

#include <atomic>
#include <string>
#include <thread>
#include <vector>

#include "vanityssh/errors.hpp"
#include "vanityssh/matcher.hpp"

using namespace VanitySsh;

TEST(MatcherTest, CaseInsensitiveByDefault) {
    PatternMatcher insensitive("ABC", false);
    EXPECT_TRUE(insensitive.test("xxxabcxxx"));
    EXPECT_TRUE(insensitive.test("xxxABCxxx"));

    PatternMatcher sensitive("ABC", true);
    EXPECT_FALSE(sensitive.test("xxxabcxxx"));
    EXPECT_TRUE(sensitive.test("xxxABCxxx"));
}

TEST(MatcherTest, RegexFeatures) {
    const std::string body = "AAAAC3NzaC1lZDI1NTE5AAAAIFooBar+/Baz";

    EXPECT_TRUE(PatternMatcher("^AAAA", false).test(body));
    EXPECT_TRUE(PatternMatcher("baz$", false).test(body));
    EXPECT_FALSE(PatternMatcher("baz$", true).test(body));
    EXPECT_TRUE(PatternMatcher("foo.*bar", false).test(body));
    EXPECT_TRUE(PatternMatcher("\\+/", true).test(body));
    EXPECT_FALSE(PatternMatcher("zzzz", false).test(body));
}

TEST(MatcherTest, InvalidPattern) {
    EXPECT_THROW(PatternMatcher("(unclosed", false), InvalidPattern);
    EXPECT_THROW(PatternMatcher("[", true), InvalidPattern);
    // InvalidPattern is reported as an invalid argument
    EXPECT_THROW(PatternMatcher("abc)", false), InvalidArgument);
}

TEST(MatcherTest, KeepsPatternAndMode) {
    PatternMatcher matcher("^abc", true);
    EXPECT_EQ(matcher.pattern(), "^abc");
    EXPECT_TRUE(matcher.case_sensitive());
}

TEST(MatcherTest, SharedAcrossThreads) {
    const PatternMatcher matcher("^AAAAC3.*ab", false);
    std::atomic<int> mismatches{0};

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&]() {
            for (int i = 0; i < 2000; ++i) {
                if (!matcher.test("AAAAC3NzaC1lZDI1NTE5xxAB") || matcher.test("BAAAC3NzaC1lZDI1NTE5xxAB")) {
                    ++mismatches;
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    EXPECT_EQ(mismatches.load(), 0);
}
