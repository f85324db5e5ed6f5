#include <gtest/gtest.h>
#include "Admission.h"
#include "Logger.h"
#include "TestUtil.h"

using Admission::InputSanitizer;

class SanitizerTest : public ::testing::Test {
protected:
    testutil::TempDir dir;
    Logger logger{dir.path() + "/logs"};
    InputSanitizer sanitizer{logger};
};

TEST_F(SanitizerTest, RejectsShellAndFetchPatterns) {
    const char* hostile[] = {
        "$(whoami)",
        "`ls -la`",
        "a && rm -rf /",
        "curl http://x",
        "eval(1)",
        "https://x",
    };
    for (const char* input : hostile) {
        auto r = sanitizer.sanitize(input, "mallory");
        EXPECT_FALSE(r.valid) << input;
        EXPECT_EQ(r.reason, "Invalid input detected") << input;
        EXPECT_TRUE(r.cleaned.empty()) << input;
    }
}

TEST_F(SanitizerTest, AcceptsAndTrimsLabType) {
    auto r = sanitizer.sanitize("  dvwa  ");
    ASSERT_TRUE(r.valid);
    EXPECT_EQ(r.cleaned, "dvwa");
    EXPECT_TRUE(r.matched_rule.empty());
}

TEST_F(SanitizerTest, MatchesAreCaseInsensitive) {
    EXPECT_FALSE(sanitizer.sanitize("SUDO reboot").valid);
    EXPECT_FALSE(sanitizer.sanitize("Import   OS").valid);
    EXPECT_FALSE(sanitizer.sanitize("cat /ETC/PASSWD").valid);
}

TEST_F(SanitizerTest, WordBoundariesAvoidFalsePositives) {
    // "curly" and "executive" only contain the blocked words as substrings
    EXPECT_TRUE(sanitizer.sanitize("curly").valid);
    EXPECT_TRUE(sanitizer.sanitize("executive").valid);
    EXPECT_TRUE(sanitizer.sanitize("juice-shop").valid);
}

TEST_F(SanitizerTest, EmptyInputIsRejected) {
    auto r = sanitizer.sanitize("   \t ");
    EXPECT_FALSE(r.valid);
    EXPECT_EQ(r.reason, "Empty input");
}

TEST_F(SanitizerTest, MatchedRuleIsAuditedButNotInReason) {
    auto r = sanitizer.sanitize("x; rm -rf ~", "mallory");
    ASSERT_FALSE(r.valid);
    EXPECT_EQ(r.matched_rule, "destructive_command");
    EXPECT_EQ(r.reason.find("destructive"), std::string::npos);

    std::string audit = testutil::read_file(logger.audit_path());
    EXPECT_NE(audit.find("BLOCKED_INPUT - User: mallory"), std::string::npos);
    EXPECT_NE(audit.find("destructive_command"), std::string::npos);
}

TEST_F(SanitizerTest, FirstMatchingRuleWins) {
    // Both command_substitution and external_fetch match; order decides.
    auto r = sanitizer.sanitize("$(curl x)");
    EXPECT_EQ(r.matched_rule, "command_substitution");
    EXPECT_EQ(InputSanitizer::default_rules().front().name, "command_substitution");
    EXPECT_EQ(InputSanitizer::default_rules().size(), 10u);
}
