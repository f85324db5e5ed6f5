#include <gtest/gtest.h>
#include "Admission.h"
#include "Logger.h"
#include "TestUtil.h"

using Admission::RateDecision;
using Admission::RateLimiter;

class RateLimiterTest : public ::testing::Test {
protected:
    RateLimiterTest() {
        policy.soft = 10;
        policy.warn = 15;
        policy.hard = 20;
        policy.window_seconds = 60;
        policy.block_seconds = 60;
    }

    RateLimiter make_limiter() {
        return RateLimiter(policy, dir.file("data/rate_limits.json"), logger, clock.fn());
    }

    // Issues n requests 0.5s apart and returns the last decision.
    RateDecision send(RateLimiter& limiter, int n, const std::string& who = "alice") {
        RateDecision last;
        for (int i = 0; i < n; ++i) {
            last = limiter.check(who);
            clock.advance(0.5);
        }
        return last;
    }

    testutil::TempDir dir;
    testutil::ManualClock clock;
    Logger logger{dir.path() + "/logs", clock.fn()};
    RateLimitPolicy policy;
};

TEST_F(RateLimiterTest, EleventhAllowedWithoutWarning) {
    auto limiter = make_limiter();
    send(limiter, 10);
    RateDecision eleventh = limiter.check("alice");
    EXPECT_TRUE(eleventh.allowed);
    EXPECT_FALSE(eleventh.warning.has_value());
}

TEST_F(RateLimiterTest, SixteenthWarnsExactlyOnce) {
    auto limiter = make_limiter();
    int warnings = 0;
    for (int i = 1; i <= 20; ++i) {
        RateDecision d = limiter.check("alice");
        clock.advance(0.5);
        ASSERT_TRUE(d.allowed) << "request " << i;
        if (d.warning) {
            ++warnings;
            EXPECT_EQ(i, 16);
        }
    }
    EXPECT_EQ(warnings, 1);
}

TEST_F(RateLimiterTest, TwentyFirstIsDeniedWithBoundedWait) {
    auto limiter = make_limiter();
    send(limiter, 20);
    RateDecision d = limiter.check("alice");
    EXPECT_FALSE(d.allowed);
    EXPECT_GT(d.wait_seconds, 0);
    EXPECT_LE(d.wait_seconds, 60);

    std::string audit = testutil::read_file(logger.audit_path());
    EXPECT_NE(audit.find("RATE_LIMIT_EXCEEDED - User: alice"), std::string::npos);
}

TEST_F(RateLimiterTest, BlockReportsRemainingTime) {
    auto limiter = make_limiter();
    send(limiter, 21);
    clock.advance(20);
    RateDecision d = limiter.check("alice");
    EXPECT_FALSE(d.allowed);
    EXPECT_LE(d.wait_seconds, 40);
    EXPECT_GE(d.wait_seconds, 39);
}

TEST_F(RateLimiterTest, WindowExpiryResetsCount) {
    auto limiter = make_limiter();
    send(limiter, 21);
    clock.advance(120);
    RateDecision d = limiter.check("alice");
    EXPECT_TRUE(d.allowed);
    EXPECT_EQ(d.count, 0);
    EXPECT_FALSE(d.warning.has_value());
}

TEST_F(RateLimiterTest, IdentitiesAreIndependent) {
    auto limiter = make_limiter();
    send(limiter, 21, "alice");
    EXPECT_FALSE(limiter.check("alice").allowed);
    EXPECT_TRUE(limiter.check("bob").allowed);
}

TEST_F(RateLimiterTest, WarnsAgainAfterDroppingBelowSoft) {
    auto limiter = make_limiter();
    double start = clock.now();
    int warnings = 0;
    for (int i = 0; i < 16; ++i) {
        RateDecision d = limiter.check("alice");
        clock.advance(0.5);
        if (d.warning) ++warnings;
    }
    EXPECT_EQ(warnings, 1);

    // Requests at start+0.0 .. start+3.0 fall out of the window, nine remain.
    clock.set(start + 63.0);
    RateDecision quiet = limiter.check("alice");
    EXPECT_TRUE(quiet.allowed);
    EXPECT_FALSE(quiet.warning.has_value());

    // Ten in the window now; the sixth request of the new burst sees fifteen before it.
    RateDecision last;
    for (int i = 0; i < 6; ++i) {
        last = limiter.check("alice");
        ASSERT_TRUE(last.allowed) << "request " << i;
        if (last.warning) ++warnings;
    }
    EXPECT_TRUE(last.warning.has_value());
    EXPECT_EQ(warnings, 2);
}

TEST_F(RateLimiterTest, StateIsSharedThroughTheStore) {
    // Two limiters over one file behave like two short-lived invocations.
    auto first = make_limiter();
    auto second = make_limiter();
    send(first, 10);
    send(second, 10);
    EXPECT_FALSE(first.check("alice").allowed);
}

TEST_F(RateLimiterTest, RejectionMessageCarriesWait) {
    RateDecision d;
    d.allowed = false;
    d.wait_seconds = 42;
    OpResult r = Admission::rate_limit_rejection(d);
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.error, ErrorKind::RateLimited);
    EXPECT_EQ(r.payload["wait_seconds"], 42);
    EXPECT_NE(r.reason.find("42 seconds"), std::string::npos);
}
