/**
 * @file test_types.cpp
 * @brief Unit tests for core types.
 */

#include "core/types.hpp"

#include <gtest/gtest.h>

using namespace jobguard;

TEST(ResourcePolicyTest, DefaultsAreUnbounded) {
    ResourcePolicy policy;
    EXPECT_FALSE(policy.has_timeout());
    EXPECT_FALSE(policy.has_address_space_limit());
    EXPECT_FALSE(policy.has_cpu_limit());
    EXPECT_EQ(policy.concurrency, 1u);
}

TEST(ResourcePolicyTest, Predicates) {
    ResourcePolicy policy{.timeout = Duration{5000}, .address_space_mb = 256, .cpu_seconds = 10};
    EXPECT_TRUE(policy.has_timeout());
    EXPECT_TRUE(policy.has_address_space_limit());
    EXPECT_TRUE(policy.has_cpu_limit());
}

TEST(RunPhaseTest, ToString) {
    EXPECT_EQ(to_string(RunPhase::Pending), "pending");
    EXPECT_EQ(to_string(RunPhase::Running), "running");
    EXPECT_EQ(to_string(RunPhase::SkippedConcurrent), "skipped_concurrent");
}

TEST(RunOutcomeTest, TerminalPhaseMapping) {
    EXPECT_EQ(outcome_of(RunPhase::Succeeded), RunOutcome::Success);
    EXPECT_EQ(outcome_of(RunPhase::Failed), RunOutcome::Failed);
    EXPECT_EQ(outcome_of(RunPhase::TimedOut), RunOutcome::TimedOut);
    EXPECT_EQ(outcome_of(RunPhase::SkippedConcurrent), RunOutcome::SkippedConcurrent);
    EXPECT_EQ(to_string(RunOutcome::TimedOut), "timed_out");
}

TEST(ReasonCodeTest, ToString) {
    EXPECT_EQ(to_string(ReasonCode::CpuLimit), "cpu_limit");
    EXPECT_EQ(to_string(ReasonCode::MemoryLimit), "memory_limit");
    EXPECT_EQ(to_string(ReasonCode::ConcurrencyLimit), "concurrency_limit");
    EXPECT_EQ(to_string(ReasonCode::Internal), "internal_error");
}

TEST(RunRecordTest, Duration) {
    RunRecord record;
    record.started_at = Timestamp{std::chrono::seconds{100}};
    record.finished_at = record.started_at + std::chrono::milliseconds{1500};
    EXPECT_EQ(record.duration(), Duration{1500});
}

TEST(RetryPolicyTest, ExponentialBackoff) {
    RetryPolicy policy{.max_retries = 4, .delay = Duration{100}, .backoff = 2.0};
    EXPECT_TRUE(policy.enabled());
    EXPECT_EQ(policy.delay_for(1), Duration{100});
    EXPECT_EQ(policy.delay_for(2), Duration{200});
    EXPECT_EQ(policy.delay_for(3), Duration{400});
    EXPECT_EQ(policy.delay_for(4), Duration{800});
}

TEST(RetryPolicyTest, DelayIsCapped) {
    RetryPolicy policy{.max_retries = 100, .delay = Duration{60000}, .backoff = 10.0};
    EXPECT_EQ(policy.delay_for(50), RetryPolicy::kMaxDelay);
    EXPECT_EQ(policy.delay_for(1), Duration{60000});
}

TEST(RetryPolicyTest, ConstantDelayWithUnitBackoff) {
    RetryPolicy policy{.max_retries = 2, .delay = Duration{500}, .backoff = 1.0};
    EXPECT_EQ(policy.delay_for(1), Duration{500});
    EXPECT_EQ(policy.delay_for(2), Duration{500});
}
