#include <gtest/gtest.h>
#include <disburse/jobs/backoff.hpp>

TEST(backoff, doubles_from_the_base_delay) {
  auto policy = disburse::jobs::backoff_policy{1'000, 1'000'000, 0.0};
  auto zero = [] { return 0.0; };
  EXPECT_EQ(disburse::jobs::compute_backoff(policy, 1, zero), 1'000u);
  EXPECT_EQ(disburse::jobs::compute_backoff(policy, 2, zero), 2'000u);
  EXPECT_EQ(disburse::jobs::compute_backoff(policy, 3, zero), 4'000u);
  EXPECT_EQ(disburse::jobs::compute_backoff(policy, 6, zero), 32'000u);
}

TEST(backoff, is_capped) {
  auto policy = disburse::jobs::backoff_policy{};
  auto zero = [] { return 0.0; };
  EXPECT_EQ(disburse::jobs::compute_backoff(policy, 1, zero), 60'000u);
  EXPECT_EQ(disburse::jobs::compute_backoff(policy, 7, zero), 3'600'000u);
  EXPECT_EQ(disburse::jobs::compute_backoff(policy, 200, zero), 3'600'000u);
}

TEST(backoff, jitter_stays_below_the_ratio) {
  auto policy = disburse::jobs::backoff_policy{10'000, 3'600'000, 0.10};
  EXPECT_EQ(disburse::jobs::compute_backoff(policy, 1, [] { return 0.5; }),
            10'500u);
  EXPECT_LT(disburse::jobs::compute_backoff(policy, 1, [] { return 1.0; }),
            11'000u);

  auto random = disburse::jobs::default_random_source();
  for (int i = 0; i < 100; ++i) {
    auto delay = disburse::jobs::compute_backoff(policy, 2, random);
    EXPECT_GE(delay, 20'000u);
    EXPECT_LT(delay, 22'000u);
  }
}
