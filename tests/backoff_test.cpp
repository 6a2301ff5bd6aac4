#include "banana/util/backoff.hpp"

#include "gtest/gtest.h"

using namespace banana;
using std::chrono::milliseconds;

TEST(RetryBackoffTest, GrowsExponentially) {
  RetryBackoff backoff({.initial = milliseconds{100},
                        .max = milliseconds{10000},
                        .multiplier = 2.0,
                        .jitter = 0.0});
  EXPECT_EQ(backoff.delay(1), milliseconds{100});
  EXPECT_EQ(backoff.delay(2), milliseconds{200});
  EXPECT_EQ(backoff.delay(3), milliseconds{400});
}

TEST(RetryBackoffTest, CappedAtMax) {
  RetryBackoff backoff({.initial = milliseconds{1000},
                        .max = milliseconds{3000},
                        .multiplier = 2.0,
                        .jitter = 0.0});
  EXPECT_EQ(backoff.delay(3), milliseconds{3000});
  EXPECT_EQ(backoff.delay(30), milliseconds{3000});
}

TEST(RetryBackoffTest, JitterStaysWithinBounds) {
  RetryBackoff backoff({.initial = milliseconds{1000},
                        .max = milliseconds{30000},
                        .multiplier = 2.0,
                        .jitter = 0.2});
  for (int i = 0; i < 200; ++i) {
    auto d = backoff.delay(2);
    EXPECT_GE(d, milliseconds{1600});
    EXPECT_LE(d, milliseconds{2400});
  }
}

TEST(RetryBackoffTest, AttemptZeroTreatedAsFirst) {
  RetryBackoff backoff({.initial = milliseconds{250},
                        .max = milliseconds{1000},
                        .multiplier = 3.0,
                        .jitter = 0.0});
  EXPECT_EQ(backoff.base_delay(0), milliseconds{250});
}
