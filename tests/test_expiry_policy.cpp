#include <gtest/gtest.h>
#include "store/ExpiryPolicy.hpp"

using namespace cloudclip::store;
using namespace std::chrono;

TEST(ExpiryPolicy, FreshActivityIsLive) {
    const auto now = Clock::now();
    EXPECT_FALSE(is_expired(now, now));
    EXPECT_FALSE(is_expired(now - hours(23), now));
}

TEST(ExpiryPolicy, ExactlyOneDayIsStillLive) {
    const auto now = Clock::now();
    EXPECT_FALSE(is_expired(now - hours(24), now));
    EXPECT_TRUE(is_expired(now - hours(24) - seconds(1), now));
}

TEST(ExpiryPolicy, OlderThanOneDayExpires) {
    const auto now = Clock::now();
    EXPECT_TRUE(is_expired(now - hours(25), now));
}

TEST(ExpiryPolicy, FutureActivityIsLive) {
    // Wall clock stepped backwards after the session was stamped.
    const auto now = Clock::now();
    EXPECT_FALSE(is_expired(now + hours(2), now));
}
