#include "utils/timestamp.hpp"

#include <gtest/gtest.h>

#include <climits>
#include <string>

using utils::Timestamp;

TEST(Timestamp, FormatsAsDateAndTime)
{
    const std::string s = Timestamp::formatFromEpochSeconds(0);
    ASSERT_EQ(19u, s.size());
    EXPECT_EQ('-', s[4]);
    EXPECT_EQ('-', s[7]);
    EXPECT_EQ(' ', s[10]);
    EXPECT_EQ(':', s[13]);
    EXPECT_EQ(':', s[16]);
}

TEST(Timestamp, NowHasSameShape)
{
    EXPECT_EQ(19u, Timestamp::now().size());
}

TEST(Timestamp, UnrepresentableTimeUsesZeroPlaceholder)
{
    // 年が int に収まらず localtime_r が失敗する
    EXPECT_EQ(std::string("0000-00-00 00:00:00"),
        Timestamp::formatFromEpochSeconds(LONG_MAX));
}
