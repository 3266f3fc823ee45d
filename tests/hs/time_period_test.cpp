#include <limits>
#include <gtest/gtest.h>
#include <onionid/hs/time_period.hpp>
#include <onionid/utils/exception.hpp>

using namespace onionid;
using namespace onionid::hs;

class TimePeriodTest : public testing::TestWithParam<uint8_t>
{
protected:
    PermanentId permanentId() const
    {
        PermanentId id{};
        id.fill(0x5A);
        id[0] = GetParam();
        return id;
    }
};

TEST_P(TimePeriodTest, PeriodAndSecondsValidAgree)
{
    auto id = permanentId();
    for (uint64_t timestamp : {0ULL, 1ULL, 86399ULL, 432000ULL, 1700000000ULL, 4102444800ULL})
    {
        auto seconds = GetSecondsValid(timestamp, id);
        ASSERT_GE(seconds, 1U);
        ASSERT_LE(seconds, kTimePeriodLength);

        auto period = GetTimePeriod(timestamp, id);
        ASSERT_EQ(GetTimePeriod(timestamp + seconds - 1, id), period);
        ASSERT_EQ(GetTimePeriod(timestamp + seconds, id), period + 1);
    }
}

TEST_P(TimePeriodTest, Monotonic)
{
    auto id = permanentId();
    uint32_t previous = GetTimePeriod(1700000000, id);
    for (uint64_t timestamp = 1700000000; timestamp < 1700000000 + 3 * kTimePeriodLength; timestamp += 997)
    {
        auto period = GetTimePeriod(timestamp, id);
        ASSERT_GE(period, previous);
        ASSERT_LE(period, previous + 1);
        previous = period;
    }
}

TEST_P(TimePeriodTest, Deviation)
{
    auto id = permanentId();
    auto period = GetTimePeriod(1700000000, id);
    ASSERT_EQ(GetTimePeriod(1700000000, id, 1), period + 1);
    ASSERT_EQ(GetTimePeriod(1700000000, id, -1), period - 1);
}

INSTANTIATE_TEST_SUITE_P(Phases, TimePeriodTest, testing::Values(0x00, 0x01, 0x80, 0xFF));

TEST(TimePeriodScenarioTest, ZeroPermanentId)
{
    PermanentId id{};
    ASSERT_EQ(GetTimePeriodOffset(id), 0U);
    ASSERT_EQ(GetTimePeriod(432000, id), 5U);
    ASSERT_EQ(GetSecondsValid(432000, id), 86400U);
}

TEST(TimePeriodScenarioTest, HalfDayPhase)
{
    PermanentId id{};
    id[0] = 0x80;
    ASSERT_EQ(GetTimePeriodOffset(id), 43200U);
    ASSERT_EQ(GetTimePeriod(432000, id), 5U);
    ASSERT_EQ(GetSecondsValid(432000, id), 43200U);
}

TEST(TimePeriodScenarioTest, OffsetIsTruncated)
{
    PermanentId id{};
    id[0] = 0x01;
    // 86400 / 256 = 337.5
    ASSERT_EQ(GetTimePeriodOffset(id), 337U);
    id[0] = 0xFF;
    ASSERT_EQ(GetTimePeriodOffset(id), 86062U);
}

TEST(TimePeriodScenarioTest, DeviationOutOfRange)
{
    PermanentId id{};
    ASSERT_THROW(GetTimePeriod(0, id, -1), utils::RuntimeError);
    ASSERT_THROW(GetTimePeriod(0, id, int64_t{1} << 32), utils::RuntimeError);
    ASSERT_THROW(GetTimePeriod(1700000000, id, std::numeric_limits<int64_t>::max()), utils::RuntimeError);
    ASSERT_THROW(GetTimePeriod(1700000000, id, std::numeric_limits<int64_t>::min()), utils::RuntimeError);
    ASSERT_EQ(GetTimePeriod(0, id, std::numeric_limits<uint32_t>::max()), std::numeric_limits<uint32_t>::max());
}

TEST(TimePeriodScenarioTest, TimestampOverflow)
{
    PermanentId id{};
    id.fill(0xFF);
    const auto timestamp = std::numeric_limits<uint64_t>::max() - 100;

    ASSERT_THROW(GetTimePeriod(timestamp, id), utils::RuntimeError);
    ASSERT_THROW(GetSecondsValid(timestamp, id), utils::RuntimeError);

    id.fill(0x00);
    ASSERT_THROW(GetTimePeriod(timestamp, id), utils::RuntimeError);
    ASSERT_NO_THROW(GetSecondsValid(timestamp, id));
}
