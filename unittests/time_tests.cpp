#include <gtest/gtest.h>

#include <util/time.hpp>

#include <chrono>
#include <stdexcept>

using namespace std::chrono_literals;

namespace {

// 2024-03-01T09:05:07.250Z
util::timestamp_t const reference = std::chrono::sys_days{ std::chrono::year{ 2024 } / 3 / 1 } + 9h + 5min + 7s + 250ms;

} // namespace

TEST(Time, FormatUtcWithPattern) {
    EXPECT_EQ(util::format_utc(reference, "%Y%m%d_%H%M%S"), "20240301_090507");
    EXPECT_EQ(util::format_utc(reference, "%Y-%m-%d"), "2024-03-01");
}

TEST(Time, FormatTimestamp) {
    EXPECT_EQ(util::format_timestamp(reference), "2024-03-01T09:05:07.250000Z");
}

TEST(Time, ParseWithOffset) {
    EXPECT_EQ(util::parse_timestamp("2024-03-01T11:05:07.25+02:00"), reference);
    EXPECT_EQ(util::parse_timestamp("2024-03-01T09:05:07.250Z"), reference);
}

TEST(Time, ParseRejectsGarbage) {
    EXPECT_THROW(static_cast<void>(util::parse_timestamp("yesterday")), std::invalid_argument);
    EXPECT_THROW(static_cast<void>(util::parse_timestamp("2024-03-01T09:05:07+2")), std::invalid_argument);
}
