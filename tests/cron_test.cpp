#include "flowcore/trigger/cron.hpp"

#include "gtest/gtest.h"

#include <chrono>
#include <string>

using namespace flowcore;
using namespace std::chrono;

namespace {

// 2024-01-15 was a Monday.
auto at(int y, unsigned m, unsigned d, int hh, int mm)
    -> system_clock::time_point {
  return sys_days{year{y} / month{m} / day{d}} + hours{hh} + minutes{mm};
}

auto cron(std::string_view text) -> CronExpr {
  auto parsed = CronExpr::parse(text);
  EXPECT_TRUE(parsed.has_value()) << text;
  return std::move(*parsed);
}

} // namespace

TEST(CronTest, EveryMinuteMatchesAnything) {
  auto c = cron("* * * * *");
  EXPECT_TRUE(c.matches(at(2024, 1, 15, 0, 0)));
  EXPECT_TRUE(c.matches(at(2024, 7, 4, 13, 37) + seconds{42}));
  EXPECT_EQ(c.raw(), "* * * * *");
}

TEST(CronTest, StepField) {
  auto c = cron("*/5 * * * *");
  EXPECT_TRUE(c.matches(at(2024, 1, 15, 10, 0)));
  EXPECT_TRUE(c.matches(at(2024, 1, 15, 10, 55)));
  EXPECT_FALSE(c.matches(at(2024, 1, 15, 10, 3)));
}

TEST(CronTest, ListsAndRanges) {
  auto c = cron("0,30 9-17 * * mon-fri");
  EXPECT_TRUE(c.matches(at(2024, 1, 15, 9, 0)));
  EXPECT_TRUE(c.matches(at(2024, 1, 15, 17, 30)));
  EXPECT_FALSE(c.matches(at(2024, 1, 15, 18, 0)));
  EXPECT_FALSE(c.matches(at(2024, 1, 15, 9, 15)));
  // Saturday
  EXPECT_FALSE(c.matches(at(2024, 1, 20, 9, 0)));
}

TEST(CronTest, MonthNames) {
  auto c = cron("0 0 1 JAN,jul *");
  EXPECT_TRUE(c.matches(at(2024, 1, 1, 0, 0)));
  EXPECT_TRUE(c.matches(at(2024, 7, 1, 0, 0)));
  EXPECT_FALSE(c.matches(at(2024, 2, 1, 0, 0)));
}

TEST(CronTest, SundayAsSeven) {
  auto c = cron("0 12 * * 7");
  // 2024-01-21 was a Sunday.
  EXPECT_TRUE(c.matches(at(2024, 1, 21, 12, 0)));
  EXPECT_FALSE(c.matches(at(2024, 1, 22, 12, 0)));
}

TEST(CronTest, RestrictedDayFieldsMatchEither) {
  // The 13th, or any Friday.
  auto c = cron("0 0 13 * fri");
  EXPECT_TRUE(c.matches(at(2024, 2, 13, 0, 0)));
  EXPECT_TRUE(c.matches(at(2024, 1, 19, 0, 0)));
  EXPECT_FALSE(c.matches(at(2024, 1, 18, 0, 0)));
}

TEST(CronTest, Macros) {
  EXPECT_TRUE(cron("@hourly").matches(at(2024, 3, 3, 5, 0)));
  EXPECT_FALSE(cron("@hourly").matches(at(2024, 3, 3, 5, 1)));
  EXPECT_TRUE(cron("@daily").matches(at(2024, 3, 3, 0, 0)));
  EXPECT_TRUE(cron("@weekly").matches(at(2024, 1, 21, 0, 0)));
  EXPECT_TRUE(cron("@monthly").matches(at(2024, 5, 1, 0, 0)));
  EXPECT_TRUE(cron("@yearly").matches(at(2025, 1, 1, 0, 0)));
}

TEST(CronTest, InvalidExpressions) {
  for (std::string_view bad :
       {"", "* * * *", "* * * * * *", "60 * * * *", "* 24 * * *",
        "* * 0 * *", "* * * 13 *", "*/0 * * * *", "5-1 * * * *", "@often",
        "a b c d e", "1,,2 * * * *"}) {
    auto parsed = CronExpr::parse(bad);
    ASSERT_FALSE(parsed.has_value()) << "accepted: '" << bad << "'";
    EXPECT_EQ(parsed.error(), make_error_code(Error::ParseError));
  }
}

TEST(CronTest, StepFromAValueRunsToTheEndOfTheField) {
  auto c = cron("5/20 * * * *");
  EXPECT_TRUE(c.matches(at(2024, 1, 15, 10, 5)));
  EXPECT_TRUE(c.matches(at(2024, 1, 15, 10, 25)));
  EXPECT_TRUE(c.matches(at(2024, 1, 15, 10, 45)));
  EXPECT_FALSE(c.matches(at(2024, 1, 15, 10, 0)));
  EXPECT_FALSE(c.matches(at(2024, 1, 15, 10, 6)));
}

TEST(CronTest, WeekdayRangeEndingOnSeven) {
  auto c = cron("0 0 ? * fri-7");
  // Friday, Saturday and Sunday.
  EXPECT_TRUE(c.matches(at(2024, 1, 19, 0, 0)));
  EXPECT_TRUE(c.matches(at(2024, 1, 20, 0, 0)));
  EXPECT_TRUE(c.matches(at(2024, 1, 21, 0, 0)));
  EXPECT_FALSE(c.matches(at(2024, 1, 22, 0, 0)));
}

TEST(CronTest, LeapDayOnlyMatchesLeapYears) {
  auto c = cron("0 0 29 2 *");
  EXPECT_TRUE(c.matches(at(2024, 2, 29, 0, 0)));
  EXPECT_FALSE(c.matches(at(2025, 3, 1, 0, 0)));
  EXPECT_FALSE(c.matches(at(2024, 2, 28, 0, 0)));
}

TEST(CronTest, ExtraWhitespaceIsIgnored) {
  auto c = cron("  0   12\t* *  *  ");
  EXPECT_EQ(c.raw(), "0   12\t* *  *");
  EXPECT_TRUE(c.matches(at(2024, 1, 15, 12, 0)));
}
