#include "RecurrenceRules.hpp"
#include "TestSupport.hpp"
#include <gtest/gtest.h>

using namespace calsync;
using calsync::test::at;

TEST(RecurrenceRulesTest, AcceptsPlainDailyRule) {
  RecurrenceRule rule;
  EXPECT_FALSE(validateRule(rule, at(2026, 1, 1, 9)).has_value());
}

TEST(RecurrenceRulesTest, RejectsZeroInterval) {
  RecurrenceRule rule;
  rule.interval = 0;
  auto error = validateRule(rule, at(2026, 1, 1, 9));
  ASSERT_TRUE(error.has_value());
  EXPECT_EQ(error->code, RuleErrorCode::ZeroInterval);
}

TEST(RecurrenceRulesTest, RejectsEndDateNotAfterAnchor) {
  RecurrenceRule rule;
  rule.termination = Termination::EndDate;
  rule.until = at(2026, 1, 1, 9);
  auto error = validateRule(rule, at(2026, 1, 1, 9));
  ASSERT_TRUE(error.has_value());
  EXPECT_EQ(error->code, RuleErrorCode::EndBeforeAnchor);

  rule.until.reset();
  error = validateRule(rule, at(2026, 1, 1, 9));
  ASSERT_TRUE(error.has_value());
  EXPECT_EQ(error->code, RuleErrorCode::MissingEndDate);
}

TEST(RecurrenceRulesTest, RejectsNonPositiveCount) {
  RecurrenceRule rule;
  rule.termination = Termination::Count;
  rule.count = 0;
  auto error = validateRule(rule, at(2026, 1, 1));
  ASSERT_TRUE(error.has_value());
  EXPECT_EQ(error->code, RuleErrorCode::NonPositiveCount);
}

TEST(RecurrenceRulesTest, CustomRuleNeedsExactlyOneConstraintKind) {
  RecurrenceRule rule;
  rule.frequency = Frequency::Custom;
  auto error = validateRule(rule, at(2026, 1, 1));
  ASSERT_TRUE(error.has_value());
  EXPECT_EQ(error->code, RuleErrorCode::MissingConstraints);

  rule.weekdays = {Weekday::Monday};
  rule.monthDays = {1};
  error = validateRule(rule, at(2026, 1, 1));
  ASSERT_TRUE(error.has_value());
  EXPECT_EQ(error->code, RuleErrorCode::AmbiguousConstraints);

  rule.weekdays.clear();
  rule.monthDays = {32};
  error = validateRule(rule, at(2026, 1, 1));
  ASSERT_TRUE(error.has_value());
  EXPECT_EQ(error->code, RuleErrorCode::InvalidMonthDay);
}

TEST(RecurrenceRulesTest, ConstraintsOnFixedFrequencyAreRejected) {
  RecurrenceRule rule;
  rule.frequency = Frequency::Weekly;
  rule.weekdays = {Weekday::Friday};
  auto error = validateRule(rule, at(2026, 1, 1));
  ASSERT_TRUE(error.has_value());
  EXPECT_EQ(error->code, RuleErrorCode::UnexpectedConstraints);
}

TEST(RecurrenceRulesTest, FormatsRRule) {
  RecurrenceRule monthly;
  monthly.frequency = Frequency::Monthly;
  monthly.interval = 2;
  monthly.termination = Termination::Count;
  monthly.count = 6;
  EXPECT_EQ(toRRule(monthly), "FREQ=MONTHLY;INTERVAL=2;COUNT=6");

  RecurrenceRule custom;
  custom.frequency = Frequency::Custom;
  custom.weekdays = {Weekday::Monday, Weekday::Wednesday};
  EXPECT_EQ(toRRule(custom), "FREQ=WEEKLY;BYDAY=MO,WE");

  RecurrenceRule days;
  days.frequency = Frequency::Custom;
  days.monthDays = {1, 15};
  EXPECT_EQ(toRRule(days), "FREQ=MONTHLY;BYMONTHDAY=1,15");
}

TEST(RecurrenceRulesTest, ParsesRRuleWithPrefixAndUntil) {
  auto rule = parseRRule("RRULE:FREQ=WEEKLY;BYDAY=MO,WE;UNTIL=20260131T100000Z");
  ASSERT_TRUE(rule.has_value());
  EXPECT_EQ(rule->frequency, Frequency::Custom);
  EXPECT_EQ(rule->interval, 1);
  ASSERT_EQ(rule->weekdays.size(), 2u);
  EXPECT_EQ(rule->weekdays[0], Weekday::Monday);
  EXPECT_EQ(rule->weekdays[1], Weekday::Wednesday);
  EXPECT_EQ(rule->termination, Termination::EndDate);
  ASSERT_TRUE(rule->until.has_value());
  EXPECT_EQ(*rule->until, at(2026, 1, 31, 10));
}

TEST(RecurrenceRulesTest, ParsesCountAndInterval) {
  auto rule = parseRRule("freq=daily;interval=3;count=10;wkst=MO");
  ASSERT_TRUE(rule.has_value());
  EXPECT_EQ(rule->frequency, Frequency::Daily);
  EXPECT_EQ(rule->interval, 3);
  EXPECT_EQ(rule->termination, Termination::Count);
  ASSERT_TRUE(rule->count.has_value());
  EXPECT_EQ(*rule->count, 10);
}

TEST(RecurrenceRulesTest, RejectsUnparsableText) {
  EXPECT_FALSE(parseRRule("").has_value());
  EXPECT_FALSE(parseRRule("INTERVAL=2").has_value());
  EXPECT_FALSE(parseRRule("FREQ=HOURLY").has_value());
  EXPECT_FALSE(parseRRule("FREQ=DAILY;COUNT=ten").has_value());
  EXPECT_FALSE(parseRRule("FREQ=WEEKLY;BYDAY=XX").has_value());
}

TEST(RecurrenceRulesTest, RejectsMonthDaysCountedFromTheEnd) {
  EXPECT_FALSE(parseRRule("FREQ=MONTHLY;BYMONTHDAY=-1").has_value());
  EXPECT_FALSE(parseRRule("FREQ=MONTHLY;BYMONTHDAY=0").has_value());
  EXPECT_FALSE(parseRRule("FREQ=MONTHLY;BYMONTHDAY=1,32").has_value());

  auto rule = parseRRule("FREQ=MONTHLY;BYMONTHDAY=31");
  ASSERT_TRUE(rule.has_value());
  EXPECT_EQ(rule->frequency, Frequency::Custom);
  EXPECT_FALSE(validateRule(*rule, at(2026, 1, 1)).has_value());
}

TEST(RecurrenceRulesTest, ValidatesEverySegmentOfASeries) {
  SeriesPayload series;
  auto error = validateSeries(series);
  ASSERT_TRUE(error.has_value());
  EXPECT_EQ(error->code, RuleErrorCode::MissingSegments);

  RuleSegment first;
  first.anchor = at(2026, 1, 1, 9);
  first.effectiveUntil = at(2026, 2, 1);
  series.segments.push_back(first);
  EXPECT_FALSE(validateSeries(series).has_value());

  RuleSegment second;
  second.anchor = at(2026, 2, 1, 9);
  second.rule.frequency = Frequency::Custom;
  second.rule.monthDays = {0};
  series.segments.push_back(second);
  error = validateSeries(series);
  ASSERT_TRUE(error.has_value());
  EXPECT_EQ(error->code, RuleErrorCode::InvalidMonthDay);

  series.recurring = false;
  EXPECT_FALSE(validateSeries(series).has_value());
}
