#include "CivilTime.hpp"
#include "RecurrenceExpander.hpp"
#include "TestSupport.hpp"
#include <gtest/gtest.h>

using namespace calsync;
using calsync::test::at;

namespace {

SeriesAnchor anchorAt(Instant start, int64_t duration = 3600) {
  return SeriesAnchor{"s1", start, duration, ItemKind::Event, "Standup"};
}

RecurrenceRule rule(Frequency frequency, int32_t interval = 1) {
  RecurrenceRule r;
  r.frequency = frequency;
  r.interval = interval;
  return r;
}

std::vector<std::string> dates(const std::vector<Occurrence> &occurrences) {
  std::vector<std::string> out;
  for (const auto &occ : occurrences)
    out.push_back(civil::formatDate(civil::dateOf(occ.start)));
  return out;
}

} // namespace

TEST(RecurrenceExpanderTest, DailyIntervalSpacesOccurrencesEvenly) {
  auto occurrences = expand(rule(Frequency::Daily, 2), anchorAt(at(2026, 1, 1, 9)),
                            at(2026, 1, 1), at(2026, 1, 11), {});

  ASSERT_EQ(occurrences.size(), 5u);
  for (size_t i = 0; i < occurrences.size(); ++i) {
    EXPECT_EQ(occurrences[i].sequence, static_cast<int32_t>(i));
    EXPECT_EQ(occurrences[i].end - occurrences[i].start, 3600);
    if (i > 0)
      EXPECT_EQ(occurrences[i].start - occurrences[i - 1].start,
                2 * civil::kSecondsPerDay);
  }
  EXPECT_EQ(occurrences.front().id, "s1@2026-01-01");
  EXPECT_EQ(occurrences.back().id, "s1@2026-01-09");
}

TEST(RecurrenceExpanderTest, SequenceIsCountedFromAnchorNotWindow) {
  auto occurrences = expand(rule(Frequency::Daily), anchorAt(at(2026, 1, 1, 9)),
                            at(2026, 1, 10), at(2026, 1, 12), {});

  ASSERT_EQ(occurrences.size(), 2u);
  EXPECT_EQ(occurrences[0].sequence, 9);
  EXPECT_EQ(occurrences[1].sequence, 10);
  EXPECT_EQ(occurrences[0].start, at(2026, 1, 10, 9));
}

TEST(RecurrenceExpanderTest, MonthlyClampsFromAnchorDay) {
  RecurrenceRule monthly = rule(Frequency::Monthly);
  monthly.termination = Termination::Count;
  monthly.count = 4;

  auto occurrences = expand(monthly, anchorAt(at(2026, 1, 31, 10)),
                            at(2026, 1, 1), at(2027, 1, 1), {});

  EXPECT_EQ(dates(occurrences),
            (std::vector<std::string>{"2026-01-31", "2026-02-28", "2026-03-31",
                                      "2026-04-30"}));
}

TEST(RecurrenceExpanderTest, MonthlyClampUsesLeapDay) {
  auto occurrences = expand(rule(Frequency::Monthly), anchorAt(at(2024, 1, 31, 10)),
                            at(2024, 2, 1), at(2024, 3, 1), {});

  EXPECT_EQ(dates(occurrences), (std::vector<std::string>{"2024-02-29"}));
}

TEST(RecurrenceExpanderTest, YearlyLeapDayFallsBackToFebruary28) {
  RecurrenceRule yearly = rule(Frequency::Yearly);
  yearly.termination = Termination::Count;
  yearly.count = 3;

  auto occurrences = expand(yearly, anchorAt(at(2024, 2, 29, 8)),
                            at(2024, 1, 1), at(2030, 1, 1), {});

  EXPECT_EQ(dates(occurrences),
            (std::vector<std::string>{"2024-02-29", "2025-02-28",
                                      "2026-02-28"}));
}

TEST(RecurrenceExpanderTest, CountTerminationIgnoresQueryWindow) {
  RecurrenceRule daily = rule(Frequency::Daily);
  daily.termination = Termination::Count;
  daily.count = 5;

  auto occurrences = expand(daily, anchorAt(at(2026, 1, 1, 9)), at(2026, 1, 4),
                            at(2026, 2, 1), {});

  EXPECT_EQ(dates(occurrences),
            (std::vector<std::string>{"2026-01-04", "2026-01-05"}));
  EXPECT_EQ(occurrences.back().sequence, 4);
}

TEST(RecurrenceExpanderTest, EndDateIsExclusive) {
  RecurrenceRule daily = rule(Frequency::Daily);
  daily.termination = Termination::EndDate;
  daily.until = at(2026, 1, 5, 9);

  auto occurrences = expand(daily, anchorAt(at(2026, 1, 1, 9)), at(2026, 1, 1),
                            at(2026, 2, 1), {});

  EXPECT_EQ(occurrences.size(), 4u);
  EXPECT_EQ(occurrences.back().start, at(2026, 1, 4, 9));
}

TEST(RecurrenceExpanderTest, WeeklyWithInterval) {
  auto occurrences = expand(rule(Frequency::Weekly, 2), anchorAt(at(2026, 1, 5, 9)),
                            at(2026, 1, 1), at(2026, 2, 3), {});

  EXPECT_EQ(dates(occurrences),
            (std::vector<std::string>{"2026-01-05", "2026-01-19",
                                      "2026-02-02"}));
}

TEST(RecurrenceExpanderTest, CustomWeekdaysStartAtAnchor) {
  RecurrenceRule custom = rule(Frequency::Custom);
  custom.weekdays = {Weekday::Wednesday, Weekday::Monday};

  // 2026-01-07 is a Wednesday; the Monday before it is not generated.
  auto occurrences = expand(custom, anchorAt(at(2026, 1, 7, 9)), at(2026, 1, 1),
                            at(2026, 1, 20), {});

  EXPECT_EQ(dates(occurrences),
            (std::vector<std::string>{"2026-01-07", "2026-01-12", "2026-01-14",
                                      "2026-01-19"}));
  EXPECT_EQ(occurrences.back().sequence, 3);
}

TEST(RecurrenceExpanderTest, CustomMonthDaysClampToShortMonths) {
  RecurrenceRule custom = rule(Frequency::Custom);
  custom.monthDays = {31, 15};

  auto occurrences = expand(custom, anchorAt(at(2026, 1, 15, 12)),
                            at(2026, 1, 1), at(2026, 4, 1), {});

  EXPECT_EQ(dates(occurrences),
            (std::vector<std::string>{"2026-01-15", "2026-01-31", "2026-02-15",
                                      "2026-02-28", "2026-03-15",
                                      "2026-03-31"}));
}

TEST(RecurrenceExpanderTest, ReplacementIsAppliedAndExpansionIsRepeatable) {
  OccurrenceException moved;
  moved.seriesId = "s1";
  moved.originalDate = CivilDate{2026, 1, 3};
  moved.kind = ExceptionKind::Replace;
  moved.start = at(2026, 1, 3, 14);
  moved.end = at(2026, 1, 3, 15);
  moved.title = "Moved standup";

  auto first = expand(rule(Frequency::Daily), anchorAt(at(2026, 1, 1, 9)),
                      at(2026, 1, 1), at(2026, 1, 6), {moved});
  auto second = expand(rule(Frequency::Daily), anchorAt(at(2026, 1, 1, 9)),
                       at(2026, 1, 1), at(2026, 1, 6), {moved});

  ASSERT_EQ(first.size(), 5u);
  ASSERT_EQ(second.size(), first.size());
  for (size_t i = 0; i < first.size(); ++i) {
    EXPECT_EQ(first[i].id, second[i].id);
    EXPECT_EQ(first[i].start, second[i].start);
    EXPECT_EQ(first[i].status, second[i].status);
  }
  EXPECT_EQ(first[2].id, "s1@2026-01-03");
  EXPECT_EQ(first[2].status, OccurrenceStatus::Modified);
  EXPECT_EQ(first[2].start, at(2026, 1, 3, 14));
  EXPECT_EQ(first[2].title, "Moved standup");
  EXPECT_EQ(first[1].status, OccurrenceStatus::Generated);
}

TEST(RecurrenceExpanderTest, ReplacingThirdOfTenWeeklyKeepsTen) {
  RecurrenceRule weekly = rule(Frequency::Weekly);
  weekly.termination = Termination::Count;
  weekly.count = 10;

  OccurrenceException moved;
  moved.seriesId = "s1";
  moved.originalDate = CivilDate{2026, 1, 19};
  moved.start = at(2026, 1, 20, 14);
  moved.end = at(2026, 1, 20, 15);

  auto first = expand(weekly, anchorAt(at(2026, 1, 5, 9)), at(2026, 1, 1),
                      at(2026, 6, 1), {moved});
  auto second = expand(weekly, anchorAt(at(2026, 1, 5, 9)), at(2026, 1, 1),
                       at(2026, 6, 1), {moved});

  ASSERT_EQ(first.size(), 10u);
  ASSERT_EQ(second.size(), 10u);
  for (size_t i = 0; i < first.size(); ++i) {
    EXPECT_EQ(first[i].id, second[i].id);
    EXPECT_EQ(first[i].start, second[i].start);
    EXPECT_EQ(first[i].sequence, static_cast<int32_t>(i));
    EXPECT_EQ(first[i].status, i == 2 ? OccurrenceStatus::Modified
                                      : OccurrenceStatus::Generated);
  }
  EXPECT_EQ(first[2].id, "s1@2026-01-19");
  EXPECT_EQ(first[2].start, at(2026, 1, 20, 14));
  EXPECT_EQ(first[9].id, "s1@2026-03-09");
}

TEST(RecurrenceExpanderTest, CancelledExceptionDropsDate) {
  OccurrenceException cancelled;
  cancelled.seriesId = "s1";
  cancelled.originalDate = CivilDate{2026, 1, 2};
  cancelled.kind = ExceptionKind::Cancel;

  auto occurrences = expand(rule(Frequency::Daily), anchorAt(at(2026, 1, 1, 9)),
                            at(2026, 1, 1), at(2026, 1, 4), {cancelled});

  EXPECT_EQ(dates(occurrences),
            (std::vector<std::string>{"2026-01-01", "2026-01-03"}));
}

TEST(RecurrenceExpanderTest, WindowMembershipFollowsGeneratedStart) {
  OccurrenceException moved;
  moved.seriesId = "s1";
  moved.originalDate = CivilDate{2026, 1, 3};
  moved.start = at(2026, 1, 20, 9);
  moved.end = at(2026, 1, 20, 10);

  auto early = expand(rule(Frequency::Daily), anchorAt(at(2026, 1, 1, 9)),
                      at(2026, 1, 3), at(2026, 1, 4), {moved});
  ASSERT_EQ(early.size(), 1u);
  EXPECT_EQ(early[0].start, at(2026, 1, 20, 9));

  RecurrenceRule shortRule = rule(Frequency::Daily);
  shortRule.termination = Termination::Count;
  shortRule.count = 5;
  auto late = expand(shortRule, anchorAt(at(2026, 1, 1, 9)), at(2026, 1, 19),
                     at(2026, 1, 22), {moved});
  EXPECT_TRUE(late.empty());
}

TEST(RecurrenceExpanderTest, ExceptionsOfOtherSeriesAreIgnored) {
  OccurrenceException other;
  other.seriesId = "s2";
  other.originalDate = CivilDate{2026, 1, 1};
  other.kind = ExceptionKind::Cancel;

  auto occurrences = expand(rule(Frequency::Daily), anchorAt(at(2026, 1, 1, 9)),
                            at(2026, 1, 1), at(2026, 1, 2), {other});
  EXPECT_EQ(occurrences.size(), 1u);
}

TEST(RecurrenceExpanderTest, NonPositiveIntervalYieldsNothing) {
  EXPECT_TRUE(expand(rule(Frequency::Daily, 0), anchorAt(at(2026, 1, 1, 9)),
                     at(2026, 1, 1), at(2026, 2, 1), {})
                  .empty());
}

TEST(RecurrenceExpanderTest, SeriesSegmentsContinueSequence) {
  SeriesPayload series = test::dailySeries("Gym", at(2026, 1, 1, 9));
  series.segments[0].effectiveUntil = at(2026, 1, 5);
  RuleSegment weekly;
  weekly.rule.frequency = Frequency::Weekly;
  weekly.anchor = at(2026, 1, 5, 18);
  weekly.durationSeconds = 1800;
  series.segments.push_back(weekly);

  auto occurrences =
      expandSeries("s1", series, at(2026, 1, 1), at(2026, 1, 20), {});

  EXPECT_EQ(dates(occurrences),
            (std::vector<std::string>{"2026-01-01", "2026-01-02", "2026-01-03",
                                      "2026-01-04", "2026-01-05", "2026-01-12",
                                      "2026-01-19"}));
  EXPECT_EQ(occurrences[4].sequence, 4);
  EXPECT_EQ(occurrences[4].start, at(2026, 1, 5, 18));
  EXPECT_EQ(occurrences[6].sequence, 6);
}

TEST(RecurrenceExpanderTest, NonRecurringSeriesHasSingleOccurrence) {
  SeriesPayload series = test::dailySeries("Dentist", at(2026, 3, 4, 15));
  series.recurring = false;

  auto occurrences =
      expandSeries("s9", series, at(2026, 3, 1), at(2026, 4, 1), {});

  ASSERT_EQ(occurrences.size(), 1u);
  EXPECT_EQ(occurrences[0].id, "s9@2026-03-04");
}

TEST(RecurrenceExpanderTest, MonthDaysOutsideTheMonthAreSkipped) {
  RecurrenceRule custom = rule(Frequency::Custom);
  custom.monthDays = {0};
  EXPECT_TRUE(expand(custom, anchorAt(at(2026, 1, 1, 9)), at(2026, 1, 1),
                     at(2026, 1, 31), {})
                  .empty());

  custom.monthDays = {-1, 10, 40};
  auto occurrences = expand(custom, anchorAt(at(2026, 1, 1, 9)),
                            at(2026, 1, 1), at(2026, 3, 1), {});
  EXPECT_EQ(dates(occurrences),
            (std::vector<std::string>{"2026-01-10", "2026-02-10"}));
}

TEST(RecurrenceExpanderTest, CivilDatesCompareByCalendarOrder) {
  const CivilDate endOfJanuary{2026, 1, 31};
  const CivilDate firstOfFebruary{2026, 2, 1};
  EXPECT_TRUE(endOfJanuary < firstOfFebruary);
  EXPECT_FALSE(firstOfFebruary < endOfJanuary);
  EXPECT_TRUE(endOfJanuary != firstOfFebruary);
  EXPECT_TRUE(civil::addDays(endOfJanuary, 1) == firstOfFebruary);
}
