// Ticket: 0008_goal_period_urgency

#include <gtest/gtest.h>

#include <chrono>

#include "bct-core/src/Aggregation/GoalUrgency.hpp"
#include "bct-core/test/Helpers/EntryFixtures.hpp"

namespace bct_core
{
namespace test
{

namespace
{

// 100-day period starting on the reference day
Goal hundredDayGoal()
{
  Goal goal = makeWeightGoal(GoalType::Lose, 80.0, 75.0);
  goal.periodStart = referenceDay();
  goal.periodEnd = referenceDay() + std::chrono::days{100};
  return goal;
}

TimePoint atDay(int day)
{
  return TimePoint{referenceDay() + std::chrono::days{day}};
}

}  // namespace

TEST(GoalUrgency, Buckets)
{
  Goal const goal = hundredDayGoal();

  EXPECT_EQ(urgencyFor(goal, atDay(0)), GoalUrgency::Relaxed);
  EXPECT_EQ(urgencyFor(goal, atDay(40)), GoalUrgency::Relaxed);
  EXPECT_EQ(urgencyFor(goal, atDay(41)), GoalUrgency::Steady);
  EXPECT_EQ(urgencyFor(goal, atDay(70)), GoalUrgency::Steady);
  EXPECT_EQ(urgencyFor(goal, atDay(71)), GoalUrgency::Intense);
  EXPECT_EQ(urgencyFor(goal, atDay(90)), GoalUrgency::Intense);
  EXPECT_EQ(urgencyFor(goal, atDay(91)), GoalUrgency::Critical);
}

TEST(GoalUrgency, PastEnd_CriticalAndClamped)
{
  Goal const goal = hundredDayGoal();

  EXPECT_EQ(urgencyFor(goal, atDay(150)), GoalUrgency::Critical);
  EXPECT_DOUBLE_EQ(*periodFractionRemaining(goal, atDay(150)), 0.0);
  EXPECT_DOUBLE_EQ(*periodFractionRemaining(goal, atDay(-10)), 1.0);
}

TEST(GoalUrgency, NoPeriod_Unknown)
{
  Goal goal = hundredDayGoal();
  goal.periodEnd.reset();

  EXPECT_FALSE(urgencyFor(goal, atDay(10)).has_value());
}

TEST(GoalUrgency, EmptyPeriod_Unknown)
{
  Goal goal = hundredDayGoal();
  goal.periodEnd = goal.periodStart;

  EXPECT_FALSE(periodFractionRemaining(goal, atDay(0)).has_value());
}

// ========== Countdown ==========

TEST(GoalUrgency, DaysUntilPeriodEnd_CalendarDays)
{
  Goal const goal = hundredDayGoal();

  EXPECT_EQ(daysUntilPeriodEnd(goal, atDay(55)), 45);
  EXPECT_EQ(daysUntilPeriodEnd(goal, atDay(99) + std::chrono::hours{23}), 1);
  EXPECT_EQ(daysUntilPeriodEnd(goal, atDay(100) + std::chrono::hours{20}), 0);
  EXPECT_EQ(daysUntilPeriodEnd(goal, atDay(103)), -3);
}

TEST(GoalUrgency, DaysUntilPeriodEnd_OnlyNeedsEnd)
{
  Goal goal = hundredDayGoal();
  goal.periodStart.reset();
  EXPECT_EQ(daysUntilPeriodEnd(goal, atDay(0)), 100);

  goal.periodEnd.reset();
  EXPECT_FALSE(daysUntilPeriodEnd(goal, atDay(0)).has_value());
}

TEST(GoalUrgency, FormatCountdown)
{
  EXPECT_EQ(formatCountdown(45), "D-45");
  EXPECT_EQ(formatCountdown(0), "D-Day");
  EXPECT_EQ(formatCountdown(-3), "D+3");
}

}  // namespace test
}  // namespace bct_core
