// Ticket: 0004_projection_engine
// Test: ProjectionEngine unit tests

#include <gtest/gtest.h>

#include <chrono>

#include "bct-core/src/Projection/ProjectionEngine.hpp"
#include "bct-core/test/Helpers/EntryFixtures.hpp"

namespace bct_core
{
namespace test
{

class ProjectionEngineTest : public ::testing::Test
{
protected:
  ProjectionEngine engine_{};
  TimePoint const now_{dayAt(0)};
};

// ========== Completion date ==========

TEST_F(ProjectionEngineTest, Remaining10_Rate2_FiveDays)
{
  auto const result = engine_.project(10.0, 2.0, true, now_);

  EXPECT_EQ(result.status, ProjectionStatus::Projected);
  ASSERT_TRUE(result.daysToCompletion.has_value());
  EXPECT_EQ(*result.daysToCompletion, 5);
  ASSERT_TRUE(result.hasCompletionDate());
  EXPECT_EQ(*result.estimatedCompletionDate, now_ + std::chrono::days{5});
}

TEST_F(ProjectionEngineTest, FractionalDays_RoundUp)
{
  // 2 / (3/14) = 9.33 days
  auto const result = engine_.project(-2.0, -3.0 / 14.0, true, now_);

  ASSERT_TRUE(result.daysToCompletion.has_value());
  EXPECT_EQ(*result.daysToCompletion, 10);
}

TEST_F(ProjectionEngineTest, ZeroRate_NoCompletionDate)
{
  auto const result = engine_.project(3.0, 0.0, true, now_);

  EXPECT_EQ(result.status, ProjectionStatus::NotConverging);
  EXPECT_FALSE(result.hasCompletionDate());
  EXPECT_FALSE(result.daysToCompletion.has_value());
  ASSERT_TRUE(result.isOnTrack.has_value());
  EXPECT_FALSE(*result.isOnTrack);
}

TEST_F(ProjectionEngineTest, MovingAway_NoCompletionDate)
{
  // Needs to lose 2 kg but gaining
  auto const result = engine_.project(-2.0, 0.1, true, now_);

  EXPECT_EQ(result.status, ProjectionStatus::NotConverging);
  EXPECT_FALSE(result.hasCompletionDate());
}

TEST_F(ProjectionEngineTest, InsufficientData_OnTrackUnknown)
{
  auto const result = engine_.project(-2.0, -0.5, false, now_);

  EXPECT_EQ(result.status, ProjectionStatus::InsufficientData);
  EXPECT_FALSE(result.hasCompletionDate());
  EXPECT_FALSE(result.isOnTrack.has_value());
}

TEST_F(ProjectionEngineTest, TargetReached_ZeroDaysAndOnTrack)
{
  ProjectionEngine::Request request{};
  request.remaining = 0.5;  // Overshot a loss target
  request.dailyRate = -0.1;
  request.targetReached = true;
  request.now = now_;

  auto const result = engine_.project(request);

  EXPECT_EQ(result.status, ProjectionStatus::AlreadyAchieved);
  EXPECT_EQ(*result.daysToCompletion, 0);
  EXPECT_EQ(*result.estimatedCompletionDate, now_);
  EXPECT_TRUE(*result.isOnTrack);
}

TEST_F(ProjectionEngineTest, NoiseLevelRate_NotConverging)
{
  // Weight flat apart from floating point noise in the last sample
  auto const result = engine_.project(5.0, 1.093e-15, true, now_);

  EXPECT_EQ(result.status, ProjectionStatus::NotConverging);
  EXPECT_FALSE(result.hasCompletionDate());
  EXPECT_FALSE(result.daysToCompletion.has_value());
  ASSERT_TRUE(result.isOnTrack.has_value());
  EXPECT_FALSE(*result.isOnTrack);
}

TEST_F(ProjectionEngineTest, SlowRate_BeyondHorizon_NotConverging)
{
  // 100000 days away, far past the year 2262 limit of system_clock
  auto const result = engine_.project(10.0, 1e-4, true, now_);

  EXPECT_EQ(result.status, ProjectionStatus::NotConverging);
  EXPECT_FALSE(result.hasCompletionDate());
  EXPECT_FALSE(result.daysToCompletion.has_value());
}

TEST_F(ProjectionEngineTest, HorizonBoundary_FromConfig)
{
  ProjectionEngine::Config config{};
  config.maxProjectionDays = 30;
  ProjectionEngine const engine{config};

  auto const atLimit = engine.project(-15.0, -0.5, true, now_);
  EXPECT_EQ(atLimit.status, ProjectionStatus::Projected);
  EXPECT_EQ(*atLimit.daysToCompletion, 30);
  EXPECT_EQ(*atLimit.estimatedCompletionDate, now_ + std::chrono::days{30});

  auto const pastLimit = engine.project(-15.0, -0.25, true, now_);
  EXPECT_EQ(pastLimit.status, ProjectionStatus::NotConverging);
  EXPECT_FALSE(pastLimit.hasCompletionDate());
}

// ========== Goal period ==========

TEST_F(ProjectionEngineTest, CompletesOnLastDayOfPeriod_FitsPeriod)
{
  ProjectionEngine::Request request{};
  request.remaining = 10.0;
  request.dailyRate = 2.0;
  request.periodEnd = referenceDay() + std::chrono::days{5};
  request.now = now_;

  auto const result = engine_.project(request);

  ASSERT_TRUE(result.completesBeforePeriodEnd.has_value());
  EXPECT_TRUE(*result.completesBeforePeriodEnd);
}

TEST_F(ProjectionEngineTest, CompletesAfterPeriod_DoesNotFit)
{
  ProjectionEngine::Request request{};
  request.remaining = 10.0;
  request.dailyRate = 2.0;
  request.periodEnd = referenceDay() + std::chrono::days{4};
  request.now = now_;

  auto const result = engine_.project(request);

  ASSERT_TRUE(result.completesBeforePeriodEnd.has_value());
  EXPECT_FALSE(*result.completesBeforePeriodEnd);
}

TEST_F(ProjectionEngineTest, NoPeriodEnd_FitUnknown)
{
  auto const result = engine_.project(10.0, 2.0, true, now_);

  EXPECT_FALSE(result.completesBeforePeriodEnd.has_value());
}

// ========== On track ==========

TEST_F(ProjectionEngineTest, OnTrack_RateMatchesPlan)
{
  // 3 kg over 14 days is exactly 1.5 kg/week
  EXPECT_TRUE(engine_.isOnTrack(-2.0, -3.0 / 14.0, -1.5));
}

TEST_F(ProjectionEngineTest, OnTrack_RateBelowPlan_False)
{
  EXPECT_FALSE(engine_.isOnTrack(-2.0, -3.0 / 14.0, -2.0));
}

TEST_F(ProjectionEngineTest, OnTrack_NoPlan_AnyForwardMovement)
{
  EXPECT_TRUE(engine_.isOnTrack(-2.0, -0.001, std::nullopt));
  EXPECT_FALSE(engine_.isOnTrack(-2.0, 0.001, std::nullopt));
  EXPECT_FALSE(engine_.isOnTrack(-2.0, 0.0, std::nullopt));
}

TEST_F(ProjectionEngineTest, OnTrack_WrongDirection_FalseEvenIfFast)
{
  EXPECT_FALSE(engine_.isOnTrack(3.0, -1.0, 0.5));
}

// ========== Trend vs plan ==========

TEST_F(ProjectionEngineTest, CompareTrend_WithinTolerance_OnTrack)
{
  auto const comparison = engine_.compareTrendToPlanned(-1.4, -1.5);

  EXPECT_EQ(comparison.status, TrendStatus::OnTrack);
  EXPECT_NEAR(comparison.percentageOfPlan, 93.333333, 1e-5);
}

TEST_F(ProjectionEngineTest, CompareTrend_FasterThanPlan_Ahead)
{
  EXPECT_EQ(engine_.compareTrendToPlanned(-2.0, -1.5).status,
            TrendStatus::Ahead);
}

TEST_F(ProjectionEngineTest, CompareTrend_SlowerThanPlan_Behind)
{
  EXPECT_EQ(engine_.compareTrendToPlanned(-1.0, -1.5).status,
            TrendStatus::Behind);
}

TEST_F(ProjectionEngineTest, CompareTrend_OppositeDirection_Behind)
{
  EXPECT_EQ(engine_.compareTrendToPlanned(1.5, -1.5).status,
            TrendStatus::Behind);
}

TEST_F(ProjectionEngineTest, CompareTrend_Flat_NoProgress)
{
  EXPECT_EQ(engine_.compareTrendToPlanned(0.005, -1.0).status,
            TrendStatus::NoProgress);
  EXPECT_EQ(engine_.compareTrendToPlanned(-1.0, 0.0).status,
            TrendStatus::NoProgress);
}

TEST_F(ProjectionEngineTest, Request_WithPlan_SetsTrendStatus)
{
  ProjectionEngine::Request request{};
  request.remaining = -2.0;
  request.dailyRate = -0.25;
  request.plannedWeeklyRate = -1.0;
  request.now = now_;

  auto const result = engine_.project(request);

  ASSERT_TRUE(result.trendStatus.has_value());
  EXPECT_EQ(*result.trendStatus, TrendStatus::Ahead);
  EXPECT_TRUE(*result.isOnTrack);
}

}  // namespace test
}  // namespace bct_core
