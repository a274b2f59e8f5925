// Ticket: 0004_projection_engine

#include "bct-core/src/Projection/ProjectionEngine.hpp"

#include <algorithm>
#include <cmath>

namespace bct_core
{

namespace
{

// Guards ceil() against quotients like 5.0000000001
constexpr double kDayRoundingTolerance = 1e-9;

std::optional<bool> fitsInPeriod(
  TimePoint completion,
  const std::optional<std::chrono::sys_days>& periodEnd)
{
  if (!periodEnd)
  {
    return std::nullopt;
  }
  // Completing at any time on the last day of the period counts
  return completion < TimePoint{*periodEnd + std::chrono::days{1}};
}

}  // namespace

ProjectionEngine::ProjectionEngine(const Config& config)
  : config_{config}
{
}

ProjectionResult ProjectionEngine::project(const Request& request) const
{
  ProjectionResult result{};

  if (!request.dailyRate)
  {
    result.status = ProjectionStatus::InsufficientData;
    return result;
  }

  double const rate = *request.dailyRate;

  if (request.plannedWeeklyRate)
  {
    result.trendStatus =
      compareTrendToPlanned(rate * 7.0, *request.plannedWeeklyRate).status;
  }

  if (request.targetReached || request.remaining == 0.0)
  {
    result.status = ProjectionStatus::AlreadyAchieved;
    result.daysToCompletion = 0;
    result.estimatedCompletionDate = request.now;
    result.isOnTrack = true;
    result.completesBeforePeriodEnd =
      fitsInPeriod(request.now, request.periodEnd);
    return result;
  }

  // Flat or diverging trend never reaches the target
  if (!isMovingToward(request.remaining, rate))
  {
    result.status = ProjectionStatus::NotConverging;
    result.isOnTrack = false;
    return result;
  }

  double const days =
    std::ceil((request.remaining / rate) - kDayRoundingTolerance);

  // Near-zero rates put the date past what int and TimePoint can hold
  if (!std::isfinite(days) ||
      days > static_cast<double>(config_.maxProjectionDays))
  {
    result.status = ProjectionStatus::NotConverging;
    result.isOnTrack = false;
    return result;
  }

  int const wholeDays = static_cast<int>(std::max(0.0, days));

  result.status = ProjectionStatus::Projected;
  result.daysToCompletion = wholeDays;
  result.estimatedCompletionDate =
    request.now + std::chrono::days{wholeDays};
  result.isOnTrack =
    isOnTrack(request.remaining, rate, request.plannedWeeklyRate);
  result.completesBeforePeriodEnd =
    fitsInPeriod(*result.estimatedCompletionDate, request.periodEnd);

  return result;
}

ProjectionResult ProjectionEngine::project(double remaining,
                                           double rate,
                                           bool hasSufficientData,
                                           TimePoint now) const
{
  Request request{};
  request.remaining = remaining;
  if (hasSufficientData)
  {
    request.dailyRate = rate;
  }
  request.now = now;
  return project(request);
}

bool ProjectionEngine::isOnTrack(double remaining,
                                 double dailyRate,
                                 std::optional<double> plannedWeeklyRate) const
{
  if (remaining == 0.0)
  {
    return true;
  }

  if (!isMovingToward(remaining, dailyRate))
  {
    return false;
  }

  if (!plannedWeeklyRate)
  {
    return true;
  }

  double const requiredDailyRate = std::abs(*plannedWeeklyRate) / 7.0;
  return std::abs(dailyRate) + config_.rateTolerance >= requiredDailyRate;
}

TrendComparison ProjectionEngine::compareTrendToPlanned(
  double actualWeeklyRate,
  double plannedWeeklyRate) const
{
  TrendComparison comparison{};
  comparison.actualWeeklyRate = actualWeeklyRate;
  comparison.plannedWeeklyRate = plannedWeeklyRate;

  if (plannedWeeklyRate == 0.0)
  {
    comparison.status = TrendStatus::NoProgress;
    return comparison;
  }

  comparison.percentageOfPlan =
    (std::abs(actualWeeklyRate) / std::abs(plannedWeeklyRate)) * 100.0;

  if (std::abs(actualWeeklyRate) < config_.minimumMeaningfulWeeklyChange)
  {
    comparison.status = TrendStatus::NoProgress;
  }
  else if ((actualWeeklyRate > 0.0) != (plannedWeeklyRate > 0.0))
  {
    comparison.status = TrendStatus::Behind;
  }
  else if (std::abs(comparison.percentageOfPlan - 100.0) <=
           config_.onTrackTolerancePct)
  {
    comparison.status = TrendStatus::OnTrack;
  }
  else if (comparison.percentageOfPlan > 100.0)
  {
    comparison.status = TrendStatus::Ahead;
  }
  else
  {
    comparison.status = TrendStatus::Behind;
  }

  return comparison;
}

bool ProjectionEngine::isMovingToward(double remaining, double dailyRate)
{
  return (remaining > 0.0 && dailyRate > 0.0) ||
         (remaining < 0.0 && dailyRate < 0.0);
}

}  // namespace bct_core
