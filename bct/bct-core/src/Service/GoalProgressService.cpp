// Ticket: 0009_goal_progress_service

#include "bct-core/src/Service/GoalProgressService.hpp"

#include <stdexcept>
#include <utility>

#include "bct-core/src/Errors.hpp"

namespace bct_core
{

GoalProgressService::GoalProgressService(GoalStore& goals,
                                         MeasurementStore& measurements,
                                         ProgressCache& cache,
                                         std::shared_ptr<spdlog::logger> logger)
  : GoalProgressService{goals, measurements, cache, std::move(logger), Config{}}
{
}

GoalProgressService::GoalProgressService(GoalStore& goals,
                                         MeasurementStore& measurements,
                                         ProgressCache& cache,
                                         std::shared_ptr<spdlog::logger> logger,
                                         Config config)
  : goals_{goals},
    measurements_{measurements},
    cache_{cache},
    logger_{std::move(logger)},
    config_{std::move(config)},
    aggregator_{config_.aggregator}
{
  if (!logger_)
  {
    throw std::invalid_argument{"GoalProgressService requires a logger"};
  }
  if (!config_.clock)
  {
    throw std::invalid_argument{"GoalProgressService requires a clock"};
  }
}

std::optional<GoalProgressData> GoalProgressService::refresh(
  const std::string& userId,
  std::stop_token stopToken)
{
  logger_->debug("Refreshing goal progress for user '{}'", userId);

  std::optional<Goal> goal = goals_.getActiveGoal(userId);
  if (stopToken.stop_requested())
  {
    logger_->debug("Refresh for '{}' cancelled after goal lookup", userId);
    return std::nullopt;
  }
  if (!goal || !goal->isActive)
  {
    logger_->info("User '{}' has no active goal", userId);
    throw NoActiveGoalError{userId};
  }

  std::optional<TimePoint> since;
  if (goal->periodStart)
  {
    since = TimePoint{*goal->periodStart};
  }

  std::vector<BodyCompositionEntry> const entries =
    measurements_.getEntries(userId, since);
  if (stopToken.stop_requested())
  {
    logger_->debug("Refresh for '{}' cancelled after measurement fetch",
                   userId);
    return std::nullopt;
  }

  std::optional<double> const previous = cache_.loadPreviousPercentage(userId);
  if (stopToken.stop_requested())
  {
    logger_->debug("Refresh for '{}' cancelled after cache lookup", userId);
    return std::nullopt;
  }

  TimePoint const now = config_.clock();
  GoalProgressData data = aggregator_.aggregate(goal, entries, previous, now);

  cache_.storePercentage(userId, data.overallProgress, now);

  logger_->info("User '{}' goal {} at {:.1f}% over {} entries",
                userId,
                data.goal.id,
                data.overallProgress,
                data.dataPointsCount);
  for (Milestone const milestone : data.newlyAchievedMilestones)
  {
    logger_->info("User '{}' reached milestone {}", userId, toString(milestone));
  }

  return data;
}

}  // namespace bct_core
