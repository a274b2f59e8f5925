// Ticket: 0009_goal_progress_service

#ifndef BCT_CORE_SERVICE_GOAL_PROGRESS_SERVICE_HPP
#define BCT_CORE_SERVICE_GOAL_PROGRESS_SERVICE_HPP

#include <functional>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>

#include <spdlog/spdlog.h>

#include "bct-core/src/Aggregation/GoalProgressAggregator.hpp"
#include "bct-core/src/Aggregation/GoalProgressData.hpp"
#include "bct-core/src/Service/Collaborators.hpp"

namespace bct_core
{

/**
 * @brief Fetches goal and measurements, aggregates, and records the new
 * overall percentage
 *
 * The service owns no state between calls. Collaborators are non-owning
 * references and must outlive the service.
 *
 * Cancellation: the stop token is checked after every collaborator read.
 * A cancelled refresh returns std::nullopt and never writes to the
 * ProgressCache.
 *
 * @ticket 0009_goal_progress_service
 */
class GoalProgressService
{
public:
  struct Config
  {
    GoalProgressAggregator::Config aggregator{};
    std::function<TimePoint()> clock{[] { return Clock::now(); }};
  };

  GoalProgressService(GoalStore& goals,
                      MeasurementStore& measurements,
                      ProgressCache& cache,
                      std::shared_ptr<spdlog::logger> logger);

  /**
   * @throws std::invalid_argument if logger or config.clock is empty
   */
  GoalProgressService(GoalStore& goals,
                      MeasurementStore& measurements,
                      ProgressCache& cache,
                      std::shared_ptr<spdlog::logger> logger,
                      Config config);

  /**
   * @brief Recompute progress for a user
   *
   * @param userId User whose active goal is evaluated
   * @param stopToken Cancels the refresh between collaborator calls
   * @return Progress data, or std::nullopt if cancelled
   * @throws NoActiveGoalError if the user has no active goal
   * @throws NoEnabledMetricsError, NoMeasurementsError from aggregation
   */
  std::optional<GoalProgressData> refresh(const std::string& userId,
                                          std::stop_token stopToken = {});

  [[nodiscard]] std::shared_ptr<spdlog::logger> getLogger() const
  {
    return logger_;
  }

private:
  GoalStore& goals_;
  MeasurementStore& measurements_;
  ProgressCache& cache_;
  std::shared_ptr<spdlog::logger> logger_;
  Config config_;
  GoalProgressAggregator aggregator_;
};

}  // namespace bct_core

#endif  // BCT_CORE_SERVICE_GOAL_PROGRESS_SERVICE_HPP
