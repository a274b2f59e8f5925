// Ticket: 0005_goal_progress_aggregator

#ifndef BCT_CORE_AGGREGATION_GOAL_PROGRESS_AGGREGATOR_HPP
#define BCT_CORE_AGGREGATION_GOAL_PROGRESS_AGGREGATOR_HPP

#include <cstddef>
#include <optional>
#include <span>

#include "bct-core/src/Aggregation/GoalProgressData.hpp"
#include "bct-core/src/DataTypes/BodyCompositionEntry.hpp"
#include "bct-core/src/DataTypes/Goal.hpp"
#include "bct-core/src/Milestones/MilestoneTracker.hpp"
#include "bct-core/src/Projection/ProjectionEngine.hpp"
#include "bct-core/src/Trend/TrendAnalyzer.hpp"

namespace bct_core
{

/**
 * @brief Combines progress, trend, projection and milestones for every
 * enabled metric of a goal
 *
 * Each call is a pure function of its arguments. The previous overall
 * percentage is supplied by the caller; persisting the new one is the
 * caller's job.
 *
 * Usage:
 * @code
 * GoalProgressAggregator aggregator{};
 * auto data = aggregator.aggregate(goal, entries, previousPct, now);
 * for (Milestone m : data.newlyAchievedMilestones) { celebrate(m); }
 * @endcode
 *
 * @ticket 0005_goal_progress_aggregator
 */
class GoalProgressAggregator
{
public:
  struct Config
  {
    int trendWindowDays{14};
    std::size_t minimumDataPoints{5};
    FirstRunPolicy firstRunPolicy{FirstRunPolicy::Suppress};
    ProjectionEngine::Config projection{};
  };

  GoalProgressAggregator() = default;
  explicit GoalProgressAggregator(const Config& config);

  /**
   * @brief Build the composite progress result
   *
   * @param goal Active goal, std::nullopt if the user has none
   * @param entries Measurements, ascending by timestamp. Unsorted input is
   *        sorted into a local copy.
   * @param previousOverallPercentage Overall percentage from the last
   *        successful aggregation, if any
   * @param now Reference time for projections and urgency
   * @throws NoActiveGoalError if goal is absent or inactive
   * @throws NoEnabledMetricsError if the goal has no enabled metric
   * @throws NoMeasurementsError if entries is empty
   */
  [[nodiscard]] GoalProgressData aggregate(
    const std::optional<Goal>& goal,
    std::span<const BodyCompositionEntry> entries,
    std::optional<double> previousOverallPercentage,
    TimePoint now) const;

  [[nodiscard]] const Config& getConfig() const
  {
    return config_;
  }

private:
  [[nodiscard]] std::optional<MetricReport> reportFor(
    const Goal& goal,
    Metric metric,
    std::span<const BodyCompositionEntry> entries,
    TimePoint now) const;

  Config config_{};
  TrendAnalyzer trendAnalyzer_{};
  ProjectionEngine projectionEngine_{};
};

}  // namespace bct_core

#endif  // BCT_CORE_AGGREGATION_GOAL_PROGRESS_AGGREGATOR_HPP
