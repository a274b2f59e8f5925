// Ticket: 0005_goal_progress_aggregator

#ifndef BCT_CORE_AGGREGATION_GOAL_PROGRESS_DATA_HPP
#define BCT_CORE_AGGREGATION_GOAL_PROGRESS_DATA_HPP

#include <array>
#include <cstddef>
#include <optional>
#include <vector>

#include "bct-core/src/Aggregation/GoalUrgency.hpp"
#include "bct-core/src/DataTypes/BodyCompositionEntry.hpp"
#include "bct-core/src/DataTypes/Goal.hpp"
#include "bct-core/src/DataTypes/Metric.hpp"
#include "bct-core/src/Milestones/MilestoneTracker.hpp"
#include "bct-core/src/Progress/MetricProgressCalculator.hpp"
#include "bct-core/src/Projection/ProjectionEngine.hpp"
#include "bct-core/src/Trend/TrendAnalyzer.hpp"

namespace bct_core
{

/**
 * @brief Per-metric slice of a progress report
 */
struct MetricReport
{
  Metric metric{Metric::Weight};
  double currentValue{0.0};
  ProgressResult progress{};
  std::optional<TrendResult> trend;  // Absent below the data gate
  ProjectionResult projection{};
};

/**
 * @brief Composite result of one aggregation
 *
 * Disabled metrics have no MetricReport. Metrics that are enabled on the goal
 * but never measured are also absent and do not count toward the overall
 * percentage.
 *
 * @ticket 0005_goal_progress_aggregator
 */
struct GoalProgressData
{
  Goal goal{};
  BodyCompositionEntry latestEntry{};
  double overallProgress{0.0};  // Mean of reported metric percentages [%]
  std::array<std::optional<MetricReport>, kMetricCount> metrics{};
  std::vector<Milestone> achievedMilestones;
  std::vector<Milestone> newlyAchievedMilestones;
  std::size_t dataPointsCount{0};
  // AND over the metrics whose on-track status is known
  std::optional<bool> isOnTrack;
  std::optional<GoalUrgency> urgency;
  std::optional<int> daysUntilPeriodEnd;  // Negative once the period is over
  TimePoint computedAt{};

  [[nodiscard]] const std::optional<MetricReport>& metric(Metric m) const
  {
    return metrics[metricIndex(m)];
  }

  /**
   * @brief Soonest projected completion across the reported metrics
   * @return std::nullopt if no metric has a completion date
   */
  [[nodiscard]] std::optional<TimePoint> earliestCompletionDate() const
  {
    std::optional<TimePoint> earliest;
    for (const auto& report : metrics)
    {
      if (report && report->projection.estimatedCompletionDate)
      {
        TimePoint const date = *report->projection.estimatedCompletionDate;
        if (!earliest || date < *earliest)
        {
          earliest = date;
        }
      }
    }
    return earliest;
  }

  /**
   * @brief Last projected completion across the reported metrics
   */
  [[nodiscard]] std::optional<TimePoint> latestCompletionDate() const
  {
    std::optional<TimePoint> latest;
    for (const auto& report : metrics)
    {
      if (report && report->projection.estimatedCompletionDate)
      {
        TimePoint const date = *report->projection.estimatedCompletionDate;
        if (!latest || date > *latest)
        {
          latest = date;
        }
      }
    }
    return latest;
  }
};

}  // namespace bct_core

#endif  // BCT_CORE_AGGREGATION_GOAL_PROGRESS_DATA_HPP
