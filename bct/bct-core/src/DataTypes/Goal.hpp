// Ticket: 0001_goal_progress_data_model

#ifndef BCT_CORE_DATA_TYPES_GOAL_HPP
#define BCT_CORE_DATA_TYPES_GOAL_HPP

#include <array>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "bct-core/src/DataTypes/Metric.hpp"

namespace bct_core
{

/**
 * @brief Start/target pair and planned pace for one metric of a goal
 *
 * The start value is captured when the goal is created. weeklyRate is signed
 * in metric units per week (negative for a planned decrease).
 */
struct MetricGoal
{
  std::optional<double> start;
  std::optional<double> target;
  std::optional<double> weeklyRate;

  /**
   * @brief A metric is enabled iff both start and target are set
   */
  [[nodiscard]] bool isEnabled() const
  {
    return start.has_value() && target.has_value();
  }
};

/**
 * @brief A user's body-composition goal
 *
 * At most one goal is active per user. The goal period bounds are calendar
 * days; both are optional because a goal may be open-ended.
 *
 * @ticket 0001_goal_progress_data_model
 */
struct Goal
{
  uint32_t id{0};
  std::string userId;
  GoalType type{GoalType::Lose};

  std::array<MetricGoal, kMetricCount> metrics{};

  std::optional<std::chrono::sys_days> periodStart;
  std::optional<std::chrono::sys_days> periodEnd;

  std::optional<int32_t> dailyCalorieTarget;
  bool isActive{true};

  [[nodiscard]] const MetricGoal& metric(Metric m) const
  {
    return metrics[metricIndex(m)];
  }

  MetricGoal& metric(Metric m)
  {
    return metrics[metricIndex(m)];
  }

  [[nodiscard]] ProgressDirection direction() const
  {
    return directionFor(type);
  }
};

/**
 * @brief Metrics that carry both a start and a target value on the goal
 *
 * Single point of truth for "which metrics are active"; the aggregator, the
 * validator and the stores all go through this.
 *
 * @return Enabled metrics in Weight, BodyFat, MuscleMass order
 */
std::vector<Metric> enabledMetrics(const Goal& goal);

}  // namespace bct_core

#endif  // BCT_CORE_DATA_TYPES_GOAL_HPP
