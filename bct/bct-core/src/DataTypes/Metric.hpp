// Ticket: 0001_goal_progress_data_model

#ifndef BCT_CORE_DATA_TYPES_METRIC_HPP
#define BCT_CORE_DATA_TYPES_METRIC_HPP

#include <array>
#include <chrono>
#include <cstddef>
#include <string_view>

namespace bct_core
{

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

/**
 * @brief Kind of goal a user has set
 *
 * Stored as an integer in goal records, so the numeric values are stable.
 */
enum class GoalType : int
{
  Lose = 0,
  Maintain = 1,
  Gain = 2,
};

/**
 * @brief Body-composition quantity that a goal can target
 *
 * Units: Weight [kg], BodyFat [%], MuscleMass [kg]
 */
enum class Metric : std::size_t
{
  Weight = 0,
  BodyFat = 1,
  MuscleMass = 2,
};

inline constexpr std::size_t kMetricCount = 3;

inline constexpr std::array<Metric, kMetricCount> kAllMetrics{
  Metric::Weight, Metric::BodyFat, Metric::MuscleMass};

/**
 * @brief Direction of change a metric is expected to follow
 *
 * Inherited from the goal type: Lose -> Loss, Gain -> Gain,
 * Maintain -> Maintain.
 */
enum class ProgressDirection
{
  Loss,
  Gain,
  Maintain,
};

constexpr std::size_t metricIndex(Metric metric)
{
  return static_cast<std::size_t>(metric);
}

constexpr ProgressDirection directionFor(GoalType type)
{
  switch (type)
  {
    case GoalType::Lose:
      return ProgressDirection::Loss;
    case GoalType::Gain:
      return ProgressDirection::Gain;
    case GoalType::Maintain:
      break;
  }
  return ProgressDirection::Maintain;
}

constexpr std::string_view toString(Metric metric)
{
  switch (metric)
  {
    case Metric::Weight:
      return "weight";
    case Metric::BodyFat:
      return "body_fat";
    case Metric::MuscleMass:
      return "muscle_mass";
  }
  return "unknown";
}

constexpr std::string_view toString(GoalType type)
{
  switch (type)
  {
    case GoalType::Lose:
      return "lose";
    case GoalType::Maintain:
      return "maintain";
    case GoalType::Gain:
      return "gain";
  }
  return "unknown";
}

constexpr std::string_view toString(ProgressDirection direction)
{
  switch (direction)
  {
    case ProgressDirection::Loss:
      return "loss";
    case ProgressDirection::Gain:
      return "gain";
    case ProgressDirection::Maintain:
      return "maintain";
  }
  return "unknown";
}

}  // namespace bct_core

#endif  // BCT_CORE_DATA_TYPES_METRIC_HPP
