// Ticket: 0008_goal_period_urgency

#ifndef BCT_CORE_AGGREGATION_GOAL_URGENCY_HPP
#define BCT_CORE_AGGREGATION_GOAL_URGENCY_HPP

#include <optional>
#include <string>
#include <string_view>

#include "bct-core/src/DataTypes/Goal.hpp"

namespace bct_core
{

/**
 * @brief How much of the goal period is left
 */
enum class GoalUrgency
{
  Relaxed,   // >= 60% of the period left
  Steady,    // 30-60% left
  Intense,   // 10-30% left
  Critical,  // < 10% left, or the period is over
};

constexpr std::string_view toString(GoalUrgency urgency)
{
  switch (urgency)
  {
    case GoalUrgency::Relaxed:
      return "relaxed";
    case GoalUrgency::Steady:
      return "steady";
    case GoalUrgency::Intense:
      return "intense";
    case GoalUrgency::Critical:
      return "critical";
  }
  return "unknown";
}

/**
 * @brief Fraction of the goal period still ahead of now, clamped to [0, 1]
 * @return std::nullopt if the goal has no complete, non-empty period
 */
std::optional<double> periodFractionRemaining(const Goal& goal, TimePoint now);

/**
 * @brief Urgency bucket for the remaining period fraction
 * @return std::nullopt if the goal has no complete, non-empty period
 */
std::optional<GoalUrgency> urgencyFor(const Goal& goal, TimePoint now);

/**
 * @brief Calendar days from today (UTC) until the goal's period end
 *
 * Zero on the last day, negative once the period is over.
 *
 * @return std::nullopt if the goal has no period end
 */
std::optional<int> daysUntilPeriodEnd(const Goal& goal, TimePoint now);

/**
 * @brief Countdown label: "D-45", "D-Day", "D+3"
 */
std::string formatCountdown(int daysUntilEnd);

}  // namespace bct_core

#endif  // BCT_CORE_AGGREGATION_GOAL_URGENCY_HPP
