// Ticket: 0008_goal_period_urgency

#include "bct-core/src/Aggregation/GoalUrgency.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>

namespace bct_core
{

std::optional<double> periodFractionRemaining(const Goal& goal, TimePoint now)
{
  if (!goal.periodStart || !goal.periodEnd)
  {
    return std::nullopt;
  }

  TimePoint const start{*goal.periodStart};
  TimePoint const end{*goal.periodEnd};
  if (end <= start)
  {
    return std::nullopt;
  }

  using Seconds = std::chrono::duration<double>;
  double const total = std::chrono::duration_cast<Seconds>(end - start).count();
  double const left = std::chrono::duration_cast<Seconds>(end - now).count();

  return std::clamp(left / total, 0.0, 1.0);
}

std::optional<GoalUrgency> urgencyFor(const Goal& goal, TimePoint now)
{
  auto const fraction = periodFractionRemaining(goal, now);
  if (!fraction)
  {
    return std::nullopt;
  }

  if (*fraction >= 0.6)
  {
    return GoalUrgency::Relaxed;
  }
  if (*fraction >= 0.3)
  {
    return GoalUrgency::Steady;
  }
  if (*fraction >= 0.1)
  {
    return GoalUrgency::Intense;
  }
  return GoalUrgency::Critical;
}

std::optional<int> daysUntilPeriodEnd(const Goal& goal, TimePoint now)
{
  if (!goal.periodEnd)
  {
    return std::nullopt;
  }

  auto const today = std::chrono::floor<std::chrono::days>(now);
  return static_cast<int>((*goal.periodEnd - today).count());
}

std::string formatCountdown(int daysUntilEnd)
{
  if (daysUntilEnd > 0)
  {
    return "D-" + std::to_string(daysUntilEnd);
  }
  if (daysUntilEnd == 0)
  {
    return "D-Day";
  }
  return "D+" + std::to_string(std::abs(daysUntilEnd));
}

}  // namespace bct_core
