// Ticket: 0005_goal_progress_aggregator

#ifndef BCT_CORE_ERRORS_HPP
#define BCT_CORE_ERRORS_HPP

#include <cstdint>
#include <stdexcept>
#include <string>

namespace bct_core
{

/**
 * @brief No active goal exists for the user
 *
 * Expected state for new users; the presentation layer maps it to a
 * call-to-action rather than a failure screen.
 */
class NoActiveGoalError : public std::runtime_error
{
public:
  explicit NoActiveGoalError(const std::string& userId)
    : std::runtime_error{"No active goal for user '" + userId + "'"},
      userId_{userId}
  {
  }

  [[nodiscard]] const std::string& userId() const
  {
    return userId_;
  }

private:
  std::string userId_;
};

/**
 * @brief Goal has no metric with both a start and a target value
 */
class NoEnabledMetricsError : public std::runtime_error
{
public:
  explicit NoEnabledMetricsError(uint32_t goalId)
    : std::runtime_error{"Goal " + std::to_string(goalId) +
                         " has no enabled metrics"}
  {
  }
};

/**
 * @brief No body-composition entry was supplied for the aggregation
 */
class NoMeasurementsError : public std::runtime_error
{
public:
  NoMeasurementsError()
    : std::runtime_error{"No body composition entries available"}
  {
  }
};

}  // namespace bct_core

#endif  // BCT_CORE_ERRORS_HPP
