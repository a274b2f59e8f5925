// Ticket: 0002_metric_progress_calculator

#ifndef BCT_CORE_PROGRESS_METRIC_PROGRESS_CALCULATOR_HPP
#define BCT_CORE_PROGRESS_METRIC_PROGRESS_CALCULATOR_HPP

#include "bct-core/src/DataTypes/Metric.hpp"

namespace bct_core
{

/**
 * @brief Progress of one metric toward its target
 */
struct ProgressResult
{
  double percentage{0.0};  // >= 0, exceeds 100 on overshoot
  double remaining{0.0};   // target - current, signed [metric units]
  ProgressDirection direction{ProgressDirection::Maintain};

  /**
   * @brief True once the target has been reached or passed
   */
  [[nodiscard]] bool isTargetReached() const
  {
    return percentage >= 100.0;
  }
};

/**
 * @brief Normalizes (start, current, target) into a bounded percentage
 *
 * percentage = (current - start) / (target - start) * 100, floored at 0.
 *
 * Movement away from the target reports 0%, never a negative value.
 * Overshoot is intentionally left uncapped so that "exceeded" can be told
 * apart from "exactly achieved".
 *
 * When target == start there is no distance to normalize against: the
 * result is 100% if current already equals the target, otherwise 0%.
 *
 * @ticket 0002_metric_progress_calculator
 */
class MetricProgressCalculator
{
public:
  /**
   * @brief Compute progress for a single metric
   *
   * @param start Value recorded when the goal was created
   * @param current Latest measured value
   * @param target Goal value
   * @param direction Direction inherited from the goal type
   * @return ProgressResult with percentage, signed remaining and direction
   */
  static ProgressResult compute(double start,
                                double current,
                                double target,
                                ProgressDirection direction);
};

}  // namespace bct_core

#endif  // BCT_CORE_PROGRESS_METRIC_PROGRESS_CALCULATOR_HPP
