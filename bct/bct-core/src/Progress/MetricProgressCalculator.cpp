// Ticket: 0002_metric_progress_calculator

#include "bct-core/src/Progress/MetricProgressCalculator.hpp"

#include <algorithm>

namespace bct_core
{

ProgressResult MetricProgressCalculator::compute(double start,
                                                 double current,
                                                 double target,
                                                 ProgressDirection direction)
{
  ProgressResult result{};
  result.remaining = target - current;
  result.direction = direction;

  double const totalChange = target - start;

  // Nothing to normalize against
  if (totalChange == 0.0)
  {
    result.percentage = (current == target) ? 100.0 : 0.0;
    return result;
  }

  double const currentChange = current - start;
  result.percentage = std::max(0.0, (currentChange / totalChange) * 100.0);

  return result;
}

}  // namespace bct_core
