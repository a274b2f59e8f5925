// Ticket: 0001_goal_progress_data_model

#include "bct-core/src/DataTypes/Goal.hpp"

namespace bct_core
{

std::vector<Metric> enabledMetrics(const Goal& goal)
{
  std::vector<Metric> enabled;
  enabled.reserve(kMetricCount);
  for (Metric const metric : kAllMetrics)
  {
    if (goal.metric(metric).isEnabled())
    {
      enabled.push_back(metric);
    }
  }
  return enabled;
}

}  // namespace bct_core
