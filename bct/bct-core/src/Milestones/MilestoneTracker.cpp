// Ticket: 0006_milestone_tracker

#include "bct-core/src/Milestones/MilestoneTracker.hpp"

#include <algorithm>
#include <iterator>

namespace bct_core
{

std::vector<Milestone> MilestoneTracker::achieved(double overallPercentage)
{
  std::vector<Milestone> milestones;
  for (Milestone const milestone : kAllMilestones)
  {
    if (overallPercentage >= thresholdOf(milestone))
    {
      milestones.push_back(milestone);
    }
  }
  return milestones;
}

std::vector<Milestone> MilestoneTracker::newlyAchieved(
  double current,
  std::optional<double> previous,
  FirstRunPolicy policy)
{
  if (!previous)
  {
    if (policy == FirstRunPolicy::CelebrateAchieved)
    {
      return achieved(current);
    }
    return {};
  }

  std::vector<Milestone> const now = achieved(current);
  std::vector<Milestone> const before = achieved(*previous);

  // Both inputs are in ascending threshold order
  std::vector<Milestone> crossed;
  std::set_difference(now.begin(),
                      now.end(),
                      before.begin(),
                      before.end(),
                      std::back_inserter(crossed));
  return crossed;
}

}  // namespace bct_core
