// Ticket: 0006_milestone_tracker

#ifndef BCT_CORE_MILESTONES_MILESTONE_TRACKER_HPP
#define BCT_CORE_MILESTONES_MILESTONE_TRACKER_HPP

#include <array>
#include <optional>
#include <string_view>
#include <vector>

namespace bct_core
{

/**
 * @brief Fixed progress thresholds that trigger celebratory feedback
 *
 * The underlying value is the threshold in percent.
 */
enum class Milestone : int
{
  Quarter = 25,
  Half = 50,
  ThreeQuarters = 75,
  Complete = 100,
};

inline constexpr std::array<Milestone, 4> kAllMilestones{Milestone::Quarter,
                                                         Milestone::Half,
                                                         Milestone::ThreeQuarters,
                                                         Milestone::Complete};

constexpr double thresholdOf(Milestone milestone)
{
  return static_cast<double>(static_cast<int>(milestone));
}

constexpr std::string_view toString(Milestone milestone)
{
  switch (milestone)
  {
    case Milestone::Quarter:
      return "25%";
    case Milestone::Half:
      return "50%";
    case Milestone::ThreeQuarters:
      return "75%";
    case Milestone::Complete:
      return "100%";
  }
  return "unknown";
}

/**
 * @brief What to report when there is no previously recorded percentage
 */
enum class FirstRunPolicy
{
  Suppress,           // Report nothing as newly achieved
  CelebrateAchieved,  // Report every currently achieved milestone
};

/**
 * @brief Maps an overall percentage to milestones and diffs against a
 * previous percentage
 *
 * Milestone sets are returned in ascending threshold order. Overshoot past
 * 100% still yields only the Complete milestone.
 *
 * The first-run default is Suppress: a goal that starts already partially
 * complete must not fire a celebration on its first computation.
 *
 * @ticket 0006_milestone_tracker
 */
class MilestoneTracker
{
public:
  /**
   * @brief Milestones whose threshold is <= overallPercentage
   */
  static std::vector<Milestone> achieved(double overallPercentage);

  /**
   * @brief achieved(current) minus achieved(previous)
   *
   * @param current Overall percentage just computed
   * @param previous Percentage from the caller's progress cache, if any
   * @param policy Behavior when previous is absent
   */
  static std::vector<Milestone> newlyAchieved(
    double current,
    std::optional<double> previous,
    FirstRunPolicy policy = FirstRunPolicy::Suppress);
};

}  // namespace bct_core

#endif  // BCT_CORE_MILESTONES_MILESTONE_TRACKER_HPP
