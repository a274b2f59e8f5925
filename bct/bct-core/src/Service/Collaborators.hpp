// Ticket: 0009_goal_progress_service

#ifndef BCT_CORE_SERVICE_COLLABORATORS_HPP
#define BCT_CORE_SERVICE_COLLABORATORS_HPP

#include <optional>
#include <string>
#include <vector>

#include "bct-core/src/DataTypes/BodyCompositionEntry.hpp"
#include "bct-core/src/DataTypes/Goal.hpp"

namespace bct_core
{

/**
 * @brief Source of goal definitions
 */
class GoalStore
{
public:
  virtual ~GoalStore() = default;

  /**
   * @brief The user's active goal, std::nullopt if none
   */
  virtual std::optional<Goal> getActiveGoal(const std::string& userId) = 0;

protected:
  GoalStore() = default;
  GoalStore(const GoalStore&) = default;
  GoalStore& operator=(const GoalStore&) = default;
  GoalStore(GoalStore&&) noexcept = default;
  GoalStore& operator=(GoalStore&&) noexcept = default;
};

/**
 * @brief Source of body composition measurements
 */
class MeasurementStore
{
public:
  virtual ~MeasurementStore() = default;

  /**
   * @brief Entries for a user, ascending by timestamp
   * @param since Lower bound (inclusive); std::nullopt returns every entry
   */
  virtual std::vector<BodyCompositionEntry> getEntries(
    const std::string& userId,
    std::optional<TimePoint> since) = 0;

protected:
  MeasurementStore() = default;
  MeasurementStore(const MeasurementStore&) = default;
  MeasurementStore& operator=(const MeasurementStore&) = default;
  MeasurementStore(MeasurementStore&&) noexcept = default;
  MeasurementStore& operator=(MeasurementStore&&) noexcept = default;
};

/**
 * @brief Remembers the last overall percentage per user for milestone diffing
 */
class ProgressCache
{
public:
  virtual ~ProgressCache() = default;

  virtual std::optional<double> loadPreviousPercentage(
    const std::string& userId) = 0;

  virtual void storePercentage(const std::string& userId,
                               double overallPercentage,
                               TimePoint recordedAt) = 0;

protected:
  ProgressCache() = default;
  ProgressCache(const ProgressCache&) = default;
  ProgressCache& operator=(const ProgressCache&) = default;
  ProgressCache(ProgressCache&&) noexcept = default;
  ProgressCache& operator=(ProgressCache&&) noexcept = default;
};

}  // namespace bct_core

#endif  // BCT_CORE_SERVICE_COLLABORATORS_HPP
