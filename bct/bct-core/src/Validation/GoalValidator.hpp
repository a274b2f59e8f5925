// Ticket: 0007_goal_validation

#ifndef BCT_CORE_VALIDATION_GOAL_VALIDATOR_HPP
#define BCT_CORE_VALIDATION_GOAL_VALIDATOR_HPP

#include <stdexcept>
#include <string>

#include "bct-core/src/DataTypes/Goal.hpp"

namespace bct_core
{

/**
 * @brief Thrown when a goal definition cannot be accepted
 */
class GoalValidationError : public std::runtime_error
{
public:
  enum class Kind
  {
    NoTargets,
    UnrealisticRate,
    InconsistentGoalType,
    PhysicallyInconsistent,
    InvalidPeriod,
  };

  GoalValidationError(Kind kind, const std::string& message)
    : std::runtime_error{message}, kind_{kind}
  {
  }

  [[nodiscard]] Kind kind() const
  {
    return kind_;
  }

private:
  Kind kind_;
};

/**
 * @brief Rejects goal definitions before they are stored
 *
 * Checks run in a fixed order and the first failure is thrown:
 * targets, weekly rates, goal type consistency, physical consistency,
 * then the period.
 *
 * @ticket 0007_goal_validation
 */
class GoalValidator
{
public:
  struct Config
  {
    double maxWeightWeeklyRate{2.0};      // [kg/week]
    double maxBodyFatWeeklyRate{3.0};     // [%/week]
    double maxMuscleWeeklyRate{1.0};      // [kg/week]
    double maintainTolerancePct{5.0};     // Allowed drift from start [%]
    int maxPeriodWeeks{104};
  };

  GoalValidator() = default;
  explicit GoalValidator(const Config& config);

  /**
   * @brief Validate a goal
   * @throws GoalValidationError describing the first violated rule
   */
  void validate(const Goal& goal) const;

  [[nodiscard]] const Config& getConfig() const
  {
    return config_;
  }

private:
  void checkRates(const Goal& goal) const;
  void checkGoalType(const Goal& goal) const;
  void checkPeriod(const Goal& goal) const;
  static void checkLeanMass(const Goal& goal);

  Config config_{};
};

}  // namespace bct_core

#endif  // BCT_CORE_VALIDATION_GOAL_VALIDATOR_HPP
