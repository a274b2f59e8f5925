// Ticket: 0007_goal_validation

#include "bct-core/src/Validation/GoalValidator.hpp"

#include <chrono>
#include <cmath>
#include <initializer_list>

namespace bct_core
{

namespace
{

using Kind = GoalValidationError::Kind;

std::string describe(Metric metric)
{
  return std::string{toString(metric)};
}

bool withinPercent(double value, double reference, double pct)
{
  return std::abs(value - reference) <= std::abs(reference) * pct / 100.0;
}

}  // namespace

GoalValidator::GoalValidator(const Config& config)
  : config_{config}
{
}

void GoalValidator::validate(const Goal& goal) const
{
  if (enabledMetrics(goal).empty())
  {
    throw GoalValidationError{Kind::NoTargets,
                              "Goal must define at least one target"};
  }

  checkRates(goal);
  checkGoalType(goal);
  checkLeanMass(goal);
  checkPeriod(goal);
}

void GoalValidator::checkRates(const Goal& goal) const
{
  std::array<double, kMetricCount> const limits{config_.maxWeightWeeklyRate,
                                                config_.maxBodyFatWeeklyRate,
                                                config_.maxMuscleWeeklyRate};

  for (Metric const metric : kAllMetrics)
  {
    auto const& rate = goal.metric(metric).weeklyRate;
    double const limit = limits[metricIndex(metric)];
    if (rate && std::abs(*rate) > limit)
    {
      throw GoalValidationError{
        Kind::UnrealisticRate,
        "Weekly " + describe(metric) + " rate " + std::to_string(*rate) +
          " exceeds +/-" + std::to_string(limit)};
    }
  }
}

void GoalValidator::checkGoalType(const Goal& goal) const
{
  const MetricGoal& weight = goal.metric(Metric::Weight);
  const MetricGoal& muscle = goal.metric(Metric::MuscleMass);

  switch (goal.type)
  {
    case GoalType::Lose:
      if (weight.isEnabled() && *weight.target >= *weight.start)
      {
        throw GoalValidationError{
          Kind::InconsistentGoalType,
          "Weight loss goal needs a target below the start weight"};
      }
      break;

    case GoalType::Gain:
      if (weight.isEnabled() && *weight.target <= *weight.start)
      {
        throw GoalValidationError{
          Kind::InconsistentGoalType,
          "Weight gain goal needs a target above the start weight"};
      }
      if (muscle.isEnabled() && *muscle.target < *muscle.start)
      {
        throw GoalValidationError{
          Kind::InconsistentGoalType,
          "Weight gain goal cannot lower muscle mass"};
      }
      break;

    case GoalType::Maintain:
      for (Metric const metric : {Metric::Weight, Metric::BodyFat})
      {
        const MetricGoal& m = goal.metric(metric);
        if (m.isEnabled() &&
            !withinPercent(*m.target, *m.start, config_.maintainTolerancePct))
        {
          throw GoalValidationError{
            Kind::InconsistentGoalType,
            "Maintenance " + describe(metric) + " target drifts more than " +
              std::to_string(config_.maintainTolerancePct) + "% from start"};
        }
      }
      break;
  }
}

void GoalValidator::checkLeanMass(const Goal& goal)
{
  auto const& weightTarget = goal.metric(Metric::Weight).target;
  auto const& fatTarget = goal.metric(Metric::BodyFat).target;
  auto const& muscleTarget = goal.metric(Metric::MuscleMass).target;

  if (!weightTarget || !fatTarget || !muscleTarget)
  {
    return;
  }

  double const leanMass = *weightTarget * (1.0 - *fatTarget / 100.0);
  if (*muscleTarget > leanMass)
  {
    throw GoalValidationError{Kind::PhysicallyInconsistent,
                              "Target muscle mass " +
                                std::to_string(*muscleTarget) +
                                " kg exceeds target lean mass " +
                                std::to_string(leanMass) + " kg"};
  }
}

void GoalValidator::checkPeriod(const Goal& goal) const
{
  if (!goal.periodStart || !goal.periodEnd)
  {
    return;
  }

  if (*goal.periodEnd < *goal.periodStart)
  {
    throw GoalValidationError{Kind::InvalidPeriod,
                              "Goal period ends before it starts"};
  }

  if (*goal.periodEnd - *goal.periodStart >
      std::chrono::weeks{config_.maxPeriodWeeks})
  {
    throw GoalValidationError{
      Kind::InvalidPeriod,
      "Goal period exceeds " + std::to_string(config_.maxPeriodWeeks) +
        " weeks"};
  }
}

}  // namespace bct_core
