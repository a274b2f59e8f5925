// Ticket: 0010_sqlite_persistence

#include "bct-store/src/RecordMapping.hpp"

#include <chrono>
#include <cmath>
#include <stdexcept>

namespace bct_store
{

namespace
{

using Seconds = std::chrono::duration<double>;

std::optional<double> optionalOf(uint32_t present, double value)
{
  if (present == 0)
  {
    return std::nullopt;
  }
  return value;
}

void storeMetric(const bct_core::MetricGoal& metric,
                 uint32_t& hasValues,
                 double& start,
                 double& target,
                 uint32_t& hasRate,
                 double& rate)
{
  hasValues = metric.isEnabled() ? 1 : 0;
  start = metric.start.value_or(0.0);
  target = metric.target.value_or(0.0);
  hasRate = metric.weeklyRate ? 1 : 0;
  rate = metric.weeklyRate.value_or(0.0);
}

bct_core::MetricGoal loadMetric(uint32_t hasValues,
                                double start,
                                double target,
                                uint32_t hasRate,
                                double rate)
{
  bct_core::MetricGoal metric{};
  metric.start = optionalOf(hasValues, start);
  metric.target = optionalOf(hasValues, target);
  metric.weeklyRate = optionalOf(hasRate, rate);
  return metric;
}

std::chrono::sys_days toDay(double seconds)
{
  return std::chrono::floor<std::chrono::days>(fromEpochSeconds(seconds));
}

}  // namespace

double toEpochSeconds(bct_core::TimePoint timePoint)
{
  return std::chrono::duration_cast<Seconds>(timePoint.time_since_epoch())
    .count();
}

bct_core::TimePoint fromEpochSeconds(double seconds)
{
  return bct_core::TimePoint{
    std::chrono::round<bct_core::Clock::duration>(Seconds{seconds})};
}

bct_transfer::GoalRecord toRecord(const bct_core::Goal& goal)
{
  using bct_core::Metric;

  bct_transfer::GoalRecord record{};
  record.id = goal.id;
  record.user_id = goal.userId;
  record.goal_type = static_cast<uint32_t>(goal.type);
  record.is_active = goal.isActive ? 1 : 0;

  storeMetric(goal.metric(Metric::Weight),
              record.has_weight,
              record.start_weight,
              record.target_weight,
              record.has_weight_rate,
              record.weekly_weight_rate);
  storeMetric(goal.metric(Metric::BodyFat),
              record.has_body_fat,
              record.start_body_fat,
              record.target_body_fat,
              record.has_body_fat_rate,
              record.weekly_body_fat_rate);
  storeMetric(goal.metric(Metric::MuscleMass),
              record.has_muscle,
              record.start_muscle,
              record.target_muscle,
              record.has_muscle_rate,
              record.weekly_muscle_rate);

  if (goal.periodStart)
  {
    record.has_period_start = 1;
    record.period_start_s = toEpochSeconds(bct_core::TimePoint{*goal.periodStart});
  }
  if (goal.periodEnd)
  {
    record.has_period_end = 1;
    record.period_end_s = toEpochSeconds(bct_core::TimePoint{*goal.periodEnd});
  }

  if (goal.dailyCalorieTarget)
  {
    record.has_calorie_target = 1;
    record.daily_calorie_target = static_cast<double>(*goal.dailyCalorieTarget);
  }

  return record;
}

bct_core::Goal fromRecord(const bct_transfer::GoalRecord& record)
{
  using bct_core::Metric;

  if (record.goal_type > static_cast<uint32_t>(bct_core::GoalType::Gain))
  {
    throw std::runtime_error{"Goal record " + std::to_string(record.id) +
                             " has unknown goal_type " +
                             std::to_string(record.goal_type)};
  }

  bct_core::Goal goal{};
  goal.id = record.id;
  goal.userId = record.user_id;
  goal.type = static_cast<bct_core::GoalType>(record.goal_type);
  goal.isActive = record.is_active != 0;

  goal.metric(Metric::Weight) = loadMetric(record.has_weight,
                                           record.start_weight,
                                           record.target_weight,
                                           record.has_weight_rate,
                                           record.weekly_weight_rate);
  goal.metric(Metric::BodyFat) = loadMetric(record.has_body_fat,
                                            record.start_body_fat,
                                            record.target_body_fat,
                                            record.has_body_fat_rate,
                                            record.weekly_body_fat_rate);
  goal.metric(Metric::MuscleMass) = loadMetric(record.has_muscle,
                                               record.start_muscle,
                                               record.target_muscle,
                                               record.has_muscle_rate,
                                               record.weekly_muscle_rate);

  if (record.has_period_start != 0)
  {
    goal.periodStart = toDay(record.period_start_s);
  }
  if (record.has_period_end != 0)
  {
    goal.periodEnd = toDay(record.period_end_s);
  }

  if (record.has_calorie_target != 0)
  {
    goal.dailyCalorieTarget =
      static_cast<int32_t>(std::lround(record.daily_calorie_target));
  }

  return goal;
}

bct_transfer::BodyCompositionRecord toRecord(
  const std::string& userId,
  const bct_core::BodyCompositionEntry& entry)
{
  bct_transfer::BodyCompositionRecord record{};
  record.id = entry.id;
  record.user_id = userId;
  record.timestamp_s = toEpochSeconds(entry.timestamp);
  record.weight = entry.weight;
  record.has_body_fat = entry.bodyFatPercent ? 1 : 0;
  record.body_fat_percent = entry.bodyFatPercent.value_or(0.0);
  record.has_muscle = entry.muscleMass ? 1 : 0;
  record.muscle_mass = entry.muscleMass.value_or(0.0);
  return record;
}

bct_core::BodyCompositionEntry fromRecord(
  const bct_transfer::BodyCompositionRecord& record)
{
  bct_core::BodyCompositionEntry entry{};
  entry.id = record.id;
  entry.timestamp = fromEpochSeconds(record.timestamp_s);
  entry.weight = record.weight;
  entry.bodyFatPercent = optionalOf(record.has_body_fat, record.body_fat_percent);
  entry.muscleMass = optionalOf(record.has_muscle, record.muscle_mass);
  return entry;
}

}  // namespace bct_store
