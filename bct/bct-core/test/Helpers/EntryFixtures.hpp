// Ticket: 0005_goal_progress_aggregator
// Helpers for building goals and measurement series in tests

#ifndef BCT_CORE_TEST_HELPERS_ENTRY_FIXTURES_HPP
#define BCT_CORE_TEST_HELPERS_ENTRY_FIXTURES_HPP

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "bct-core/src/DataTypes/BodyCompositionEntry.hpp"
#include "bct-core/src/DataTypes/Goal.hpp"

namespace bct_core
{
namespace test
{

// Fixed reference day so results do not depend on the wall clock
inline std::chrono::sys_days referenceDay()
{
  using namespace std::chrono;
  return sys_days{year{2024} / January / 1};
}

inline TimePoint dayAt(int day, int hour = 8)
{
  return TimePoint{referenceDay() + std::chrono::days{day} +
                   std::chrono::hours{hour}};
}

inline BodyCompositionEntry makeEntry(int day,
                                      double weight,
                                      std::optional<double> bodyFat = std::nullopt,
                                      std::optional<double> muscle = std::nullopt)
{
  BodyCompositionEntry entry{};
  entry.id = static_cast<uint32_t>(day + 1);
  entry.timestamp = dayAt(day);
  entry.weight = weight;
  entry.bodyFatPercent = bodyFat;
  entry.muscleMass = muscle;
  return entry;
}

/**
 * @brief One entry per day on days [0, lastDay], weight linear from
 * startWeight to endWeight
 */
inline std::vector<BodyCompositionEntry> linearWeightSeries(double startWeight,
                                                            double endWeight,
                                                            int lastDay)
{
  std::vector<BodyCompositionEntry> entries;
  for (int day = 0; day <= lastDay; ++day)
  {
    double const fraction = static_cast<double>(day) / lastDay;
    entries.push_back(
      makeEntry(day, startWeight + (endWeight - startWeight) * fraction));
  }
  return entries;
}

inline std::vector<MetricSample> linearSamples(double startValue,
                                               double dailyChange,
                                               int count)
{
  std::vector<MetricSample> samples;
  for (int day = 0; day < count; ++day)
  {
    samples.push_back(MetricSample{dayAt(day), startValue + dailyChange * day});
  }
  return samples;
}

inline Goal makeWeightGoal(GoalType type,
                           double start,
                           double target,
                           std::optional<double> weeklyRate = std::nullopt)
{
  Goal goal{};
  goal.id = 1;
  goal.userId = "user-1";
  goal.type = type;
  goal.metric(Metric::Weight) = MetricGoal{start, target, weeklyRate};
  return goal;
}

}  // namespace test
}  // namespace bct_core

#endif  // BCT_CORE_TEST_HELPERS_ENTRY_FIXTURES_HPP
