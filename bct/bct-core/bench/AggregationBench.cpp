// Ticket: 0005_goal_progress_aggregator

#include <benchmark/benchmark.h>

#include <chrono>
#include <random>
#include <vector>

#include "bct-core/src/Aggregation/GoalProgressAggregator.hpp"
#include "bct-core/src/Trend/TrendAnalyzer.hpp"

using namespace bct_core;

// ============================================================================
// Helper Functions
// ============================================================================

namespace
{

std::chrono::sys_days const kFirstDay{std::chrono::year{2024} /
                                      std::chrono::January / 1};

// Noisy daily weigh-ins trending down 0.1 kg/day, fixed seed
std::vector<BodyCompositionEntry> generateEntries(std::size_t count)
{
  static std::mt19937 rng{42};
  std::normal_distribution<double> noise{0.0, 0.3};

  std::vector<BodyCompositionEntry> entries;
  entries.reserve(count);
  for (std::size_t i = 0; i < count; ++i)
  {
    BodyCompositionEntry entry{};
    entry.id = static_cast<uint32_t>(i + 1);
    entry.timestamp = TimePoint{kFirstDay + std::chrono::days{static_cast<int>(i)}} +
                      std::chrono::hours{7};
    entry.weight = 90.0 - 0.1 * static_cast<double>(i) + noise(rng);
    entry.bodyFatPercent = 30.0 - 0.02 * static_cast<double>(i) + noise(rng);
    entry.muscleMass = 35.0 + 0.005 * static_cast<double>(i);
    entries.push_back(entry);
  }
  return entries;
}

Goal threeMetricGoal()
{
  Goal goal{};
  goal.id = 1;
  goal.userId = "bench";
  goal.type = GoalType::Lose;
  goal.metric(Metric::Weight) = MetricGoal{90.0, 75.0, -0.7};
  goal.metric(Metric::BodyFat) = MetricGoal{30.0, 22.0, -0.2};
  goal.metric(Metric::MuscleMass) = MetricGoal{35.0, 37.0, 0.05};
  goal.periodStart = kFirstDay;
  goal.periodEnd = kFirstDay + std::chrono::weeks{52};
  return goal;
}

}  // namespace

// ============================================================================
// Aggregation
// ============================================================================

/**
 * @brief Full aggregation of a three-metric goal over a growing history
 */
static void BM_Aggregate_ThreeMetrics(benchmark::State& state)
{
  auto const entries = generateEntries(static_cast<std::size_t>(state.range(0)));
  Goal const goal = threeMetricGoal();
  GoalProgressAggregator const aggregator{};
  TimePoint const now = entries.back().timestamp;

  for (auto _ : state)
  {
    auto data = aggregator.aggregate(goal, entries, 40.0, now);
    benchmark::DoNotOptimize(data);
  }
  state.SetComplexityN(state.range(0));
}
BENCHMARK(BM_Aggregate_ThreeMetrics)
  ->Arg(14)
  ->Arg(90)
  ->Arg(365)  // One year of daily weigh-ins
  ->Arg(1825)
  ->Complexity();

// ============================================================================
// Trend
// ============================================================================

static void BM_LeastSquaresSlope(benchmark::State& state)
{
  auto const entries = generateEntries(static_cast<std::size_t>(state.range(0)));
  auto const samples = samplesFor(entries, Metric::Weight);

  for (auto _ : state)
  {
    double slope = TrendAnalyzer::leastSquaresSlope(samples);
    benchmark::DoNotOptimize(slope);
  }
  state.SetComplexityN(state.range(0));
}
BENCHMARK(BM_LeastSquaresSlope)->Arg(14)->Arg(90)->Arg(365)->Complexity();

BENCHMARK_MAIN();
