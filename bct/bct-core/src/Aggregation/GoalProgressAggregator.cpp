// Ticket: 0005_goal_progress_aggregator

#include "bct-core/src/Aggregation/GoalProgressAggregator.hpp"

#include <algorithm>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "bct-core/src/Errors.hpp"
#include "bct-core/src/Progress/MetricProgressCalculator.hpp"

namespace bct_core
{

GoalProgressAggregator::GoalProgressAggregator(const Config& config)
  : config_{config},
    trendAnalyzer_{TrendAnalyzer::Config{config.trendWindowDays,
                                         config.minimumDataPoints}},
    projectionEngine_{config.projection}
{
}

GoalProgressData GoalProgressAggregator::aggregate(
  const std::optional<Goal>& goal,
  std::span<const BodyCompositionEntry> entries,
  std::optional<double> previousOverallPercentage,
  TimePoint now) const
{
  if (!goal)
  {
    throw NoActiveGoalError{""};
  }
  if (!goal->isActive)
  {
    throw NoActiveGoalError{goal->userId};
  }

  std::vector<Metric> const metrics = enabledMetrics(*goal);
  if (metrics.empty())
  {
    throw NoEnabledMetricsError{goal->id};
  }

  if (entries.empty())
  {
    throw NoMeasurementsError{};
  }

  std::vector<BodyCompositionEntry> sortedCopy;
  if (!std::is_sorted(entries.begin(), entries.end(), earlierThan))
  {
    sortedCopy.assign(entries.begin(), entries.end());
    std::stable_sort(sortedCopy.begin(), sortedCopy.end(), earlierThan);
    entries = sortedCopy;
  }

  GoalProgressData data{};
  data.goal = *goal;
  data.latestEntry = entries.back();
  data.dataPointsCount = entries.size();
  data.urgency = urgencyFor(*goal, now);
  data.daysUntilPeriodEnd = daysUntilPeriodEnd(*goal, now);
  data.computedAt = now;

  double percentageSum{0.0};
  std::size_t reported{0};

  for (Metric const metric : metrics)
  {
    auto report = reportFor(*goal, metric, entries, now);
    if (!report)
    {
      spdlog::warn("Goal {} has {} enabled but no entry measures it",
                   goal->id,
                   toString(metric));
      continue;
    }

    percentageSum += report->progress.percentage;
    ++reported;

    if (auto const onTrack = report->projection.isOnTrack)
    {
      data.isOnTrack = data.isOnTrack.value_or(true) && *onTrack;
    }

    data.metrics[metricIndex(metric)] = std::move(report);
  }

  if (reported > 0)
  {
    data.overallProgress = percentageSum / static_cast<double>(reported);
  }

  data.achievedMilestones = MilestoneTracker::achieved(data.overallProgress);
  data.newlyAchievedMilestones =
    MilestoneTracker::newlyAchieved(data.overallProgress,
                                    previousOverallPercentage,
                                    config_.firstRunPolicy);

  return data;
}

std::optional<MetricReport> GoalProgressAggregator::reportFor(
  const Goal& goal,
  Metric metric,
  std::span<const BodyCompositionEntry> entries,
  TimePoint now) const
{
  auto const current = latestValue(entries, metric);
  if (!current)
  {
    return std::nullopt;
  }

  const MetricGoal& metricGoal = goal.metric(metric);

  MetricReport report{};
  report.metric = metric;
  report.currentValue = *current;
  report.progress = MetricProgressCalculator::compute(
    *metricGoal.start, *current, *metricGoal.target, goal.direction());

  std::vector<MetricSample> const samples = samplesFor(entries, metric);
  report.trend = trendAnalyzer_.analyze(samples);

  ProjectionEngine::Request request{};
  request.remaining = report.progress.remaining;
  if (report.trend)
  {
    request.dailyRate = report.trend->dailyRate;
  }
  request.targetReached = report.progress.isTargetReached();
  request.plannedWeeklyRate = metricGoal.weeklyRate;
  request.periodEnd = goal.periodEnd;
  request.now = now;

  report.projection = projectionEngine_.project(request);

  return report;
}

}  // namespace bct_core
