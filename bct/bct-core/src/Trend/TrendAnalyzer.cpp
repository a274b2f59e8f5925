// Ticket: 0003_trend_analyzer

#include "bct-core/src/Trend/TrendAnalyzer.hpp"

#include <Eigen/Dense>
#include <chrono>

namespace bct_core
{

namespace
{

using FractionalDays = std::chrono::duration<double, std::chrono::days::period>;

double daysBetween(TimePoint from, TimePoint to)
{
  return std::chrono::duration_cast<FractionalDays>(to - from).count();
}

std::optional<TrendResult> analyzeWindow(std::span<const MetricSample> samples,
                                         int windowDays,
                                         std::size_t minimumDataPoints)
{
  std::vector<MetricSample> const window =
    TrendAnalyzer::windowed(samples, windowDays);

  // Hard gate: below the minimum the estimate is too noisy to project from
  if (window.size() < minimumDataPoints || window.size() < 2)
  {
    return std::nullopt;
  }

  const MetricSample& first = window.front();
  const MetricSample& last = window.back();

  double const elapsedDays = daysBetween(first.timestamp, last.timestamp);
  if (elapsedDays <= 0.0)
  {
    return std::nullopt;
  }

  TrendResult result{};
  result.dailyRate = (last.value - first.value) / elapsedDays;
  result.weeklyRate = result.dailyRate * 7.0;
  result.dataPoints = window.size();
  result.confidence = TrendAnalyzer::confidenceFor(window.size());
  result.regressionDailyRate = TrendAnalyzer::leastSquaresSlope(window);
  result.windowStart = first.timestamp;
  result.windowEnd = last.timestamp;
  return result;
}

}  // namespace

TrendAnalyzer::TrendAnalyzer(const Config& config)
  : config_{config}
{
}

std::optional<TrendResult> TrendAnalyzer::analyze(
  std::span<const MetricSample> samples) const
{
  return analyzeWindow(samples, config_.windowDays, config_.minimumDataPoints);
}

std::optional<TrendResult> TrendAnalyzer::analyze(
  std::span<const MetricSample> samples,
  int windowDays)
{
  return analyzeWindow(samples, windowDays, Config{}.minimumDataPoints);
}

std::vector<MetricSample> TrendAnalyzer::windowed(
  std::span<const MetricSample> samples,
  int windowDays)
{
  std::vector<MetricSample> window;
  if (samples.empty())
  {
    return window;
  }

  TimePoint const latest = samples.back().timestamp;
  TimePoint const cutoff = latest - std::chrono::days{windowDays};

  window.reserve(samples.size());
  for (const auto& sample : samples)
  {
    if (sample.timestamp < cutoff)
    {
      continue;
    }

    // Same calendar day: the later sample replaces the earlier one
    if (!window.empty() &&
        std::chrono::floor<std::chrono::days>(window.back().timestamp) ==
          std::chrono::floor<std::chrono::days>(sample.timestamp))
    {
      window.back() = sample;
      continue;
    }

    window.push_back(sample);
  }

  return window;
}

double TrendAnalyzer::leastSquaresSlope(std::span<const MetricSample> samples)
{
  if (samples.size() < 2)
  {
    return 0.0;
  }

  auto const n = static_cast<Eigen::Index>(samples.size());
  TimePoint const origin = samples.front().timestamp;

  // Design matrix [1, t_i] with t in days since the first sample
  Eigen::MatrixXd A(n, 2);
  Eigen::VectorXd y(n);
  for (Eigen::Index i = 0; i < n; ++i)
  {
    const auto& sample = samples[static_cast<std::size_t>(i)];
    A(i, 0) = 1.0;
    A(i, 1) = daysBetween(origin, sample.timestamp);
    y(i) = sample.value;
  }

  // Zero spread in time leaves the slope undefined
  Eigen::VectorXd const t = A.col(1);
  if ((t.array() - t.mean()).square().sum() == 0.0)
  {
    return 0.0;
  }

  Eigen::Vector2d const coefficients = A.colPivHouseholderQr().solve(y);
  return coefficients(1);
}

TrendConfidence TrendAnalyzer::confidenceFor(std::size_t dataPoints)
{
  if (dataPoints >= 10)
  {
    return TrendConfidence::High;
  }
  if (dataPoints >= 5)
  {
    return TrendConfidence::Medium;
  }
  return TrendConfidence::Low;
}

}  // namespace bct_core
