// Ticket: 0003_trend_analyzer

#ifndef BCT_CORE_TREND_TREND_ANALYZER_HPP
#define BCT_CORE_TREND_TREND_ANALYZER_HPP

#include <cstddef>
#include <optional>
#include <span>
#include <vector>

#include "bct-core/src/DataTypes/BodyCompositionEntry.hpp"
#include "bct-core/src/DataTypes/Metric.hpp"

namespace bct_core
{

/**
 * @brief How much the trend estimate can be trusted, by distinct days used
 */
enum class TrendConfidence
{
  Low,     // 2-4 days
  Medium,  // 5-9 days
  High,    // 10+ days
};

/**
 * @brief Recent rate of change of one metric
 */
struct TrendResult
{
  double dailyRate{0.0};   // [units/day], positive = increasing
  double weeklyRate{0.0};  // dailyRate * 7 [units/week]
  std::size_t dataPoints{0};
  TrendConfidence confidence{TrendConfidence::Low};

  // Least-squares slope over the same window [units/day]. Informational only,
  // projections use dailyRate.
  double regressionDailyRate{0.0};

  TimePoint windowStart{};
  TimePoint windowEnd{};
};

/**
 * @brief Derives a per-day rate of change from a measurement history window
 *
 * Algorithm:
 * 1. Keep samples with timestamp >= latest - windowDays (inclusive bound)
 * 2. Collapse same-day duplicates to the most recent sample of that UTC day
 * 3. Require at least minimumDataPoints distinct days, otherwise report
 *    insufficient data (std::nullopt)
 * 4. rate = (last.value - first.value) / elapsed days between them
 *
 * The two-point rate is insensitive to outliers scattered mid-window. The
 * minimum-data gate is shared with the projection engine: no rate means no
 * projection.
 *
 * Samples must be sorted ascending by timestamp.
 *
 * @ticket 0003_trend_analyzer
 */
class TrendAnalyzer
{
public:
  struct Config
  {
    int windowDays{14};
    std::size_t minimumDataPoints{5};
  };

  TrendAnalyzer() = default;

  explicit TrendAnalyzer(const Config& config);

  /**
   * @brief Analyze samples using this analyzer's configuration
   * @return TrendResult, or std::nullopt when the window has too few days
   */
  [[nodiscard]] std::optional<TrendResult> analyze(
    std::span<const MetricSample> samples) const;

  /**
   * @brief Analyze samples with an explicit window and the default
   * minimum of 5 distinct days
   */
  static std::optional<TrendResult> analyze(std::span<const MetricSample> samples,
                                            int windowDays);

  /**
   * @brief Samples inside the trend window, one per calendar day
   *
   * @param samples Ascending samples
   * @param windowDays Window length counted back from the latest sample
   * @return Filtered and deduplicated samples, ascending
   */
  static std::vector<MetricSample> windowed(std::span<const MetricSample> samples,
                                            int windowDays);

  /**
   * @brief Ordinary least-squares slope of value against time
   * @return Slope [units/day], 0.0 for fewer than 2 samples or zero time spread
   */
  static double leastSquaresSlope(std::span<const MetricSample> samples);

  static TrendConfidence confidenceFor(std::size_t dataPoints);

  [[nodiscard]] const Config& getConfig() const
  {
    return config_;
  }

private:
  Config config_{};
};

}  // namespace bct_core

#endif  // BCT_CORE_TREND_TREND_ANALYZER_HPP
