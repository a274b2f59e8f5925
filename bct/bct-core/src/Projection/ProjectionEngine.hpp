// Ticket: 0004_projection_engine

#ifndef BCT_CORE_PROJECTION_PROJECTION_ENGINE_HPP
#define BCT_CORE_PROJECTION_PROJECTION_ENGINE_HPP

#include <chrono>
#include <optional>

#include "bct-core/src/DataTypes/Metric.hpp"

namespace bct_core
{

/**
 * @brief Why a projection does or does not carry a completion date
 *
 * InsufficientData and NotConverging are kept apart so the presentation
 * layer can say "keep logging" vs. "adjust the plan".
 */
enum class ProjectionStatus
{
  Projected,         // Date available from the current trend
  AlreadyAchieved,   // Target reached, nothing left to project
  InsufficientData,  // Trend gate not met, on-track unknown
  NotConverging,     // Trend flat, moving away, or beyond the horizon
};

/**
 * @brief Actual pace relative to the planned weekly rate
 */
enum class TrendStatus
{
  Ahead,       // More than the tolerance above plan
  OnTrack,     // Within the tolerance of plan
  Behind,      // Below plan, or moving the wrong way
  NoProgress,  // Practically flat
};

struct ProjectionResult
{
  ProjectionStatus status{ProjectionStatus::InsufficientData};
  std::optional<TimePoint> estimatedCompletionDate;
  std::optional<int> daysToCompletion;

  // Absent when unknown (insufficient data). Never fabricated.
  std::optional<bool> isOnTrack;

  // Only when the goal carries a planned weekly rate and a trend exists
  std::optional<TrendStatus> trendStatus;

  // Only when the goal has a period end and a completion date exists
  std::optional<bool> completesBeforePeriodEnd;

  [[nodiscard]] bool hasCompletionDate() const
  {
    return estimatedCompletionDate.has_value();
  }
};

/**
 * @brief Planned vs. actual weekly rate comparison
 */
struct TrendComparison
{
  double actualWeeklyRate{0.0};
  double plannedWeeklyRate{0.0};
  double percentageOfPlan{0.0};  // |actual| / |planned| * 100
  TrendStatus status{TrendStatus::NoProgress};
};

/**
 * @brief Turns the remaining distance and a trend rate into a completion date
 *
 * daysToCompletion = ceil(remaining / rate), only when the rate moves toward
 * the target and the result stays within Config::maxProjectionDays. The
 * completion date is now + daysToCompletion days.
 *
 * On-track:
 * - With a planned weekly rate: |rate| >= |plannedWeeklyRate| / 7 and the
 *   trend moves toward the target
 * - Without one: any movement toward the target
 *
 * @ticket 0004_projection_engine
 */
class ProjectionEngine
{
public:
  struct Config
  {
    double onTrackTolerancePct{10.0};           // Band around 100% of plan
    double minimumMeaningfulWeeklyChange{0.01};  // [units/week]
    double rateTolerance{1e-9};                 // [units/day]
    // Longer projections are reported as NotConverging
    int maxProjectionDays{3650};
  };

  /**
   * @brief Everything the engine needs for one metric
   */
  struct Request
  {
    double remaining{0.0};            // target - current
    std::optional<double> dailyRate;  // std::nullopt = insufficient data
    bool targetReached{false};        // Current value at or past the target
    std::optional<double> plannedWeeklyRate;
    std::optional<std::chrono::sys_days> periodEnd;
    TimePoint now{};
  };

  ProjectionEngine() = default;

  explicit ProjectionEngine(const Config& config);

  [[nodiscard]] ProjectionResult project(const Request& request) const;

  /**
   * @brief Project without plan or period information
   *
   * @param remaining target - current
   * @param rate Trend rate [units/day]
   * @param hasSufficientData Whether the trend gate was met
   * @param now Reference time for the completion date
   */
  [[nodiscard]] ProjectionResult project(double remaining,
                                         double rate,
                                         bool hasSufficientData,
                                         TimePoint now) const;

  /**
   * @brief Whether a rate moves toward the target fast enough
   *
   * @param remaining target - current
   * @param dailyRate Actual rate [units/day]
   * @param plannedWeeklyRate Planned rate [units/week], if configured
   */
  [[nodiscard]] bool isOnTrack(double remaining,
                               double dailyRate,
                               std::optional<double> plannedWeeklyRate) const;

  /**
   * @brief Classify the actual weekly pace against the planned one
   */
  [[nodiscard]] TrendComparison compareTrendToPlanned(
    double actualWeeklyRate,
    double plannedWeeklyRate) const;

  static bool isMovingToward(double remaining, double dailyRate);

private:
  Config config_{};
};

}  // namespace bct_core

#endif  // BCT_CORE_PROJECTION_PROJECTION_ENGINE_HPP
