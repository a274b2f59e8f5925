// Ticket: 0001_goal_progress_data_model

#ifndef BCT_CORE_DATA_TYPES_BODY_COMPOSITION_ENTRY_HPP
#define BCT_CORE_DATA_TYPES_BODY_COMPOSITION_ENTRY_HPP

#include <cstdint>
#include <optional>
#include <span>
#include <vector>

#include "bct-core/src/DataTypes/Metric.hpp"

namespace bct_core
{

/**
 * @brief A single body-composition measurement
 *
 * Weight is always present; body fat and muscle mass depend on the
 * measuring device. Entries are immutable once recorded.
 */
struct BodyCompositionEntry
{
  uint32_t id{0};
  TimePoint timestamp{};
  double weight{0.0};                    // [kg]
  std::optional<double> bodyFatPercent;  // [%]
  std::optional<double> muscleMass;      // [kg]

  /**
   * @brief Value of the given metric on this entry, if measured
   */
  [[nodiscard]] std::optional<double> value(Metric metric) const;
};

/**
 * @brief (timestamp, value) pair fed to the trend analyzer
 */
struct MetricSample
{
  TimePoint timestamp{};
  double value{0.0};
};

/**
 * @brief Extract the samples of one metric, skipping entries without it
 *
 * Input order is preserved.
 */
std::vector<MetricSample> samplesFor(std::span<const BodyCompositionEntry> entries,
                                     Metric metric);

/**
 * @brief Most recent value of a metric in an ascending entry list
 * @return std::nullopt if no entry carries the metric
 */
std::optional<double> latestValue(std::span<const BodyCompositionEntry> entries,
                                  Metric metric);

/**
 * @brief Strict weak ordering by timestamp
 */
inline bool earlierThan(const BodyCompositionEntry& lhs,
                        const BodyCompositionEntry& rhs)
{
  return lhs.timestamp < rhs.timestamp;
}

}  // namespace bct_core

#endif  // BCT_CORE_DATA_TYPES_BODY_COMPOSITION_ENTRY_HPP
