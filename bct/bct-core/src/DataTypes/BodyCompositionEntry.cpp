// Ticket: 0001_goal_progress_data_model

#include "bct-core/src/DataTypes/BodyCompositionEntry.hpp"

namespace bct_core
{

std::optional<double> BodyCompositionEntry::value(Metric metric) const
{
  switch (metric)
  {
    case Metric::Weight:
      return weight;
    case Metric::BodyFat:
      return bodyFatPercent;
    case Metric::MuscleMass:
      return muscleMass;
  }
  return std::nullopt;
}

std::vector<MetricSample> samplesFor(std::span<const BodyCompositionEntry> entries,
                                     Metric metric)
{
  std::vector<MetricSample> samples;
  samples.reserve(entries.size());
  for (const auto& entry : entries)
  {
    if (auto const v = entry.value(metric))
    {
      samples.push_back(MetricSample{entry.timestamp, *v});
    }
  }
  return samples;
}

std::optional<double> latestValue(std::span<const BodyCompositionEntry> entries,
                                  Metric metric)
{
  for (auto it = entries.rbegin(); it != entries.rend(); ++it)
  {
    if (auto const v = it->value(metric))
    {
      return v;
    }
  }
  return std::nullopt;
}

}  // namespace bct_core
