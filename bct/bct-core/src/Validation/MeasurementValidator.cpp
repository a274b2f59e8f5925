// Ticket: 0007_goal_validation

#include "bct-core/src/Validation/MeasurementValidator.hpp"

#include <cmath>

namespace bct_core
{

namespace
{

void requireRange(const char* name, double value, double lo, double hi)
{
  if (!std::isfinite(value) || value < lo || value > hi)
  {
    throw MeasurementValidationError{
      std::string{name} + " " + std::to_string(value) + " outside [" +
      std::to_string(lo) + ", " + std::to_string(hi) + "]"};
  }
}

}  // namespace

MeasurementValidator::MeasurementValidator(const Config& config)
  : config_{config}
{
}

void MeasurementValidator::validate(const BodyCompositionEntry& entry) const
{
  requireRange("Weight", entry.weight, config_.minWeight, config_.maxWeight);

  if (entry.bodyFatPercent)
  {
    requireRange("Body fat",
                 *entry.bodyFatPercent,
                 config_.minBodyFat,
                 config_.maxBodyFat);
  }

  if (entry.muscleMass)
  {
    requireRange("Muscle mass",
                 *entry.muscleMass,
                 config_.minMuscleMass,
                 config_.maxMuscleMass);

    if (*entry.muscleMass >= entry.weight)
    {
      throw MeasurementValidationError{"Muscle mass must be below weight"};
    }
  }
}

}  // namespace bct_core
