// Ticket: 0007_goal_validation

#ifndef BCT_CORE_VALIDATION_MEASUREMENT_VALIDATOR_HPP
#define BCT_CORE_VALIDATION_MEASUREMENT_VALIDATOR_HPP

#include <stdexcept>
#include <string>

#include "bct-core/src/DataTypes/BodyCompositionEntry.hpp"

namespace bct_core
{

class MeasurementValidationError : public std::runtime_error
{
public:
  explicit MeasurementValidationError(const std::string& message)
    : std::runtime_error{message}
  {
  }
};

/**
 * @brief Plausibility bounds for a single body composition entry
 */
class MeasurementValidator
{
public:
  struct Config
  {
    double minWeight{20.0};      // [kg]
    double maxWeight{200.0};     // [kg]
    double minBodyFat{1.0};      // [%]
    double maxBodyFat{60.0};     // [%]
    double minMuscleMass{10.0};  // [kg]
    double maxMuscleMass{100.0}; // [kg]
  };

  MeasurementValidator() = default;
  explicit MeasurementValidator(const Config& config);

  /**
   * @throws MeasurementValidationError for out-of-range values or muscle
   *         mass not below weight
   */
  void validate(const BodyCompositionEntry& entry) const;

private:
  Config config_{};
};

}  // namespace bct_core

#endif  // BCT_CORE_VALIDATION_MEASUREMENT_VALIDATOR_HPP
