// Ticket: 0007_goal_validation

#include <gtest/gtest.h>

#include <limits>

#include "bct-core/src/Validation/MeasurementValidator.hpp"
#include "bct-core/test/Helpers/EntryFixtures.hpp"

namespace bct_core
{
namespace test
{

TEST(MeasurementValidator, TypicalEntry_Passes)
{
  MeasurementValidator const validator{};

  EXPECT_NO_THROW(validator.validate(makeEntry(0, 72.5, 21.0, 33.0)));
  EXPECT_NO_THROW(validator.validate(makeEntry(0, 72.5)));
}

TEST(MeasurementValidator, WeightOutOfRange_Rejected)
{
  MeasurementValidator const validator{};

  EXPECT_THROW(validator.validate(makeEntry(0, 19.9)), MeasurementValidationError);
  EXPECT_THROW(validator.validate(makeEntry(0, 200.1)), MeasurementValidationError);
}

TEST(MeasurementValidator, BodyFatOutOfRange_Rejected)
{
  MeasurementValidator const validator{};

  EXPECT_THROW(validator.validate(makeEntry(0, 70.0, 0.5)),
               MeasurementValidationError);
  EXPECT_THROW(validator.validate(makeEntry(0, 70.0, 61.0)),
               MeasurementValidationError);
}

TEST(MeasurementValidator, MuscleNotBelowWeight_Rejected)
{
  MeasurementValidator const validator{};

  EXPECT_THROW(validator.validate(makeEntry(0, 40.0, 10.0, 40.0)),
               MeasurementValidationError);
}

TEST(MeasurementValidator, MuscleOutOfRange_Rejected)
{
  MeasurementValidator const validator{};

  EXPECT_THROW(validator.validate(makeEntry(0, 70.0, 20.0, 9.0)),
               MeasurementValidationError);
}

TEST(MeasurementValidator, NonFiniteValues_Rejected)
{
  MeasurementValidator const validator{};
  double const nan = std::numeric_limits<double>::quiet_NaN();
  double const inf = std::numeric_limits<double>::infinity();

  EXPECT_THROW(validator.validate(makeEntry(0, nan)), MeasurementValidationError);
  EXPECT_THROW(validator.validate(makeEntry(0, inf)), MeasurementValidationError);
  EXPECT_THROW(validator.validate(makeEntry(0, 70.0, nan)),
               MeasurementValidationError);
  EXPECT_THROW(validator.validate(makeEntry(0, 70.0, 20.0, nan)),
               MeasurementValidationError);
}

}  // namespace test
}  // namespace bct_core
