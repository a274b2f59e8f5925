// Ticket: 0010_sqlite_persistence

#ifndef BCT_TRANSFER_GOAL_RECORD_HPP
#define BCT_TRANSFER_GOAL_RECORD_HPP

#include <cstdint>
#include <string>

#include <boost/describe.hpp>
#include <cpp_sqlite/src/cpp_sqlite/DBBaseTransferObject.hpp>

namespace bct_transfer
{

/**
 * @brief Database record for a body composition goal
 *
 * Optional values are stored as a has_ flag (0/1) beside the value.
 * Period bounds are UTC midnights in seconds since the Unix epoch.
 *
 * @see bct_core::Goal
 * @ticket 0010_sqlite_persistence
 */
struct GoalRecord : public cpp_sqlite::BaseTransferObject
{
  std::string user_id;
  uint32_t goal_type{0};  // bct_core::GoalType
  uint32_t is_active{1};

  uint32_t has_weight{0};
  double start_weight{0.0};   // [kg]
  double target_weight{0.0};  // [kg]
  uint32_t has_weight_rate{0};
  double weekly_weight_rate{0.0};  // [kg/week]

  uint32_t has_body_fat{0};
  double start_body_fat{0.0};   // [%]
  double target_body_fat{0.0};  // [%]
  uint32_t has_body_fat_rate{0};
  double weekly_body_fat_rate{0.0};  // [%/week]

  uint32_t has_muscle{0};
  double start_muscle{0.0};   // [kg]
  double target_muscle{0.0};  // [kg]
  uint32_t has_muscle_rate{0};
  double weekly_muscle_rate{0.0};  // [kg/week]

  uint32_t has_period_start{0};
  double period_start_s{0.0};
  uint32_t has_period_end{0};
  double period_end_s{0.0};

  uint32_t has_calorie_target{0};
  double daily_calorie_target{0.0};  // [kcal]
};

BOOST_DESCRIBE_STRUCT(GoalRecord,
                      (cpp_sqlite::BaseTransferObject),
                      (user_id,
                       goal_type,
                       is_active,
                       has_weight,
                       start_weight,
                       target_weight,
                       has_weight_rate,
                       weekly_weight_rate,
                       has_body_fat,
                       start_body_fat,
                       target_body_fat,
                       has_body_fat_rate,
                       weekly_body_fat_rate,
                       has_muscle,
                       start_muscle,
                       target_muscle,
                       has_muscle_rate,
                       weekly_muscle_rate,
                       has_period_start,
                       period_start_s,
                       has_period_end,
                       period_end_s,
                       has_calorie_target,
                       daily_calorie_target));

}  // namespace bct_transfer

#endif  // BCT_TRANSFER_GOAL_RECORD_HPP
