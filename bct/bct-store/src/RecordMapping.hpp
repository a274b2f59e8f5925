// Ticket: 0010_sqlite_persistence

#ifndef BCT_STORE_RECORD_MAPPING_HPP
#define BCT_STORE_RECORD_MAPPING_HPP

#include <string>

#include "bct-core/src/DataTypes/BodyCompositionEntry.hpp"
#include "bct-core/src/DataTypes/Goal.hpp"
#include "bct-transfer/src/BodyCompositionRecord.hpp"
#include "bct-transfer/src/GoalRecord.hpp"

namespace bct_store
{

double toEpochSeconds(bct_core::TimePoint timePoint);
bct_core::TimePoint fromEpochSeconds(double seconds);

bct_transfer::GoalRecord toRecord(const bct_core::Goal& goal);

/**
 * @throws std::runtime_error for an unknown goal_type value
 */
bct_core::Goal fromRecord(const bct_transfer::GoalRecord& record);

bct_transfer::BodyCompositionRecord toRecord(
  const std::string& userId,
  const bct_core::BodyCompositionEntry& entry);

bct_core::BodyCompositionEntry fromRecord(
  const bct_transfer::BodyCompositionRecord& record);

}  // namespace bct_store

#endif  // BCT_STORE_RECORD_MAPPING_HPP
