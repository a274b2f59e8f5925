#ifndef BCT_TRANSFER_RECORDS_HPP
#define BCT_TRANSFER_RECORDS_HPP

/**
 * @file Records.hpp
 * @brief Single include point for every bct-transfer record
 */

#include <cpp_sqlite/src/cpp_sqlite/DBDatabase.hpp>

#include "bct-transfer/src/BodyCompositionRecord.hpp"
#include "bct-transfer/src/GoalRecord.hpp"
#include "bct-transfer/src/ProgressSnapshotRecord.hpp"

namespace bct_transfer
{

using Database = cpp_sqlite::Database;

}  // namespace bct_transfer

#endif  // BCT_TRANSFER_RECORDS_HPP
