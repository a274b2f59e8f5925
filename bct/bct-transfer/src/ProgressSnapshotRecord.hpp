// Ticket: 0010_sqlite_persistence

#ifndef BCT_TRANSFER_PROGRESS_SNAPSHOT_RECORD_HPP
#define BCT_TRANSFER_PROGRESS_SNAPSHOT_RECORD_HPP

#include <string>

#include <boost/describe.hpp>
#include <cpp_sqlite/src/cpp_sqlite/DBBaseTransferObject.hpp>

namespace bct_transfer
{

/**
 * @brief Overall progress recorded after a successful aggregation
 *
 * Snapshots are append-only. The newest one per user is the previous
 * percentage for milestone diffing.
 *
 * @ticket 0010_sqlite_persistence
 */
struct ProgressSnapshotRecord : public cpp_sqlite::BaseTransferObject
{
  std::string user_id;
  double overall_percentage{0.0};  // [%]
  double recorded_at_s{0.0};       // Seconds since the Unix epoch (UTC)
};

BOOST_DESCRIBE_STRUCT(ProgressSnapshotRecord,
                      (cpp_sqlite::BaseTransferObject),
                      (user_id, overall_percentage, recorded_at_s));

}  // namespace bct_transfer

#endif  // BCT_TRANSFER_PROGRESS_SNAPSHOT_RECORD_HPP
