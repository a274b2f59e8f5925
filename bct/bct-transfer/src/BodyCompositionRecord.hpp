// Ticket: 0010_sqlite_persistence

#ifndef BCT_TRANSFER_BODY_COMPOSITION_RECORD_HPP
#define BCT_TRANSFER_BODY_COMPOSITION_RECORD_HPP

#include <cstdint>
#include <string>

#include <boost/describe.hpp>
#include <cpp_sqlite/src/cpp_sqlite/DBBaseTransferObject.hpp>

namespace bct_transfer
{

/**
 * @brief Database record for one body composition measurement
 *
 * @see bct_core::BodyCompositionEntry
 * @ticket 0010_sqlite_persistence
 */
struct BodyCompositionRecord : public cpp_sqlite::BaseTransferObject
{
  std::string user_id;
  double timestamp_s{0.0};  // Seconds since the Unix epoch (UTC)
  double weight{0.0};       // [kg]
  uint32_t has_body_fat{0};
  double body_fat_percent{0.0};  // [%]
  uint32_t has_muscle{0};
  double muscle_mass{0.0};  // [kg]
};

BOOST_DESCRIBE_STRUCT(BodyCompositionRecord,
                      (cpp_sqlite::BaseTransferObject),
                      (user_id,
                       timestamp_s,
                       weight,
                       has_body_fat,
                       body_fat_percent,
                       has_muscle,
                       muscle_mass));

}  // namespace bct_transfer

#endif  // BCT_TRANSFER_BODY_COMPOSITION_RECORD_HPP
