// Ticket: 0010_sqlite_persistence

#ifndef BCT_STORE_SQLITE_REPOSITORY_HPP
#define BCT_STORE_SQLITE_REPOSITORY_HPP

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <cpp_sqlite/src/cpp_sqlite/DBDatabase.hpp>
#include <spdlog/spdlog.h>

#include "bct-core/src/Service/Collaborators.hpp"
#include "bct-core/src/Validation/GoalValidator.hpp"
#include "bct-core/src/Validation/MeasurementValidator.hpp"

namespace bct_store
{

/**
 * @brief SQLite-backed goal, measurement and progress storage
 *
 * Implements every collaborator the GoalProgressService needs, on top of the
 * cpp_sqlite ORM. Goals and entries are validated before insertion.
 * Progress snapshots are append-only; the newest snapshot per user is the
 * previous percentage.
 *
 * Thread safety: all public methods serialize on an internal mutex.
 *
 * @ticket 0010_sqlite_persistence
 */
class SqliteRepository : public bct_core::GoalStore,
                         public bct_core::MeasurementStore,
                         public bct_core::ProgressCache
{
public:
  struct Config
  {
    std::string databasePath{"body_composition.db"};
    bool allowWrite{true};
    bct_core::GoalValidator::Config goalValidation{};
    bct_core::MeasurementValidator::Config measurementValidation{};
  };

  /**
   * @throws std::invalid_argument if logger is null
   * @throws std::runtime_error if the database cannot be opened
   */
  SqliteRepository(const Config& config, std::shared_ptr<spdlog::logger> logger);

  ~SqliteRepository() override = default;

  SqliteRepository(const SqliteRepository&) = delete;
  SqliteRepository& operator=(const SqliteRepository&) = delete;
  SqliteRepository(SqliteRepository&&) = delete;
  SqliteRepository& operator=(SqliteRepository&&) = delete;

  // GoalStore
  std::optional<bct_core::Goal> getActiveGoal(const std::string& userId) override;

  // MeasurementStore
  std::vector<bct_core::BodyCompositionEntry> getEntries(
    const std::string& userId,
    std::optional<bct_core::TimePoint> since) override;

  // ProgressCache
  std::optional<double> loadPreviousPercentage(const std::string& userId) override;
  void storePercentage(const std::string& userId,
                       double overallPercentage,
                       bct_core::TimePoint recordedAt) override;

  /**
   * @brief Validate and insert a goal
   * @return Assigned goal id
   * @throws bct_core::GoalValidationError for an invalid goal
   * @throws std::runtime_error if the repository is read-only
   */
  uint32_t addGoal(const bct_core::Goal& goal);

  /**
   * @brief Validate and insert a measurement for a user
   * @return Assigned entry id
   * @throws bct_core::MeasurementValidationError for implausible values
   * @throws std::runtime_error if the repository is read-only
   */
  uint32_t addEntry(const std::string& userId,
                    const bct_core::BodyCompositionEntry& entry);

  [[nodiscard]] const Config& getConfig() const
  {
    return config_;
  }

private:
  void requireWritable(const char* operation) const;

  Config config_;
  std::shared_ptr<spdlog::logger> logger_;
  bct_core::GoalValidator goalValidator_;
  bct_core::MeasurementValidator measurementValidator_;
  std::unique_ptr<cpp_sqlite::Database> database_;
  std::mutex mutex_;
};

}  // namespace bct_store

#endif  // BCT_STORE_SQLITE_REPOSITORY_HPP
