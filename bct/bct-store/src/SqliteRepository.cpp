// Ticket: 0010_sqlite_persistence

#include "bct-store/src/SqliteRepository.hpp"

#include <algorithm>
#include <stdexcept>

#include <cpp_sqlite/src/cpp_sqlite/DBDataAccessObject.hpp>

#include "bct-store/src/RecordMapping.hpp"
#include "bct-transfer/src/Records.hpp"

namespace bct_store
{

SqliteRepository::SqliteRepository(const Config& config,
                                   std::shared_ptr<spdlog::logger> logger)
  : config_{config},
    logger_{std::move(logger)},
    goalValidator_{config.goalValidation},
    measurementValidator_{config.measurementValidation}
{
  if (!logger_)
  {
    throw std::invalid_argument{"SqliteRepository requires a logger"};
  }

  logger_->debug("Opening progress database: {}", config_.databasePath);
  database_ =
    std::make_unique<cpp_sqlite::Database>(config_.databasePath, config_.allowWrite);

  // Create every table up front so reads on a fresh file see empty tables
  database_->getDAO<bct_transfer::GoalRecord>();
  database_->getDAO<bct_transfer::BodyCompositionRecord>();
  database_->getDAO<bct_transfer::ProgressSnapshotRecord>();

  logger_->info("Progress database ready: {}", config_.databasePath);
}

std::optional<bct_core::Goal> SqliteRepository::getActiveGoal(
  const std::string& userId)
{
  std::lock_guard<std::mutex> lock{mutex_};

  auto& dao = database_->getDAO<bct_transfer::GoalRecord>();
  std::optional<bct_transfer::GoalRecord> newest;
  for (auto const& record : dao.selectAll())
  {
    if (record.user_id != userId || record.is_active == 0)
    {
      continue;
    }
    if (!newest || record.id > newest->id)
    {
      newest = record;
    }
  }

  if (!newest)
  {
    logger_->debug("No active goal stored for '{}'", userId);
    return std::nullopt;
  }
  return fromRecord(*newest);
}

std::vector<bct_core::BodyCompositionEntry> SqliteRepository::getEntries(
  const std::string& userId,
  std::optional<bct_core::TimePoint> since)
{
  std::lock_guard<std::mutex> lock{mutex_};

  auto& dao = database_->getDAO<bct_transfer::BodyCompositionRecord>();
  std::vector<bct_core::BodyCompositionEntry> entries;
  for (auto const& record : dao.selectAll())
  {
    if (record.user_id != userId)
    {
      continue;
    }
    auto entry = fromRecord(record);
    if (since && entry.timestamp < *since)
    {
      continue;
    }
    entries.push_back(std::move(entry));
  }

  std::stable_sort(entries.begin(), entries.end(), bct_core::earlierThan);
  logger_->debug("Loaded {} entries for '{}'", entries.size(), userId);
  return entries;
}

std::optional<double> SqliteRepository::loadPreviousPercentage(
  const std::string& userId)
{
  std::lock_guard<std::mutex> lock{mutex_};

  auto& dao = database_->getDAO<bct_transfer::ProgressSnapshotRecord>();
  std::optional<bct_transfer::ProgressSnapshotRecord> newest;
  for (auto const& record : dao.selectAll())
  {
    if (record.user_id != userId)
    {
      continue;
    }
    // Ties on recorded time are broken by insertion order
    if (!newest || record.recorded_at_s > newest->recorded_at_s ||
        (record.recorded_at_s == newest->recorded_at_s && record.id > newest->id))
    {
      newest = record;
    }
  }

  if (!newest)
  {
    return std::nullopt;
  }
  return newest->overall_percentage;
}

void SqliteRepository::storePercentage(const std::string& userId,
                                       double overallPercentage,
                                       bct_core::TimePoint recordedAt)
{
  std::lock_guard<std::mutex> lock{mutex_};
  requireWritable("storePercentage");

  bct_transfer::ProgressSnapshotRecord record{};
  record.user_id = userId;
  record.overall_percentage = overallPercentage;
  record.recorded_at_s = toEpochSeconds(recordedAt);

  database_->getDAO<bct_transfer::ProgressSnapshotRecord>().insert(record);
  logger_->debug("Stored {:.2f}% for '{}' (snapshot {})",
                 overallPercentage,
                 userId,
                 record.id);
}

uint32_t SqliteRepository::addGoal(const bct_core::Goal& goal)
{
  goalValidator_.validate(goal);

  std::lock_guard<std::mutex> lock{mutex_};
  requireWritable("addGoal");

  auto record = toRecord(goal);
  record.id = 0;
  database_->getDAO<bct_transfer::GoalRecord>().insert(record);

  logger_->info("Added {} goal {} for '{}'",
                bct_core::toString(goal.type),
                record.id,
                goal.userId);
  return record.id;
}

uint32_t SqliteRepository::addEntry(const std::string& userId,
                                    const bct_core::BodyCompositionEntry& entry)
{
  measurementValidator_.validate(entry);

  std::lock_guard<std::mutex> lock{mutex_};
  requireWritable("addEntry");

  auto record = toRecord(userId, entry);
  record.id = 0;
  database_->getDAO<bct_transfer::BodyCompositionRecord>().insert(record);
  return record.id;
}

void SqliteRepository::requireWritable(const char* operation) const
{
  if (!config_.allowWrite)
  {
    logger_->error("{} rejected: {} is read-only", operation, config_.databasePath);
    throw std::runtime_error{std::string{operation} +
                             ": repository opened read-only"};
  }
}

}  // namespace bct_store
