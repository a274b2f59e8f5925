// Ticket: 0011_progress_report_tool

#include <chrono>
#include <iostream>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "bct-store/src/SqliteRepository.hpp"

using namespace bct_core;
using namespace std::chrono;

// Writes a 70 -> 65 kg loss goal and 15 daily weigh-ins ending today
int main(int argc, char** argv)
{
  if (argc != 3)
  {
    std::cerr << "Usage: " << argv[0] << " <database.db> <user-id>\n";
    return 1;
  }

  std::string const databasePath = argv[1];
  std::string const userId = argv[2];

  auto logger = spdlog::stdout_color_mt("seed_progress_db");

  try
  {
    bct_store::SqliteRepository repository{
      bct_store::SqliteRepository::Config{databasePath, true}, logger};

    sys_days const today = floor<days>(system_clock::now());
    sys_days const firstDay = today - days{14};

    Goal goal{};
    goal.userId = userId;
    goal.type = GoalType::Lose;
    goal.metric(Metric::Weight) = MetricGoal{70.0, 65.0, -0.5};
    goal.metric(Metric::BodyFat) = MetricGoal{25.0, 22.0, std::nullopt};
    goal.periodStart = firstDay;
    goal.periodEnd = firstDay + weeks{12};
    goal.dailyCalorieTarget = 1900;

    uint32_t const goalId = repository.addGoal(goal);
    std::cout << "Created goal " << goalId << " for " << userId << "\n";

    for (int day = 0; day <= 14; ++day)
    {
      BodyCompositionEntry entry{};
      entry.timestamp = firstDay + days{day} + hours{7};
      entry.weight = 70.0 - (3.0 * day / 14.0);
      entry.bodyFatPercent = 25.0 - (1.2 * day / 14.0);
      repository.addEntry(userId, entry);
    }
    std::cout << "Added 15 entries\n";
  }
  catch (const std::exception& e)
  {
    std::cerr << "seed_progress_db failed: " << e.what() << "\n";
    return 1;
  }

  return 0;
}
