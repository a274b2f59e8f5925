// Ticket: 0011_progress_report_tool

#include <chrono>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "bct-core/src/Errors.hpp"
#include "bct-core/src/Service/GoalProgressService.hpp"
#include "bct-store/src/SqliteRepository.hpp"

using namespace bct_core;

namespace
{

std::string formatDate(TimePoint timePoint)
{
  std::chrono::year_month_day const ymd{
    std::chrono::floor<std::chrono::days>(timePoint)};

  std::ostringstream out;
  out << static_cast<int>(ymd.year()) << "-" << std::setfill('0')
      << std::setw(2) << static_cast<unsigned>(ymd.month()) << "-"
      << std::setw(2) << static_cast<unsigned>(ymd.day());
  return out.str();
}

void printMetric(const MetricReport& report)
{
  std::cout << "  " << std::left << std::setw(12) << toString(report.metric)
            << std::right << std::fixed << std::setprecision(1)
            << std::setw(7) << report.progress.percentage << "%"
            << "  current " << std::setprecision(2) << report.currentValue
            << "  remaining " << report.progress.remaining;

  if (report.trend)
  {
    std::cout << "  trend " << std::setprecision(3) << report.trend->weeklyRate
              << "/week (" << report.trend->dataPoints << " days)";
  }

  const ProjectionResult& projection = report.projection;
  switch (projection.status)
  {
    case ProjectionStatus::Projected:
      std::cout << "  done in " << *projection.daysToCompletion << " days";
      break;
    case ProjectionStatus::AlreadyAchieved:
      std::cout << "  target reached";
      break;
    case ProjectionStatus::InsufficientData:
      std::cout << "  not enough data to project";
      break;
    case ProjectionStatus::NotConverging:
      std::cout << "  not converging";
      break;
  }

  if (projection.isOnTrack)
  {
    std::cout << (*projection.isOnTrack ? "  [on track]" : "  [off track]");
  }
  std::cout << "\n";
}

}  // namespace

int main(int argc, char** argv)
{
  if (argc != 3)
  {
    std::cerr << "Usage: " << argv[0] << " <database.db> <user-id>\n";
    return 1;
  }

  std::string const databasePath = argv[1];
  std::string const userId = argv[2];

  auto logger = spdlog::stdout_color_mt("progress_report");
  logger->set_level(spdlog::level::warn);

  try
  {
    bct_store::SqliteRepository repository{
      bct_store::SqliteRepository::Config{databasePath, true}, logger};
    GoalProgressService service{repository, repository, repository, logger};

    auto const data = service.refresh(userId);
    if (!data)
    {
      std::cerr << "Refresh cancelled\n";
      return 1;
    }

    std::cout << "Goal " << data->goal.id << " (" << toString(data->goal.type)
              << ") for " << userId << "\n";
    std::cout << "Overall progress: " << std::fixed << std::setprecision(1)
              << data->overallProgress << "% over " << data->dataPointsCount
              << " entries\n";

    for (Metric const metric : kAllMetrics)
    {
      if (const auto& report = data->metric(metric))
      {
        printMetric(*report);
      }
    }

    if (data->isOnTrack)
    {
      std::cout << "On track: " << (*data->isOnTrack ? "yes" : "no") << "\n";
    }
    if (data->urgency)
    {
      std::cout << "Urgency: " << toString(*data->urgency) << "\n";
    }
    if (data->daysUntilPeriodEnd)
    {
      std::cout << "Period end: " << formatCountdown(*data->daysUntilPeriodEnd)
                << "\n";
    }
    if (auto const earliest = data->earliestCompletionDate())
    {
      auto const latest = data->latestCompletionDate();
      std::cout << "Projected completion: " << formatDate(*earliest);
      if (latest && *latest != *earliest)
      {
        std::cout << " to " << formatDate(*latest);
      }
      std::cout << "\n";
    }
    for (Milestone const milestone : data->newlyAchievedMilestones)
    {
      std::cout << "Milestone reached: " << toString(milestone) << "\n";
    }
  }
  catch (const NoActiveGoalError& e)
  {
    std::cerr << e.what() << "\n";
    return 2;
  }
  catch (const std::exception& e)
  {
    std::cerr << "progress_report failed: " << e.what() << "\n";
    return 1;
  }

  return 0;
}
