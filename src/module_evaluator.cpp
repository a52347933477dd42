#include "lingo/module_evaluator.hpp"

#include "debug_log.hpp"

#include <algorithm>
#include <numeric>
#include <sstream>

namespace lingo {
namespace {

constexpr double kTrendThreshold = 2.0;

bool level_met(const LevelRequirement& requirement, double accuracy, int attempts) {
  return accuracy >= requirement.accuracy && attempts >= requirement.minimum_attempts;
}

double ratio_or_complete(double value, double target) {
  if (target <= 0.0) {
    return 1.0;
  }
  return value / target;
}

} // namespace

CefrLevel determine_level(SkillModule module,
                          double accuracy,
                          int attempts,
                          const LevelRequirementTable& table) {
  CefrLevel current = CefrLevel::A1;
  for (CefrLevel level : kCefrLevels) {
    if (!level_met(table.at(level, module), accuracy, attempts)) {
      break;
    }
    current = level;
  }
  return current;
}

double requirement_progress(double accuracy, int attempts, const LevelRequirement& requirement) {
  const double accuracy_ratio = ratio_or_complete(accuracy, requirement.accuracy);
  const double attempts_ratio =
      ratio_or_complete(static_cast<double>(attempts), static_cast<double>(requirement.minimum_attempts));
  const double progress = 100.0 * std::min(accuracy_ratio, attempts_ratio);
  return detail::clip_percent(progress);
}

Trend recent_trend(const std::vector<double>& chronological_accuracies) {
  const std::size_t n = chronological_accuracies.size();
  if (n < kTrendWindow * 2) {
    return Trend::Stable;
  }
  const auto recent_begin = chronological_accuracies.end() - static_cast<std::ptrdiff_t>(kTrendWindow);
  const auto previous_begin = recent_begin - static_cast<std::ptrdiff_t>(kTrendWindow);
  const double recent =
      std::accumulate(recent_begin, chronological_accuracies.end(), 0.0) / static_cast<double>(kTrendWindow);
  const double previous =
      std::accumulate(previous_begin, recent_begin, 0.0) / static_cast<double>(kTrendWindow);
  const double delta = recent - previous;
  if (delta > kTrendThreshold) {
    return Trend::Up;
  }
  if (delta < -kTrendThreshold) {
    return Trend::Down;
  }
  return Trend::Stable;
}

ModuleAssessment evaluate(SkillModule module,
                          const AggregateResult& stats,
                          const LevelRequirementTable& table) {
  ModuleAssessment assessment;
  assessment.module = module;
  assessment.accuracy = detail::clip_percent(stats.average_accuracy);
  assessment.total_attempts = std::max(0, stats.total_attempts);
  assessment.correct_attempts = std::clamp(stats.correct_attempts, 0, assessment.total_attempts);
  assessment.current_level =
      determine_level(module, assessment.accuracy, assessment.total_attempts, table);
  assessment.recent_trend = recent_trend(stats.recent_accuracies);

  auto& next = assessment.next_level_requirement;
  if (const auto upcoming = next_level(assessment.current_level)) {
    const auto& requirement = table.at(*upcoming, module);
    next.target_accuracy = requirement.accuracy;
    next.minimum_attempts = requirement.minimum_attempts;
    next.current_progress =
        requirement_progress(assessment.accuracy, assessment.total_attempts, requirement);
  } else {
    next.current_progress = 100.0;
  }

  if (debug_enabled()) {
    std::ostringstream oss;
    oss << to_string(module) << ": accuracy=" << assessment.accuracy
        << " attempts=" << assessment.total_attempts
        << " level=" << to_string(assessment.current_level)
        << " progress=" << next.current_progress
        << " trend=" << to_string(assessment.recent_trend);
    debug_log("evaluate", oss.str());
  }
  return assessment;
}

} // namespace lingo
