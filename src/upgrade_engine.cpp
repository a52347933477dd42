#include "lingo/upgrade_engine.hpp"

#include "debug_log.hpp"

#include <algorithm>
#include <cassert>
#include <iomanip>
#include <sstream>
#include <utility>

namespace lingo {
namespace {

constexpr std::size_t kMaxRecommendations = 5;
constexpr std::size_t kMaxRequirementHints = 2;

std::string display_name(SkillModule module) {
  switch (module) {
    case SkillModule::Reading: return "Reading";
    case SkillModule::Listening: return "Listening";
    case SkillModule::Speaking: return "Speaking";
    case SkillModule::Writing: return "Writing";
  }
  return "Reading";
}

std::string one_decimal(double value) {
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(1) << value;
  return oss.str();
}

double progress_of(const ModuleAssessment& assessment) {
  return assessment.next_level_requirement.current_progress;
}

// Strict "a ranks below b" for the weakest-module pick.
bool weaker(const ModuleAssessment& a, const ModuleAssessment& b) {
  if (progress_of(a) != progress_of(b)) {
    return progress_of(a) < progress_of(b);
  }
  return a.accuracy < b.accuracy;
}

bool stronger(const ModuleAssessment& a, const ModuleAssessment& b) {
  if (progress_of(a) != progress_of(b)) {
    return progress_of(a) > progress_of(b);
  }
  return a.accuracy > b.accuracy;
}

std::string describe(SkillModule module, const LevelRequirement& requirement, const ModuleAssessment& assessment) {
  const double accuracy_gap = requirement.accuracy - assessment.accuracy;
  const int attempts_gap = requirement.minimum_attempts - assessment.total_attempts;
  const std::string prefix = display_name(module) + ": ";
  if (accuracy_gap > 0.0 && attempts_gap > 0) {
    return prefix + "raise accuracy by " + one_decimal(accuracy_gap) + "% and complete " +
           std::to_string(attempts_gap) + " more exercises";
  }
  if (accuracy_gap > 0.0) {
    return prefix + "raise accuracy by " + one_decimal(accuracy_gap) + "%";
  }
  if (attempts_gap > 0) {
    return prefix + "complete " + std::to_string(attempts_gap) + " more exercises";
  }
  return prefix + "requirement met";
}

// Reorders the entries by module_index(); callers may pass them in any order.
ModuleAssessments in_skill_order(const ModuleAssessments& modules) {
  ModuleAssessments ordered = modules;
  std::stable_sort(ordered.begin(), ordered.end(), [](const ModuleAssessment& a, const ModuleAssessment& b) {
    return module_index(a.module) < module_index(b.module);
  });
  for (std::size_t i = 0; i < ordered.size(); ++i) {
    assert(ordered[i].module == kSkillModules[i] && "each skill needs exactly one assessment");
  }
  return ordered;
}

} // namespace

ProficiencyAssessment decide(const ModuleAssessments& input) {
  const ModuleAssessments modules = in_skill_order(input);
  ProficiencyAssessment result;
  result.modules = modules;

  CefrLevel overall = modules[0].current_level;
  bool all_complete = true;
  double progress_sum = 0.0;
  std::size_t weakest = 0;
  std::size_t strongest = 0;
  for (std::size_t i = 0; i < modules.size(); ++i) {
    const auto& m = modules[i];
    if (level_index(m.current_level) < level_index(overall)) {
      overall = m.current_level;
    }
    const double progress = detail::clip_percent(progress_of(m));
    progress_sum += progress;
    all_complete = all_complete && progress >= 100.0;
    if (weaker(m, modules[weakest])) {
      weakest = i;
    }
    if (stronger(m, modules[strongest])) {
      strongest = i;
    }
  }

  result.overall_level = overall;
  result.weakest_module = modules[weakest].module;
  result.strongest_module = modules[strongest].module;
  result.level_upgrade.next_level = next_level(overall);
  // Assessments built from records never reach this: a module whose next
  // level is met has already been placed at that level.
  result.level_upgrade.can_upgrade = all_complete && result.level_upgrade.next_level.has_value();
  result.level_upgrade.overall_progress = progress_sum / static_cast<double>(modules.size());

  if (debug_enabled()) {
    std::ostringstream oss;
    oss << "overall=" << to_string(overall)
        << " progress=" << result.level_upgrade.overall_progress
        << " can_upgrade=" << (result.level_upgrade.can_upgrade ? "true" : "false")
        << " weakest=" << to_string(result.weakest_module)
        << " strongest=" << to_string(result.strongest_module);
    debug_log("upgrade", oss.str());
  }
  return result;
}

ProficiencyAssessment decide(const ModuleAssessments& modules, const LevelRequirementTable& table) {
  auto result = decide(modules);
  if (result.level_upgrade.next_level) {
    result.level_upgrade.requirements =
        upgrade_requirements(result.modules, *result.level_upgrade.next_level, table);
  }
  return result;
}

std::vector<RequirementStatus> upgrade_requirements(const ModuleAssessments& modules,
                                                    CefrLevel target,
                                                    const LevelRequirementTable& table) {
  const ModuleAssessments ordered = in_skill_order(modules);
  std::vector<RequirementStatus> out;
  out.reserve(ordered.size());
  for (SkillModule module : kSkillModules) {
    const auto& assessment = ordered[module_index(module)];
    const auto& requirement = table.at(target, module);
    RequirementStatus status;
    status.module = module;
    status.current_accuracy = assessment.accuracy;
    status.required_accuracy = requirement.accuracy;
    status.current_attempts = assessment.total_attempts;
    status.minimum_attempts = requirement.minimum_attempts;
    status.met = assessment.accuracy >= requirement.accuracy &&
                 assessment.total_attempts >= requirement.minimum_attempts;
    status.description = describe(module, requirement, assessment);
    out.push_back(std::move(status));
  }
  return out;
}

std::vector<std::string> recommendations(const ProficiencyAssessment& assessment) {
  std::vector<std::string> out;
  const auto& weakest = assessment.module(assessment.weakest_module);
  out.push_back("Focus on " + display_name(assessment.weakest_module) +
                ", current accuracy is " + one_decimal(weakest.accuracy) + "%");

  const auto& upgrade = assessment.level_upgrade;
  if (!upgrade.can_upgrade && upgrade.next_level) {
    std::size_t added = 0;
    for (const auto& requirement : upgrade.requirements) {
      if (added == kMaxRequirementHints) {
        break;
      }
      if (!requirement.met) {
        out.push_back(requirement.description);
        ++added;
      }
    }
  }

  for (const auto& module : assessment.modules) {
    if (module.recent_trend == Trend::Down) {
      out.push_back(display_name(module.module) + " results are declining, practice it more often");
    }
  }

  if (out.size() > kMaxRecommendations) {
    out.resize(kMaxRecommendations);
  }
  return out;
}

} // namespace lingo
