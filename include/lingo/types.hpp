#pragma once

#include <algorithm>
#include <array>
#include <chrono>
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace lingo {

using Timestamp = std::chrono::system_clock::time_point;

namespace detail {

inline double clip_percent(double value) {
  return std::clamp(value, 0.0, 100.0);
}

inline double clip01(double value) {
  return std::clamp(value, 0.0, 1.0);
}

} // namespace detail

//-----------------------------------------------------------------
// ENUMERATIONS
//-----------------------------------------------------------------
enum class CefrLevel {
  A1,
  A2,
  B1,
  B2,
  C1,
  C2
};

inline constexpr std::array<CefrLevel, 6> kCefrLevels = {
    CefrLevel::A1, CefrLevel::A2, CefrLevel::B1,
    CefrLevel::B2, CefrLevel::C1, CefrLevel::C2};

inline constexpr std::size_t level_index(CefrLevel level) {
  return static_cast<std::size_t>(level);
}

inline std::optional<CefrLevel> next_level(CefrLevel level) {
  switch (level) {
    case CefrLevel::A1: return CefrLevel::A2;
    case CefrLevel::A2: return CefrLevel::B1;
    case CefrLevel::B1: return CefrLevel::B2;
    case CefrLevel::B2: return CefrLevel::C1;
    case CefrLevel::C1: return CefrLevel::C2;
    case CefrLevel::C2: return std::nullopt;
  }
  return std::nullopt;
}

inline std::string to_string(CefrLevel level) {
  switch (level) {
    case CefrLevel::A1: return "A1";
    case CefrLevel::A2: return "A2";
    case CefrLevel::B1: return "B1";
    case CefrLevel::B2: return "B2";
    case CefrLevel::C1: return "C1";
    case CefrLevel::C2: return "C2";
  }
  return "A1";
}

inline CefrLevel cefr_level_from_string(const std::string& value) {
  for (CefrLevel level : kCefrLevels) {
    if (to_string(level) == value) {
      return level;
    }
  }
  throw std::invalid_argument("Unknown CEFR level: " + value);
}

// The four assessed skills. Order is the tie-break order used by the
// upgrade engine.
enum class SkillModule {
  Reading,
  Listening,
  Speaking,
  Writing
};

inline constexpr std::array<SkillModule, 4> kSkillModules = {
    SkillModule::Reading, SkillModule::Listening,
    SkillModule::Speaking, SkillModule::Writing};

inline constexpr std::size_t module_index(SkillModule module) {
  return static_cast<std::size_t>(module);
}

inline std::string to_string(SkillModule module) {
  switch (module) {
    case SkillModule::Reading: return "reading";
    case SkillModule::Listening: return "listening";
    case SkillModule::Speaking: return "speaking";
    case SkillModule::Writing: return "writing";
  }
  return "reading";
}

inline SkillModule skill_module_from_string(const std::string& value) {
  for (SkillModule module : kSkillModules) {
    if (to_string(module) == value) {
      return module;
    }
  }
  throw std::invalid_argument("Unknown skill module: " + value);
}

// Activity records carry one more category than the assessed skills.
enum class ActivityModule {
  Reading,
  Listening,
  Speaking,
  Writing,
  Translation
};

inline constexpr std::array<ActivityModule, 5> kActivityModules = {
    ActivityModule::Reading, ActivityModule::Listening, ActivityModule::Speaking,
    ActivityModule::Writing, ActivityModule::Translation};

inline constexpr std::size_t activity_index(ActivityModule module) {
  return static_cast<std::size_t>(module);
}

inline ActivityModule to_activity(SkillModule module) {
  switch (module) {
    case SkillModule::Reading: return ActivityModule::Reading;
    case SkillModule::Listening: return ActivityModule::Listening;
    case SkillModule::Speaking: return ActivityModule::Speaking;
    case SkillModule::Writing: return ActivityModule::Writing;
  }
  return ActivityModule::Reading;
}

inline std::string to_string(ActivityModule module) {
  switch (module) {
    case ActivityModule::Reading: return "reading";
    case ActivityModule::Listening: return "listening";
    case ActivityModule::Speaking: return "speaking";
    case ActivityModule::Writing: return "writing";
    case ActivityModule::Translation: return "translation";
  }
  return "reading";
}

inline ActivityModule activity_module_from_string(const std::string& value) {
  for (ActivityModule module : kActivityModules) {
    if (to_string(module) == value) {
      return module;
    }
  }
  throw std::invalid_argument("Unknown activity module: " + value);
}

enum class ReviewOutcome {
  Unknown,
  Familiar,
  Known
};

inline std::string to_string(ReviewOutcome outcome) {
  switch (outcome) {
    case ReviewOutcome::Unknown: return "unknown";
    case ReviewOutcome::Familiar: return "familiar";
    case ReviewOutcome::Known: return "known";
  }
  return "unknown";
}

inline ReviewOutcome review_outcome_from_string(const std::string& value) {
  if (value == "unknown") {
    return ReviewOutcome::Unknown;
  }
  if (value == "familiar") {
    return ReviewOutcome::Familiar;
  }
  if (value == "known") {
    return ReviewOutcome::Known;
  }
  throw std::invalid_argument("Unknown review outcome: " + value);
}

enum class Trend {
  Up,
  Down,
  Stable
};

inline std::string to_string(Trend trend) {
  switch (trend) {
    case Trend::Up: return "up";
    case Trend::Down: return "down";
    case Trend::Stable: return "stable";
  }
  return "stable";
}

inline Trend trend_from_string(const std::string& value) {
  if (value == "up") {
    return Trend::Up;
  }
  if (value == "down") {
    return Trend::Down;
  }
  if (value == "stable") {
    return Trend::Stable;
  }
  throw std::invalid_argument("Unknown trend: " + value);
}

//-----------------------------------------------------------------
// RAW INPUTS
//-----------------------------------------------------------------
struct ActivityRecord {
  ActivityModule module = ActivityModule::Reading;
  Timestamp timestamp{};
  double time_spent_seconds = 0.0;
  std::optional<double> accuracy;   // 0-100, absent for ungraded activities
  std::optional<std::string> word_ref;
};

struct VocabularyEntry {
  std::string text;
  int mastery_level = 0;            // 0-5
  int review_count = 0;
  int correct_count = 0;
  Timestamp last_reviewed_at{};
  Timestamp next_review_due_at{};
};

//-----------------------------------------------------------------
// DERIVED VALUES
//-----------------------------------------------------------------
struct NextLevelRequirement {
  std::optional<double> target_accuracy;  // unset when already at C2
  std::optional<int> minimum_attempts;
  double current_progress = 0.0;          // 0-100
};

struct ModuleAssessment {
  SkillModule module = SkillModule::Reading;
  CefrLevel current_level = CefrLevel::A1;
  double accuracy = 0.0;
  int total_attempts = 0;
  int correct_attempts = 0;
  Trend recent_trend = Trend::Stable;
  NextLevelRequirement next_level_requirement;
};

struct RequirementStatus {
  SkillModule module = SkillModule::Reading;
  double current_accuracy = 0.0;
  double required_accuracy = 0.0;
  int current_attempts = 0;
  int minimum_attempts = 0;
  bool met = false;
  std::string description;
};

struct LevelUpgrade {
  bool can_upgrade = false;
  std::optional<CefrLevel> next_level;
  double overall_progress = 0.0;          // 0-100
  std::vector<RequirementStatus> requirements;
};

struct ProficiencyAssessment {
  CefrLevel overall_level = CefrLevel::A1;
  std::array<ModuleAssessment, 4> modules{};
  LevelUpgrade level_upgrade;
  SkillModule weakest_module = SkillModule::Reading;
  SkillModule strongest_module = SkillModule::Reading;

  const ModuleAssessment& module(SkillModule skill) const {
    return modules[module_index(skill)];
  }
};

struct SubScore {
  std::string name;
  double value = 0.0;                     // 0-100
};

struct Mistake {
  std::string expected;
  std::string actual;
  std::string suggestion;
};

struct CriterionScore {
  std::string criterion;
  double score = 0.0;
  double max_score = 0.0;
  std::string feedback;
};

struct ScoreResult {
  double overall_score = 0.0;             // 0-100
  std::vector<SubScore> sub_scores;
  std::string feedback;
  std::vector<Mistake> mistakes;          // at most 3
  std::vector<std::string> suggestions;   // at most 3

  // Writing only: raw rubric totals and per-criterion breakdown.
  double total_score = 0.0;
  double max_score = 0.0;
  std::vector<CriterionScore> criteria;

  std::optional<double> sub_score(const std::string& name) const {
    for (const auto& entry : sub_scores) {
      if (entry.name == name) {
        return entry.value;
      }
    }
    return std::nullopt;
  }
};

} // namespace lingo
