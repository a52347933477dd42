#include "json_bridge.hpp"

#include "utils/iso8601.hpp"

#include <array>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace lingo::bridge {
namespace {

template <typename Setter>
bool assign_if_present(const nlohmann::json& obj, const char* key, Setter&& setter) {
  if (!obj.contains(key)) {
    return false;
  }
  const auto& value = obj.at(key);
  if (value.is_null()) {
    return false;
  }
  setter(value);
  return true;
}

void require_object(const nlohmann::json& value, std::string_view what) {
  if (!value.is_object()) {
    throw std::invalid_argument("Expected object for " + std::string(what));
  }
}

const nlohmann::json& require_field(const nlohmann::json& obj, const char* key) {
  if (!obj.contains(key) || obj.at(key).is_null()) {
    throw std::invalid_argument("Missing required field '" + std::string(key) + "'");
  }
  return obj.at(key);
}

int json_to_int(const nlohmann::json& value, std::string_view key) {
  constexpr auto kMin = std::numeric_limits<int>::min();
  constexpr auto kMax = std::numeric_limits<int>::max();
  if (value.is_number_unsigned()) {
    const auto raw = value.get<std::uint64_t>();
    if (raw <= static_cast<std::uint64_t>(kMax)) {
      return static_cast<int>(raw);
    }
  } else if (value.is_number_integer()) {
    const auto raw = value.get<std::int64_t>();
    if (raw >= kMin && raw <= kMax) {
      return static_cast<int>(raw);
    }
  } else if (value.is_number_float()) {
    const double rounded = std::round(value.get<double>());
    if (std::isfinite(rounded) && rounded >= static_cast<double>(kMin) && rounded <= static_cast<double>(kMax)) {
      return static_cast<int>(rounded);
    }
  }
  throw std::invalid_argument("Expected integer for field '" + std::string(key) + "'");
}

double json_to_double(const nlohmann::json& value, std::string_view key) {
  if (!value.is_number()) {
    throw std::invalid_argument("Expected number for field '" + std::string(key) + "'");
  }
  return value.get<double>();
}

std::string json_to_string(const nlohmann::json& value, std::string_view key) {
  if (!value.is_string()) {
    throw std::invalid_argument("Expected string for field '" + std::string(key) + "'");
  }
  return value.get<std::string>();
}

std::vector<std::string> json_to_string_vector(const nlohmann::json& value, std::string_view key) {
  if (!value.is_array()) {
    throw std::invalid_argument("Expected array<string> for field '" + std::string(key) + "'");
  }
  std::vector<std::string> out;
  out.reserve(value.size());
  for (const auto& item : value) {
    out.push_back(json_to_string(item, key));
  }
  return out;
}

template <typename Enum, typename Parse>
Enum json_to_enum(const nlohmann::json& value, std::string_view key, Parse&& parse) {
  return parse(json_to_string(value, key));
}

nlohmann::json strings_to_json_array(const std::vector<std::string>& values) {
  nlohmann::json arr = nlohmann::json::array();
  for (const auto& v : values) {
    arr.push_back(v);
  }
  return arr;
}

template <typename T>
nlohmann::json optional_to_json(const std::optional<T>& value) {
  if (value.has_value()) {
    return nlohmann::json(value.value());
  }
  return nlohmann::json(nullptr);
}

ReviewIntervals::Ladder json_to_ladder(const nlohmann::json& value, const char* key) {
  if (!value.is_array() || value.size() != 6) {
    throw std::invalid_argument("Expected array of 6 hour values for field '" + std::string(key) + "'");
  }
  ReviewIntervals::Ladder ladder{};
  for (std::size_t i = 0; i < ladder.size(); ++i) {
    const double hours = json_to_double(value[i], key);
    ladder[i] = std::chrono::seconds(std::llround(hours * 3600.0));
  }
  return ladder;
}

nlohmann::json ladder_to_json(const ReviewIntervals::Ladder& ladder) {
  nlohmann::json arr = nlohmann::json::array();
  for (const auto& step : ladder) {
    arr.push_back(static_cast<double>(step.count()) / 3600.0);
  }
  return arr;
}

} // namespace

nlohmann::json to_json(Timestamp timestamp) {
  return format_iso8601(timestamp);
}

Timestamp timestamp_from_json(const nlohmann::json& json_timestamp, const char* key) {
  const std::string text = json_to_string(json_timestamp, key);
  try {
    return parse_iso8601(text);
  } catch (const std::invalid_argument& ex) {
    throw std::invalid_argument("Invalid timestamp for field '" + std::string(key) + "': " + ex.what());
  }
}

nlohmann::json to_json(const ActivityRecord& record) {
  nlohmann::json json_record = nlohmann::json::object();
  json_record["module"] = to_string(record.module);
  json_record["timestamp"] = to_json(record.timestamp);
  json_record["time_spent_seconds"] = record.time_spent_seconds;
  json_record["accuracy"] = optional_to_json(record.accuracy);
  json_record["word_ref"] = optional_to_json(record.word_ref);
  return json_record;
}

ActivityRecord activity_record_from_json(const nlohmann::json& json_record) {
  require_object(json_record, "activity record");
  ActivityRecord record;
  record.module = json_to_enum<ActivityModule>(require_field(json_record, "module"), "module",
                                               activity_module_from_string);
  record.timestamp = timestamp_from_json(require_field(json_record, "timestamp"), "timestamp");
  assign_if_present(json_record, "time_spent_seconds", [&](const nlohmann::json& value) {
    record.time_spent_seconds = json_to_double(value, "time_spent_seconds");
  });
  assign_if_present(json_record, "accuracy", [&](const nlohmann::json& value) {
    record.accuracy = json_to_double(value, "accuracy");
  });
  assign_if_present(json_record, "word_ref", [&](const nlohmann::json& value) {
    record.word_ref = json_to_string(value, "word_ref");
  });
  return record;
}

std::vector<ActivityRecord> activity_records_from_json(const nlohmann::json& json_records) {
  if (!json_records.is_array()) {
    throw std::invalid_argument("Expected array for field 'records'");
  }
  std::vector<ActivityRecord> records;
  records.reserve(json_records.size());
  for (const auto& item : json_records) {
    records.push_back(activity_record_from_json(item));
  }
  return records;
}

nlohmann::json to_json(const VocabularyEntry& entry) {
  nlohmann::json json_entry = nlohmann::json::object();
  json_entry["text"] = entry.text;
  json_entry["mastery_level"] = entry.mastery_level;
  json_entry["review_count"] = entry.review_count;
  json_entry["correct_count"] = entry.correct_count;
  json_entry["last_reviewed_at"] = to_json(entry.last_reviewed_at);
  json_entry["next_review_due_at"] = to_json(entry.next_review_due_at);
  return json_entry;
}

VocabularyEntry vocabulary_entry_from_json(const nlohmann::json& json_entry) {
  require_object(json_entry, "vocabulary entry");
  VocabularyEntry entry;
  entry.text = json_to_string(require_field(json_entry, "text"), "text");
  assign_if_present(json_entry, "mastery_level", [&](const nlohmann::json& value) {
    entry.mastery_level = json_to_int(value, "mastery_level");
  });
  assign_if_present(json_entry, "review_count", [&](const nlohmann::json& value) {
    entry.review_count = json_to_int(value, "review_count");
  });
  assign_if_present(json_entry, "correct_count", [&](const nlohmann::json& value) {
    entry.correct_count = json_to_int(value, "correct_count");
  });
  assign_if_present(json_entry, "last_reviewed_at", [&](const nlohmann::json& value) {
    entry.last_reviewed_at = timestamp_from_json(value, "last_reviewed_at");
  });
  assign_if_present(json_entry, "next_review_due_at", [&](const nlohmann::json& value) {
    entry.next_review_due_at = timestamp_from_json(value, "next_review_due_at");
  });
  return entry;
}

std::vector<VocabularyEntry> vocabulary_from_json(const nlohmann::json& json_entries) {
  if (!json_entries.is_array()) {
    throw std::invalid_argument("Expected array for field 'entries'");
  }
  std::vector<VocabularyEntry> entries;
  entries.reserve(json_entries.size());
  for (const auto& item : json_entries) {
    entries.push_back(vocabulary_entry_from_json(item));
  }
  return entries;
}

nlohmann::json to_json(const AggregateWindow& window) {
  nlohmann::json json_window = nlohmann::json::object();
  json_window["from"] = to_json(window.from);
  json_window["to"] = to_json(window.to);
  json_window["utc_offset_minutes"] = window.utc_offset.count();
  return json_window;
}

AggregateWindow aggregate_window_from_json(const nlohmann::json& json_window) {
  require_object(json_window, "aggregation window");
  AggregateWindow window;
  window.from = timestamp_from_json(require_field(json_window, "from"), "from");
  window.to = timestamp_from_json(require_field(json_window, "to"), "to");
  assign_if_present(json_window, "utc_offset_minutes", [&](const nlohmann::json& value) {
    window.utc_offset = std::chrono::minutes(json_to_int(value, "utc_offset_minutes"));
  });
  if (window.utc_offset > kMaxUtcOffset || window.utc_offset < -kMaxUtcOffset) {
    throw std::invalid_argument("Field 'utc_offset_minutes' must be within +/-" +
                                std::to_string(kMaxUtcOffset.count()));
  }
  if (window.from > window.to) {
    throw std::invalid_argument("Field 'from' must not be later than 'to'");
  }
  return window;
}

nlohmann::json to_json(const AggregateResult& result) {
  nlohmann::json json_result = nlohmann::json::object();
  json_result["total_time_spent"] = result.total_time_spent;
  json_result["total_attempts"] = result.total_attempts;
  json_result["correct_attempts"] = result.correct_attempts;
  json_result["average_accuracy"] = result.average_accuracy;
  json_result["streak_days"] = result.streak_days;
  nlohmann::json counts = nlohmann::json::object();
  for (ActivityModule module : kActivityModules) {
    counts[to_string(module)] = result.count(module);
  }
  json_result["counts_by_module"] = std::move(counts);
  json_result["warnings"] = strings_to_json_array(result.warnings);
  return json_result;
}

nlohmann::json to_json(const ModuleAssessment& assessment) {
  nlohmann::json json_assessment = nlohmann::json::object();
  json_assessment["module"] = to_string(assessment.module);
  json_assessment["current_level"] = to_string(assessment.current_level);
  json_assessment["accuracy"] = assessment.accuracy;
  json_assessment["total_attempts"] = assessment.total_attempts;
  json_assessment["correct_attempts"] = assessment.correct_attempts;
  json_assessment["recent_trend"] = to_string(assessment.recent_trend);
  const auto& next = assessment.next_level_requirement;
  nlohmann::json requirement = nlohmann::json::object();
  requirement["target_accuracy"] = optional_to_json(next.target_accuracy);
  requirement["minimum_attempts"] = optional_to_json(next.minimum_attempts);
  requirement["current_progress"] = next.current_progress;
  json_assessment["next_level_requirement"] = std::move(requirement);
  return json_assessment;
}

ModuleAssessment module_assessment_from_json(const nlohmann::json& json_assessment) {
  require_object(json_assessment, "module assessment");
  ModuleAssessment assessment;
  assessment.module = json_to_enum<SkillModule>(require_field(json_assessment, "module"), "module",
                                                skill_module_from_string);
  assign_if_present(json_assessment, "current_level", [&](const nlohmann::json& value) {
    assessment.current_level = json_to_enum<CefrLevel>(value, "current_level", cefr_level_from_string);
  });
  assign_if_present(json_assessment, "accuracy", [&](const nlohmann::json& value) {
    assessment.accuracy = json_to_double(value, "accuracy");
  });
  assign_if_present(json_assessment, "total_attempts", [&](const nlohmann::json& value) {
    assessment.total_attempts = json_to_int(value, "total_attempts");
  });
  assign_if_present(json_assessment, "correct_attempts", [&](const nlohmann::json& value) {
    assessment.correct_attempts = json_to_int(value, "correct_attempts");
  });
  assign_if_present(json_assessment, "recent_trend", [&](const nlohmann::json& value) {
    assessment.recent_trend = json_to_enum<Trend>(value, "recent_trend", trend_from_string);
  });
  assign_if_present(json_assessment, "next_level_requirement", [&](const nlohmann::json& value) {
    require_object(value, "field 'next_level_requirement'");
    auto& next = assessment.next_level_requirement;
    assign_if_present(value, "target_accuracy", [&](const nlohmann::json& v) {
      next.target_accuracy = json_to_double(v, "target_accuracy");
    });
    assign_if_present(value, "minimum_attempts", [&](const nlohmann::json& v) {
      next.minimum_attempts = json_to_int(v, "minimum_attempts");
    });
    assign_if_present(value, "current_progress", [&](const nlohmann::json& v) {
      next.current_progress = json_to_double(v, "current_progress");
    });
  });
  return assessment;
}

ModuleAssessments module_assessments_from_json(const nlohmann::json& json_modules) {
  std::vector<ModuleAssessment> parsed;
  if (json_modules.is_array()) {
    for (const auto& item : json_modules) {
      parsed.push_back(module_assessment_from_json(item));
    }
  } else if (json_modules.is_object()) {
    for (const auto& item : json_modules.items()) {
      nlohmann::json entry = item.value();
      require_object(entry, "module assessment");
      if (!entry.contains("module")) {
        entry["module"] = item.key();
      }
      auto assessment = module_assessment_from_json(entry);
      if (to_string(assessment.module) != item.key()) {
        throw std::invalid_argument("Module assessment under '" + item.key() + "' names module '" +
                                    to_string(assessment.module) + "'");
      }
      parsed.push_back(std::move(assessment));
    }
  } else {
    throw std::invalid_argument("Expected array or object for field 'modules'");
  }

  ModuleAssessments modules{};
  std::array<bool, 4> seen{};
  for (auto& assessment : parsed) {
    const auto index = module_index(assessment.module);
    if (seen[index]) {
      throw std::invalid_argument("Duplicate module assessment for '" + to_string(assessment.module) + "'");
    }
    seen[index] = true;
    modules[index] = std::move(assessment);
  }
  for (SkillModule module : kSkillModules) {
    if (!seen[module_index(module)]) {
      throw std::invalid_argument("Missing module assessment for '" + to_string(module) + "'");
    }
  }
  return modules;
}

nlohmann::json to_json(const RequirementStatus& status) {
  nlohmann::json json_status = nlohmann::json::object();
  json_status["module"] = to_string(status.module);
  json_status["current_accuracy"] = status.current_accuracy;
  json_status["required_accuracy"] = status.required_accuracy;
  json_status["current_attempts"] = status.current_attempts;
  json_status["minimum_attempts"] = status.minimum_attempts;
  json_status["met"] = status.met;
  json_status["description"] = status.description;
  return json_status;
}

nlohmann::json to_json(const ProficiencyAssessment& assessment) {
  nlohmann::json json_assessment = nlohmann::json::object();
  json_assessment["overall_level"] = to_string(assessment.overall_level);
  nlohmann::json modules = nlohmann::json::object();
  for (const auto& module : assessment.modules) {
    modules[to_string(module.module)] = to_json(module);
  }
  json_assessment["modules"] = std::move(modules);

  const auto& upgrade = assessment.level_upgrade;
  nlohmann::json json_upgrade = nlohmann::json::object();
  json_upgrade["can_upgrade"] = upgrade.can_upgrade;
  if (upgrade.next_level.has_value()) {
    json_upgrade["next_level"] = to_string(upgrade.next_level.value());
  } else {
    json_upgrade["next_level"] = nullptr;
  }
  json_upgrade["overall_progress"] = upgrade.overall_progress;
  nlohmann::json requirements = nlohmann::json::array();
  for (const auto& status : upgrade.requirements) {
    requirements.push_back(to_json(status));
  }
  json_upgrade["requirements"] = std::move(requirements);
  json_assessment["level_upgrade"] = std::move(json_upgrade);

  json_assessment["weakest_module"] = to_string(assessment.weakest_module);
  json_assessment["strongest_module"] = to_string(assessment.strongest_module);
  return json_assessment;
}

nlohmann::json to_json(const ReviewTransition& transition) {
  nlohmann::json json_transition = nlohmann::json::object();
  json_transition["entry"] = to_json(transition.entry);
  json_transition["warnings"] = strings_to_json_array(transition.warnings);
  return json_transition;
}

nlohmann::json to_json(const ReviewIntervals& intervals) {
  nlohmann::json json_intervals = nlohmann::json::object();
  json_intervals["short_hours"] = ladder_to_json(intervals.short_band);
  json_intervals["medium_hours"] = ladder_to_json(intervals.medium_band);
  json_intervals["long_hours"] = ladder_to_json(intervals.long_band);
  return json_intervals;
}

ReviewIntervals review_intervals_from_json(const nlohmann::json& json_intervals) {
  require_object(json_intervals, "review intervals");
  ReviewIntervals intervals = ReviewIntervals::defaults();
  assign_if_present(json_intervals, "short_hours", [&](const nlohmann::json& value) {
    intervals.short_band = json_to_ladder(value, "short_hours");
  });
  assign_if_present(json_intervals, "medium_hours", [&](const nlohmann::json& value) {
    intervals.medium_band = json_to_ladder(value, "medium_hours");
  });
  assign_if_present(json_intervals, "long_hours", [&](const nlohmann::json& value) {
    intervals.long_band = json_to_ladder(value, "long_hours");
  });
  intervals.validate();
  return intervals;
}

nlohmann::json to_json(const LearnerStatistics& statistics) {
  nlohmann::json json_stats = nlohmann::json::object();
  json_stats["totals"] = to_json(statistics.totals);

  nlohmann::json daily = nlohmann::json::array();
  for (const auto& day : statistics.daily) {
    nlohmann::json json_day = nlohmann::json::object();
    const auto midnight = Timestamp(std::chrono::hours(24 * day.day));
    json_day["date"] = format_iso8601(midnight).substr(0, 10);
    json_day["study_time"] = day.study_time;
    json_day["accuracy"] = optional_to_json(day.accuracy);
    json_day["words"] = day.words;
    json_day["activities"] = day.activities;
    daily.push_back(std::move(json_day));
  }
  json_stats["daily"] = std::move(daily);

  const auto& vocabulary = statistics.vocabulary;
  nlohmann::json json_vocabulary = nlohmann::json::object();
  json_vocabulary["total"] = vocabulary.total;
  json_vocabulary["mastered"] = vocabulary.mastered;
  json_vocabulary["due_now"] = vocabulary.due_now;
  nlohmann::json by_level = nlohmann::json::array();
  for (int count : vocabulary.by_level) {
    by_level.push_back(count);
  }
  json_vocabulary["by_level"] = std::move(by_level);
  json_stats["vocabulary"] = std::move(json_vocabulary);

  nlohmann::json achievements = nlohmann::json::array();
  for (const auto& achievement : statistics.achievements) {
    nlohmann::json json_achievement = nlohmann::json::object();
    json_achievement["type"] = achievement.type;
    json_achievement["title"] = achievement.title;
    json_achievement["description"] = achievement.description;
    achievements.push_back(std::move(json_achievement));
  }
  json_stats["achievements"] = std::move(achievements);
  return json_stats;
}

nlohmann::json to_json(const ScoreResult& result) {
  nlohmann::json json_result = nlohmann::json::object();
  json_result["overall_score"] = result.overall_score;
  nlohmann::json sub_scores = nlohmann::json::object();
  for (const auto& entry : result.sub_scores) {
    sub_scores[entry.name] = entry.value;
  }
  json_result["sub_scores"] = std::move(sub_scores);
  json_result["feedback"] = result.feedback;
  nlohmann::json mistakes = nlohmann::json::array();
  for (const auto& mistake : result.mistakes) {
    nlohmann::json json_mistake = nlohmann::json::object();
    json_mistake["expected"] = mistake.expected;
    json_mistake["actual"] = mistake.actual;
    json_mistake["suggestion"] = mistake.suggestion;
    mistakes.push_back(std::move(json_mistake));
  }
  json_result["mistakes"] = std::move(mistakes);
  json_result["suggestions"] = strings_to_json_array(result.suggestions);
  if (!result.criteria.empty()) {
    json_result["total_score"] = result.total_score;
    json_result["max_score"] = result.max_score;
    nlohmann::json criteria = nlohmann::json::array();
    for (const auto& criterion : result.criteria) {
      nlohmann::json json_criterion = nlohmann::json::object();
      json_criterion["criterion"] = criterion.criterion;
      json_criterion["score"] = criterion.score;
      json_criterion["max_score"] = criterion.max_score;
      json_criterion["feedback"] = criterion.feedback;
      criteria.push_back(std::move(json_criterion));
    }
    json_result["criteria"] = std::move(criteria);
  }
  return json_result;
}

scoring::WritingTask writing_task_from_json(const nlohmann::json& json_task) {
  scoring::WritingTask task;
  if (json_task.is_null()) {
    return task;
  }
  require_object(json_task, "writing task");
  assign_if_present(json_task, "rubric", [&](const nlohmann::json& value) {
    if (!value.is_array()) {
      throw std::invalid_argument("Expected array for field 'rubric'");
    }
    std::vector<scoring::RubricItem> rubric;
    for (const auto& item : value) {
      require_object(item, "rubric item");
      scoring::RubricItem rubric_item;
      rubric_item.criterion = json_to_enum<scoring::Criterion>(require_field(item, "criterion"), "criterion",
                                                               scoring::criterion_from_string);
      rubric_item.max_score = json_to_double(require_field(item, "max_score"), "max_score");
      if (rubric_item.max_score <= 0.0) {
        throw std::invalid_argument("Field 'max_score' must be positive");
      }
      rubric.push_back(rubric_item);
    }
    task.rubric = std::move(rubric);
  });
  assign_if_present(json_task, "word_limit", [&](const nlohmann::json& value) {
    task.word_limit = json_to_int(value, "word_limit");
  });
  assign_if_present(json_task, "keywords", [&](const nlohmann::json& value) {
    task.keywords = json_to_string_vector(value, "keywords");
  });
  return task;
}

} // namespace lingo::bridge
