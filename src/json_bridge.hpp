#pragma once

#include "../include/lingo/assessment_engine.hpp"

#include <nlohmann/json.hpp>

namespace lingo::bridge {

nlohmann::json to_json(Timestamp timestamp);
Timestamp timestamp_from_json(const nlohmann::json& json_timestamp, const char* key);

nlohmann::json to_json(const ActivityRecord& record);
ActivityRecord activity_record_from_json(const nlohmann::json& json_record);
std::vector<ActivityRecord> activity_records_from_json(const nlohmann::json& json_records);

nlohmann::json to_json(const VocabularyEntry& entry);
VocabularyEntry vocabulary_entry_from_json(const nlohmann::json& json_entry);
std::vector<VocabularyEntry> vocabulary_from_json(const nlohmann::json& json_entries);

nlohmann::json to_json(const AggregateWindow& window);
AggregateWindow aggregate_window_from_json(const nlohmann::json& json_window);

nlohmann::json to_json(const AggregateResult& result);

nlohmann::json to_json(const ModuleAssessment& assessment);
ModuleAssessment module_assessment_from_json(const nlohmann::json& json_assessment);
// Accepts an array of four assessments or an object keyed by module name;
// every skill must appear exactly once.
ModuleAssessments module_assessments_from_json(const nlohmann::json& json_modules);

nlohmann::json to_json(const RequirementStatus& status);

nlohmann::json to_json(const ProficiencyAssessment& assessment);

nlohmann::json to_json(const ReviewTransition& transition);

nlohmann::json to_json(const ReviewIntervals& intervals);
ReviewIntervals review_intervals_from_json(const nlohmann::json& json_intervals);

nlohmann::json to_json(const LearnerStatistics& statistics);

nlohmann::json to_json(const ScoreResult& result);

scoring::WritingTask writing_task_from_json(const nlohmann::json& json_task);

} // namespace lingo::bridge
