#include "lingo/assessment_engine.hpp"

#include "lingo/module_evaluator.hpp"
#include "lingo/upgrade_engine.hpp"
#include "debug_log.hpp"

#include <utility>

namespace lingo {
namespace {

class AssessmentEngineImpl : public AssessmentEngine {
public:
  AssessmentEngineImpl(LevelRequirementTable table, ReviewIntervals intervals)
      : table_(std::move(table)), intervals_(std::move(intervals)) {
    intervals_.validate();
  }

  ProficiencyAssessment assess(const std::vector<ActivityRecord>& records,
                               const AggregateWindow& window) const override {
    ModuleAssessments modules{};
    for (SkillModule module : kSkillModules) {
      const auto stats = aggregate(records, window, module);
      modules[module_index(module)] = evaluate(module, stats, table_);
    }
    return ::lingo::decide(modules, table_);
  }

  ProficiencyAssessment decide(const ModuleAssessments& modules) const override {
    return ::lingo::decide(modules, table_);
  }

  std::vector<std::string> recommendations(const ProficiencyAssessment& assessment) const override {
    return ::lingo::recommendations(assessment);
  }

  LearnerStatistics statistics(const std::vector<ActivityRecord>& records,
                               const std::vector<VocabularyEntry>& vocabulary,
                               const AggregateWindow& window) const override {
    LearnerStatistics stats;
    stats.totals = aggregate(records, window);
    stats.daily = daily_breakdown(records, window);
    stats.vocabulary = vocabulary_stats(vocabulary, window.to);
    stats.achievements = achievements(stats.totals, stats.vocabulary.mastered);
    return stats;
  }

  ReviewTransition review(const VocabularyEntry& entry, ReviewOutcome outcome, Timestamp now) const override {
    return apply_review(entry, outcome, now, intervals_);
  }

  std::vector<VocabularyEntry> review_queue(const std::vector<VocabularyEntry>& entries,
                                            Timestamp now,
                                            std::size_t limit) const override {
    auto due = due_for_review(entries, now);
    if (limit > 0 && due.size() > limit) {
      due.resize(limit);
    }
    return due;
  }

  ScoreResult score_pronunciation(const std::string& original_text,
                                  const std::string& spoken_text,
                                  double confidence) const override {
    return scoring::score_pronunciation(original_text, spoken_text, confidence);
  }

  ScoreResult score_writing(const std::string& content, const scoring::WritingTask& task) const override {
    return scoring::score_writing(content, task);
  }

  const LevelRequirementTable& level_requirements() const override { return table_; }

  const ReviewIntervals& review_intervals() const override { return intervals_; }

  nlohmann::json capabilities() const override {
    nlohmann::json caps = nlohmann::json::object();
    caps["version"] = "v1";
    nlohmann::json modules = nlohmann::json::array();
    for (SkillModule module : kSkillModules) {
      modules.push_back(to_string(module));
    }
    caps["modules"] = modules;
    nlohmann::json levels = nlohmann::json::array();
    for (CefrLevel level : kCefrLevels) {
      levels.push_back(to_string(level));
    }
    caps["levels"] = levels;
    caps["review_outcomes"] = nlohmann::json::array({"unknown", "familiar", "known"});
    nlohmann::json criteria = nlohmann::json::array();
    for (const auto& item : scoring::default_rubric()) {
      criteria.push_back(scoring::to_string(item.criterion));
    }
    caps["writing_criteria"] = criteria;
    caps["level_policy"] = "weakest_link";
    return caps;
  }

private:
  LevelRequirementTable table_;
  ReviewIntervals intervals_;
};

} // namespace

std::unique_ptr<AssessmentEngine> make_engine() {
  return make_engine(LevelRequirementTable::builtin(), ReviewIntervals::defaults());
}

std::unique_ptr<AssessmentEngine> make_engine(LevelRequirementTable table, ReviewIntervals intervals) {
  debug_log("engine", "creating assessment engine");
  return std::make_unique<AssessmentEngineImpl>(std::move(table), std::move(intervals));
}

} // namespace lingo
