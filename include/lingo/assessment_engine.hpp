#pragma once

#include "level_table.hpp"
#include "record_aggregator.hpp"
#include "review_scheduler.hpp"
#include "types.hpp"
#include "upgrade_engine.hpp"
#include "../../scoring/scoring.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace lingo {

struct LearnerStatistics {
  AggregateResult totals;
  std::vector<DailyStats> daily;
  VocabularyStats vocabulary;
  std::vector<Achievement> achievements;
};

class AssessmentEngine {
public:
  virtual ~AssessmentEngine() = default;

  virtual ProficiencyAssessment assess(const std::vector<ActivityRecord>& records,
                                       const AggregateWindow& window) const = 0;

  // Combines assessments computed elsewhere; requirements use this
  // engine's table.
  virtual ProficiencyAssessment decide(const ModuleAssessments& modules) const = 0;

  virtual std::vector<std::string> recommendations(const ProficiencyAssessment& assessment) const = 0;

  virtual LearnerStatistics statistics(const std::vector<ActivityRecord>& records,
                                       const std::vector<VocabularyEntry>& vocabulary,
                                       const AggregateWindow& window) const = 0;

  virtual ReviewTransition review(const VocabularyEntry& entry,
                                  ReviewOutcome outcome,
                                  Timestamp now) const = 0;

  // limit == 0 returns every due entry.
  virtual std::vector<VocabularyEntry> review_queue(const std::vector<VocabularyEntry>& entries,
                                                    Timestamp now,
                                                    std::size_t limit) const = 0;

  virtual ScoreResult score_pronunciation(const std::string& original_text,
                                          const std::string& spoken_text,
                                          double confidence) const = 0;

  virtual ScoreResult score_writing(const std::string& content,
                                    const scoring::WritingTask& task) const = 0;

  virtual const LevelRequirementTable& level_requirements() const = 0;

  virtual const ReviewIntervals& review_intervals() const = 0;

  virtual nlohmann::json capabilities() const = 0;
};

std::unique_ptr<AssessmentEngine> make_engine();

// Throws std::invalid_argument when the intervals are not monotonic.
std::unique_ptr<AssessmentEngine> make_engine(LevelRequirementTable table, ReviewIntervals intervals);

} // namespace lingo
