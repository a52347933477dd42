#pragma once

#include "types.hpp"

#include <array>
#include <chrono>
#include <string>
#include <vector>

namespace lingo {

inline constexpr int kMinMastery = 0;
inline constexpr int kMaxMastery = 5;
inline constexpr int kMasteredLevel = 4;

enum class IntervalBand {
  Short,
  Medium,
  Long
};

inline std::string to_string(IntervalBand band) {
  switch (band) {
    case IntervalBand::Short: return "short";
    case IntervalBand::Medium: return "medium";
    case IntervalBand::Long: return "long";
  }
  return "short";
}

IntervalBand interval_band_for(ReviewOutcome outcome);

// Review delay per mastery level (index 0-5) for each band. Must grow
// strictly with the level, and short < medium < long at every level.
struct ReviewIntervals {
  using Ladder = std::array<std::chrono::seconds, 6>;

  Ladder short_band{};
  Ladder medium_band{};
  Ladder long_band{};

  static const ReviewIntervals& defaults();

  const Ladder& ladder(IntervalBand band) const noexcept;
  // Level is clamped into [0, 5].
  std::chrono::seconds interval(int level, IntervalBand band) const noexcept;

  void validate() const;
};

struct ReviewTransition {
  VocabularyEntry entry;
  std::vector<std::string> warnings;
};

// Pure transition for one review. Corrupt input state is clamped first and
// reported in warnings.
ReviewTransition apply_review(const VocabularyEntry& entry,
                              ReviewOutcome outcome,
                              Timestamp now,
                              const ReviewIntervals& intervals = ReviewIntervals::defaults());

// Graded review with a 0-1 score: >= 0.8 known, < 0.5 unknown, else familiar.
ReviewOutcome outcome_for_accuracy(double accuracy);

ReviewTransition apply_accuracy(const VocabularyEntry& entry,
                                double accuracy,
                                Timestamp now,
                                const ReviewIntervals& intervals = ReviewIntervals::defaults());

// Explicit override; throws std::invalid_argument when level is outside 0-5.
VocabularyEntry set_mastery(const VocabularyEntry& entry,
                            int level,
                            Timestamp now,
                            const ReviewIntervals& intervals = ReviewIntervals::defaults());

// Due entries, previously reviewed ones first, most overdue first within
// each group.
std::vector<VocabularyEntry> due_for_review(const std::vector<VocabularyEntry>& entries, Timestamp now);

// A review action as an activity record for the aggregator.
ActivityRecord review_activity_record(const VocabularyEntry& entry,
                                      ReviewOutcome outcome,
                                      Timestamp now,
                                      double time_spent_seconds = 0.0);

struct VocabularyStats {
  int total = 0;
  int mastered = 0;
  int due_now = 0;
  std::array<int, 6> by_level{};
};

VocabularyStats vocabulary_stats(const std::vector<VocabularyEntry>& entries, Timestamp now);

} // namespace lingo
