#include "lingo/review_scheduler.hpp"

#include "debug_log.hpp"

#include <algorithm>
#include <initializer_list>
#include <stdexcept>
#include <utility>

namespace lingo {
namespace {

using std::chrono::hours;

constexpr std::chrono::seconds h(long count) {
  return hours(count);
}

ReviewIntervals make_defaults() {
  ReviewIntervals intervals;
  intervals.short_band = {h(1), h(2), h(4), h(8), h(12), h(24)};
  intervals.medium_band = {h(2), h(12), h(36), h(84), h(180), h(360)};
  intervals.long_band = {h(12), h(24), h(3 * 24), h(7 * 24), h(15 * 24), h(30 * 24)};
  return intervals;
}

// Clamps stored state into its invariants before a transition.
VocabularyEntry sanitize(const VocabularyEntry& entry, std::vector<std::string>& warnings) {
  VocabularyEntry clean = entry;
  if (clean.mastery_level < kMinMastery || clean.mastery_level > kMaxMastery) {
    warnings.push_back("mastery level " + std::to_string(clean.mastery_level) + " of '" + entry.text +
                       "' clamped into [0, 5]");
    clean.mastery_level = std::clamp(clean.mastery_level, kMinMastery, kMaxMastery);
  }
  if (clean.review_count < 0) {
    warnings.push_back("negative review count of '" + entry.text + "' reset to 0");
    clean.review_count = 0;
  }
  if (clean.correct_count < 0) {
    warnings.push_back("negative correct count of '" + entry.text + "' reset to 0");
    clean.correct_count = 0;
  }
  if (clean.next_review_due_at < clean.last_reviewed_at) {
    warnings.push_back("due date of '" + entry.text + "' precedes its last review");
    clean.next_review_due_at = clean.last_reviewed_at;
  }
  return clean;
}

int accuracy_percent(ReviewOutcome outcome) {
  switch (outcome) {
    case ReviewOutcome::Known: return 100;
    case ReviewOutcome::Familiar: return 70;
    case ReviewOutcome::Unknown: return 30;
  }
  return 30;
}

} // namespace

IntervalBand interval_band_for(ReviewOutcome outcome) {
  switch (outcome) {
    case ReviewOutcome::Unknown: return IntervalBand::Short;
    case ReviewOutcome::Familiar: return IntervalBand::Medium;
    case ReviewOutcome::Known: return IntervalBand::Long;
  }
  return IntervalBand::Short;
}

const ReviewIntervals& ReviewIntervals::defaults() {
  static const ReviewIntervals intervals = make_defaults();
  return intervals;
}

const ReviewIntervals::Ladder& ReviewIntervals::ladder(IntervalBand band) const noexcept {
  switch (band) {
    case IntervalBand::Short: return short_band;
    case IntervalBand::Medium: return medium_band;
    case IntervalBand::Long: return long_band;
  }
  return short_band;
}

std::chrono::seconds ReviewIntervals::interval(int level, IntervalBand band) const noexcept {
  const int index = std::clamp(level, kMinMastery, kMaxMastery);
  return ladder(band)[static_cast<std::size_t>(index)];
}

void ReviewIntervals::validate() const {
  for (IntervalBand band : {IntervalBand::Short, IntervalBand::Medium, IntervalBand::Long}) {
    const auto& values = ladder(band);
    if (values[0].count() <= 0) {
      throw std::invalid_argument("Interval band '" + to_string(band) + "' must start above zero");
    }
    for (std::size_t i = 1; i < values.size(); ++i) {
      if (values[i] <= values[i - 1]) {
        throw std::invalid_argument("Interval band '" + to_string(band) +
                                    "' must increase with mastery level (level " + std::to_string(i) + ")");
      }
    }
  }
  for (std::size_t i = 0; i < short_band.size(); ++i) {
    if (!(short_band[i] < medium_band[i] && medium_band[i] < long_band[i])) {
      throw std::invalid_argument("Interval bands must satisfy short < medium < long at level " +
                                  std::to_string(i));
    }
  }
}

ReviewTransition apply_review(const VocabularyEntry& entry,
                              ReviewOutcome outcome,
                              Timestamp now,
                              const ReviewIntervals& intervals) {
  ReviewTransition result;
  VocabularyEntry next = sanitize(entry, result.warnings);

  switch (outcome) {
    case ReviewOutcome::Unknown:
      next.mastery_level = std::max(kMinMastery, next.mastery_level - 1);
      break;
    case ReviewOutcome::Familiar:
      break;
    case ReviewOutcome::Known:
      next.mastery_level = std::min(kMaxMastery, next.mastery_level + 1);
      next.correct_count += 1;
      break;
  }
  next.review_count += 1;
  next.last_reviewed_at = now;
  next.next_review_due_at = now + intervals.interval(next.mastery_level, interval_band_for(outcome));

  for (const auto& warning : result.warnings) {
    debug_log("review", warning);
  }
  debug_log("review", "'" + next.text + "' " + to_string(outcome) + " -> mastery " +
                          std::to_string(next.mastery_level));
  result.entry = std::move(next);
  return result;
}

ReviewOutcome outcome_for_accuracy(double accuracy) {
  const double score = detail::clip01(accuracy);
  if (score >= 0.8) {
    return ReviewOutcome::Known;
  }
  if (score < 0.5) {
    return ReviewOutcome::Unknown;
  }
  return ReviewOutcome::Familiar;
}

ReviewTransition apply_accuracy(const VocabularyEntry& entry,
                                double accuracy,
                                Timestamp now,
                                const ReviewIntervals& intervals) {
  return apply_review(entry, outcome_for_accuracy(accuracy), now, intervals);
}

VocabularyEntry set_mastery(const VocabularyEntry& entry,
                            int level,
                            Timestamp now,
                            const ReviewIntervals& intervals) {
  if (level < kMinMastery || level > kMaxMastery) {
    throw std::invalid_argument("Mastery level must be between 0 and 5, got " + std::to_string(level));
  }
  VocabularyEntry next = entry;
  next.mastery_level = level;
  next.last_reviewed_at = now;
  next.next_review_due_at = now + intervals.interval(level, IntervalBand::Long);
  return next;
}

std::vector<VocabularyEntry> due_for_review(const std::vector<VocabularyEntry>& entries, Timestamp now) {
  std::vector<VocabularyEntry> due;
  for (const auto& entry : entries) {
    if (entry.next_review_due_at <= now) {
      due.push_back(entry);
    }
  }
  std::stable_sort(due.begin(), due.end(), [](const VocabularyEntry& a, const VocabularyEntry& b) {
    const bool a_new = a.review_count <= 0;
    const bool b_new = b.review_count <= 0;
    if (a_new != b_new) {
      return !a_new;
    }
    if (a.next_review_due_at != b.next_review_due_at) {
      return a.next_review_due_at < b.next_review_due_at;
    }
    if (a.mastery_level != b.mastery_level) {
      return a.mastery_level < b.mastery_level;
    }
    if (a.last_reviewed_at != b.last_reviewed_at) {
      return a.last_reviewed_at < b.last_reviewed_at;
    }
    return a.text < b.text;
  });
  return due;
}

ActivityRecord review_activity_record(const VocabularyEntry& entry,
                                      ReviewOutcome outcome,
                                      Timestamp now,
                                      double time_spent_seconds) {
  ActivityRecord record;
  record.module = ActivityModule::Reading;
  record.timestamp = now;
  record.time_spent_seconds = std::max(0.0, time_spent_seconds);
  record.accuracy = static_cast<double>(accuracy_percent(outcome));
  record.word_ref = entry.text;
  return record;
}

VocabularyStats vocabulary_stats(const std::vector<VocabularyEntry>& entries, Timestamp now) {
  VocabularyStats stats;
  for (const auto& entry : entries) {
    const int level = std::clamp(entry.mastery_level, kMinMastery, kMaxMastery);
    stats.total += 1;
    stats.by_level[static_cast<std::size_t>(level)] += 1;
    if (level >= kMasteredLevel) {
      stats.mastered += 1;
    }
    if (entry.next_review_due_at <= now) {
      stats.due_now += 1;
    }
  }
  return stats;
}

} // namespace lingo
