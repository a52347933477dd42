#include "lingo/record_aggregator.hpp"

#include "debug_log.hpp"

#include <algorithm>
#include <cassert>
#include <map>
#include <set>
#include <utility>

namespace lingo {
namespace {

using Days = std::chrono::duration<std::int64_t, std::ratio<86400>>;

bool in_window(const ActivityRecord& record, const AggregateWindow& window) {
  return record.timestamp >= window.from && record.timestamp <= window.to;
}

// Accuracy clamped into [0, 100]; out-of-range stored values are reported.
std::optional<double> sanitized_accuracy(const ActivityRecord& record,
                                         std::vector<std::string>& warnings) {
  if (!record.accuracy.has_value()) {
    return std::nullopt;
  }
  const double raw = record.accuracy.value();
  const double clamped = detail::clip_percent(raw);
  if (clamped != raw) {
    warnings.push_back("accuracy " + std::to_string(raw) + " clamped into [0, 100]");
  }
  return clamped;
}

double sanitized_time(const ActivityRecord& record, std::vector<std::string>& warnings) {
  if (record.time_spent_seconds < 0.0) {
    warnings.push_back("negative time spent " + std::to_string(record.time_spent_seconds) +
                       " treated as 0");
    return 0.0;
  }
  return record.time_spent_seconds;
}

AggregateResult reduce(const std::vector<const ActivityRecord*>& selected,
                       const std::vector<ActivityRecord>& streak_source,
                       const AggregateWindow& window) {
  AggregateResult result;

  double accuracy_sum = 0.0;
  std::vector<std::pair<Timestamp, double>> graded;
  graded.reserve(selected.size());

  for (const ActivityRecord* record : selected) {
    result.total_time_spent += sanitized_time(*record, result.warnings);
    result.counts_by_module[activity_index(record->module)] += 1;

    const auto accuracy = sanitized_accuracy(*record, result.warnings);
    if (!accuracy.has_value()) {
      continue;
    }
    accuracy_sum += *accuracy;
    result.total_attempts += 1;
    if (*accuracy >= kCorrectAccuracyThreshold) {
      result.correct_attempts += 1;
    }
    graded.emplace_back(record->timestamp, *accuracy);
  }

  if (result.total_attempts > 0) {
    result.average_accuracy = accuracy_sum / static_cast<double>(result.total_attempts);
  }

  std::stable_sort(graded.begin(), graded.end(),
                   [](const auto& a, const auto& b) { return a.first < b.first; });
  const std::size_t keep = std::min(graded.size(), kTrendWindow * 2);
  for (std::size_t i = graded.size() - keep; i < graded.size(); ++i) {
    result.recent_accuracies.push_back(graded[i].second);
  }

  result.streak_days = streak_days(streak_source, window.to, window.utc_offset);
  return result;
}

} // namespace

std::int64_t calendar_day(Timestamp timestamp, std::chrono::minutes utc_offset) {
  const auto shifted = timestamp.time_since_epoch() + utc_offset;
  return std::chrono::floor<Days>(shifted).count();
}

int streak_days(const std::vector<ActivityRecord>& records,
                Timestamp today,
                std::chrono::minutes utc_offset) {
  std::set<std::int64_t> covered;
  for (const auto& record : records) {
    if (record.timestamp <= today) {
      covered.insert(calendar_day(record.timestamp, utc_offset));
    }
  }
  if (covered.empty()) {
    return 0;
  }

  std::int64_t day = calendar_day(today, utc_offset);
  if (covered.count(day) == 0) {
    day -= 1;
  }
  int streak = 0;
  while (covered.count(day) != 0) {
    ++streak;
    --day;
  }
  return streak;
}

AggregateResult aggregate(const std::vector<ActivityRecord>& records, const AggregateWindow& window) {
  assert(window.from <= window.to && "aggregation window is inverted");
  if (window.from > window.to) {
    AggregateResult empty;
    empty.warnings.push_back("inverted aggregation window");
    return empty;
  }

  std::vector<const ActivityRecord*> selected;
  selected.reserve(records.size());
  for (const auto& record : records) {
    if (in_window(record, window)) {
      selected.push_back(&record);
    }
  }
  auto result = reduce(selected, records, window);
  for (const auto& warning : result.warnings) {
    debug_log("aggregate", warning);
  }
  return result;
}

AggregateResult aggregate(const std::vector<ActivityRecord>& records,
                          const AggregateWindow& window,
                          SkillModule module) {
  std::vector<ActivityRecord> filtered;
  const ActivityModule activity = to_activity(module);
  for (const auto& record : records) {
    if (record.module == activity) {
      filtered.push_back(record);
    }
  }
  return aggregate(filtered, window);
}

std::vector<DailyStats> daily_breakdown(const std::vector<ActivityRecord>& records,
                                        const AggregateWindow& window,
                                        std::size_t max_days) {
  struct Bucket {
    double time = 0.0;
    double accuracy_sum = 0.0;
    int graded = 0;
    int activities = 0;
    std::set<std::string> words;
  };

  std::map<std::int64_t, Bucket> buckets;
  std::vector<std::string> ignored;
  for (const auto& record : records) {
    if (!in_window(record, window)) {
      continue;
    }
    auto& bucket = buckets[calendar_day(record.timestamp, window.utc_offset)];
    bucket.time += sanitized_time(record, ignored);
    bucket.activities += 1;
    if (const auto accuracy = sanitized_accuracy(record, ignored)) {
      bucket.accuracy_sum += *accuracy;
      bucket.graded += 1;
    }
    if (record.word_ref.has_value() && !record.word_ref->empty()) {
      bucket.words.insert(*record.word_ref);
    }
  }

  std::vector<DailyStats> out;
  for (auto it = buckets.rbegin(); it != buckets.rend() && out.size() < max_days; ++it) {
    DailyStats stats;
    stats.day = it->first;
    stats.study_time = it->second.time;
    stats.activities = it->second.activities;
    stats.words = static_cast<int>(it->second.words.size());
    if (it->second.graded > 0) {
      stats.accuracy = it->second.accuracy_sum / static_cast<double>(it->second.graded);
    }
    out.push_back(std::move(stats));
  }
  return out;
}

std::vector<Achievement> achievements(const AggregateResult& stats, int mastered_words) {
  std::vector<Achievement> out;
  if (stats.total_time_spent >= 3600.0) {
    out.push_back({"study_time", "Dedicated learner", "Studied for more than one hour in total"});
  }
  if (mastered_words >= 100) {
    out.push_back({"vocabulary", "Word collector", "Mastered more than 100 words"});
  }
  if (stats.streak_days >= 7) {
    out.push_back({"streak", "Persistence", "Studied seven days in a row"});
  }
  return out;
}

} // namespace lingo
