#pragma once

#include "types.hpp"

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace lingo {

struct AggregateWindow {
  Timestamp from{};
  Timestamp to{};
  // Offset applied before cutting timestamps into calendar days.
  std::chrono::minutes utc_offset{0};
};

struct AggregateResult {
  double total_time_spent = 0.0;     // seconds
  int total_attempts = 0;            // graded records
  int correct_attempts = 0;          // graded records with accuracy >= 50
  double average_accuracy = 0.0;     // 0-100
  int streak_days = 0;
  std::array<int, 5> counts_by_module{};
  // Chronological accuracies of the newest graded records, oldest first.
  std::vector<double> recent_accuracies;
  std::vector<std::string> warnings;

  int count(ActivityModule module) const noexcept { return counts_by_module[activity_index(module)]; }
};

struct DailyStats {
  std::int64_t day = 0;              // days since 1970-01-01 in the window's offset
  double study_time = 0.0;           // seconds
  std::optional<double> accuracy;
  int words = 0;                     // distinct word refs
  int activities = 0;
};

struct Achievement {
  std::string type;
  std::string title;
  std::string description;
};

inline constexpr std::size_t kTrendWindow = 3;
inline constexpr std::chrono::minutes kMaxUtcOffset{23 * 60 + 59};
inline constexpr double kCorrectAccuracyThreshold = 50.0;

AggregateResult aggregate(const std::vector<ActivityRecord>& records, const AggregateWindow& window);

// Same reduction restricted to one skill's records.
AggregateResult aggregate(const std::vector<ActivityRecord>& records,
                          const AggregateWindow& window,
                          SkillModule module);

std::int64_t calendar_day(Timestamp timestamp, std::chrono::minutes utc_offset);

// Consecutive covered days ending today. A day without activity yet does
// not break the streak until it is over, so counting starts from yesterday
// when today is still empty.
int streak_days(const std::vector<ActivityRecord>& records,
                Timestamp today,
                std::chrono::minutes utc_offset);

// Newest day first, at most max_days entries.
std::vector<DailyStats> daily_breakdown(const std::vector<ActivityRecord>& records,
                                        const AggregateWindow& window,
                                        std::size_t max_days = 30);

std::vector<Achievement> achievements(const AggregateResult& stats, int mastered_words);

} // namespace lingo
