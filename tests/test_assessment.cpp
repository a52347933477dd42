#include "../include/lingo/assessment_engine.hpp"
#include "../include/lingo/level_table.hpp"
#include "../include/lingo/module_evaluator.hpp"
#include "../include/lingo/record_aggregator.hpp"
#include "../include/lingo/upgrade_engine.hpp"

#include <chrono>
#include <cmath>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

struct TestSuite {
  bool ok = true;
  void require(bool condition, const std::string& message) {
    if (!condition) {
      std::cerr << "[FAIL] " << message << std::endl;
      ok = false;
    }
  }
};

constexpr int kBaseDay = 20000;

lingo::Timestamp at(int day, int hour = 12) {
  return lingo::Timestamp(std::chrono::hours(24 * (kBaseDay + day) + hour));
}

lingo::ActivityRecord record(lingo::ActivityModule module,
                             lingo::Timestamp when,
                             std::optional<double> accuracy,
                             double seconds = 60.0) {
  lingo::ActivityRecord r;
  r.module = module;
  r.timestamp = when;
  r.accuracy = accuracy;
  r.time_spent_seconds = seconds;
  return r;
}

lingo::AggregateWindow window(int from_day, int to_day) {
  lingo::AggregateWindow w;
  w.from = at(from_day, 0);
  w.to = at(to_day, 23);
  return w;
}

bool near(double a, double b, double eps = 1e-6) {
  return std::abs(a - b) < eps;
}

lingo::AggregateResult stats_of(double accuracy, int attempts) {
  lingo::AggregateResult stats;
  stats.average_accuracy = accuracy;
  stats.total_attempts = attempts;
  stats.correct_attempts = attempts;
  return stats;
}

lingo::ModuleAssessment module_at(lingo::SkillModule module,
                                  lingo::CefrLevel level,
                                  double progress,
                                  double accuracy = 70.0) {
  lingo::ModuleAssessment m;
  m.module = module;
  m.current_level = level;
  m.accuracy = accuracy;
  m.total_attempts = 20;
  m.correct_attempts = 15;
  m.next_level_requirement.current_progress = progress;
  return m;
}

void test_aggregator(TestSuite& suite) {
  using lingo::ActivityModule;

  {
    const auto result = lingo::aggregate({}, window(0, 10));
    suite.require(result.total_time_spent == 0.0, "Empty input should have zero time");
    suite.require(result.total_attempts == 0 && result.correct_attempts == 0,
                  "Empty input should have zero attempts");
    suite.require(result.average_accuracy == 0.0, "Empty input should have zero accuracy");
    suite.require(result.streak_days == 0, "Empty input should have no streak");
    suite.require(result.warnings.empty(), "Empty input should not warn");
    for (ActivityModule module : lingo::kActivityModules) {
      suite.require(result.count(module) == 0, "Empty input should have zero module counts");
    }
  }

  {
    std::vector<lingo::ActivityRecord> records = {
        record(ActivityModule::Reading, at(10, 10), 80.0, 100.0),
        record(ActivityModule::Listening, at(10, 11), 40.0, 50.0),
        record(ActivityModule::Translation, at(9, 8), std::nullopt, 120.0),
        record(ActivityModule::Reading, at(20), 10.0, 999.0),
    };
    const auto result = lingo::aggregate(records, window(0, 10));
    suite.require(result.total_attempts == 2, "Only graded records count as attempts");
    suite.require(result.correct_attempts == 1, "Accuracy >= 50 counts as correct");
    suite.require(near(result.average_accuracy, 60.0), "Average accuracy ignores ungraded records");
    suite.require(near(result.total_time_spent, 270.0), "Time spent sums records in the window");
    suite.require(result.count(ActivityModule::Reading) == 1, "Out-of-window reading record is excluded");
    suite.require(result.count(ActivityModule::Translation) == 1, "Ungraded records are still counted");
    suite.require(result.streak_days == 2, "Two consecutive covered days ending today");

    const auto reading = lingo::aggregate(records, window(0, 10), lingo::SkillModule::Reading);
    suite.require(reading.total_attempts == 1 && near(reading.average_accuracy, 80.0),
                  "Module overload keeps only that module's records");
  }

  {
    const auto today = at(10, 23);
    const std::chrono::minutes utc(0);
    std::vector<lingo::ActivityRecord> grace = {
        record(ActivityModule::Reading, at(8), 70.0),
        record(ActivityModule::Reading, at(9), 70.0),
    };
    suite.require(lingo::streak_days(grace, today, utc) == 2,
                  "An empty today should not break a streak ending yesterday");

    std::vector<lingo::ActivityRecord> gap = {
        record(ActivityModule::Reading, at(7), 70.0),
        record(ActivityModule::Reading, at(9), 70.0),
        record(ActivityModule::Writing, at(10), 70.0),
    };
    suite.require(lingo::streak_days(gap, today, utc) == 2, "Streak stops at the first gap day");

    std::vector<lingo::ActivityRecord> stale = {record(ActivityModule::Reading, at(5), 70.0)};
    suite.require(lingo::streak_days(stale, today, utc) == 0, "Old activity should give no streak");

    std::vector<lingo::ActivityRecord> late = {record(ActivityModule::Reading, at(9, 23), 70.0)};
    suite.require(lingo::streak_days(late, at(10, 1), std::chrono::minutes(120)) == 1,
                  "Offset should move a late record onto the next local day");
  }

  {
    std::vector<lingo::ActivityRecord> records = {
        record(ActivityModule::Speaking, at(3), 140.0, -30.0),
        record(ActivityModule::Speaking, at(3, 13), -5.0, 30.0),
    };
    const auto result = lingo::aggregate(records, window(0, 10));
    suite.require(result.warnings.size() == 3, "Each corrupt value should produce a warning");
    suite.require(near(result.total_time_spent, 30.0), "Negative time spent should count as zero");
    suite.require(near(result.average_accuracy, 50.0), "Out-of-range accuracy should be clamped");
  }

  {
    std::vector<lingo::ActivityRecord> records;
    for (int i = 7; i >= 0; --i) {
      records.push_back(record(ActivityModule::Reading, at(1, i), 10.0 * i));
    }
    const auto result = lingo::aggregate(records, window(0, 10));
    const std::vector<double> expected = {20.0, 30.0, 40.0, 50.0, 60.0, 70.0};
    suite.require(result.recent_accuracies == expected,
                  "Recent accuracies should be the newest six in chronological order");
  }

  {
    std::vector<lingo::ActivityRecord> records = {
        record(ActivityModule::Reading, at(2, 9), 60.0, 100.0),
        record(ActivityModule::Reading, at(2, 10), 80.0, 200.0),
        record(ActivityModule::Translation, at(4), std::nullopt, 50.0),
    };
    records[0].word_ref = "apple";
    records[1].word_ref = "apple";
    const auto days = lingo::daily_breakdown(records, window(0, 10));
    suite.require(days.size() == 2, "Daily breakdown should have one entry per active day");
    if (days.size() == 2) {
      suite.require(days[0].day == kBaseDay + 4, "Newest day should come first");
      suite.require(!days[0].accuracy.has_value(), "Ungraded day should have no accuracy");
      suite.require(near(days[1].study_time, 300.0), "Study time should sum per day");
      suite.require(days[1].accuracy.has_value() && near(*days[1].accuracy, 70.0),
                    "Daily accuracy should average graded records");
      suite.require(days[1].words == 1, "Words should count distinct references");
    }
  }

  {
    lingo::AggregateResult stats;
    stats.total_time_spent = 4000.0;
    stats.streak_days = 3;
    const auto earned = lingo::achievements(stats, 120);
    suite.require(earned.size() == 2, "Study time and vocabulary achievements should be earned");
    stats.streak_days = 7;
    suite.require(lingo::achievements(stats, 0).size() == 2,
                  "A seven day streak should be rewarded");
  }
}

void test_evaluator(TestSuite& suite) {
  using lingo::CefrLevel;
  using lingo::SkillModule;
  const auto& table = lingo::LevelRequirementTable::builtin();

  {
    const auto m = lingo::evaluate(SkillModule::Reading, stats_of(78.0, 20), table);
    suite.require(m.current_level == CefrLevel::B1, "78% over 20 reading attempts should be B1");
    suite.require(near(m.next_level_requirement.current_progress, 80.0),
                  "Progress towards B2 should be bottlenecked at 80");
    suite.require(m.next_level_requirement.target_accuracy == 80.0, "B2 reading target should be 80");
    suite.require(m.next_level_requirement.minimum_attempts == 25, "B2 reading minimum should be 25");
  }

  {
    const auto m = lingo::evaluate(SkillModule::Listening, lingo::aggregate({}, window(0, 1)), table);
    suite.require(m.current_level == CefrLevel::A1, "No records should evaluate to the A1 floor");
    suite.require(m.next_level_requirement.current_progress == 0.0, "No records should have zero progress");
    suite.require(m.recent_trend == lingo::Trend::Stable, "No records should have a stable trend");
  }

  {
    const auto m = lingo::evaluate(SkillModule::Reading, stats_of(95.0, 40), table);
    suite.require(m.current_level == CefrLevel::C2, "Top results should reach C2");
    suite.require(!m.next_level_requirement.target_accuracy.has_value() &&
                      !m.next_level_requirement.minimum_attempts.has_value(),
                  "C2 should have no next requirement");
    suite.require(m.next_level_requirement.current_progress == 100.0, "C2 progress should be 100");
  }

  {
    const auto m = lingo::evaluate(SkillModule::Reading, stats_of(100.0, 12), table);
    suite.require(m.current_level == CefrLevel::A1, "Scan should stop at the first unmet level");
    suite.require(near(m.next_level_requirement.current_progress, 80.0),
                  "Attempts should bottleneck the progress towards A2");
  }

  {
    suite.require(lingo::recent_trend({50, 50, 50, 60, 60, 60}) == lingo::Trend::Up, "Rising means should trend up");
    suite.require(lingo::recent_trend({60, 60, 60, 50, 50, 50}) == lingo::Trend::Down,
                  "Falling means should trend down");
    suite.require(lingo::recent_trend({50, 50, 50, 52, 52, 52}) == lingo::Trend::Stable,
                  "A two point change should be stable");
    suite.require(lingo::recent_trend({10, 90, 90, 90, 90}) == lingo::Trend::Stable,
                  "Fewer than six values should be stable");
  }

  {
    auto stats = stats_of(72.5, 17);
    stats.recent_accuracies = {70, 71, 72, 80, 81, 82};
    const auto a = lingo::evaluate(SkillModule::Speaking, stats, table);
    const auto b = lingo::evaluate(SkillModule::Speaking, stats, table);
    suite.require(a.current_level == b.current_level && a.accuracy == b.accuracy &&
                      a.total_attempts == b.total_attempts && a.recent_trend == b.recent_trend &&
                      a.next_level_requirement.current_progress == b.next_level_requirement.current_progress &&
                      a.next_level_requirement.target_accuracy == b.next_level_requirement.target_accuracy,
                  "Evaluate should be idempotent");
    suite.require(a.recent_trend == lingo::Trend::Up, "Trend should come from recent accuracies");
  }

  {
    bool monotonic = true;
    bool bounded = true;
    for (SkillModule module : lingo::kSkillModules) {
      for (int accuracy = 0; accuracy <= 100; accuracy += 5) {
        for (int attempts = 0; attempts <= 40; attempts += 5) {
          const auto base = lingo::evaluate(module, stats_of(accuracy, attempts), table);
          const auto more_acc = lingo::evaluate(module, stats_of(accuracy + 5, attempts), table);
          const auto more_att = lingo::evaluate(module, stats_of(accuracy, attempts + 5), table);
          monotonic = monotonic &&
                      lingo::level_index(more_acc.current_level) >= lingo::level_index(base.current_level) &&
                      lingo::level_index(more_att.current_level) >= lingo::level_index(base.current_level);
          const double progress = base.next_level_requirement.current_progress;
          bounded = bounded && progress >= 0.0 && progress <= 100.0 && base.accuracy >= 0.0 &&
                    base.accuracy <= 100.0;
        }
      }
    }
    suite.require(monotonic, "Level should never drop when accuracy or attempts increase");
    suite.require(bounded, "Progress and accuracy should stay within [0, 100]");
  }
}

void test_upgrade(TestSuite& suite) {
  using lingo::CefrLevel;
  using lingo::SkillModule;

  {
    lingo::ModuleAssessments modules = {
        module_at(SkillModule::Reading, CefrLevel::B1, 100.0),
        module_at(SkillModule::Listening, CefrLevel::B1, 100.0),
        module_at(SkillModule::Speaking, CefrLevel::B1, 100.0),
        module_at(SkillModule::Writing, CefrLevel::B1, 100.0),
    };
    const auto result = lingo::decide(modules);
    suite.require(result.level_upgrade.can_upgrade, "All modules at 100% should allow an upgrade");
    suite.require(result.level_upgrade.next_level == CefrLevel::B2, "Next level should follow B1");
    suite.require(near(result.level_upgrade.overall_progress, 100.0), "Overall progress should be 100");
  }

  {
    lingo::ModuleAssessments modules = {
        module_at(SkillModule::Reading, CefrLevel::B2, 50.0, 80.0),
        module_at(SkillModule::Listening, CefrLevel::A2, 40.0, 60.0),
        module_at(SkillModule::Speaking, CefrLevel::C1, 40.0, 55.0),
        module_at(SkillModule::Writing, CefrLevel::B1, 90.0, 65.0),
    };
    const auto result = lingo::decide(modules);
    suite.require(result.overall_level == CefrLevel::A2, "Overall level should be the weakest skill");
    suite.require(!result.level_upgrade.can_upgrade, "Partial progress should not allow an upgrade");
    suite.require(result.level_upgrade.next_level == CefrLevel::B1, "Next level should follow A2");
    suite.require(near(result.level_upgrade.overall_progress, 55.0), "Overall progress should be the mean");
    suite.require(result.weakest_module == SkillModule::Speaking,
                  "Progress ties should fall back to lower accuracy");
    suite.require(result.strongest_module == SkillModule::Writing, "Highest progress should be strongest");
  }

  {
    lingo::ModuleAssessments modules = {
        module_at(SkillModule::Reading, CefrLevel::A1, 30.0),
        module_at(SkillModule::Listening, CefrLevel::A1, 30.0),
        module_at(SkillModule::Speaking, CefrLevel::A1, 30.0),
        module_at(SkillModule::Writing, CefrLevel::A1, 30.0),
    };
    const auto result = lingo::decide(modules);
    suite.require(result.weakest_module == SkillModule::Reading &&
                      result.strongest_module == SkillModule::Reading,
                  "Full ties should resolve by module order");
  }

  {
    lingo::ModuleAssessments modules = {
        module_at(SkillModule::Reading, CefrLevel::C2, 100.0),
        module_at(SkillModule::Listening, CefrLevel::C2, 100.0),
        module_at(SkillModule::Speaking, CefrLevel::C2, 100.0),
        module_at(SkillModule::Writing, CefrLevel::C2, 100.0),
    };
    const auto result = lingo::decide(modules);
    suite.require(!result.level_upgrade.next_level.has_value(), "C2 should have no next level");
    suite.require(!result.level_upgrade.can_upgrade, "C2 cannot be upgraded");
  }

  {
    const auto& table = lingo::LevelRequirementTable::builtin();
    lingo::ModuleAssessments modules = {
        module_at(SkillModule::Reading, CefrLevel::A2, 90.0, 72.0),
        module_at(SkillModule::Listening, CefrLevel::B1, 60.0, 75.0),
        module_at(SkillModule::Speaking, CefrLevel::B1, 70.0, 70.0),
        module_at(SkillModule::Writing, CefrLevel::A2, 80.0, 58.0),
    };
    modules[0].total_attempts = 18;
    const auto result = lingo::decide(modules, table);
    const auto& requirements = result.level_upgrade.requirements;
    suite.require(requirements.size() == 4, "Every module should report a requirement");
    if (requirements.size() == 4) {
      suite.require(requirements[0].required_accuracy == 75.0 && requirements[0].minimum_attempts == 20,
                    "Requirements should target the B1 row");
      suite.require(!requirements[0].met, "Reading should not meet B1 yet");
      suite.require(requirements[0].description ==
                        "Reading: raise accuracy by 3.0% and complete 2 more exercises",
                    "Description should name both gaps");
      suite.require(requirements[1].met, "Listening should meet B1");
      suite.require(requirements[1].description == "Listening: requirement met",
                    "Met requirement should say so");
    }

    const auto hints = lingo::recommendations(result);
    suite.require(!hints.empty() && hints.size() <= 5, "Recommendations should be bounded");
    suite.require(!hints.empty() && hints.front().rfind("Focus on Listening", 0) == 0,
                  "First recommendation should target the weakest module");
  }

  {
    lingo::ModuleAssessments shuffled = {
        module_at(SkillModule::Writing, CefrLevel::A2, 10.0, 40.0),
        module_at(SkillModule::Speaking, CefrLevel::B1, 50.0),
        module_at(SkillModule::Listening, CefrLevel::B1, 60.0),
        module_at(SkillModule::Reading, CefrLevel::B2, 90.0, 85.0),
    };
    const auto result = lingo::decide(shuffled, lingo::LevelRequirementTable::builtin());
    suite.require(result.weakest_module == SkillModule::Writing, "Weakest should follow the entry, not its slot");
    suite.require(result.strongest_module == SkillModule::Reading, "Strongest should follow the entry, not its slot");
    suite.require(result.module(SkillModule::Writing).accuracy == 40.0, "Lookup by skill should find the writing entry");
    suite.require(result.modules[0].module == SkillModule::Reading, "Result should list skills in module order");
    const auto& requirements = result.level_upgrade.requirements;
    suite.require(requirements.size() == 4 && requirements[0].module == SkillModule::Reading &&
                      requirements[0].current_accuracy == 85.0,
                  "Requirements should pair each skill with its own entry");
  }
}

void test_level_table(TestSuite& suite) {
  using lingo::CefrLevel;
  using lingo::SkillModule;
  const auto& table = lingo::LevelRequirementTable::builtin();
  suite.require(table.at(CefrLevel::B1, SkillModule::Reading).accuracy == 75.0, "Builtin B1 reading accuracy");
  suite.require(table.at(CefrLevel::A2, SkillModule::Writing).minimum_attempts == 8, "Builtin A2 writing minimum");

  {
    auto grid = table.grid();
    grid[2][0].accuracy = 65.0;
    bool threw = false;
    try {
      lingo::LevelRequirementTable broken(grid);
      (void)broken;
    } catch (const std::invalid_argument&) {
      threw = true;
    }
    suite.require(threw, "Decreasing thresholds should be rejected");
  }

  {
    auto grid = table.grid();
    grid[5][3].accuracy = 120.0;
    bool threw = false;
    try {
      lingo::LevelRequirementTable broken(grid);
      (void)broken;
    } catch (const std::invalid_argument&) {
      threw = true;
    }
    suite.require(threw, "Accuracy above 100 should be rejected");
  }

  {
    const auto path = std::filesystem::path(LINGO_RESOURCES_DIR) / "level_requirements.json";
    const auto loaded = lingo::load_level_requirements(path);
    suite.require(loaded == table, "Shipped JSON table should match the builtin table");
    suite.require(lingo::level_requirements_from_json(lingo::to_json(table)) == table,
                  "Serialized table should load back unchanged");
  }

  {
    bool threw = false;
    try {
      lingo::load_level_requirements("/nonexistent/level_requirements.json");
    } catch (const std::runtime_error&) {
      threw = true;
    }
    suite.require(threw, "Missing table file should throw runtime_error");
  }

  {
    auto document = lingo::to_json(table);
    document.erase("C1");
    bool threw = false;
    try {
      lingo::level_requirements_from_json(document);
    } catch (const std::invalid_argument&) {
      threw = true;
    }
    suite.require(threw, "Table without a level should be rejected");
  }
}

void test_engine(TestSuite& suite) {
  using lingo::ActivityModule;
  using lingo::CefrLevel;
  using lingo::SkillModule;

  auto engine = lingo::make_engine();
  std::vector<lingo::ActivityRecord> records;
  for (int i = 0; i < 25; ++i) {
    records.push_back(record(ActivityModule::Reading, at(i % 5, i % 20), 82.0));
  }
  const auto assessment = engine->assess(records, window(0, 10));
  suite.require(assessment.module(SkillModule::Reading).current_level == CefrLevel::B2,
                "Reading at 82% over 25 attempts should be B2");
  suite.require(near(assessment.module(SkillModule::Reading).next_level_requirement.current_progress,
                     100.0 * 25.0 / 30.0),
                "Reading progress towards C1 should be bottlenecked by attempts");
  suite.require(assessment.overall_level == CefrLevel::A1, "Untouched skills should hold the level at A1");
  suite.require(assessment.weakest_module == SkillModule::Listening,
                "Weakest module should be the first untouched skill");
  suite.require(assessment.strongest_module == SkillModule::Reading, "Reading should be strongest");
  suite.require(assessment.level_upgrade.requirements.size() == 4, "Engine should report requirements");

  const auto stats = engine->statistics(records, {}, window(0, 10));
  suite.require(stats.totals.total_attempts == 25, "Statistics should aggregate all records");
  suite.require(stats.daily.size() == 5, "Statistics should break down five active days");
  suite.require(engine->capabilities().contains("modules"), "Capabilities should list modules");

  {
    std::vector<lingo::ActivityRecord> strong;
    for (ActivityModule module :
         {ActivityModule::Reading, ActivityModule::Listening, ActivityModule::Speaking, ActivityModule::Writing}) {
      for (int i = 0; i < 20; ++i) {
        strong.push_back(record(module, at(i % 5, i), 100.0));
      }
    }
    const auto result = engine->assess(strong, window(0, 10));
    bool below_full = true;
    for (const auto& m : result.modules) {
      below_full = below_full && m.next_level_requirement.current_progress < 100.0;
    }
    suite.require(below_full, "A module meeting its next level is placed at that level instead");
    suite.require(!result.level_upgrade.can_upgrade, "Record-based assessments below C2 do not flag an upgrade");
    suite.require(result.overall_level == CefrLevel::B1, "Reading and listening cap the overall level at B1");

    const auto again = engine->decide(result.modules);
    suite.require(again.overall_level == result.overall_level && again.weakest_module == result.weakest_module,
                  "Deciding on the same modules should reproduce the assessment");
  }
}

} // namespace

int main() {
  TestSuite suite;

  test_aggregator(suite);
  test_evaluator(suite);
  test_upgrade(suite);
  test_level_table(suite);
  test_engine(suite);

  if (!suite.ok) {
    std::cerr << "Assessment tests FAILED" << std::endl;
    return 1;
  }

  std::cout << "Assessment tests passed" << std::endl;
  return 0;
}
