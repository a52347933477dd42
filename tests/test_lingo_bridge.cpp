#include "bridge/LingoBridge.h"

#include <filesystem>
#include <iostream>
#include <string>
#include <utility>

#include <nlohmann/json.hpp>

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

// Takes ownership of a bridge response and parses it.
nlohmann::json take(char* raw) {
  if (!raw) {
    return nlohmann::json();
  }
  auto response = nlohmann::json::parse(raw);
  free_string(raw);
  return response;
}

nlohmann::json call(char* (*fn)(const char*), const nlohmann::json& request) {
  return take(fn(request.dump().c_str()));
}

bool is_ok(const nlohmann::json& response) {
  return response.is_object() && response.value("status", "") == "ok";
}

bool is_error(const nlohmann::json& response, const std::string& fragment) {
  return response.is_object() && response.value("status", "") == "error" &&
         response.value("message", "").find(fragment) != std::string::npos;
}

const char* kNow = "2024-03-05T12:00:00Z";

nlohmann::json harbour_entry() {
  return {{"text", "harbour"},
          {"mastery_level", 3},
          {"review_count", 2},
          {"correct_count", 1},
          {"last_reviewed_at", "2024-03-01T12:00:00Z"},
          {"next_review_due_at", "2024-03-02T12:00:00Z"}};
}

std::string due_after_known_review() {
  const auto response =
      call(review_word, {{"entry", harbour_entry()}, {"outcome", "known"}, {"now", kNow}});
  if (!is_ok(response)) {
    return "";
  }
  return response["entry"]["next_review_due_at"].get<std::string>();
}

void test_envelopes(TestSuite& suite) {
  suite.require(is_error(take(assess_proficiency(nullptr)), "Missing request json"), "Null request is an error");
  suite.require(is_error(take(assess_proficiency("[1, 2]")), "must be a JSON object"), "Array request is an error");
  suite.require(is_error(take(assess_proficiency("{not json")), ""), "Malformed JSON is an error envelope");
  suite.require(is_error(call(assess_proficiency, {{"records", nlohmann::json::array()}}),
                         "Missing required field 'window'"),
                "Missing field is named");

  const auto caps = take(capabilities());
  suite.require(is_ok(caps) && caps["capabilities"]["modules"].size() == 4, "Capabilities list four modules");
}

void test_assessment_calls(TestSuite& suite) {
  const nlohmann::json window = {{"from", "2024-03-01T00:00:00Z"}, {"to", "2024-03-08T00:00:00Z"}};
  nlohmann::json records = nlohmann::json::array();
  for (int i = 0; i < 12; ++i) {
    records.push_back({{"module", "reading"}, {"timestamp", "2024-03-04T10:00:00Z"}, {"accuracy", 90}});
  }

  const auto assessed = call(assess_proficiency, {{"records", records}, {"window", window}});
  suite.require(is_ok(assessed), "Assessment succeeds");
  if (is_ok(assessed)) {
    suite.require(assessed["assessment"]["overall_level"] == "A1", "Untouched skills keep the level at A1");
    suite.require(assessed["assessment"]["modules"]["reading"]["current_level"] == "A1",
                  "Twelve reading attempts reach A1 only");
    suite.require(assessed["recommendations"].is_array() && !assessed["recommendations"].empty(),
                  "Assessment carries recommendations");
  }

  const auto stats = call(learner_statistics, {{"records", records}, {"window", window}});
  suite.require(is_ok(stats) && stats["statistics"]["totals"]["total_attempts"] == 12,
                "Statistics aggregate the records");

  nlohmann::json modules = nlohmann::json::object();
  const std::pair<const char*, double> progress[] = {
      {"reading", 90.0}, {"listening", 60.0}, {"speaking", 50.0}, {"writing", 10.0}};
  for (const auto& item : progress) {
    modules[item.first] = {{"current_level", "B1"},
                           {"accuracy", 70.0},
                           {"total_attempts", 20},
                           {"next_level_requirement", {{"current_progress", item.second}}}};
  }
  const auto decided = call(decide_upgrade, {{"modules", modules}});
  suite.require(is_ok(decided), "Upgrade decision succeeds");
  if (is_ok(decided)) {
    suite.require(decided["assessment"]["weakest_module"] == "writing", "Weakest module is reported");
    suite.require(decided["assessment"]["strongest_module"] == "reading", "Strongest module is reported");
    suite.require(decided["assessment"]["level_upgrade"]["next_level"] == "B2", "Next level follows B1");
    suite.require(decided["assessment"]["level_upgrade"]["requirements"].size() == 4,
                  "Requirements are filled from the table");
  }

  modules.erase("speaking");
  suite.require(is_error(call(decide_upgrade, {{"modules", modules}}), "Missing module assessment for 'speaking'"),
                "Incomplete module set is rejected");
}

void test_review_calls(TestSuite& suite) {
  suite.require(due_after_known_review() == "2024-03-20T12:00:00.000Z", "Known review schedules 15 days out");
  suite.require(is_error(call(review_word, {{"entry", harbour_entry()}, {"outcome", "maybe"}, {"now", kNow}}), ""),
                "Unknown outcome is an error");
  suite.require(is_error(call(review_word, {{"entry", harbour_entry()}, {"outcome", "known"}, {"now", "soon"}}),
                         "field 'now'"),
                "Bad timestamp names its field");

  nlohmann::json entries = nlohmann::json::array();
  for (const char* text : {"anchor", "buoy", "cable"}) {
    auto entry = harbour_entry();
    entry["text"] = text;
    entries.push_back(entry);
  }
  auto later = harbour_entry();
  later["text"] = "dock";
  later["next_review_due_at"] = "2024-04-01T00:00:00Z";
  entries.push_back(later);

  const auto all = call(review_queue, {{"entries", entries}, {"now", kNow}});
  suite.require(is_ok(all) && all["entries"].size() == 3, "Queue holds every due entry without a limit");
  const auto limited = call(review_queue, {{"entries", entries}, {"now", kNow}, {"limit", 2}});
  suite.require(is_ok(limited) && limited["entries"].size() == 2, "Limit truncates the queue");
  suite.require(is_error(call(review_queue, {{"entries", entries}, {"now", kNow}, {"limit", -1}}), "non-negative"),
                "Negative limit is rejected");
}

void test_scoring_calls(TestSuite& suite) {
  const auto spoken = call(score_pronunciation,
                           {{"original", "I like apples"}, {"spoken", "I like oranges"}, {"confidence", 0.8}});
  suite.require(is_ok(spoken) && spoken["score"]["sub_scores"]["fluency"] == 80.0, "Pronunciation is scored");
  suite.require(is_error(call(score_pronunciation,
                              {{"original", "I like apples"}, {"spoken", "I like oranges"}, {"confidence", "high"}}),
                         "field 'confidence'"),
                "Non-numeric confidence is rejected");

  const auto written = call(score_writing, {{"content", "Short text. Another line."}});
  suite.require(is_ok(written) && written["score"]["criteria"].size() == 5, "Writing uses the default rubric");
  suite.require(is_error(call(score_writing, {{"content", "Text."}, {"task", {{"word_limit", "many"}}}}),
                         "field 'word_limit'"),
                "Bad task field is named");
}

void test_configuration_calls(TestSuite& suite) {
  suite.require(is_error(take(load_level_requirements(nullptr)), "Missing level requirements path"),
                "Null path is an error");
  suite.require(is_error(take(load_level_requirements("/nonexistent/level_requirements.json")), ""),
                "Missing file is an error");

  const auto path = (std::filesystem::path(LINGO_RESOURCES_DIR) / "level_requirements.json").string();
  const auto loaded = take(load_level_requirements(path.c_str()));
  suite.require(is_ok(loaded) && loaded["level_requirements"]["A1"]["reading"]["accuracy"] == 60.0,
                "Shipped table loads");

  const nlohmann::json doubled = {{"long_hours", {24, 48, 96, 192, 384, 768}}};
  const auto configured = call(set_review_intervals, doubled);
  suite.require(is_ok(configured) && configured["review_intervals"]["long_hours"][4] == 384.0,
                "Custom intervals are applied");
  suite.require(due_after_known_review() == "2024-03-21T12:00:00.000Z", "Reviews use the custom long band");

  suite.require(is_ok(take(reset_level_requirements())), "Requirements reset");
  suite.require(due_after_known_review() == "2024-03-21T12:00:00.000Z",
                "Resetting requirements keeps the custom intervals");

  const nlohmann::json inverted = {{"short_hours", {100, 200, 300, 400, 500, 600}}};
  suite.require(is_error(call(set_review_intervals, inverted), "short < medium < long"),
                "Out-of-order bands are rejected");
  suite.require(due_after_known_review() == "2024-03-21T12:00:00.000Z", "Rejected intervals leave the engine as is");

  suite.require(is_ok(call(set_review_intervals, nlohmann::json::object())), "Empty intervals restore defaults");
  suite.require(due_after_known_review() == "2024-03-20T12:00:00.000Z", "Default long band is back");
}

} // namespace

int main() {
  TestSuite suite;

  test_envelopes(suite);
  test_assessment_calls(suite);
  test_review_calls(suite);
  test_scoring_calls(suite);
  test_configuration_calls(suite);

  if (!suite.ok) {
    std::cerr << "Bridge tests FAILED" << std::endl;
    return 1;
  }

  std::cout << "Bridge tests passed" << std::endl;
  return 0;
}
