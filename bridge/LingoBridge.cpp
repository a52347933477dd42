#include "LingoBridge.h"

#include <chrono>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "../include/lingo/assessment_engine.hpp"
#include "../include/lingo/level_table.hpp"
#include "../src/json_bridge.hpp"

namespace {

struct EngineState {
  std::mutex mutex;
  std::unique_ptr<lingo::AssessmentEngine> engine;
};

EngineState& state() {
  static EngineState instance;
  return instance;
}

lingo::AssessmentEngine& ensure_engine() {
  auto& s = state();
  if (!s.engine) {
    s.engine = lingo::make_engine();
  }
  return *s.engine;
}

char* copy_string(const std::string& value) {
  char* buffer = static_cast<char*>(std::malloc(value.size() + 1));
  if (!buffer) {
    return nullptr;
  }
  std::memcpy(buffer, value.c_str(), value.size());
  buffer[value.size()] = '\0';
  return buffer;
}

char* copy_json(const nlohmann::json& json) {
  return copy_string(json.dump());
}

nlohmann::json ok_envelope() {
  nlohmann::json payload = nlohmann::json::object();
  payload["status"] = "ok";
  return payload;
}

nlohmann::json error_envelope(const std::string& message) {
  nlohmann::json payload = nlohmann::json::object();
  payload["status"] = "error";
  payload["message"] = message;
  return payload;
}

nlohmann::json parse_request(const char* request_json) {
  if (!request_json) {
    throw std::invalid_argument("Missing request json");
  }
  auto request = nlohmann::json::parse(request_json);
  if (!request.is_object()) {
    throw std::invalid_argument("Request must be a JSON object");
  }
  return request;
}

const nlohmann::json& field(const nlohmann::json& request, const char* key) {
  if (!request.contains(key)) {
    throw std::invalid_argument("Missing required field '" + std::string(key) + "'");
  }
  return request.at(key);
}

lingo::Timestamp request_now(const nlohmann::json& request) {
  if (request.contains("now") && !request.at("now").is_null()) {
    return lingo::bridge::timestamp_from_json(request.at("now"), "now");
  }
  return std::chrono::system_clock::now();
}

nlohmann::json assessment_payload(const lingo::AssessmentEngine& engine,
                                  const lingo::ProficiencyAssessment& assessment) {
  nlohmann::json payload = ok_envelope();
  payload["assessment"] = lingo::bridge::to_json(assessment);
  nlohmann::json hints = nlohmann::json::array();
  for (const auto& hint : engine.recommendations(assessment)) {
    hints.push_back(hint);
  }
  payload["recommendations"] = std::move(hints);
  return payload;
}

} // namespace

extern "C" {

char* assess_proficiency(const char* request_json) {
  try {
    const auto request = parse_request(request_json);
    const auto records = lingo::bridge::activity_records_from_json(field(request, "records"));
    const auto window = lingo::bridge::aggregate_window_from_json(field(request, "window"));
    auto& s = state();
    std::scoped_lock guard(s.mutex);
    auto& engine = ensure_engine();
    return copy_json(assessment_payload(engine, engine.assess(records, window)));
  } catch (const std::exception& ex) {
    return copy_json(error_envelope(ex.what()));
  }
}

char* decide_upgrade(const char* request_json) {
  try {
    const auto request = parse_request(request_json);
    const auto modules = lingo::bridge::module_assessments_from_json(field(request, "modules"));
    auto& s = state();
    std::scoped_lock guard(s.mutex);
    auto& engine = ensure_engine();
    return copy_json(assessment_payload(engine, engine.decide(modules)));
  } catch (const std::exception& ex) {
    return copy_json(error_envelope(ex.what()));
  }
}

char* learner_statistics(const char* request_json) {
  try {
    const auto request = parse_request(request_json);
    const auto records = lingo::bridge::activity_records_from_json(field(request, "records"));
    std::vector<lingo::VocabularyEntry> vocabulary;
    if (request.contains("vocabulary")) {
      vocabulary = lingo::bridge::vocabulary_from_json(request.at("vocabulary"));
    }
    const auto window = lingo::bridge::aggregate_window_from_json(field(request, "window"));
    auto& s = state();
    std::scoped_lock guard(s.mutex);
    nlohmann::json payload = ok_envelope();
    payload["statistics"] = lingo::bridge::to_json(ensure_engine().statistics(records, vocabulary, window));
    return copy_json(payload);
  } catch (const std::exception& ex) {
    return copy_json(error_envelope(ex.what()));
  }
}

char* review_word(const char* request_json) {
  try {
    const auto request = parse_request(request_json);
    const auto entry = lingo::bridge::vocabulary_entry_from_json(field(request, "entry"));
    const auto& outcome_json = field(request, "outcome");
    if (!outcome_json.is_string()) {
      throw std::invalid_argument("Expected string for field 'outcome'");
    }
    const auto outcome = lingo::review_outcome_from_string(outcome_json.get<std::string>());
    const auto now = request_now(request);
    auto& s = state();
    std::scoped_lock guard(s.mutex);
    const auto transition = ensure_engine().review(entry, outcome, now);
    nlohmann::json payload = ok_envelope();
    payload["entry"] = lingo::bridge::to_json(transition.entry);
    payload["warnings"] = lingo::bridge::to_json(transition)["warnings"];
    return copy_json(payload);
  } catch (const std::exception& ex) {
    return copy_json(error_envelope(ex.what()));
  }
}

char* review_queue(const char* request_json) {
  try {
    const auto request = parse_request(request_json);
    const auto entries = lingo::bridge::vocabulary_from_json(field(request, "entries"));
    std::size_t limit = 0;
    if (request.contains("limit") && !request.at("limit").is_null()) {
      if (!request.at("limit").is_number_unsigned()) {
        throw std::invalid_argument("Expected non-negative integer for field 'limit'");
      }
      limit = request.at("limit").get<std::size_t>();
    }
    const auto now = request_now(request);
    auto& s = state();
    std::scoped_lock guard(s.mutex);
    nlohmann::json queue = nlohmann::json::array();
    for (const auto& entry : ensure_engine().review_queue(entries, now, limit)) {
      queue.push_back(lingo::bridge::to_json(entry));
    }
    nlohmann::json payload = ok_envelope();
    payload["entries"] = std::move(queue);
    return copy_json(payload);
  } catch (const std::exception& ex) {
    return copy_json(error_envelope(ex.what()));
  }
}

char* score_pronunciation(const char* request_json) {
  try {
    const auto request = parse_request(request_json);
    const auto& original = field(request, "original");
    const auto& spoken = field(request, "spoken");
    const auto& confidence = field(request, "confidence");
    if (!original.is_string() || !spoken.is_string()) {
      throw std::invalid_argument("Expected strings for fields 'original' and 'spoken'");
    }
    if (!confidence.is_number()) {
      throw std::invalid_argument("Expected number for field 'confidence'");
    }
    auto& s = state();
    std::scoped_lock guard(s.mutex);
    const auto result = ensure_engine().score_pronunciation(
        original.get<std::string>(), spoken.get<std::string>(), confidence.get<double>());
    nlohmann::json payload = ok_envelope();
    payload["score"] = lingo::bridge::to_json(result);
    return copy_json(payload);
  } catch (const std::exception& ex) {
    return copy_json(error_envelope(ex.what()));
  }
}

char* score_writing(const char* request_json) {
  try {
    const auto request = parse_request(request_json);
    const auto& content = field(request, "content");
    if (!content.is_string()) {
      throw std::invalid_argument("Expected string for field 'content'");
    }
    const auto task = lingo::bridge::writing_task_from_json(
        request.contains("task") ? request.at("task") : nlohmann::json(nullptr));
    auto& s = state();
    std::scoped_lock guard(s.mutex);
    nlohmann::json payload = ok_envelope();
    payload["score"] = lingo::bridge::to_json(ensure_engine().score_writing(content.get<std::string>(), task));
    return copy_json(payload);
  } catch (const std::exception& ex) {
    return copy_json(error_envelope(ex.what()));
  }
}

char* load_level_requirements(const char* path) {
  if (!path) {
    return copy_json(error_envelope("Missing level requirements path"));
  }
  try {
    auto table = lingo::load_level_requirements(path);
    auto& s = state();
    std::scoped_lock guard(s.mutex);
    const auto intervals = ensure_engine().review_intervals();
    s.engine = lingo::make_engine(std::move(table), intervals);
    nlohmann::json payload = ok_envelope();
    payload["level_requirements"] = lingo::to_json(s.engine->level_requirements());
    return copy_json(payload);
  } catch (const std::exception& ex) {
    return copy_json(error_envelope(ex.what()));
  }
}

char* reset_level_requirements(void) {
  auto& s = state();
  std::scoped_lock guard(s.mutex);
  try {
    const auto intervals = ensure_engine().review_intervals();
    s.engine = lingo::make_engine(lingo::LevelRequirementTable::builtin(), intervals);
    return copy_json(ok_envelope());
  } catch (const std::exception& ex) {
    return copy_json(error_envelope(ex.what()));
  }
}

char* set_review_intervals(const char* request_json) {
  try {
    auto intervals = lingo::bridge::review_intervals_from_json(parse_request(request_json));
    auto& s = state();
    std::scoped_lock guard(s.mutex);
    auto table = ensure_engine().level_requirements();
    s.engine = lingo::make_engine(std::move(table), std::move(intervals));
    nlohmann::json payload = ok_envelope();
    payload["review_intervals"] = lingo::bridge::to_json(s.engine->review_intervals());
    return copy_json(payload);
  } catch (const std::exception& ex) {
    return copy_json(error_envelope(ex.what()));
  }
}

char* capabilities(void) {
  auto& s = state();
  std::scoped_lock guard(s.mutex);
  try {
    nlohmann::json payload = ok_envelope();
    payload["capabilities"] = ensure_engine().capabilities();
    return copy_json(payload);
  } catch (const std::exception& ex) {
    return copy_json(error_envelope(ex.what()));
  }
}

void free_string(char* ptr) {
  if (ptr != nullptr) {
    std::free(ptr);
  }
}

} // extern "C"
