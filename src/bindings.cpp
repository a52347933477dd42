#include "../include/lingo/assessment_engine.hpp"
#include "../include/lingo/level_table.hpp"

#include "json_bridge.hpp"
#include "utils/iso8601.hpp"

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <utility>

namespace py = pybind11;

namespace {

nlohmann::json py_to_json(py::handle handle) {
  if (handle.is_none()) {
    return nullptr;
  }
  if (py::isinstance<py::bool_>(handle)) {
    return handle.cast<bool>();
  }
  if (py::isinstance<py::int_>(handle)) {
    return static_cast<long long>(handle.cast<long long>());
  }
  if (py::isinstance<py::float_>(handle)) {
    return handle.cast<double>();
  }
  if (py::isinstance<py::str>(handle)) {
    return handle.cast<std::string>();
  }
  if (py::isinstance<py::dict>(handle)) {
    nlohmann::json json_obj = nlohmann::json::object();
    for (auto item : handle.cast<py::dict>()) {
      auto key = py::cast<std::string>(item.first);
      json_obj[key] = py_to_json(item.second);
    }
    return json_obj;
  }
  if (py::isinstance<py::list>(handle) || py::isinstance<py::tuple>(handle)) {
    nlohmann::json json_array = nlohmann::json::array();
    for (auto item : handle.cast<py::sequence>()) {
      json_array.push_back(py_to_json(item));
    }
    return json_array;
  }
  throw std::runtime_error("Unsupported Python type for JSON conversion");
}

py::object json_to_py(const nlohmann::json& json_value) {
  if (json_value.is_null()) {
    return py::none();
  }
  if (json_value.is_boolean()) {
    return py::bool_(json_value.get<bool>());
  }
  if (json_value.is_number_integer()) {
    return py::int_(json_value.get<long long>());
  }
  if (json_value.is_number_float()) {
    return py::float_(json_value.get<double>());
  }
  if (json_value.is_string()) {
    return py::str(json_value.get<std::string>());
  }
  if (json_value.is_array()) {
    py::list list;
    for (const auto& element : json_value) {
      list.append(json_to_py(element));
    }
    return list;
  }
  if (json_value.is_object()) {
    py::dict dict;
    for (const auto& entry : json_value.items()) {
      dict[py::str(entry.key())] = json_to_py(entry.value());
    }
    return dict;
  }
  throw std::runtime_error("Unhandled JSON type");
}

lingo::Timestamp now_or(const std::string& iso_now) {
  if (iso_now.empty()) {
    return std::chrono::system_clock::now();
  }
  return lingo::parse_iso8601(iso_now);
}

class PyAssessmentEngine {
public:
  PyAssessmentEngine() : engine_(lingo::make_engine()) {}

  explicit PyAssessmentEngine(const std::string& requirements_path)
      : engine_(lingo::make_engine(lingo::load_level_requirements(requirements_path),
                                   lingo::ReviewIntervals::defaults())) {}

  py::object assess(py::object records_obj, py::object window_obj) const {
    const auto records = lingo::bridge::activity_records_from_json(py_to_json(records_obj));
    const auto window = lingo::bridge::aggregate_window_from_json(py_to_json(window_obj));
    const auto assessment = engine_->assess(records, window);
    auto result = lingo::bridge::to_json(assessment);
    nlohmann::json hints = nlohmann::json::array();
    for (const auto& hint : engine_->recommendations(assessment)) {
      hints.push_back(hint);
    }
    result["recommendations"] = std::move(hints);
    return json_to_py(result);
  }

  py::object decide(py::object modules_obj) const {
    const auto assessment = engine_->decide(lingo::bridge::module_assessments_from_json(py_to_json(modules_obj)));
    auto result = lingo::bridge::to_json(assessment);
    nlohmann::json hints = nlohmann::json::array();
    for (const auto& hint : engine_->recommendations(assessment)) {
      hints.push_back(hint);
    }
    result["recommendations"] = std::move(hints);
    return json_to_py(result);
  }

  py::object statistics(py::object records_obj, py::object vocabulary_obj, py::object window_obj) const {
    const auto records = lingo::bridge::activity_records_from_json(py_to_json(records_obj));
    const auto vocabulary = lingo::bridge::vocabulary_from_json(py_to_json(vocabulary_obj));
    const auto window = lingo::bridge::aggregate_window_from_json(py_to_json(window_obj));
    return json_to_py(lingo::bridge::to_json(engine_->statistics(records, vocabulary, window)));
  }

  py::object review(py::object entry_obj, const std::string& outcome, const std::string& now) const {
    const auto entry = lingo::bridge::vocabulary_entry_from_json(py_to_json(entry_obj));
    const auto transition =
        engine_->review(entry, lingo::review_outcome_from_string(outcome), now_or(now));
    return json_to_py(lingo::bridge::to_json(transition));
  }

  py::object review_queue(py::object entries_obj, const std::string& now, std::size_t limit) const {
    const auto entries = lingo::bridge::vocabulary_from_json(py_to_json(entries_obj));
    nlohmann::json queue = nlohmann::json::array();
    for (const auto& entry : engine_->review_queue(entries, now_or(now), limit)) {
      queue.push_back(lingo::bridge::to_json(entry));
    }
    return json_to_py(queue);
  }

  py::object score_pronunciation(const std::string& original, const std::string& spoken, double confidence) const {
    return json_to_py(lingo::bridge::to_json(engine_->score_pronunciation(original, spoken, confidence)));
  }

  py::object score_writing(const std::string& content, py::object task_obj) const {
    const auto task = lingo::bridge::writing_task_from_json(py_to_json(task_obj));
    return json_to_py(lingo::bridge::to_json(engine_->score_writing(content, task)));
  }

  py::object level_requirements() const {
    return json_to_py(lingo::to_json(engine_->level_requirements()));
  }

  py::object review_intervals() const {
    return json_to_py(lingo::bridge::to_json(engine_->review_intervals()));
  }

  py::object capabilities() const {
    return json_to_py(engine_->capabilities());
  }

  // Missing bands fall back to the defaults; the level table is kept.
  void set_review_intervals(py::object intervals_obj) {
    auto intervals = lingo::bridge::review_intervals_from_json(py_to_json(intervals_obj));
    engine_ = lingo::make_engine(engine_->level_requirements(), std::move(intervals));
  }

private:
  std::unique_ptr<lingo::AssessmentEngine> engine_;
};

} // namespace

PYBIND11_MODULE(_lingocore, m) {
  py::class_<PyAssessmentEngine>(m, "AssessmentEngine")
      .def(py::init<>())
      .def(py::init<const std::string&>(), py::arg("requirements_path"))
      .def("assess", &PyAssessmentEngine::assess, py::arg("records"), py::arg("window"))
      .def("decide", &PyAssessmentEngine::decide, py::arg("modules"))
      .def("statistics", &PyAssessmentEngine::statistics,
           py::arg("records"), py::arg("vocabulary"), py::arg("window"))
      .def("review", &PyAssessmentEngine::review,
           py::arg("entry"), py::arg("outcome"), py::arg("now") = std::string())
      .def("review_queue", &PyAssessmentEngine::review_queue,
           py::arg("entries"), py::arg("now") = std::string(), py::arg("limit") = 0)
      .def("score_pronunciation", &PyAssessmentEngine::score_pronunciation,
           py::arg("original"), py::arg("spoken"), py::arg("confidence"))
      .def("score_writing", &PyAssessmentEngine::score_writing,
           py::arg("content"), py::arg("task") = py::none())
      .def("level_requirements", &PyAssessmentEngine::level_requirements)
      .def("review_intervals", &PyAssessmentEngine::review_intervals)
      .def("set_review_intervals", &PyAssessmentEngine::set_review_intervals, py::arg("intervals"))
      .def("capabilities", &PyAssessmentEngine::capabilities);

  m.def("format_timestamp", [](const std::string& iso) {
    return lingo::format_iso8601(lingo::parse_iso8601(iso));
  });
}
