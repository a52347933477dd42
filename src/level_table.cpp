#include "lingo/level_table.hpp"

#include "resources/builtin_level_requirements.hpp"
#include "debug_log.hpp"

#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>

namespace lingo {
namespace {

double json_to_double(const nlohmann::json& value, const std::string& key) {
  if (!value.is_number()) {
    throw std::invalid_argument("Expected number for field '" + key + "'");
  }
  return value.get<double>();
}

int json_to_int(const nlohmann::json& value, const std::string& key) {
  if (!value.is_number_integer()) {
    throw std::invalid_argument("Expected integer for field '" + key + "'");
  }
  return value.get<int>();
}

} // namespace

LevelRequirementTable::LevelRequirementTable(const Grid& grid) : grid_(grid) {
  validate();
}

const LevelRequirementTable& LevelRequirementTable::builtin() {
  static const LevelRequirementTable table(::lingo::builtin::LevelRequirements::grid());
  return table;
}

void LevelRequirementTable::validate() const {
  for (CefrLevel level : kCefrLevels) {
    for (SkillModule module : kSkillModules) {
      const auto& req = at(level, module);
      const std::string where = to_string(level) + "/" + to_string(module);
      if (req.accuracy < 0.0 || req.accuracy > 100.0) {
        throw std::invalid_argument("Level requirement " + where + ": accuracy must be within [0, 100]");
      }
      if (req.minimum_attempts < 0) {
        throw std::invalid_argument("Level requirement " + where + ": minimum attempts must be >= 0");
      }
      const auto next = next_level(level);
      if (!next) {
        continue;
      }
      const auto& upper = at(*next, module);
      if (upper.accuracy < req.accuracy || upper.minimum_attempts < req.minimum_attempts) {
        throw std::invalid_argument("Level requirement " + to_string(*next) + "/" + to_string(module) +
                                    " is lower than " + where);
      }
    }
  }
}

bool LevelRequirementTable::operator==(const LevelRequirementTable& other) const {
  for (CefrLevel level : kCefrLevels) {
    for (SkillModule module : kSkillModules) {
      const auto& a = at(level, module);
      const auto& b = other.at(level, module);
      if (a.accuracy != b.accuracy || a.minimum_attempts != b.minimum_attempts) {
        return false;
      }
    }
  }
  return true;
}

LevelRequirementTable level_requirements_from_json(const nlohmann::json& document) {
  if (!document.is_object()) {
    throw std::invalid_argument("Level requirement table must be a JSON object");
  }
  LevelRequirementTable::Grid grid{};
  for (CefrLevel level : kCefrLevels) {
    const std::string level_key = to_string(level);
    if (!document.contains(level_key) || !document.at(level_key).is_object()) {
      throw std::invalid_argument("Level requirement table is missing level '" + level_key + "'");
    }
    const auto& row = document.at(level_key);
    for (SkillModule module : kSkillModules) {
      const std::string module_key = to_string(module);
      if (!row.contains(module_key) || !row.at(module_key).is_object()) {
        throw std::invalid_argument("Level requirement table is missing '" + level_key + "." +
                                    module_key + "'");
      }
      const auto& cell = row.at(module_key);
      const std::string prefix = level_key + "." + module_key + ".";
      if (!cell.contains("accuracy") || !cell.contains("min_attempts")) {
        throw std::invalid_argument("Level requirement '" + level_key + "." + module_key +
                                    "' needs accuracy and min_attempts");
      }
      auto& req = grid[level_index(level)][module_index(module)];
      req.accuracy = json_to_double(cell.at("accuracy"), prefix + "accuracy");
      req.minimum_attempts = json_to_int(cell.at("min_attempts"), prefix + "min_attempts");
    }
  }
  return LevelRequirementTable(grid);
}

nlohmann::json to_json(const LevelRequirementTable& table) {
  nlohmann::json document = nlohmann::json::object();
  for (CefrLevel level : kCefrLevels) {
    nlohmann::json row = nlohmann::json::object();
    for (SkillModule module : kSkillModules) {
      const auto& req = table.at(level, module);
      row[to_string(module)] = {{"accuracy", req.accuracy}, {"min_attempts", req.minimum_attempts}};
    }
    document[to_string(level)] = std::move(row);
  }
  return document;
}

LevelRequirementTable load_level_requirements(const std::filesystem::path& path) {
  if (!std::filesystem::exists(path)) {
    throw std::runtime_error("Level requirement table not found at: " + path.string());
  }
  if (path.extension() != ".json") {
    throw std::runtime_error("Level requirement table must be JSON: " + path.string());
  }
  std::ifstream stream(path);
  if (!stream) {
    throw std::runtime_error("Failed to open level requirement table: " + path.string());
  }
  std::string content((std::istreambuf_iterator<char>(stream)), std::istreambuf_iterator<char>());
  nlohmann::json document;
  try {
    document = nlohmann::json::parse(content);
  } catch (const nlohmann::json::parse_error& e) {
    throw std::invalid_argument("Level requirement table is not valid JSON: " + std::string(e.what()));
  }
  auto table = level_requirements_from_json(document);
  debug_log("config", "loaded level requirements from " + path.string());
  return table;
}

} // namespace lingo
