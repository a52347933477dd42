#pragma once

#include "types.hpp"

#include <array>
#include <filesystem>

#include <nlohmann/json.hpp>

namespace lingo {

struct LevelRequirement {
  double accuracy = 0.0;     // 0-100
  int minimum_attempts = 0;
};

// Static CEFR x module threshold grid. Immutable once constructed; the
// constructor rejects out-of-range values and thresholds that decrease as
// the level rises.
class LevelRequirementTable {
public:
  using Row = std::array<LevelRequirement, 4>;
  using Grid = std::array<Row, 6>;

  explicit LevelRequirementTable(const Grid& grid);

  static const LevelRequirementTable& builtin();

  const LevelRequirement& at(CefrLevel level, SkillModule module) const noexcept {
    return grid_[level_index(level)][module_index(module)];
  }

  const Grid& grid() const noexcept { return grid_; }

  bool operator==(const LevelRequirementTable& other) const;
  bool operator!=(const LevelRequirementTable& other) const { return !(*this == other); }

private:
  void validate() const;

  Grid grid_{};
};

LevelRequirementTable level_requirements_from_json(const nlohmann::json& document);
nlohmann::json to_json(const LevelRequirementTable& table);

// Reads a JSON table from disk. Throws std::runtime_error when the file is
// missing or not JSON, std::invalid_argument when the content is invalid.
LevelRequirementTable load_level_requirements(const std::filesystem::path& path);

} // namespace lingo
