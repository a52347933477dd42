#pragma once

#include "lingo/level_table.hpp"

#include <string_view>

namespace lingo::builtin::LevelRequirements {

inline constexpr std::string_view name = "level_requirements";

// Rows A1..C2, columns reading, listening, speaking, writing.
// {accuracy threshold, minimum graded attempts}
inline const LevelRequirementTable::Grid& grid() {
  static const LevelRequirementTable::Grid table = {{
      {{{60.0, 10}, {55.0, 10}, {50.0, 5}, {45.0, 5}}},
      {{{70.0, 15}, {65.0, 15}, {60.0, 10}, {55.0, 8}}},
      {{{75.0, 20}, {70.0, 20}, {65.0, 15}, {60.0, 12}}},
      {{{80.0, 25}, {75.0, 25}, {70.0, 20}, {65.0, 15}}},
      {{{85.0, 30}, {80.0, 30}, {75.0, 25}, {70.0, 20}}},
      {{{90.0, 35}, {85.0, 35}, {80.0, 30}, {75.0, 25}}},
  }};
  return table;
}

} // namespace lingo::builtin::LevelRequirements
