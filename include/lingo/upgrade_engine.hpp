#pragma once

#include "level_table.hpp"
#include "types.hpp"

#include <array>
#include <string>
#include <vector>

namespace lingo {

using ModuleAssessments = std::array<ModuleAssessment, 4>;

// Combines the four per-skill assessments, one per skill in any order. The
// result lists them by module_index(); the level is the weakest skill's
// level and an upgrade needs every skill at 100 % progress.
ProficiencyAssessment decide(const ModuleAssessments& modules);

// As above, and fills level_upgrade.requirements against the table row of
// the next overall level.
ProficiencyAssessment decide(const ModuleAssessments& modules, const LevelRequirementTable& table);

// One status per skill measured against `target`.
std::vector<RequirementStatus> upgrade_requirements(const ModuleAssessments& modules,
                                                    CefrLevel target,
                                                    const LevelRequirementTable& table);

// At most five short study hints.
std::vector<std::string> recommendations(const ProficiencyAssessment& assessment);

} // namespace lingo
