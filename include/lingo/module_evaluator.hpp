#pragma once

#include "level_table.hpp"
#include "record_aggregator.hpp"
#include "types.hpp"

#include <vector>

namespace lingo {

// Maps one skill's aggregate onto the CEFR grid. The aggregate is expected
// to be built from that skill's records only (see the module overload of
// aggregate()).
ModuleAssessment evaluate(SkillModule module,
                          const AggregateResult& stats,
                          const LevelRequirementTable& table);

// Highest level L such that every level up to L is met. A1 is the floor.
CefrLevel determine_level(SkillModule module,
                          double accuracy,
                          int attempts,
                          const LevelRequirementTable& table);

// 0-100; bottlenecked by the dimension furthest from the requirement.
double requirement_progress(double accuracy, int attempts, const LevelRequirement& requirement);

// Compares the mean of the newest kTrendWindow accuracies with the mean of
// the kTrendWindow before them. Input is chronological.
Trend recent_trend(const std::vector<double>& chronological_accuracies);

} // namespace lingo
