#pragma once

#include "mlbt/prediction_result.h"
#include "mlbt/situation.h"
#include <string>
#include <vector>

namespace mlbt {

ContextAnalysis analyzeContext(const SituationRecord& rec);

// Context checks joined with " | ":
// late game, high pressure, runners in scoring position, score margin,
// then a category-specific note for the tactic.
std::string recommendationReasoning(const std::string& tactic, const ContextAnalysis& ctx);

// Outcome actions the tactic is built from (empty outside the taxonomy)
std::vector<std::string> specificActions(const std::string& tactic);

// Highest n entries across all categories; stable for equal values
std::vector<TacticScore> topTactics(const ProbabilityTable& table, size_t n = 3);

std::vector<Recommendation> buildRecommendations(const std::vector<TacticScore>& top,
                                                 const ContextAnalysis& ctx);

} // namespace mlbt
