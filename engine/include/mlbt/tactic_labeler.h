#pragma once

#include "mlbt/situation.h"
#include "mlbt/tactic_taxonomy.h"
#include "mlbt/feature_table.h"
#include <string>
#include <utility>
#include <vector>

namespace mlbt {

// Heuristic tactic scores for one play. Scores are un-normalized: they do not
// sum to 1 and the fallback entry is 100.
struct TacticLabel {
    std::vector<std::pair<std::string, double>> probabilities;  // taxonomy order
    std::string primary;
};

constexpr const char* FALLBACK_TACTIC = "contact_hitting";
constexpr double FALLBACK_SCORE = 100.0;

bool clauseMatches(const ContextClause& clause, const SituationRecord& rec);

// Fraction of the tactic's context clauses the record satisfies
double contextMatchFraction(const TacticDef& def, const SituationRecord& rec);

TacticLabel labelSituation(const SituationRecord& rec);

// Label every record; rows labeled "other" are dropped.
TrainingSet buildTrainingSet(const std::vector<SituationRecord>& records);

} // namespace mlbt
