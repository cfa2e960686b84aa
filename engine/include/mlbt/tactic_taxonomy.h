#pragma once

#include "mlbt/enums.h"
#include <cstdint>
#include <string>
#include <vector>

namespace mlbt {

// One threshold condition of a tactic's context predicate.
struct ContextClause {
    enum class Kind : uint8_t {
        MIN_RUNNERS, MAX_OUTS, SCORING_POSITION,
        MIN_PRESSURE, MAX_PRESSURE, SCORE_DIFF_RANGE,
        MIN_BALLS, MAX_STRIKES, MIN_STRIKES,
        MIN_OFFENSIVE_OPPORTUNITY, MIN_DEFENSIVE_PRESSURE
    };

    Kind kind;
    double value = 0.0;   // threshold, or lower bound for SCORE_DIFF_RANGE
    double upper = 0.0;   // upper bound for SCORE_DIFF_RANGE
};

struct TacticDef {
    Tactic tactic;
    TacticCategory category;
    const char* name;
    std::vector<std::string> actions;
    std::vector<ContextClause> contexts;
};

// Static registry, built once, never mutated. Ordered by category then tactic.
const std::vector<TacticDef>& tacticTaxonomy();

const TacticDef& tacticDef(Tactic t);
const char* tacticName(Tactic t);
bool tacticFromName(const std::string& name, Tactic& out);

// Candidate tactics for an outcome action, in taxonomy order (empty if unmapped)
const std::vector<Tactic>& tacticsForAction(const std::string& action);

// First vocabulary bucket containing the action (HITTING, BASERUNNING, FIELDING)
ActionGroup actionGroup(const std::string& action);
bool isKnownAction(const std::string& action);

// Category name for a tactic name; "OTHER" for names outside the taxonomy
std::string categoryOfTacticName(const std::string& name);

// Per-tactic momentum sensitivity (0.1 when unmapped)
double momentumWeight(const std::string& tacticName);

} // namespace mlbt
