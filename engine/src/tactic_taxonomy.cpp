#include "mlbt/tactic_taxonomy.h"
#include <stdexcept>
#include <unordered_map>

namespace mlbt {

namespace {

using K = ContextClause::Kind;

ContextClause clause(K kind, double value) {
    ContextClause c{kind};
    c.value = value;
    return c;
}

ContextClause range(K kind, double lo, double hi) {
    ContextClause c{kind};
    c.value = lo;
    c.upper = hi;
    return c;
}

struct Registry {
    std::vector<TacticDef> defs;
    std::unordered_map<std::string, std::vector<Tactic>> byAction;
    std::unordered_map<std::string, ActionGroup> groups;
    std::unordered_map<std::string, Tactic> byName;

    Registry() {
        defs = {
            // --- OFFENSIVE ---
            {Tactic::POWER_HITTING, TacticCategory::OFFENSIVE, "power_hitting",
             {"Home Run", "Double", "Triple"},
             {clause(K::MIN_RUNNERS, 1), clause(K::SCORING_POSITION, 1),
              clause(K::MIN_PRESSURE, 1.5)}},
            {Tactic::CONTACT_HITTING, TacticCategory::OFFENSIVE, "contact_hitting",
             {"Single", "Ground Ball"},
             {clause(K::MAX_PRESSURE, 1.5), clause(K::MAX_OUTS, 2)}},
            {Tactic::SMALL_BALL, TacticCategory::OFFENSIVE, "small_ball",
             {"Sac Bunt", "Sac Fly", "Bunt Groundout"},
             {range(K::SCORE_DIFF_RANGE, -2, 2), clause(K::MAX_OUTS, 1)}},
            {Tactic::PATIENT_HITTING, TacticCategory::OFFENSIVE, "patient_hitting",
             {"Walk", "Hit By Pitch", "Intent Walk"},
             {clause(K::MIN_BALLS, 2), clause(K::MAX_STRIKES, 1)}},

            // --- BASERUNNING ---
            {Tactic::AGGRESSIVE_BASERUNNING, TacticCategory::BASERUNNING, "aggressive_baserunning",
             {"Stolen Base 2B", "Stolen Base 3B", "Stolen Base Home", "Triple"},
             {clause(K::MAX_OUTS, 1), clause(K::MIN_OFFENSIVE_OPPORTUNITY, 1.0)}},
            {Tactic::CONSERVATIVE_BASERUNNING, TacticCategory::BASERUNNING, "conservative_baserunning",
             {"Pickoff", "Caught Stealing", "Pickoff Caught Stealing"},
             {clause(K::MIN_PRESSURE, 1.5)}},

            // --- DEFENSIVE ---
            {Tactic::DEFENSIVE_OUTS, TacticCategory::DEFENSIVE, "defensive_outs",
             {"Groundout", "Flyout", "Lineout", "Pop Out", "Forceout"},
             {clause(K::MIN_DEFENSIVE_PRESSURE, 1.0)}},
            {Tactic::STRIKEOUT_PITCHING, TacticCategory::DEFENSIVE, "strikeout_pitching",
             {"Strikeout", "Strikeout Double Play"},
             {clause(K::MIN_STRIKES, 2)}},
            {Tactic::DOUBLE_PLAY, TacticCategory::DEFENSIVE, "double_play",
             {"Double Play", "Grounded Into DP", "Triple Play"},
             {clause(K::MIN_RUNNERS, 1), clause(K::MAX_OUTS, 2)}},
            {Tactic::FIELD_DEFENSE, TacticCategory::DEFENSIVE, "field_defense",
             {"Field Error", "Pickoff", "Caught Stealing"},
             {clause(K::MIN_DEFENSIVE_PRESSURE, 1.5)}},
        };

        for (const auto& def : defs) {
            byName[def.name] = def.tactic;
            ActionGroup group = ActionGroup::FIELDING;
            if (def.category == TacticCategory::OFFENSIVE) group = ActionGroup::HITTING;
            else if (def.category == TacticCategory::BASERUNNING) group = ActionGroup::BASERUNNING;

            for (const auto& action : def.actions) {
                byAction[action].push_back(def.tactic);
                groups.emplace(action, group);  // first bucket wins
            }
        }
    }
};

const Registry& registry() {
    static const Registry r;
    return r;
}

} // anonymous namespace

const std::vector<TacticDef>& tacticTaxonomy() {
    return registry().defs;
}

const TacticDef& tacticDef(Tactic t) {
    int idx = static_cast<int>(t);
    if (idx < 0 || idx >= NUM_TACTICS) {
        throw std::out_of_range("tacticDef: invalid tactic");
    }
    return registry().defs[idx];
}

const char* tacticName(Tactic t) {
    return tacticDef(t).name;
}

bool tacticFromName(const std::string& name, Tactic& out) {
    const auto& byName = registry().byName;
    auto it = byName.find(name);
    if (it == byName.end()) return false;
    out = it->second;
    return true;
}

const std::vector<Tactic>& tacticsForAction(const std::string& action) {
    static const std::vector<Tactic> none;
    const auto& byAction = registry().byAction;
    auto it = byAction.find(action);
    return it == byAction.end() ? none : it->second;
}

ActionGroup actionGroup(const std::string& action) {
    const auto& groups = registry().groups;
    auto it = groups.find(action);
    return it == groups.end() ? ActionGroup::UNKNOWN : it->second;
}

bool isKnownAction(const std::string& action) {
    return actionGroup(action) != ActionGroup::UNKNOWN;
}

std::string categoryOfTacticName(const std::string& name) {
    Tactic t;
    if (!tacticFromName(name, t)) return "OTHER";
    return categoryName(tacticDef(t).category);
}

double momentumWeight(const std::string& tacticName) {
    // Unlisted tactics move with batting form at the default weight
    static const std::unordered_map<std::string, double> weights = {
        {"power_hitting", 0.15},
        {"small_ball", 0.1},
        {"patient_hitting", -0.1},
    };
    auto it = weights.find(tacticName);
    return it == weights.end() ? 0.1 : it->second;
}

} // namespace mlbt
