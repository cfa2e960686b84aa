#include "mlbt/tactic_labeler.h"

namespace mlbt {

namespace {

constexpr double BASE_SCORE = 0.4;
constexpr double CONTEXT_SCORE = 0.6;
constexpr double MIN_SCORE = 0.05;
constexpr double HIGH_PRESSURE = 1.5;

double situationalMultiplier(Tactic t, const SituationRecord& rec) {
    if (rec.pressureIndex < HIGH_PRESSURE) return 1.0;
    switch (t) {
        case Tactic::POWER_HITTING:
        case Tactic::PATIENT_HITTING:
            return 1.2;
        case Tactic::CONTACT_HITTING:
        case Tactic::DEFENSIVE_OUTS:
            return 1.1;
        default:
            return 1.0;
    }
}

double playerQualityMultiplier(Tactic t, const SituationRecord& rec) {
    double m = 1.0;

    if (rec.hasBatterStats) {
        if (t == Tactic::POWER_HITTING && rec.batter.ops > 0.800) m *= 1.2;
        else if (t == Tactic::CONTACT_HITTING && rec.batter.avg > 0.300) m *= 1.1;
    }

    if (rec.hasPitcherStats) {
        if (t == Tactic::STRIKEOUT_PITCHING && rec.pitcher.kPer9 > 9.0) m *= 1.2;
        else if (t == Tactic::DEFENSIVE_OUTS && rec.pitcher.groundBallRate > 0.5) m *= 1.1;
    }

    // Matchup history only counts with a meaningful sample
    if (rec.hasMatchupStats && rec.matchup.atBats > 10) {
        if (rec.matchup.ops > 0.800) {
            if (t == Tactic::POWER_HITTING || t == Tactic::CONTACT_HITTING) m *= 1.15;
        } else if (rec.matchup.ops < 0.600) {
            if (t == Tactic::DEFENSIVE_OUTS || t == Tactic::STRIKEOUT_PITCHING) m *= 1.15;
        }
    }
    return m;
}

TacticLabel fallbackLabel() {
    TacticLabel label;
    label.probabilities.emplace_back(FALLBACK_TACTIC, FALLBACK_SCORE);
    label.primary = FALLBACK_TACTIC;
    return label;
}

} // anonymous namespace

bool clauseMatches(const ContextClause& c, const SituationRecord& rec) {
    using K = ContextClause::Kind;
    switch (c.kind) {
        case K::MIN_RUNNERS:        return rec.runners.numRunners >= c.value;
        case K::MAX_OUTS:           return rec.outs <= c.value;
        case K::SCORING_POSITION:   return rec.runners.scoringPosition == (c.value != 0.0);
        case K::MIN_PRESSURE:       return rec.pressureIndex >= c.value;
        case K::MAX_PRESSURE:       return rec.pressureIndex <= c.value;
        case K::SCORE_DIFF_RANGE:   return rec.scoreDiff >= c.value && rec.scoreDiff <= c.upper;
        case K::MIN_BALLS:          return rec.balls >= c.value;
        case K::MAX_STRIKES:        return rec.strikes <= c.value;
        case K::MIN_STRIKES:        return rec.strikes >= c.value;
        case K::MIN_OFFENSIVE_OPPORTUNITY: return rec.offensiveOpportunity >= c.value;
        case K::MIN_DEFENSIVE_PRESSURE:    return rec.defensivePressure >= c.value;
    }
    return false;
}

double contextMatchFraction(const TacticDef& def, const SituationRecord& rec) {
    if (def.contexts.empty()) return 0.0;
    int matched = 0;
    for (const auto& c : def.contexts) {
        if (clauseMatches(c, rec)) matched++;
    }
    return static_cast<double>(matched) / def.contexts.size();
}

TacticLabel labelSituation(const SituationRecord& rec) {
    const auto& candidates = tacticsForAction(rec.result);
    if (candidates.empty()) return fallbackLabel();

    TacticLabel label;
    for (Tactic t : candidates) {
        const TacticDef& def = tacticDef(t);

        double score = BASE_SCORE + CONTEXT_SCORE * contextMatchFraction(def, rec);
        score *= situationalMultiplier(t, rec);
        score *= playerQualityMultiplier(t, rec);

        if (score < MIN_SCORE) continue;
        label.probabilities.emplace_back(def.name, score);
    }

    if (label.probabilities.empty()) return fallbackLabel();

    // Strict comparison keeps the earliest tactic on ties
    const auto* best = &label.probabilities.front();
    for (const auto& p : label.probabilities) {
        if (p.second > best->second) best = &p;
    }
    label.primary = best->first;
    return label;
}

TrainingSet buildTrainingSet(const std::vector<SituationRecord>& records) {
    TrainingSet set;
    set.rows.reserve(records.size());
    set.labels.reserve(records.size());
    for (const auto& rec : records) {
        TacticLabel label = labelSituation(rec);
        if (label.primary == "other") continue;
        set.rows.push_back(featureRow(rec));
        set.labels.push_back(label.primary);
    }
    return set;
}

} // namespace mlbt
