#include "mlbt/recommendations.h"
#include "mlbt/tactic_taxonomy.h"
#include <algorithm>
#include <cstdlib>

namespace mlbt {

ContextAnalysis analyzeContext(const SituationRecord& rec) {
    ContextAnalysis ctx;
    ctx.inning = rec.inning;
    ctx.outs = rec.outs;
    ctx.scoreDiff = rec.scoreDiff;
    ctx.pressureIndex = round2(rec.pressureIndex);
    ctx.runners = rec.runners.numRunners;
    ctx.scoringPosition = rec.runners.scoringPosition;
    return ctx;
}

std::string recommendationReasoning(const std::string& tactic, const ContextAnalysis& ctx) {
    std::vector<std::string> reasons;

    if (ctx.inning >= 7) reasons.push_back("Late game situation");
    if (ctx.pressureIndex > 1.5) reasons.push_back("High pressure situation");
    if (ctx.scoringPosition) reasons.push_back("Runners in scoring position");

    if (std::abs(ctx.scoreDiff) <= 2) reasons.push_back("Close game");
    else if (ctx.scoreDiff > 0) reasons.push_back("Leading by multiple runs");
    else reasons.push_back("Trailing by multiple runs");

    Tactic t;
    if (tacticFromName(tactic, t)) {
        TacticCategory cat = tacticDef(t).category;
        if (cat == TacticCategory::OFFENSIVE && ctx.scoringPosition) {
            reasons.push_back("Good opportunity for run scoring");
        } else if (cat == TacticCategory::DEFENSIVE && ctx.pressureIndex > 1.5) {
            reasons.push_back("Critical defensive situation");
        }
    }

    if (reasons.empty()) return "Based on general game situation";
    std::string out = reasons[0];
    for (size_t i = 1; i < reasons.size(); ++i) out += " | " + reasons[i];
    return out;
}

std::vector<std::string> specificActions(const std::string& tactic) {
    Tactic t;
    if (!tacticFromName(tactic, t)) return {};
    return tacticDef(t).actions;
}

std::vector<TacticScore> topTactics(const ProbabilityTable& table, size_t n) {
    std::vector<TacticScore> all;
    for (const auto& cat : table) {
        all.insert(all.end(), cat.tactics.begin(), cat.tactics.end());
    }
    std::stable_sort(all.begin(), all.end(),
                     [](const TacticScore& a, const TacticScore& b) { return a.value > b.value; });
    if (all.size() > n) all.resize(n);
    return all;
}

std::vector<Recommendation> buildRecommendations(const std::vector<TacticScore>& top,
                                                 const ContextAnalysis& ctx) {
    std::vector<Recommendation> recs;
    recs.reserve(top.size());
    for (const auto& t : top) {
        Recommendation r;
        r.tactic = t.tactic;
        r.probability = t.value;
        r.reasoning = recommendationReasoning(t.tactic, ctx);
        r.actions = specificActions(t.tactic);
        recs.push_back(std::move(r));
    }
    return recs;
}

} // namespace mlbt
