#include "mlbt/prediction_result.h"
#include <algorithm>
#include <iomanip>
#include <sstream>

namespace mlbt {

double tableValue(const ProbabilityTable& table, const std::string& tactic, double fallback) {
    for (const auto& cat : table) {
        for (const auto& t : cat.tactics) {
            if (t.tactic == tactic) return t.value;
        }
    }
    return fallback;
}

void sortCategories(ProbabilityTable& table) {
    for (auto& cat : table) {
        std::stable_sort(cat.tactics.begin(), cat.tactics.end(),
                         [](const TacticScore& a, const TacticScore& b) { return a.value > b.value; });
    }
}

namespace {

nlohmann::json tableToJson(const ProbabilityTable& table) {
    nlohmann::json out = nlohmann::json::object();
    for (const auto& cat : table) {
        nlohmann::json tactics = nlohmann::json::object();
        for (const auto& t : cat.tactics) tactics[t.tactic] = t.value;
        out[cat.category] = tactics;
    }
    return out;
}

nlohmann::json batterToJson(const BatterStats& b) {
    return {{"avg", b.avg}, {"obp", b.obp}, {"slg", b.slg}, {"ops", b.ops},
            {"home_runs", b.homeRuns}, {"strikeouts", b.strikeouts}, {"walks", b.walks},
            {"risp_avg", b.rispAvg}, {"clutch_ops", b.clutchOps}};
}

nlohmann::json pitcherToJson(const PitcherStats& p) {
    return {{"era", p.era}, {"whip", p.whip}, {"k_per_9", p.kPer9}, {"bb_per_9", p.bbPer9},
            {"h_per_9", p.hPer9}, {"ground_ball_rate", p.groundBallRate},
            {"strikeout_rate", p.strikeoutRate}, {"walk_rate", p.walkRate}};
}

nlohmann::json sideToJson(const MomentumSide& s) {
    return {{"recent_success", s.recentSuccess}, {"pressure_handling", s.pressureHandling}};
}

} // anonymous namespace

nlohmann::json predictionToJson(const PredictionResult& r) {
    nlohmann::json j;
    j["tactical_probabilities"] = tableToJson(r.probabilities);

    // Array keeps the ranking order
    nlohmann::json top = nlohmann::json::array();
    for (const auto& t : r.topTactics) top.push_back({{"tactic", t.tactic}, {"probability", t.value}});
    j["top_tactics"] = top;

    j["context_analysis"] = {
        {"game_situation", {{"inning", r.context.inning}, {"outs", r.context.outs},
                            {"score_diff", r.context.scoreDiff},
                            {"pressure_index", r.context.pressureIndex}}},
        {"runner_situation", {{"runners", r.context.runners},
                              {"scoring_position", r.context.scoringPosition}}},
    };

    nlohmann::json recs = nlohmann::json::array();
    for (const auto& rec : r.recommendations) {
        recs.push_back({{"tactic", rec.tactic}, {"probability", rec.probability},
                        {"reasoning", rec.reasoning}, {"specific_actions", rec.actions}});
    }
    j["recommendations"] = recs;

    if (r.hasGameContext) {
        j["game_context"] = {{"season", r.gameContext.season},
                             {"game_type", r.gameContext.gameType},
                             {"is_spring_training", r.gameContext.isSpringTraining}};
    }
    if (r.hasMomentum) {
        j["momentum_analysis"] = {{"batting_team", sideToJson(r.momentum.batting)},
                                  {"pitching_team", sideToJson(r.momentum.pitching)},
                                  {"plays", r.momentum.plays}};
    }
    if (r.hasHistorical) {
        nlohmann::json h = {{"success_rates", tableToJson(r.historical.successRates)},
                            {"sample_size", r.historical.sampleSize}};
        if (r.historical.hasSummary) {
            const auto& s = r.historical.summary;
            h["similar_situations"] = {{"total_count", s.totalCount},
                                       {"success_count", s.successCount},
                                       {"avg_pressure", s.avgPressure},
                                       {"most_common_tactic", s.mostCommonTactic}};
        }
        j["historical_patterns"] = h;
    }
    if (r.hasMatchup) {
        nlohmann::json factors = nlohmann::json::array();
        for (const auto& f : r.matchup.keyFactors) {
            factors.push_back({{"factor", f.factor}, {"description", f.description}});
        }
        nlohmann::json mrecs = nlohmann::json::array();
        for (const auto& m : r.matchup.recommendations) {
            mrecs.push_back({{"tactic", m.tactic}, {"reason", m.reason}});
        }
        j["player_analysis"] = {{"batter", batterToJson(r.matchup.batter)},
                                {"pitcher", pitcherToJson(r.matchup.pitcher)},
                                {"advantage", r.matchup.advantage},
                                {"key_factors", factors},
                                {"recommendations", mrecs}};
    }
    return j;
}

nlohmann::json flattenPrediction(const PredictionResult& result) {
    return predictionToJson(result).flatten();
}

std::string formatPrediction(const PredictionResult& r) {
    std::ostringstream out;
    const std::string rule(50, '=');
    const std::string sub(30, '-');

    out << "Tactical Analysis Report\n" << rule << "\n\n";

    out << "Tactical Probabilities by Category:\n" << sub << "\n";
    for (const auto& cat : r.probabilities) {
        if (cat.tactics.empty()) continue;
        out << "\n" << cat.category << ":\n";
        for (const auto& t : cat.tactics) {
            out << "  " << std::left << std::setw(25) << t.tactic << " "
                << std::right << std::setw(5) << std::fixed << std::setprecision(1)
                << t.value << "%\n";
        }
    }
    out.unsetf(std::ios::floatfield);
    out.precision(6);

    out << "\nTop Recommendations:\n" << sub << "\n";
    for (const auto& rec : r.recommendations) {
        out << "\n" << rec.tactic << " (" << rec.probability << "%):\n";
        out << "Reasoning: " << rec.reasoning << "\n";
        out << "Specific Actions:\n";
        for (const auto& a : rec.actions) out << "  - " << a << "\n";
    }

    out << "\nSituation Analysis:\n" << sub << "\n";
    out << "Inning: " << r.context.inning << "\n";
    out << "Outs: " << r.context.outs << "\n";
    out << "Pressure Index: " << std::fixed << std::setprecision(2) << r.context.pressureIndex << "\n";
    out << "Runners: " << r.context.runners << "\n";
    out << "Scoring Position: " << (r.context.scoringPosition ? "Yes" : "No") << "\n";

    if (r.hasMomentum) {
        out << "\nMomentum:\n" << sub << "\n";
        out << "Batting recent success:  " << r.momentum.batting.recentSuccess << "\n";
        out << "Pitching recent success: " << r.momentum.pitching.recentSuccess << "\n";
    }

    if (r.hasHistorical) {
        out << "\nHistorical Patterns:\n" << sub << "\n";
        out << "Similar situations: " << r.historical.sampleSize << "\n";
        if (r.historical.hasSummary) {
            out << "Most common tactic: " << r.historical.summary.mostCommonTactic << "\n";
        }
    }

    if (r.hasMatchup) {
        out << "\nMatchup:\n" << sub << "\n";
        out << "Advantage: " << r.matchup.advantage << "\n";
        for (const auto& f : r.matchup.keyFactors) {
            out << "  - " << f.factor << ": " << f.description << "\n";
        }
    }

    return out.str();
}

} // namespace mlbt
