#include "mlbt/feature_table.h"
#include <cmath>
#include <unordered_map>
#include <unordered_set>

namespace mlbt {

FeatureRow featureRow(const SituationRecord& rec) {
    FeatureRow row;
    row.reserve(64);

    row.emplace_back("inning", rec.inning);
    row.emplace_back("outs", rec.outs);
    row.emplace_back("balls", rec.balls);
    row.emplace_back("strikes", rec.strikes);
    row.emplace_back("score_home", rec.scoreHome);
    row.emplace_back("score_away", rec.scoreAway);
    row.emplace_back("score_diff", rec.scoreDiff);
    row.emplace_back("is_close_game", rec.isCloseGame ? 1.0 : 0.0);

    row.emplace_back("num_runners", rec.runners.numRunners);
    row.emplace_back("scoring_position", rec.runners.scoringPosition ? 1.0 : 0.0);
    row.emplace_back("runs_scored", rec.runners.runsScored);
    row.emplace_back("runner_on_first", rec.runners.onFirst ? 1.0 : 0.0);
    row.emplace_back("runner_on_second", rec.runners.onSecond ? 1.0 : 0.0);
    row.emplace_back("runner_on_third", rec.runners.onThird ? 1.0 : 0.0);

    row.emplace_back("pressure_index", rec.pressureIndex);
    row.emplace_back("game_stage", rec.gameStage);
    row.emplace_back("run_expectancy", rec.runExpectancy);
    row.emplace_back("leverage_index", rec.leverageIndex);
    row.emplace_back("win_probability_added", rec.winProbabilityAdded);
    row.emplace_back("offensive_opportunity", rec.offensiveOpportunity);
    row.emplace_back("defensive_pressure", rec.defensivePressure);
    row.emplace_back("count_leverage", rec.countLeverage);
    row.emplace_back("scoring_threat", rec.scoringThreat);

    if (rec.hasBatterStats) {
        row.emplace_back("batter_avg", rec.batter.avg);
        row.emplace_back("batter_obp", rec.batter.obp);
        row.emplace_back("batter_slg", rec.batter.slg);
        row.emplace_back("batter_ops", rec.batter.ops);
        row.emplace_back("batter_hr", rec.batter.homeRuns);
        row.emplace_back("batter_so", rec.batter.strikeouts);
        row.emplace_back("batter_bb", rec.batter.walks);
        row.emplace_back("batter_risp_avg", rec.batter.rispAvg);
        row.emplace_back("batter_clutch_ops", rec.batter.clutchOps);
    }
    if (rec.hasPitcherStats) {
        row.emplace_back("pitcher_era", rec.pitcher.era);
        row.emplace_back("pitcher_whip", rec.pitcher.whip);
        row.emplace_back("pitcher_k_per_9", rec.pitcher.kPer9);
        row.emplace_back("pitcher_bb_per_9", rec.pitcher.bbPer9);
        row.emplace_back("pitcher_h_per_9", rec.pitcher.hPer9);
        row.emplace_back("pitcher_gb_rate", rec.pitcher.groundBallRate);
        row.emplace_back("pitcher_k_rate", rec.pitcher.strikeoutRate);
        row.emplace_back("pitcher_bb_rate", rec.pitcher.walkRate);
    }
    if (rec.hasMatchupStats) {
        row.emplace_back("matchup_avg", rec.matchup.avg);
        row.emplace_back("matchup_ops", rec.matchup.ops);
        row.emplace_back("matchup_abs", rec.matchup.atBats);
        row.emplace_back("matchup_hr", rec.matchup.homeRuns);
        row.emplace_back("matchup_so", rec.matchup.strikeouts);
        row.emplace_back("matchup_bb", rec.matchup.walks);
    }

    // One-hot categoricals
    row.emplace_back(std::string("half_inning_") + halfInningName(rec.half), 1.0);
    row.emplace_back("result_" + rec.result, 1.0);

    return row;
}

std::vector<std::string> collectFeatureNames(const std::vector<FeatureRow>& rows) {
    std::vector<std::string> names;
    std::unordered_set<std::string> seen;
    for (const auto& row : rows) {
        for (const auto& col : row) {
            if (seen.insert(col.first).second) names.push_back(col.first);
        }
    }
    return names;
}

std::vector<float> alignFeatures(const FeatureRow& row, const std::vector<std::string>& names) {
    std::unordered_map<std::string, double> byName;
    byName.reserve(row.size());
    for (const auto& col : row) byName[col.first] = col.second;

    std::vector<float> out(names.size(), 0.0f);
    for (size_t i = 0; i < names.size(); ++i) {
        auto it = byName.find(names[i]);
        if (it == byName.end()) continue;
        double v = it->second;
        out[i] = std::isfinite(v) ? static_cast<float>(v) : 0.0f;
    }
    return out;
}

bool hasColumn(const FeatureRow& row, const std::string& name) {
    for (const auto& col : row) {
        if (col.first == name) return true;
    }
    return false;
}

} // namespace mlbt
