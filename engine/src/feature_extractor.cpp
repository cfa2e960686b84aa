#include "mlbt/feature_extractor.h"
#include "mlbt/tactic_taxonomy.h"
#include "mlbt/errors.h"
#include <algorithm>
#include <cmath>
#include <string>

namespace mlbt {

namespace {

constexpr int LATE_INNING = 7;
constexpr int CLOSE_SCORE = 2;

inline double clampd(double v, double lo, double hi) {
    return std::max(lo, std::min(hi, v));
}

void checkRange(int value, int lo, int hi, const char* field) {
    if (value < lo || value > hi) {
        throw FeatureExtractionError(std::string(field) + " out of range: " +
                                     std::to_string(value));
    }
}

void validate(const RawPlay& play) {
    if (play.inning < 1) {
        throw FeatureExtractionError("inning out of range: " + std::to_string(play.inning));
    }
    checkRange(play.outs, 0, 3, "outs");
    checkRange(play.balls, 0, 4, "balls");
    checkRange(play.strikes, 0, 3, "strikes");
    if (play.homeScore < 0 || play.awayScore < 0) {
        throw FeatureExtractionError("negative score");
    }
    if (play.event.empty()) {
        throw FeatureExtractionError("missing required field 'result.event'");
    }
}

} // anonymous namespace

RunnerState processRunners(const std::vector<RunnerMovement>& runners) {
    RunnerState rs;
    rs.numRunners = static_cast<int>(runners.size());
    for (const auto& r : runners) {
        if (r.start == "1B") rs.onFirst = true;
        if (r.start == "2B") rs.onSecond = true;
        if (r.start == "3B") rs.onThird = true;
        if (r.end == "score") rs.runsScored++;
    }
    rs.scoringPosition = rs.onSecond || rs.onThird;
    return rs;
}

void computeDerivedMetrics(SituationRecord& rec) {
    const int outs = rec.outs;
    const int runners = rec.runners.numRunners;
    const bool risp = rec.runners.scoringPosition;
    const double outsLeft = (3 - outs) / 3.0;

    // Pressure: late innings, outs, runners in scoring position
    double pressure = 1.0;
    if (rec.inning >= LATE_INNING) pressure *= 1.5;
    pressure *= (1.0 + 0.2 * outs);
    if (risp) pressure *= 1.3;
    rec.pressureIndex = clampd(pressure, 0.0, 2.0);

    // Extra innings count as the 9th
    int effectiveInning = std::min(rec.inning, 9);
    rec.gameStage = clampd((effectiveInning - 1 + outs / 3.0) / 9.0, 0.0, 1.0);

    rec.runExpectancy = runners * (risp ? 0.5 : 0.3) * outsLeft;

    double leverage = rec.pressureIndex *
                      (rec.isCloseGame ? 2.0 : 1.0) *
                      (rec.gameStage > 0.7 ? 1.5 : 1.0);
    rec.leverageIndex = clampd(leverage, 0.0, 3.0);

    if (rec.inning >= 10) {
        rec.winProbabilityAdded = 0.5 + 0.1 * rec.scoreDiff / 2.0;
    } else {
        int remaining = std::max(10 - rec.inning, 1);
        rec.winProbabilityAdded = 0.5 + 0.1 * rec.scoreDiff / remaining;
    }

    rec.offensiveOpportunity = runners * (risp ? 1.5 : 1.0) * outsLeft;
    rec.defensivePressure = runners * rec.pressureIndex * ((outs + 1) / 3.0);
    rec.countLeverage = (rec.balls / 4.0) * (1.0 - rec.strikes / 3.0);
    rec.scoringThreat = rec.offensiveOpportunity * rec.pressureIndex *
                        (rec.isCloseGame ? 2.0 : 1.0);
}

SituationRecord extractSituation(const RawPlay& play, const StatsSource* stats) {
    validate(play);

    SituationRecord rec;
    rec.inning = play.inning;
    rec.half = play.half;
    rec.outs = play.outs;
    rec.balls = play.balls;
    rec.strikes = play.strikes;
    rec.scoreHome = play.homeScore;
    rec.scoreAway = play.awayScore;
    rec.result = play.event;
    rec.battingTeam = play.battingTeam;
    rec.batterId = play.batterId;
    rec.pitcherId = play.pitcherId;

    rec.scoreDiff = rec.scoreAway - rec.scoreHome;
    rec.isCloseGame = std::abs(rec.scoreDiff) <= CLOSE_SCORE;

    rec.runners = processRunners(play.runners);

    if (stats && rec.batterId != 0 && rec.pitcherId != 0) {
        rec.hasBatterStats = stats->batterStats(rec.batterId, rec.batter);
        rec.hasPitcherStats = stats->pitcherStats(rec.pitcherId, rec.pitcher);
        rec.hasMatchupStats = stats->matchupStats(rec.batterId, rec.pitcherId, rec.matchup);
    }

    computeDerivedMetrics(rec);
    return rec;
}

std::vector<SituationRecord> extractSituations(const std::vector<RawPlay>& plays,
                                               const StatsSource* stats) {
    std::vector<SituationRecord> out;
    out.reserve(plays.size());
    for (const auto& play : plays) {
        if (!isKnownAction(play.event)) continue;
        out.push_back(extractSituation(play, stats));
    }
    return out;
}

nlohmann::json situationToJson(const SituationRecord& rec) {
    nlohmann::json j;
    j["inning"] = rec.inning;
    j["half_inning"] = halfInningName(rec.half);
    j["outs"] = rec.outs;
    j["balls"] = rec.balls;
    j["strikes"] = rec.strikes;
    j["score_home"] = rec.scoreHome;
    j["score_away"] = rec.scoreAway;
    j["result"] = rec.result;
    j["batting_team"] = rec.battingTeam;
    j["batter_id"] = rec.batterId;
    j["pitcher_id"] = rec.pitcherId;
    j["score_diff"] = rec.scoreDiff;
    j["is_close_game"] = rec.isCloseGame ? 1 : 0;

    j["num_runners"] = rec.runners.numRunners;
    j["runs_scored"] = rec.runners.runsScored;
    j["scoring_position"] = rec.runners.scoringPosition ? 1 : 0;
    j["runner_on_first"] = rec.runners.onFirst ? 1 : 0;
    j["runner_on_second"] = rec.runners.onSecond ? 1 : 0;
    j["runner_on_third"] = rec.runners.onThird ? 1 : 0;

    j["pressure_index"] = rec.pressureIndex;
    j["game_stage"] = rec.gameStage;
    j["run_expectancy"] = rec.runExpectancy;
    j["leverage_index"] = rec.leverageIndex;
    j["win_probability_added"] = rec.winProbabilityAdded;
    j["offensive_opportunity"] = rec.offensiveOpportunity;
    j["defensive_pressure"] = rec.defensivePressure;
    j["count_leverage"] = rec.countLeverage;
    j["scoring_threat"] = rec.scoringThreat;

    if (rec.hasBatterStats) {
        j["batter_avg"] = rec.batter.avg;
        j["batter_obp"] = rec.batter.obp;
        j["batter_slg"] = rec.batter.slg;
        j["batter_ops"] = rec.batter.ops;
        j["batter_hr"] = rec.batter.homeRuns;
        j["batter_so"] = rec.batter.strikeouts;
        j["batter_bb"] = rec.batter.walks;
        j["batter_risp_avg"] = rec.batter.rispAvg;
        j["batter_clutch_ops"] = rec.batter.clutchOps;
    }
    if (rec.hasPitcherStats) {
        j["pitcher_era"] = rec.pitcher.era;
        j["pitcher_whip"] = rec.pitcher.whip;
        j["pitcher_k_per_9"] = rec.pitcher.kPer9;
        j["pitcher_bb_per_9"] = rec.pitcher.bbPer9;
        j["pitcher_h_per_9"] = rec.pitcher.hPer9;
        j["pitcher_gb_rate"] = rec.pitcher.groundBallRate;
        j["pitcher_k_rate"] = rec.pitcher.strikeoutRate;
        j["pitcher_bb_rate"] = rec.pitcher.walkRate;
    }
    if (rec.hasMatchupStats) {
        j["matchup_avg"] = rec.matchup.avg;
        j["matchup_ops"] = rec.matchup.ops;
        j["matchup_abs"] = rec.matchup.atBats;
        j["matchup_hr"] = rec.matchup.homeRuns;
        j["matchup_so"] = rec.matchup.strikeouts;
        j["matchup_bb"] = rec.matchup.walks;
    }
    return j;
}

} // namespace mlbt
