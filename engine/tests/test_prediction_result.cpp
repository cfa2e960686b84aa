#include <gtest/gtest.h>
#include "mlbt/prediction_result.h"

using namespace mlbt;

namespace {

PredictionResult sampleResult() {
    PredictionResult r;
    r.probabilities = {
        {"OFFENSIVE", {{"power_hitting", 41.5}, {"contact_hitting", 12.34}}},
        {"BASERUNNING", {}},
        {"DEFENSIVE", {{"strikeout_pitching", 30.0}}},
    };
    r.topTactics = {{"power_hitting", 41.5}, {"strikeout_pitching", 30.0},
                    {"contact_hitting", 12.34}};
    r.context.inning = 8;
    r.context.outs = 1;
    r.context.scoreDiff = 1;
    r.context.pressureIndex = 2.0;
    r.context.runners = 2;
    r.context.scoringPosition = true;

    Recommendation rec;
    rec.tactic = "power_hitting";
    rec.probability = 41.5;
    rec.reasoning = "Late game situation | Close game";
    rec.actions = {"Home Run", "Double", "Triple"};
    r.recommendations.push_back(rec);
    return r;
}

} // anonymous namespace

TEST(PredictionResult, Round2) {
    EXPECT_DOUBLE_EQ(round2(41.4567), 41.46);
    EXPECT_DOUBLE_EQ(round2(0.004), 0.0);
    EXPECT_DOUBLE_EQ(round2(100.0), 100.0);
}

TEST(PredictionResult, TableValueAndSort) {
    ProbabilityTable table = {
        {"OFFENSIVE", {{"contact_hitting", 10.0}, {"small_ball", 20.0}, {"power_hitting", 20.0}}},
    };
    EXPECT_DOUBLE_EQ(tableValue(table, "small_ball"), 20.0);
    EXPECT_DOUBLE_EQ(tableValue(table, "double_play", -1.0), -1.0);

    sortCategories(table);
    EXPECT_EQ(table[0].tactics[0].tactic, "small_ball");
    EXPECT_EQ(table[0].tactics[1].tactic, "power_hitting");
    EXPECT_EQ(table[0].tactics[2].tactic, "contact_hitting");
}

TEST(PredictionResult, JsonLayout) {
    nlohmann::json j = predictionToJson(sampleResult());
    EXPECT_DOUBLE_EQ(j["tactical_probabilities"]["OFFENSIVE"]["power_hitting"].get<double>(), 41.5);
    EXPECT_TRUE(j["tactical_probabilities"]["BASERUNNING"].empty());
    ASSERT_EQ(j["top_tactics"].size(), 3u);
    EXPECT_EQ(j["top_tactics"][1]["tactic"], "strikeout_pitching");
    EXPECT_EQ(j["context_analysis"]["game_situation"]["inning"], 8);
    EXPECT_EQ(j["context_analysis"]["runner_situation"]["scoring_position"], true);
    EXPECT_EQ(j["recommendations"][0]["specific_actions"].size(), 3u);

    EXPECT_FALSE(j.contains("momentum_analysis"));
    EXPECT_FALSE(j.contains("historical_patterns"));
    EXPECT_FALSE(j.contains("player_analysis"));
    EXPECT_FALSE(j.contains("game_context"));
}

TEST(PredictionResult, OptionalSections) {
    PredictionResult r = sampleResult();
    r.hasMomentum = true;
    r.momentum.batting.recentSuccess = 0.8;
    r.momentum.plays = 5;
    r.hasHistorical = true;
    r.historical.sampleSize = 4;
    r.hasMatchup = true;
    r.matchup.advantage = "batter";
    r.hasGameContext = true;
    r.gameContext.season = 2023;

    nlohmann::json j = predictionToJson(r);
    EXPECT_DOUBLE_EQ(j["momentum_analysis"]["batting_team"]["recent_success"].get<double>(), 0.8);
    EXPECT_EQ(j["historical_patterns"]["sample_size"], 4);
    EXPECT_FALSE(j["historical_patterns"].contains("similar_situations"));
    EXPECT_EQ(j["player_analysis"]["advantage"], "batter");
    EXPECT_EQ(j["game_context"]["season"], 2023);
}

TEST(PredictionResult, FlatKeys) {
    nlohmann::json flat = flattenPrediction(sampleResult());
    EXPECT_DOUBLE_EQ(flat["/tactical_probabilities/OFFENSIVE/power_hitting"].get<double>(), 41.5);
    EXPECT_EQ(flat["/context_analysis/game_situation/outs"], 1);
    EXPECT_EQ(flat["/recommendations/0/tactic"], "power_hitting");
}

TEST(PredictionResult, FormattedReport) {
    std::string text = formatPrediction(sampleResult());
    EXPECT_NE(text.find("Tactical Analysis Report\n" + std::string(50, '=')), std::string::npos);
    EXPECT_NE(text.find("\nOFFENSIVE:\n"), std::string::npos);
    EXPECT_EQ(text.find("BASERUNNING:"), std::string::npos);
    EXPECT_NE(text.find("  power_hitting" + std::string(12, ' ') + "  41.5%\n"), std::string::npos);
    EXPECT_NE(text.find("  contact_hitting" + std::string(10, ' ') + "  12.3%\n"), std::string::npos);

    EXPECT_NE(text.find("power_hitting (41.5%):"), std::string::npos);
    EXPECT_NE(text.find("Reasoning: Late game situation | Close game"), std::string::npos);
    EXPECT_NE(text.find("  - Double\n"), std::string::npos);
    EXPECT_NE(text.find("Pressure Index: 2.00"), std::string::npos);
    EXPECT_NE(text.find("Scoring Position: Yes"), std::string::npos);
    EXPECT_EQ(text.find("Momentum:"), std::string::npos);
}
