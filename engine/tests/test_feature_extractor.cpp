#include <gtest/gtest.h>
#include "mlbt/feature_extractor.h"
#include "mlbt/errors.h"

using namespace mlbt;

namespace {

RawPlay makePlay(const std::string& event, int inning, int outs,
                 std::vector<RunnerMovement> runners = {}) {
    RawPlay p;
    p.inning = inning;
    p.outs = outs;
    p.event = event;
    p.runners = std::move(runners);
    return p;
}

} // anonymous namespace

TEST(FeatureExtractor, ProcessRunners) {
    RunnerState rs = processRunners({{"1B", "2B"}, {"3B", "score"}, {"", "1B"}});
    EXPECT_EQ(rs.numRunners, 3);
    EXPECT_EQ(rs.runsScored, 1);
    EXPECT_TRUE(rs.onFirst);
    EXPECT_FALSE(rs.onSecond);
    EXPECT_TRUE(rs.onThird);
    EXPECT_TRUE(rs.scoringPosition);

    RunnerState empty = processRunners({});
    EXPECT_EQ(empty.numRunners, 0);
    EXPECT_FALSE(empty.scoringPosition);
}

TEST(FeatureExtractor, LateCloseGameMetrics) {
    RawPlay p = makePlay("Single", 8, 1, {{"2B", "3B"}, {"1B", "2B"}});
    p.balls = 2;
    p.strikes = 1;
    p.homeScore = 3;
    p.awayScore = 4;
    SituationRecord rec = extractSituation(p);

    EXPECT_EQ(rec.scoreDiff, 1);
    EXPECT_TRUE(rec.isCloseGame);
    EXPECT_EQ(rec.runners.numRunners, 2);

    // 1.5 x 1.2 x 1.3 = 2.34, capped
    EXPECT_DOUBLE_EQ(rec.pressureIndex, 2.0);
    EXPECT_NEAR(rec.gameStage, (7 + 1.0 / 3.0) / 9.0, 1e-12);
    EXPECT_NEAR(rec.runExpectancy, 2 * 0.5 * 2.0 / 3.0, 1e-12);
    EXPECT_DOUBLE_EQ(rec.leverageIndex, 3.0);
    EXPECT_NEAR(rec.winProbabilityAdded, 0.55, 1e-12);
    EXPECT_NEAR(rec.offensiveOpportunity, 2.0, 1e-12);
    EXPECT_NEAR(rec.defensivePressure, 2 * 2.0 * 2.0 / 3.0, 1e-12);
    EXPECT_NEAR(rec.countLeverage, 0.5 * (2.0 / 3.0), 1e-12);
    EXPECT_NEAR(rec.scoringThreat, 2.0 * 2.0 * 2.0, 1e-12);
}

TEST(FeatureExtractor, FirstPitchMetrics) {
    SituationRecord rec = extractSituation(makePlay("Groundout", 1, 0));
    EXPECT_DOUBLE_EQ(rec.pressureIndex, 1.0);
    EXPECT_DOUBLE_EQ(rec.gameStage, 0.0);
    EXPECT_DOUBLE_EQ(rec.runExpectancy, 0.0);
    EXPECT_DOUBLE_EQ(rec.leverageIndex, 2.0);
    EXPECT_DOUBLE_EQ(rec.winProbabilityAdded, 0.5);
    EXPECT_DOUBLE_EQ(rec.scoringThreat, 0.0);
}

TEST(FeatureExtractor, ExtraInningsWinProbability) {
    RawPlay p = makePlay("Single", 11, 0);
    p.awayScore = 2;
    SituationRecord rec = extractSituation(p);
    EXPECT_NEAR(rec.winProbabilityAdded, 0.5 + 0.1 * 2 / 2.0, 1e-12);
    EXPECT_NEAR(rec.gameStage, 8.0 / 9.0, 1e-12);
}

TEST(FeatureExtractor, MetricBoundsHoldEverywhere) {
    const std::vector<std::vector<RunnerMovement>> runnerSets = {
        {}, {{"1B", ""}}, {{"2B", ""}}, {{"1B", ""}, {"2B", ""}, {"3B", ""}},
    };
    for (int inning = 1; inning <= 13; ++inning) {
        for (int outs = 0; outs <= 3; ++outs) {
            for (const auto& runners : runnerSets) {
                for (int diff : {-8, -2, 0, 1, 6}) {
                    RawPlay p = makePlay("Single", inning, outs, runners);
                    p.homeScore = diff < 0 ? -diff : 0;
                    p.awayScore = diff > 0 ? diff : 0;
                    SituationRecord rec = extractSituation(p);
                    EXPECT_GE(rec.pressureIndex, 0.0);
                    EXPECT_LE(rec.pressureIndex, 2.0);
                    EXPECT_GE(rec.leverageIndex, 0.0);
                    EXPECT_LE(rec.leverageIndex, 3.0);
                    EXPECT_GE(rec.gameStage, 0.0);
                    EXPECT_LE(rec.gameStage, 1.0);
                }
            }
        }
    }
}

TEST(FeatureExtractor, ExtractionIsIdempotent) {
    std::vector<RawPlay> plays = {
        makePlay("Single", 1, 0),
        makePlay("Double", 3, 2, {{"1B", "score"}}),
        makePlay("Strikeout", 9, 2, {{"2B", "2B"}, {"3B", "3B"}}),
    };
    auto first = extractSituations(plays);
    auto second = extractSituations(plays);
    ASSERT_EQ(first.size(), second.size());
    for (size_t i = 0; i < first.size(); ++i) {
        EXPECT_EQ(situationToJson(first[i]).dump(), situationToJson(second[i]).dump());
    }
}

TEST(FeatureExtractor, UnknownActionsAreSkipped) {
    std::vector<RawPlay> plays = {
        makePlay("Single", 1, 0),
        makePlay("Game Advisory", 1, 1),
        makePlay("Walk", 1, 1),
    };
    auto recs = extractSituations(plays);
    ASSERT_EQ(recs.size(), 2u);
    EXPECT_EQ(recs[0].result, "Single");
    EXPECT_EQ(recs[1].result, "Walk");
}

TEST(FeatureExtractor, InvalidGameStateThrows) {
    EXPECT_THROW(extractSituation(makePlay("Single", 1, -1)), FeatureExtractionError);
    EXPECT_THROW(extractSituation(makePlay("Single", 1, 4)), FeatureExtractionError);
    EXPECT_THROW(extractSituation(makePlay("Single", 0, 0)), FeatureExtractionError);
    EXPECT_THROW(extractSituation(makePlay("", 1, 0)), FeatureExtractionError);

    RawPlay p = makePlay("Single", 1, 0);
    p.balls = 5;
    EXPECT_THROW(extractSituation(p), FeatureExtractionError);
    p.balls = 0;
    p.homeScore = -1;
    EXPECT_THROW(extractSituation(p), FeatureExtractionError);
}

TEST(FeatureExtractor, StatsMergedWhenAvailable) {
    JsonStatsSource stats(nlohmann::json::parse(R"({
        "batters": {"100": {"avg": ".310", "ops": ".905", "slg": ".540", "homeRuns": 30}},
        "pitchers": {"200": {"era": "4.80", "inningsPitched": "90.0", "strikeOuts": 100}}
    })"));

    RawPlay p = makePlay("Home Run", 5, 0);
    p.batterId = 100;
    p.pitcherId = 200;
    SituationRecord rec = extractSituation(p, &stats);
    EXPECT_TRUE(rec.hasBatterStats);
    EXPECT_NEAR(rec.batter.ops, 0.905, 1e-12);
    EXPECT_EQ(rec.batter.homeRuns, 30);
    EXPECT_TRUE(rec.hasPitcherStats);
    EXPECT_NEAR(rec.pitcher.kPer9, 10.0, 1e-12);
    EXPECT_FALSE(rec.hasMatchupStats);

    // Unknown pitcher id: no stats, no error
    p.pitcherId = 0;
    SituationRecord bare = extractSituation(p, &stats);
    EXPECT_FALSE(bare.hasBatterStats);
    EXPECT_FALSE(bare.hasPitcherStats);
}

TEST(FeatureExtractor, JsonCarriesStatColumnsOnlyWhenPresent) {
    SituationRecord rec = extractSituation(makePlay("Walk", 2, 1));
    nlohmann::json j = situationToJson(rec);
    EXPECT_EQ(j["result"], "Walk");
    EXPECT_EQ(j["half_inning"], "top");
    EXPECT_FALSE(j.contains("batter_ops"));

    rec.hasBatterStats = true;
    rec.batter.ops = 0.8;
    EXPECT_TRUE(situationToJson(rec).contains("batter_ops"));
}
