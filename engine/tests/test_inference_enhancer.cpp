#include <gtest/gtest.h>
#include "mlbt/inference_enhancer.h"
#include "mlbt/feature_extractor.h"

using namespace mlbt;

namespace {

SituationRecord makeRecord(const std::string& event, int inning = 1, int outs = 0,
                           std::vector<RunnerMovement> runners = {}) {
    RawPlay p;
    p.inning = inning;
    p.outs = outs;
    p.event = event;
    p.runners = std::move(runners);
    return extractSituation(p);
}

PredictionResult baseResult(double power, double strikeout) {
    PredictionResult r;
    r.probabilities = {
        {"OFFENSIVE", {{"power_hitting", power}, {"contact_hitting", 10.0}}},
        {"BASERUNNING", {}},
        {"DEFENSIVE", {{"strikeout_pitching", strikeout}}},
    };
    r.topTactics = {{"power_hitting", power}, {"strikeout_pitching", strikeout},
                    {"contact_hitting", 10.0}};
    return r;
}

HistoricalSituation past(int inning, int outs, double pressure, const std::string& tactic,
                         bool success) {
    HistoricalSituation h;
    h.inning = inning;
    h.outs = outs;
    h.pressureIndex = pressure;
    h.tactic = tactic;
    h.success = success;
    return h;
}

} // anonymous namespace

TEST(InferenceEnhancer, SuccessIndicators) {
    EXPECT_TRUE(battingSuccess(makeRecord("Single")));
    EXPECT_TRUE(battingSuccess(makeRecord("Hit By Pitch")));
    EXPECT_TRUE(battingSuccess(makeRecord("Sac Fly", 5, 1, {{"3B", "score"}})));
    EXPECT_FALSE(battingSuccess(makeRecord("Strikeout")));

    EXPECT_TRUE(pitchingSuccess(makeRecord("Strikeout")));
    EXPECT_TRUE(pitchingSuccess(makeRecord("Grounded Into DP")));
    EXPECT_FALSE(pitchingSuccess(makeRecord("Double")));
}

TEST(InferenceEnhancer, MomentumFromRecentPlays) {
    InferenceEnhancer enhancer;
    std::vector<SituationRecord> plays = {
        makeRecord("Single"), makeRecord("Single"), makeRecord("Single"),
        makeRecord("Single"), makeRecord("Strikeout"),
    };
    MomentumAnalysis m = enhancer.analyzeMomentum(plays);
    EXPECT_EQ(m.plays, 5);
    EXPECT_DOUBLE_EQ(m.batting.recentSuccess, 0.8);
    EXPECT_DOUBLE_EQ(m.pitching.recentSuccess, 0.2);
    EXPECT_NEAR(momentumFactor(m, "power_hitting"), 0.6 * 0.15, 1e-12);
    EXPECT_NEAR(momentumFactor(m, "strikeout_pitching"), 0.6 * 0.1, 1e-12);
    // Patient hitting leans against batting form
    EXPECT_NEAR(momentumFactor(m, "patient_hitting"), -0.6 * 0.1, 1e-12);
}

TEST(InferenceEnhancer, MomentumWindowAndPressureHandling) {
    InferenceEnhancer enhancer;
    std::vector<SituationRecord> plays = {
        makeRecord("Home Run"), makeRecord("Home Run"),          // outside the window
        makeRecord("Strikeout", 9, 2, {{"2B", ""}}),              // pressure 2.0
        makeRecord("Groundout", 9, 2, {{"3B", ""}}),              // pressure 2.0
        makeRecord("Single", 9, 2, {{"2B", "score"}}),            // pressure 2.0
        makeRecord("Flyout"), makeRecord("Walk"),
    };
    MomentumAnalysis m = enhancer.analyzeMomentum(plays);
    EXPECT_EQ(m.plays, 5);
    EXPECT_DOUBLE_EQ(m.batting.recentSuccess, 0.4);
    EXPECT_DOUBLE_EQ(m.pitching.recentSuccess, 0.6);
    EXPECT_DOUBLE_EQ(m.batting.pressureHandling, 1.0 / 3.0);
    EXPECT_DOUBLE_EQ(m.pitching.pressureHandling, 2.0 / 3.0);

    MomentumAnalysis none = enhancer.analyzeMomentum({});
    EXPECT_EQ(none.plays, 0);
    EXPECT_DOUBLE_EQ(none.batting.recentSuccess, 0.0);
}

TEST(InferenceEnhancer, MomentumAdjustsProbabilities) {
    InferenceEnhancer enhancer;
    std::vector<SituationRecord> plays = {
        makeRecord("Single"), makeRecord("Single"), makeRecord("Single"),
        makeRecord("Single"), makeRecord("Strikeout"),
    };
    PredictionResult out = enhancer.enhance(baseResult(40.0, 30.0), makeRecord("Single", 4, 0), plays);

    ASSERT_TRUE(out.hasMomentum);
    EXPECT_FALSE(out.hasHistorical);
    EXPECT_DOUBLE_EQ(tableValue(out.probabilities, "power_hitting"), 43.6);
    EXPECT_DOUBLE_EQ(tableValue(out.probabilities, "strikeout_pitching"), 31.8);
    EXPECT_DOUBLE_EQ(tableValue(out.probabilities, "contact_hitting"), 10.6);
}

TEST(InferenceEnhancer, PitchingMomentumReranksTopTactics) {
    InferenceEnhancer enhancer;
    std::vector<SituationRecord> plays(5, makeRecord("Strikeout"));
    PredictionResult out = enhancer.enhance(baseResult(40.0, 38.0), makeRecord("Single", 4, 0), plays);

    ASSERT_FALSE(out.topTactics.empty());
    EXPECT_EQ(out.topTactics[0].tactic, "strikeout_pitching");
    // 38 x 0.9 edges past 40 x 0.85
    EXPECT_DOUBLE_EQ(out.topTactics[0].value, 34.2);
    EXPECT_EQ(out.topTactics[1].tactic, "power_hitting");
    EXPECT_DOUBLE_EQ(out.topTactics[1].value, 34.0);
    ASSERT_EQ(out.recommendations.size(), out.topTactics.size());
    EXPECT_EQ(out.recommendations[0].tactic, "strikeout_pitching");
}

TEST(InferenceEnhancer, HistoricalPatternsAdjustProbabilities) {
    SituationRecord current = makeRecord("Home Run", 8, 1, {{"2B", ""}});
    ASSERT_DOUBLE_EQ(current.pressureIndex, 2.0);

    InferenceEnhancer enhancer;
    enhancer.setHistoricalCorpus({
        past(8, 1, 2.0, "power_hitting", true),
        past(8, 1, 1.9, "power_hitting", true),
        past(8, 1, 2.0, "power_hitting", true),
        past(8, 1, 2.1, "power_hitting", false),
        past(8, 1, 1.7, "power_hitting", false),   // pressure too far off
        past(3, 1, 2.0, "strikeout_pitching", true),
    });

    HistoricalPatterns h = enhancer.analyzeHistoricalPatterns(current);
    EXPECT_EQ(h.sampleSize, 4);
    EXPECT_DOUBLE_EQ(tableValue(h.successRates, "power_hitting"), 75.0);
    EXPECT_DOUBLE_EQ(tableValue(h.successRates, "strikeout_pitching", -1.0), 0.0);
    ASSERT_TRUE(h.hasSummary);
    EXPECT_EQ(h.summary.totalCount, 4);
    EXPECT_EQ(h.summary.successCount, 3);
    EXPECT_EQ(h.summary.mostCommonTactic, "power_hitting");
    EXPECT_NEAR(h.summary.avgPressure, 2.0, 1e-12);

    PredictionResult out = enhancer.enhance(baseResult(50.0, 20.0), current, {});
    EXPECT_TRUE(out.hasHistorical);
    EXPECT_FALSE(out.hasMomentum);
    EXPECT_DOUBLE_EQ(tableValue(out.probabilities, "power_hitting"), 62.5);
    // Zero rate leaves the value alone
    EXPECT_DOUBLE_EQ(tableValue(out.probabilities, "strikeout_pitching"), 20.0);
}

TEST(InferenceEnhancer, AdjustedValuesAreClamped) {
    HistoricalPatterns h;
    h.successRates = {{"OFFENSIVE", {{"power_hitting", 100.0}}}};
    ProbabilityTable base = {{"OFFENSIVE", {{"power_hitting", 90.0}}}};
    ProbabilityTable out = adjustProbabilities(base, &h, nullptr);
    EXPECT_DOUBLE_EQ(tableValue(out, "power_hitting"), 100.0);
}

TEST(InferenceEnhancer, NoMatchingHistoryOnlyMomentumApplies) {
    SituationRecord current = makeRecord("Single", 2, 0);
    InferenceEnhancer enhancer;
    enhancer.setHistoricalCorpus({past(9, 2, 2.0, "power_hitting", true)});

    std::vector<SituationRecord> plays = {
        makeRecord("Double"), makeRecord("Groundout"), makeRecord("Walk"),
    };
    PredictionResult base = baseResult(40.0, 30.0);
    PredictionResult out = enhancer.enhance(base, current, plays);

    ASSERT_TRUE(out.hasHistorical);
    EXPECT_EQ(out.historical.sampleSize, 0);
    EXPECT_TRUE(out.historical.successRates.empty());

    MomentumAnalysis m = enhancer.analyzeMomentum(plays);
    ProbabilityTable expected = adjustProbabilities(base.probabilities, nullptr, &m);
    for (const char* t : {"power_hitting", "contact_hitting", "strikeout_pitching"}) {
        EXPECT_DOUBLE_EQ(tableValue(out.probabilities, t), tableValue(expected, t));
    }
}

TEST(InferenceEnhancer, NoEnrichmentsLeaveProbabilities) {
    InferenceEnhancer enhancer;
    PredictionResult out = enhancer.enhance(baseResult(40.0, 30.0), makeRecord("Single"), {});
    EXPECT_FALSE(out.hasMomentum);
    EXPECT_FALSE(out.hasHistorical);
    EXPECT_FALSE(out.hasMatchup);
    EXPECT_DOUBLE_EQ(tableValue(out.probabilities, "power_hitting"), 40.0);
    EXPECT_DOUBLE_EQ(tableValue(out.probabilities, "strikeout_pitching"), 30.0);
}

TEST(InferenceEnhancer, MatchupAnalysis) {
    BatterStats slugger;
    slugger.ops = 0.950;
    slugger.slg = 0.600;
    PitcherStats wild;
    wild.era = 5.10;
    wild.kPer9 = 10.2;
    wild.bbPer9 = 4.8;

    MatchupAnalysis m = analyzeMatchup(slugger, wild);
    EXPECT_EQ(m.advantage, "batter");
    ASSERT_EQ(m.keyFactors.size(), 2u);
    EXPECT_EQ(m.keyFactors[0].factor, "power_threat");
    EXPECT_EQ(m.keyFactors[1].factor, "strikeout_pitcher");
    ASSERT_EQ(m.recommendations.size(), 2u);
    EXPECT_EQ(m.recommendations[0].tactic, "power_hitting");
    EXPECT_EQ(m.recommendations[1].tactic, "patient_hitting");

    BatterStats weak;
    weak.ops = 0.650;
    PitcherStats ace;
    ace.era = 2.80;
    EXPECT_EQ(analyzeMatchup(weak, ace).advantage, "pitcher");
    EXPECT_TRUE(analyzeMatchup(weak, ace).recommendations.empty());
    EXPECT_EQ(analyzeMatchup(slugger, ace).advantage, "neutral");
}

TEST(InferenceEnhancer, EnhanceAddsMatchupWithBothStatLines) {
    SituationRecord current = makeRecord("Single", 3, 1);
    current.hasBatterStats = true;
    current.batter.ops = 0.850;
    InferenceEnhancer enhancer;

    EXPECT_FALSE(enhancer.enhance(baseResult(40.0, 30.0), current, {}).hasMatchup);

    current.hasPitcherStats = true;
    current.pitcher.era = 3.90;
    PredictionResult out = enhancer.enhance(baseResult(40.0, 30.0), current, {});
    ASSERT_TRUE(out.hasMatchup);
    EXPECT_EQ(out.matchup.advantage, "neutral");
    ASSERT_EQ(out.matchup.recommendations.size(), 1u);
}

TEST(InferenceEnhancer, CorpusLoader) {
    auto corpus = loadHistoricalCorpusFromString(R"([
        {"inning": 7, "outs": 2, "pressure_index": 1.8, "tactic": "small_ball", "success": true},
        {"inning": 3, "tactic": "double_play", "success": 0},
        {"inning": 5, "outs": 1, "tactic": "field_defense", "success": 1}
    ])");
    ASSERT_NE(corpus, nullptr);
    ASSERT_EQ(corpus->size(), 3u);
    EXPECT_EQ((*corpus)[0].outs, 2);
    EXPECT_TRUE((*corpus)[0].success);
    EXPECT_FALSE((*corpus)[1].success);
    EXPECT_DOUBLE_EQ((*corpus)[1].pressureIndex, 0.0);
    EXPECT_TRUE((*corpus)[2].success);

    auto notArray = loadHistoricalCorpusFromString(R"({"inning": 1})");
    ASSERT_NE(notArray, nullptr);
    EXPECT_TRUE(notArray->empty());

    EXPECT_EQ(loadHistoricalCorpus("/nonexistent/history.json"), nullptr);

    InferenceEnhancer enhancer;
    EXPECT_FALSE(enhancer.hasHistoricalCorpus());
    enhancer.setHistoricalCorpus(std::move(*corpus));
    EXPECT_TRUE(enhancer.hasHistoricalCorpus());
}
