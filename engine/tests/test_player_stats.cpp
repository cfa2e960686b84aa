#include <gtest/gtest.h>
#include "mlbt/player_stats.h"

using namespace mlbt;

namespace {

// Fixed-answer source for chain ordering checks
class FixedSource : public StatsSource {
    double ops_;
public:
    explicit FixedSource(double ops) : ops_(ops) {}
    bool batterStats(long batterId, BatterStats& out) const override {
        if (batterId != 7) return false;
        out.ops = ops_;
        return true;
    }
    bool pitcherStats(long, PitcherStats&) const override { return false; }
    bool matchupStats(long, long, MatchupStats&) const override { return false; }
};

} // anonymous namespace

TEST(PlayerStats, ParseStatValue) {
    EXPECT_DOUBLE_EQ(parseStatValue(nlohmann::json(".285")), 0.285);
    EXPECT_DOUBLE_EQ(parseStatValue(nlohmann::json("3.45")), 3.45);
    EXPECT_DOUBLE_EQ(parseStatValue(nlohmann::json(12)), 12.0);
    EXPECT_DOUBLE_EQ(parseStatValue(nlohmann::json(".---")), 0.0);
    EXPECT_DOUBLE_EQ(parseStatValue(nlohmann::json("-.--")), 0.0);
    EXPECT_DOUBLE_EQ(parseStatValue(nlohmann::json("*.**")), 0.0);
    EXPECT_DOUBLE_EQ(parseStatValue(nlohmann::json(nullptr)), 0.0);
}

TEST(PlayerStats, DerivePitchingRates) {
    PitchingTotals t;
    t.era = 3.10;
    t.inningsPitched = 180.0;
    t.strikeouts = 200;
    t.walks = 60;
    t.hits = 140;
    t.groundOuts = 150;
    t.airOuts = 100;

    PitcherStats s = derivePitchingRates(t);
    EXPECT_DOUBLE_EQ(s.era, 3.10);
    EXPECT_NEAR(s.kPer9, 10.0, 1e-12);
    EXPECT_NEAR(s.bbPer9, 3.0, 1e-12);
    EXPECT_NEAR(s.hPer9, 7.0, 1e-12);
    EXPECT_NEAR(s.strikeoutRate, 200.0 / 400.0, 1e-12);
    EXPECT_NEAR(s.walkRate, 60.0 / 400.0, 1e-12);
    EXPECT_NEAR(s.groundBallRate, 0.6, 1e-12);
}

TEST(PlayerStats, ZeroDenominatorsGiveZeroRates) {
    PitcherStats s = derivePitchingRates(PitchingTotals{});
    EXPECT_DOUBLE_EQ(s.kPer9, 0.0);
    EXPECT_DOUBLE_EQ(s.strikeoutRate, 0.0);
    EXPECT_DOUBLE_EQ(s.groundBallRate, 0.0);
}

TEST(PlayerStats, JsonSourceLookups) {
    JsonStatsSource src(nlohmann::json::parse(R"({
        "batters": {"660271": {"avg": ".304", "obp": ".412", "slg": ".654",
                               "ops": "1.066", "homeRuns": 44, "strikeOuts": 143,
                               "baseOnBalls": 91}},
        "pitchers": {"543037": {"era": "2.25", "whip": "0.98", "inningsPitched": "72.0",
                                "strikeOuts": 88, "baseOnBalls": 16, "hits": 54,
                                "groundOuts": 60, "airOuts": 40}},
        "matchups": {"660271-543037": {"atBats": 12, "hits": 4, "homeRuns": 2,
                                       "strikeOuts": 3, "avg": ".333", "ops": "1.250"}},
        "empty": {}
    })"));

    BatterStats b;
    ASSERT_TRUE(src.batterStats(660271, b));
    EXPECT_NEAR(b.ops, 1.066, 1e-12);
    EXPECT_EQ(b.homeRuns, 44);
    EXPECT_EQ(b.walks, 91);
    EXPECT_DOUBLE_EQ(b.rispAvg, b.avg);

    PitcherStats p;
    ASSERT_TRUE(src.pitcherStats(543037, p));
    EXPECT_NEAR(p.kPer9, 11.0, 1e-12);
    EXPECT_NEAR(p.bbPer9, 2.0, 1e-12);
    EXPECT_NEAR(p.groundBallRate, 0.6, 1e-12);

    MatchupStats m;
    ASSERT_TRUE(src.matchupStats(660271, 543037, m));
    EXPECT_EQ(m.atBats, 12);
    EXPECT_EQ(m.homeRuns, 2);
    EXPECT_NEAR(m.avg, 0.333, 1e-12);

    EXPECT_FALSE(src.batterStats(1, b));
    EXPECT_FALSE(src.pitcherStats(660271, p));
    EXPECT_FALSE(src.matchupStats(543037, 660271, m));
}

TEST(PlayerStats, ChainFallsThroughInOrder) {
    StatsLookupChain chain;
    chain.addSource(nullptr);
    chain.addSource(std::make_unique<JsonStatsSource>(nlohmann::json::object()));
    chain.addSource(std::make_unique<FixedSource>(0.9));
    chain.addSource(std::make_unique<FixedSource>(0.5));
    EXPECT_EQ(chain.size(), 3u);

    BatterStats b;
    ASSERT_TRUE(chain.batterStats(7, b));
    EXPECT_DOUBLE_EQ(b.ops, 0.9);
    EXPECT_FALSE(chain.batterStats(8, b));

    PitcherStats p;
    EXPECT_FALSE(chain.pitcherStats(7, p));
}

TEST(PlayerStats, MissingFileReturnsNull) {
    EXPECT_EQ(loadStatsSource("/nonexistent/stats.json"), nullptr);
}
