#pragma once

#include <nlohmann/json.hpp>
#include <memory>
#include <string>
#include <vector>

namespace mlbt {

struct BatterStats {
    double avg = 0.0;
    double obp = 0.0;
    double slg = 0.0;
    double ops = 0.0;
    int homeRuns = 0;
    int strikeouts = 0;
    int walks = 0;
    double rispAvg = 0.0;
    double clutchOps = 0.0;
};

struct PitcherStats {
    double era = 0.0;
    double whip = 0.0;
    double kPer9 = 0.0;
    double bbPer9 = 0.0;
    double hPer9 = 0.0;
    double groundBallRate = 0.0;  // ground outs / (ground + air outs)
    double strikeoutRate = 0.0;   // K / (H + BB + K)
    double walkRate = 0.0;
};

struct MatchupStats {
    int atBats = 0;
    int hits = 0;
    int homeRuns = 0;
    int strikeouts = 0;
    int walks = 0;
    double avg = 0.0;
    double ops = 0.0;
};

// Counting stats a pitching line is reported with
struct PitchingTotals {
    double era = 0.0;
    double whip = 0.0;
    double inningsPitched = 0.0;
    int strikeouts = 0;
    int walks = 0;
    int hits = 0;
    int groundOuts = 0;
    int airOuts = 0;
};

// Rate stats from totals; zero where a denominator is zero
PitcherStats derivePitchingRates(const PitchingTotals& totals);

// Numeric value of a StatsAPI stat field; "no value" markers (".---", "-.--", "*.**") give 0
double parseStatValue(const nlohmann::json& v);

// Source of player statistics. Lookups return false when the source has no data.
class StatsSource {
public:
    virtual ~StatsSource() = default;
    virtual bool batterStats(long batterId, BatterStats& out) const = 0;
    virtual bool pitcherStats(long pitcherId, PitcherStats& out) const = 0;
    virtual bool matchupStats(long batterId, long pitcherId, MatchupStats& out) const = 0;
};

// Ordered fallback: each source is tried in turn until one yields data.
class StatsLookupChain : public StatsSource {
    std::vector<std::unique_ptr<StatsSource>> sources_;
public:
    void addSource(std::unique_ptr<StatsSource> source);
    size_t size() const { return sources_.size(); }

    bool batterStats(long batterId, BatterStats& out) const override;
    bool pitcherStats(long pitcherId, PitcherStats& out) const override;
    bool matchupStats(long batterId, long pitcherId, MatchupStats& out) const override;
};

// In-memory source backed by a JSON document:
// {"batters": {"<id>": {...}}, "pitchers": {"<id>": {...}}, "matchups": {"<bid>-<pid>": {...}}}
// Entries use StatsAPI season-line field names; pitcher rates are derived
// from the counting stats (inningsPitched, strikeOuts, baseOnBalls, hits,
// groundOuts, airOuts).
class JsonStatsSource : public StatsSource {
    nlohmann::json doc_;
public:
    explicit JsonStatsSource(nlohmann::json doc);

    bool batterStats(long batterId, BatterStats& out) const override;
    bool pitcherStats(long pitcherId, PitcherStats& out) const override;
    bool matchupStats(long batterId, long pitcherId, MatchupStats& out) const override;
};

// Load from file; nullptr if the file cannot be opened
std::unique_ptr<JsonStatsSource> loadStatsSource(const std::string& path);

} // namespace mlbt
