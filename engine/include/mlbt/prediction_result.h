#pragma once

#include "mlbt/play_event.h"
#include "mlbt/player_stats.h"
#include <nlohmann/json.hpp>
#include <cmath>
#include <string>
#include <vector>

namespace mlbt {

// Percentages are reported with 2 decimals
inline double round2(double v) {
    return std::round(v * 100.0) / 100.0;
}

// tactic name with a percentage (probability or success rate)
struct TacticScore {
    std::string tactic;
    double value = 0.0;
};

struct CategoryScores {
    std::string category;
    std::vector<TacticScore> tactics;   // descending by value
};

// Category order: OFFENSIVE, BASERUNNING, DEFENSIVE, then OTHER if present
using ProbabilityTable = std::vector<CategoryScores>;

// Value for a tactic anywhere in the table; fallback when absent
double tableValue(const ProbabilityTable& table, const std::string& tactic, double fallback = 0.0);

// Sort every category descending by value, keeping order among equal values
void sortCategories(ProbabilityTable& table);

struct ContextAnalysis {
    int inning = 1;
    int outs = 0;
    int scoreDiff = 0;
    double pressureIndex = 0.0;   // rounded to 2 decimals
    int runners = 0;
    bool scoringPosition = false;
};

struct Recommendation {
    std::string tactic;
    double probability = 0.0;
    std::string reasoning;
    std::vector<std::string> actions;
};

// --- Enrichments ---

struct MomentumSide {
    double recentSuccess = 0.0;      // [0, 1]
    double pressureHandling = 0.0;   // [0, 1], over plays with pressure > 1.5
};

struct MomentumAnalysis {
    MomentumSide batting;
    MomentumSide pitching;
    int plays = 0;                   // plays in the window
};

struct SimilarSituationSummary {
    int totalCount = 0;
    int successCount = 0;
    double avgPressure = 0.0;
    std::string mostCommonTactic;
};

struct HistoricalPatterns {
    ProbabilityTable successRates;   // per tactic, percent; empty when no match
    int sampleSize = 0;
    bool hasSummary = false;
    SimilarSituationSummary summary;
};

struct MatchupFactor {
    std::string factor;
    std::string description;
};

struct MatchupRecommendation {
    std::string tactic;
    std::string reason;
};

struct MatchupAnalysis {
    BatterStats batter;
    PitcherStats pitcher;
    std::string advantage = "neutral";   // batter, pitcher or neutral
    std::vector<MatchupFactor> keyFactors;
    std::vector<MatchupRecommendation> recommendations;
};

// Output of one inference call
struct PredictionResult {
    ProbabilityTable probabilities;
    std::vector<TacticScore> topTactics;
    ContextAnalysis context;
    std::vector<Recommendation> recommendations;

    bool hasGameContext = false;
    GameContext gameContext;
    bool hasMomentum = false;
    MomentumAnalysis momentum;
    bool hasHistorical = false;
    HistoricalPatterns historical;
    bool hasMatchup = false;
    MatchupAnalysis matchup;
};

nlohmann::json predictionToJson(const PredictionResult& result);

// Flat key-value document ("/tactical_probabilities/OFFENSIVE/power_hitting": 41.5, ...)
nlohmann::json flattenPrediction(const PredictionResult& result);

// Human-readable report
std::string formatPrediction(const PredictionResult& result);

} // namespace mlbt
