#pragma once

#include "mlbt/prediction_result.h"
#include "mlbt/situation.h"
#include <memory>
#include <string>
#include <vector>

namespace mlbt {

// One prior situation with the tactic used and whether it worked
struct HistoricalSituation {
    int inning = 1;
    int outs = 0;
    double pressureIndex = 0.0;
    std::string tactic;
    bool success = false;
};

// JSON array of {"inning", "outs", "pressure_index", "tactic", "success"}.
// nullptr if the file cannot be opened.
std::unique_ptr<std::vector<HistoricalSituation>> loadHistoricalCorpus(const std::string& path);
std::unique_ptr<std::vector<HistoricalSituation>> loadHistoricalCorpusFromString(const std::string& json);

struct EnhancerConfig {
    int momentumWindow = 5;          // most recent plays considered
    double highPressure = 1.5;       // pressure-handling threshold (exclusive)
    double pressureTolerance = 0.2;  // historical match window on pressure_index
};

// Per-play success indicators, from the outcome action
bool battingSuccess(const SituationRecord& play);
bool pitchingSuccess(const SituationRecord& play);

// (batting - pitching recent success) x per-tactic momentum weight
double momentumFactor(const MomentumAnalysis& momentum, const std::string& tactic);

// base x (1 + (rate - 50)/100) when the historical rate is > 0,
// then x (1 + momentum factor) when momentum is given; clamped to [0, 100],
// 2 decimals. Null enrichments leave the value unchanged.
ProbabilityTable adjustProbabilities(const ProbabilityTable& base,
                                     const HistoricalPatterns* historical,
                                     const MomentumAnalysis* momentum);

MatchupAnalysis analyzeMatchup(const BatterStats& batter, const PitcherStats& pitcher);

// Refines classifier output with momentum, historical and matchup signals.
class InferenceEnhancer {
    EnhancerConfig config_;
    std::vector<HistoricalSituation> history_;
    bool hasHistory_ = false;

public:
    InferenceEnhancer();
    explicit InferenceEnhancer(EnhancerConfig config);

    void setHistoricalCorpus(std::vector<HistoricalSituation> corpus);
    bool hasHistoricalCorpus() const { return hasHistory_; }
    const EnhancerConfig& config() const { return config_; }

    // Over the last momentumWindow plays; plays=0 when the list is empty
    MomentumAnalysis analyzeMomentum(const std::vector<SituationRecord>& plays) const;

    // Situations with the same inning and outs and pressure within tolerance
    HistoricalPatterns analyzeHistoricalPatterns(const SituationRecord& current) const;

    // Adjusted probabilities, re-ranked top tactics and recommendations.
    // recentPlays may be empty; the corpus may be unset.
    PredictionResult enhance(const PredictionResult& base, const SituationRecord& current,
                             const std::vector<SituationRecord>& recentPlays) const;
};

} // namespace mlbt
