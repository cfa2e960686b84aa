#include "mlbt/inference_enhancer.h"
#include "mlbt/recommendations.h"
#include "mlbt/tactic_taxonomy.h"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cmath>
#include <fstream>
#include <map>
#include <unordered_set>

namespace mlbt {

namespace {

std::unique_ptr<std::vector<HistoricalSituation>> parseCorpus(const nlohmann::json& j) {
    auto corpus = std::make_unique<std::vector<HistoricalSituation>>();
    if (!j.is_array()) return corpus;
    for (const auto& e : j) {
        HistoricalSituation h;
        h.inning = e.value("inning", h.inning);
        h.outs = e.value("outs", h.outs);
        h.pressureIndex = e.value("pressure_index", h.pressureIndex);
        h.tactic = e.value("tactic", std::string());
        if (e.contains("success")) {
            const auto& s = e["success"];
            h.success = s.is_boolean() ? s.get<bool>() : (s.is_number() && s.get<double>() != 0.0);
        }
        corpus->push_back(std::move(h));
    }
    return corpus;
}

bool inSet(const std::unordered_set<std::string>& set, const std::string& action) {
    return set.count(action) > 0;
}

} // anonymous namespace

std::unique_ptr<std::vector<HistoricalSituation>> loadHistoricalCorpus(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) return nullptr;
    nlohmann::json j = nlohmann::json::parse(file);
    return parseCorpus(j);
}

std::unique_ptr<std::vector<HistoricalSituation>> loadHistoricalCorpusFromString(const std::string& json) {
    auto j = nlohmann::json::parse(json);
    return parseCorpus(j);
}

// --- Success indicators ---

bool battingSuccess(const SituationRecord& play) {
    static const std::unordered_set<std::string> onBase = {
        "Single", "Double", "Triple", "Home Run", "Walk", "Intent Walk", "Hit By Pitch",
    };
    return inSet(onBase, play.result) || play.runners.runsScored > 0;
}

bool pitchingSuccess(const SituationRecord& play) {
    static const std::unordered_set<std::string> outs = {
        "Strikeout", "Strikeout Double Play",
        "Groundout", "Flyout", "Lineout", "Pop Out", "Forceout", "Bunt Groundout",
        "Field Out", "Fielders Choice Out",
        "Double Play", "Grounded Into DP", "Triple Play",
    };
    return inSet(outs, play.result);
}

double momentumFactor(const MomentumAnalysis& momentum, const std::string& tactic) {
    double diff = momentum.batting.recentSuccess - momentum.pitching.recentSuccess;
    return diff * momentumWeight(tactic);
}

ProbabilityTable adjustProbabilities(const ProbabilityTable& base,
                                     const HistoricalPatterns* historical,
                                     const MomentumAnalysis* momentum) {
    ProbabilityTable adjusted = base;
    for (auto& cat : adjusted) {
        for (auto& t : cat.tactics) {
            double p = t.value;

            double rate = historical ? tableValue(historical->successRates, t.tactic, 0.0) : 0.0;
            if (rate > 0.0) p *= 1.0 + (rate - 50.0) / 100.0;

            if (momentum) p *= 1.0 + momentumFactor(*momentum, t.tactic);

            t.value = round2(std::min(std::max(p, 0.0), 100.0));
        }
    }
    sortCategories(adjusted);
    return adjusted;
}

MatchupAnalysis analyzeMatchup(const BatterStats& batter, const PitcherStats& pitcher) {
    MatchupAnalysis m;
    m.batter = batter;
    m.pitcher = pitcher;

    if (batter.ops > 0.900 && pitcher.era > 4.50) m.advantage = "batter";
    else if (batter.ops < 0.700 && pitcher.era < 3.50) m.advantage = "pitcher";
    else m.advantage = "neutral";

    if (batter.slg > 0.500) {
        m.keyFactors.push_back({"power_threat", "Batter shows significant power potential"});
    }
    if (pitcher.kPer9 > 9.0) {
        m.keyFactors.push_back({"strikeout_pitcher", "Pitcher has high strikeout rate"});
    }

    if (batter.ops > 0.800) {
        m.recommendations.push_back({"power_hitting", "Batter showing strong offensive performance"});
    }
    if (pitcher.bbPer9 > 4.0) {
        m.recommendations.push_back({"patient_hitting", "Pitcher has control issues"});
    }
    return m;
}

// --- InferenceEnhancer ---

InferenceEnhancer::InferenceEnhancer() = default;

InferenceEnhancer::InferenceEnhancer(EnhancerConfig config) : config_(config) {}

void InferenceEnhancer::setHistoricalCorpus(std::vector<HistoricalSituation> corpus) {
    history_ = std::move(corpus);
    hasHistory_ = true;
}

MomentumAnalysis InferenceEnhancer::analyzeMomentum(const std::vector<SituationRecord>& plays) const {
    MomentumAnalysis m;
    if (plays.empty()) return m;

    size_t window = static_cast<size_t>(std::max(1, config_.momentumWindow));
    size_t first = plays.size() > window ? plays.size() - window : 0;

    int batting = 0, pitching = 0;
    int pressurePlays = 0, battingPressure = 0, pitchingPressure = 0;
    for (size_t i = first; i < plays.size(); ++i) {
        const SituationRecord& p = plays[i];
        bool bat = battingSuccess(p);
        bool pitch = pitchingSuccess(p);
        batting += bat;
        pitching += pitch;
        if (p.pressureIndex > config_.highPressure) {
            pressurePlays++;
            battingPressure += bat;
            pitchingPressure += pitch;
        }
    }

    m.plays = static_cast<int>(plays.size() - first);
    m.batting.recentSuccess = static_cast<double>(batting) / m.plays;
    m.pitching.recentSuccess = static_cast<double>(pitching) / m.plays;
    if (pressurePlays > 0) {
        m.batting.pressureHandling = static_cast<double>(battingPressure) / pressurePlays;
        m.pitching.pressureHandling = static_cast<double>(pitchingPressure) / pressurePlays;
    }
    return m;
}

HistoricalPatterns InferenceEnhancer::analyzeHistoricalPatterns(const SituationRecord& current) const {
    HistoricalPatterns h;
    if (!hasHistory_) return h;

    std::vector<const HistoricalSituation*> similar;
    for (const auto& s : history_) {
        if (s.inning == current.inning && s.outs == current.outs &&
            std::abs(s.pressureIndex - current.pressureIndex) < config_.pressureTolerance) {
            similar.push_back(&s);
        }
    }
    if (similar.empty()) return h;

    for (TacticCategory c : {TacticCategory::OFFENSIVE, TacticCategory::BASERUNNING,
                             TacticCategory::DEFENSIVE}) {
        h.successRates.push_back(CategoryScores{categoryName(c), {}});
    }
    for (const auto& def : tacticTaxonomy()) {
        int total = 0, success = 0;
        for (const auto* s : similar) {
            if (s->tactic != def.name) continue;
            total++;
            if (s->success) success++;
        }
        double rate = total > 0 ? 100.0 * success / total : 0.0;
        h.successRates[static_cast<int>(def.category)].tactics.push_back(
            TacticScore{def.name, round2(rate)});
    }

    h.sampleSize = static_cast<int>(similar.size());
    h.hasSummary = true;
    std::map<std::string, int> tacticCounts;
    double pressureSum = 0.0;
    for (const auto* s : similar) {
        h.summary.totalCount++;
        if (s->success) h.summary.successCount++;
        pressureSum += s->pressureIndex;
        tacticCounts[s->tactic]++;
    }
    h.summary.avgPressure = pressureSum / similar.size();
    int bestCount = 0;
    for (const auto& tc : tacticCounts) {
        if (tc.second > bestCount) {
            bestCount = tc.second;
            h.summary.mostCommonTactic = tc.first;
        }
    }
    return h;
}

PredictionResult InferenceEnhancer::enhance(const PredictionResult& base,
                                            const SituationRecord& current,
                                            const std::vector<SituationRecord>& recentPlays) const {
    PredictionResult out = base;

    const HistoricalPatterns* historical = nullptr;
    if (hasHistory_) {
        out.historical = analyzeHistoricalPatterns(current);
        out.hasHistorical = true;
        historical = &out.historical;
    }

    const MomentumAnalysis* momentum = nullptr;
    if (!recentPlays.empty()) {
        out.momentum = analyzeMomentum(recentPlays);
        out.hasMomentum = true;
        momentum = &out.momentum;
    }

    out.probabilities = adjustProbabilities(base.probabilities, historical, momentum);
    out.topTactics = topTactics(out.probabilities, 3);
    out.recommendations = buildRecommendations(out.topTactics, out.context);

    if (current.hasBatterStats && current.hasPitcherStats) {
        out.matchup = analyzeMatchup(current.batter, current.pitcher);
        out.hasMatchup = true;
    }
    return out;
}

} // namespace mlbt
