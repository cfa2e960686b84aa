#pragma once

#include "mlbt/play_event.h"
#include "mlbt/situation.h"
#include "mlbt/player_stats.h"
#include <nlohmann/json.hpp>
#include <vector>

namespace mlbt {

// Runner occupancy from movement start bases; runs = movements ending in "score"
RunnerState processRunners(const std::vector<RunnerMovement>& runners);

// Fill the derived metric fields of rec from its game state and runner fields.
void computeDerivedMetrics(SituationRecord& rec);

// Build one situation record. stats may be null (no player statistics).
// Throws FeatureExtractionError for out-of-range game state (e.g. negative outs).
SituationRecord extractSituation(const RawPlay& play, const StatsSource* stats = nullptr);

// Situation table for a play list. Plays whose event is outside the known
// action vocabulary are skipped.
std::vector<SituationRecord> extractSituations(const std::vector<RawPlay>& plays,
                                               const StatsSource* stats = nullptr);

nlohmann::json situationToJson(const SituationRecord& rec);

} // namespace mlbt
