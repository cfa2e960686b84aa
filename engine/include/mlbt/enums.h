#pragma once

#include <cstdint>

namespace mlbt {

// --- HalfInning ---
enum class HalfInning : uint8_t { TOP, BOTTOM };

inline const char* halfInningName(HalfInning h) {
    return h == HalfInning::TOP ? "top" : "bottom";
}

// --- TacticCategory ---
enum class TacticCategory : uint8_t { OFFENSIVE, BASERUNNING, DEFENSIVE };

constexpr int NUM_CATEGORIES = 3;

inline const char* categoryName(TacticCategory c) {
    switch (c) {
        case TacticCategory::OFFENSIVE:   return "OFFENSIVE";
        case TacticCategory::BASERUNNING: return "BASERUNNING";
        default:                          return "DEFENSIVE";
    }
}

// --- Tactic ---
// Order matches taxonomy insertion order (used for tie-breaking).
enum class Tactic : uint8_t {
    POWER_HITTING = 0,
    CONTACT_HITTING,
    SMALL_BALL,
    PATIENT_HITTING,
    AGGRESSIVE_BASERUNNING,
    CONSERVATIVE_BASERUNNING,
    DEFENSIVE_OUTS,
    STRIKEOUT_PITCHING,
    DOUBLE_PLAY,
    FIELD_DEFENSE,
    TACTIC_COUNT
};

constexpr int NUM_TACTICS = static_cast<int>(Tactic::TACTIC_COUNT);

// --- ActionGroup ---
// Vocabulary buckets for outcome actions
enum class ActionGroup : uint8_t { HITTING, BASERUNNING, FIELDING, UNKNOWN };

} // namespace mlbt
