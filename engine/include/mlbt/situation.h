#pragma once

#include "mlbt/enums.h"
#include "mlbt/player_stats.h"
#include <string>

namespace mlbt {

struct RunnerState {
    int numRunners = 0;
    int runsScored = 0;
    bool scoringPosition = false;   // any runner starting on 2B or 3B
    bool onFirst = false;
    bool onSecond = false;
    bool onThird = false;
};

// Situational state of one play. Built once by extractSituation, then read-only.
struct SituationRecord {
    // Raw game state
    int inning = 1;
    HalfInning half = HalfInning::TOP;
    int outs = 0;
    int balls = 0;
    int strikes = 0;
    int scoreHome = 0;
    int scoreAway = 0;
    std::string result;
    std::string battingTeam;
    long batterId = 0;
    long pitcherId = 0;

    // Score situation (away - home)
    int scoreDiff = 0;
    bool isCloseGame = false;

    RunnerState runners;

    // Derived metrics
    double pressureIndex = 0.0;     // [0, 2]
    double gameStage = 0.0;         // [0, 1]
    double runExpectancy = 0.0;
    double leverageIndex = 0.0;     // [0, 3]
    double winProbabilityAdded = 0.0;
    double offensiveOpportunity = 0.0;
    double defensivePressure = 0.0;
    double countLeverage = 0.0;
    double scoringThreat = 0.0;

    // Optional player statistics
    bool hasBatterStats = false;
    BatterStats batter;
    bool hasPitcherStats = false;
    PitcherStats pitcher;
    bool hasMatchupStats = false;
    MatchupStats matchup;
};

} // namespace mlbt
