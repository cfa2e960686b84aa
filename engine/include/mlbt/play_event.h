#pragma once

#include "mlbt/enums.h"
#include <string>
#include <vector>

namespace mlbt {

// Base codes as they appear in the feed: "1B", "2B", "3B", "score"; empty = batter
struct RunnerMovement {
    std::string start;
    std::string end;
};

// One play as delivered by the data feed, before any derivation.
struct RawPlay {
    int inning = 1;
    HalfInning half = HalfInning::TOP;
    int outs = 0;
    int balls = 0;
    int strikes = 0;
    int homeScore = 0;
    int awayScore = 0;
    std::string event;
    std::string battingTeam;
    long batterId = 0;   // 0 = unknown
    long pitcherId = 0;
    std::vector<RunnerMovement> runners;
};

struct GameContext {
    int season = 2024;
    std::string gameType;
    bool isSpringTraining = false;
};

struct GameFeed {
    GameContext context;
    std::vector<RawPlay> plays;
};

} // namespace mlbt
