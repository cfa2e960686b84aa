#pragma once

#include "mlbt/play_event.h"
#include <nlohmann/json.hpp>
#include <memory>
#include <string>

namespace mlbt {

// Parse one play object (StatsAPI "allPlays" entry).
// Throws FeatureExtractionError when a required field is missing or mistyped.
RawPlay parsePlay(const nlohmann::json& play);

// Parse a full live-game feed: liveData.plays.allPlays plus gameData context
GameFeed parseGameFeed(const nlohmann::json& feed);

// Load from file; nullptr if the file cannot be opened
std::unique_ptr<GameFeed> loadGameFeed(const std::string& path);

// Load from JSON string (for testing)
GameFeed loadGameFeedFromString(const std::string& json);

} // namespace mlbt
