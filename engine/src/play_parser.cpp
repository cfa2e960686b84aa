#include "mlbt/play_parser.h"
#include "mlbt/errors.h"
#include <cctype>
#include <fstream>

namespace mlbt {

using nlohmann::json;

namespace {

// Nested lookup (section.key) with a flat fallback (flatKey at top level)
const json* findField(const json& play, const char* section, const char* key,
                      const char* flatKey) {
    if (play.contains(section) && play[section].is_object()) {
        const json& s = play[section];
        if (s.contains(key) && !s[key].is_null()) return &s[key];
    }
    if (flatKey && play.contains(flatKey) && !play[flatKey].is_null()) {
        return &play[flatKey];
    }
    return nullptr;
}

int toInt(const json& v, const std::string& field) {
    if (v.is_number_integer()) return v.get<int>();
    if (v.is_number()) return static_cast<int>(v.get<double>());
    if (v.is_string()) {
        try {
            return std::stoi(v.get<std::string>());
        } catch (const std::exception&) {
            // fall through to the error below
        }
    }
    throw FeatureExtractionError("field '" + field + "' is not an integer");
}

int requiredInt(const json& play, const char* section, const char* key, const char* flatKey) {
    const json* v = findField(play, section, key, flatKey);
    std::string field = std::string(section) + "." + key;
    if (!v) throw FeatureExtractionError("missing required field '" + field + "'");
    return toInt(*v, field);
}

int optionalInt(const json& play, const char* section, const char* key, const char* flatKey) {
    const json* v = findField(play, section, key, flatKey);
    if (!v) return 0;
    return toInt(*v, std::string(section) + "." + key);
}

long playerId(const json& play, const char* role) {
    if (!play.contains("matchup") || !play["matchup"].is_object()) return 0;
    const json& m = play["matchup"];
    if (!m.contains(role) || !m[role].is_object() || !m[role].contains("id")) return 0;
    const json& id = m[role]["id"];
    if (id.is_number_integer()) return id.get<long>();
    if (id.is_string()) {
        try {
            return std::stol(id.get<std::string>());
        } catch (const std::exception&) {
            return 0;
        }
    }
    return 0;
}

HalfInning parseHalf(const json& play) {
    const json* v = findField(play, "about", "halfInning", "halfInning");
    if (!v || !v->is_string()) {
        throw FeatureExtractionError("missing required field 'about.halfInning'");
    }
    std::string s = v->get<std::string>();
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (s == "top") return HalfInning::TOP;
    if (s == "bottom") return HalfInning::BOTTOM;
    throw FeatureExtractionError("unknown half inning '" + s + "'");
}

std::string baseCode(const json& movement, const char* key) {
    if (!movement.contains(key) || !movement[key].is_string()) return "";
    return movement[key].get<std::string>();
}

} // anonymous namespace

RawPlay parsePlay(const json& play) {
    if (!play.is_object()) {
        throw FeatureExtractionError("play record is not an object");
    }

    RawPlay p;
    p.inning = requiredInt(play, "about", "inning", "inning");
    p.half = parseHalf(play);
    p.outs = requiredInt(play, "count", "outs", "outs");
    p.balls = optionalInt(play, "count", "balls", "balls");
    p.strikes = optionalInt(play, "count", "strikes", "strikes");

    const json* event = findField(play, "result", "event", "event");
    if (!event || !event->is_string()) {
        throw FeatureExtractionError("missing required field 'result.event'");
    }
    p.event = event->get<std::string>();

    // Scores: result.homeScore (live feed), about.home (older exports), flat keys
    if (findField(play, "result", "homeScore", nullptr)) {
        p.homeScore = optionalInt(play, "result", "homeScore", nullptr);
        p.awayScore = optionalInt(play, "result", "awayScore", nullptr);
    } else {
        p.homeScore = optionalInt(play, "about", "home", "homeScore");
        p.awayScore = optionalInt(play, "about", "away", "awayScore");
    }

    const json* team = findField(play, "about", "team", nullptr);
    if (team && team->is_string()) p.battingTeam = team->get<std::string>();

    p.batterId = playerId(play, "batter");
    p.pitcherId = playerId(play, "pitcher");

    if (play.contains("runners") && play["runners"].is_array()) {
        for (const auto& r : play["runners"]) {
            RunnerMovement mv;
            if (r.contains("movement") && r["movement"].is_object()) {
                mv.start = baseCode(r["movement"], "start");
                mv.end = baseCode(r["movement"], "end");
            }
            p.runners.push_back(std::move(mv));
        }
    }

    return p;
}

GameFeed parseGameFeed(const json& feed) {
    GameFeed g;

    // Bare array of plays
    if (feed.is_array()) {
        for (const auto& play : feed) g.plays.push_back(parsePlay(play));
        return g;
    }

    if (feed.contains("gameData") && feed["gameData"].is_object()) {
        const json& gd = feed["gameData"];
        if (gd.contains("datetime") && gd["datetime"].contains("originalDate") &&
            gd["datetime"]["originalDate"].is_string()) {
            std::string date = gd["datetime"]["originalDate"].get<std::string>();
            size_t dash = date.find('-');
            if (dash != std::string::npos && dash > 0) {
                try {
                    g.context.season = std::stoi(date.substr(0, dash));
                } catch (const std::exception&) {
                    g.context.season = 2024;
                }
            }
        }
        if (gd.contains("game") && gd["game"].contains("type") && gd["game"]["type"].is_string()) {
            g.context.gameType = gd["game"]["type"].get<std::string>();
            g.context.isSpringTraining = (g.context.gameType == "S");
        }
    }

    if (feed.contains("liveData") && feed["liveData"].contains("plays") &&
        feed["liveData"]["plays"].contains("allPlays")) {
        for (const auto& play : feed["liveData"]["plays"]["allPlays"]) {
            g.plays.push_back(parsePlay(play));
        }
    }

    return g;
}

std::unique_ptr<GameFeed> loadGameFeed(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) return nullptr;
    json j = json::parse(file);
    return std::make_unique<GameFeed>(parseGameFeed(j));
}

GameFeed loadGameFeedFromString(const std::string& json) {
    return parseGameFeed(nlohmann::json::parse(json));
}

} // namespace mlbt
