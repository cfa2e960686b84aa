#include "mlbt/player_stats.h"
#include <fstream>

namespace mlbt {

using nlohmann::json;

PitcherStats derivePitchingRates(const PitchingTotals& t) {
    PitcherStats s;
    s.era = t.era;
    s.whip = t.whip;

    if (t.inningsPitched > 0.0) {
        s.kPer9 = t.strikeouts * 9.0 / t.inningsPitched;
        s.bbPer9 = t.walks * 9.0 / t.inningsPitched;
        s.hPer9 = t.hits * 9.0 / t.inningsPitched;
    }

    int faced = t.hits + t.walks + t.strikeouts;
    if (faced > 0) {
        s.strikeoutRate = static_cast<double>(t.strikeouts) / faced;
        s.walkRate = static_cast<double>(t.walks) / faced;
    }

    int outs = t.groundOuts + t.airOuts;
    if (outs > 0) {
        s.groundBallRate = static_cast<double>(t.groundOuts) / outs;
    }
    return s;
}

double parseStatValue(const json& v) {
    if (v.is_number()) return v.get<double>();
    if (!v.is_string()) return 0.0;

    std::string s = v.get<std::string>();
    if (s.empty() || s == "-" || s == ".---" || s == "0.---" || s == "-.--" ||
        s == "-.---" || s == "*.**") {
        return 0.0;
    }
    // ".285" -> "0.285"
    if (s[0] == '.') s = "0" + s;
    try {
        return std::stod(s);
    } catch (const std::exception&) {
        return 0.0;
    }
}

// --- StatsLookupChain ---

void StatsLookupChain::addSource(std::unique_ptr<StatsSource> source) {
    if (source) sources_.push_back(std::move(source));
}

bool StatsLookupChain::batterStats(long batterId, BatterStats& out) const {
    for (const auto& src : sources_) {
        if (src->batterStats(batterId, out)) return true;
    }
    return false;
}

bool StatsLookupChain::pitcherStats(long pitcherId, PitcherStats& out) const {
    for (const auto& src : sources_) {
        if (src->pitcherStats(pitcherId, out)) return true;
    }
    return false;
}

bool StatsLookupChain::matchupStats(long batterId, long pitcherId, MatchupStats& out) const {
    for (const auto& src : sources_) {
        if (src->matchupStats(batterId, pitcherId, out)) return true;
    }
    return false;
}

// --- JsonStatsSource ---

namespace {

const json* entry(const json& doc, const char* section, const std::string& key) {
    if (!doc.contains(section) || !doc[section].is_object()) return nullptr;
    const json& s = doc[section];
    auto it = s.find(key);
    if (it == s.end() || !it->is_object() || it->empty()) return nullptr;
    return &(*it);
}

double num(const json& e, const char* key) {
    auto it = e.find(key);
    return it == e.end() ? 0.0 : parseStatValue(*it);
}

int count(const json& e, const char* key) {
    return static_cast<int>(num(e, key));
}

} // anonymous namespace

JsonStatsSource::JsonStatsSource(json doc) : doc_(std::move(doc)) {}

bool JsonStatsSource::batterStats(long batterId, BatterStats& out) const {
    const json* e = entry(doc_, "batters", std::to_string(batterId));
    if (!e) return false;

    out.avg = num(*e, "avg");
    out.obp = num(*e, "obp");
    out.slg = num(*e, "slg");
    out.ops = num(*e, "ops");
    out.homeRuns = count(*e, "homeRuns");
    out.strikeouts = count(*e, "strikeOuts");
    out.walks = count(*e, "baseOnBalls");
    // No split data in a season line: season figures stand in
    out.rispAvg = out.avg;
    out.clutchOps = out.ops;
    return true;
}

bool JsonStatsSource::pitcherStats(long pitcherId, PitcherStats& out) const {
    const json* e = entry(doc_, "pitchers", std::to_string(pitcherId));
    if (!e) return false;

    PitchingTotals t;
    t.era = num(*e, "era");
    t.whip = num(*e, "whip");
    t.inningsPitched = num(*e, "inningsPitched");
    t.strikeouts = count(*e, "strikeOuts");
    t.walks = count(*e, "baseOnBalls");
    t.hits = count(*e, "hits");
    t.groundOuts = count(*e, "groundOuts");
    t.airOuts = count(*e, "airOuts");
    out = derivePitchingRates(t);
    return true;
}

bool JsonStatsSource::matchupStats(long batterId, long pitcherId, MatchupStats& out) const {
    const json* e = entry(doc_, "matchups",
                          std::to_string(batterId) + "-" + std::to_string(pitcherId));
    if (!e) return false;

    out.atBats = count(*e, "atBats");
    out.hits = count(*e, "hits");
    out.homeRuns = count(*e, "homeRuns");
    out.strikeouts = count(*e, "strikeOuts");
    out.walks = count(*e, "baseOnBalls");
    out.avg = num(*e, "avg");
    out.ops = num(*e, "ops");
    return true;
}

std::unique_ptr<JsonStatsSource> loadStatsSource(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) return nullptr;
    json j = json::parse(file);
    return std::make_unique<JsonStatsSource>(std::move(j));
}

} // namespace mlbt
