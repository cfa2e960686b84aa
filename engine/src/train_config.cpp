#include "mlbt/train_config.h"
#include <nlohmann/json.hpp>
#include <fstream>

namespace mlbt {

namespace {

void readForest(const nlohmann::json& j, ForestParams& p) {
    p.nEstimators = j.value("n_estimators", p.nEstimators);
    p.tree.maxDepth = j.value("max_depth", p.tree.maxDepth);
    p.tree.minSamplesSplit = j.value("min_samples_split", p.tree.minSamplesSplit);
    p.tree.minSamplesLeaf = j.value("min_samples_leaf", p.tree.minSamplesLeaf);
    p.tree.ccpAlpha = j.value("ccp_alpha", p.tree.ccpAlpha);
    p.bootstrap = j.value("bootstrap", p.bootstrap);
    if (j.contains("max_features")) {
        maxFeaturesFromName(j["max_features"].get<std::string>(), p.tree.maxFeatures);
    }
}

template <typename T>
void readList(const nlohmann::json& j, const char* key, std::vector<T>& out) {
    if (j.contains(key)) out = j[key].get<std::vector<T>>();
}

void readGrid(const nlohmann::json& j, ParamGrid& g) {
    readList(j, "n_estimators", g.nEstimators);
    readList(j, "max_depth", g.maxDepth);
    readList(j, "min_samples_leaf", g.minSamplesLeaf);
    readList(j, "min_samples_split", g.minSamplesSplit);
    readList(j, "ccp_alpha", g.ccpAlpha);
    if (j.contains("max_features")) {
        g.maxFeatures.clear();
        for (const auto& name : j["max_features"]) {
            MaxFeatures mf;
            if (maxFeaturesFromName(name.get<std::string>(), mf)) g.maxFeatures.push_back(mf);
        }
    }
}

std::unique_ptr<TrainConfig> parseConfig(const nlohmann::json& j) {
    auto cfg = std::make_unique<TrainConfig>();
    if (!j.is_object()) return cfg;

    cfg->seed = j.value("seed", cfg->seed);
    cfg->testFraction = j.value("test_fraction", cfg->testFraction);
    cfg->cvFolds = j.value("cv_folds", cfg->cvFolds);
    cfg->workers = j.value("workers", cfg->workers);
    cfg->verbose = j.value("verbose", cfg->verbose);
    cfg->crossValidate = j.value("cross_validate", cfg->crossValidate);
    if (j.contains("forest")) readForest(j["forest"], cfg->fixed);
    if (j.contains("grid")) readGrid(j["grid"], cfg->grid);
    cfg->fixed.seed = cfg->seed;
    return cfg;
}

} // anonymous namespace

std::unique_ptr<TrainConfig> loadTrainConfig(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) return nullptr;
    nlohmann::json j = nlohmann::json::parse(file);
    return parseConfig(j);
}

std::unique_ptr<TrainConfig> loadTrainConfigFromString(const std::string& json) {
    auto j = nlohmann::json::parse(json);
    return parseConfig(j);
}

} // namespace mlbt
