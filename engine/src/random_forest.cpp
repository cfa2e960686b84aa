#include "mlbt/random_forest.h"
#include <algorithm>
#include <random>
#include <set>
#include <stdexcept>

namespace mlbt {

RandomForest::RandomForest(ForestParams params) : params_(std::move(params)) {}

void RandomForest::fit(const Matrix& X, const std::vector<std::string>& labels,
                       const std::map<std::string, double>& classWeights) {
    if (X.empty() || X.size() != labels.size()) {
        throw std::invalid_argument("RandomForest: feature/label size mismatch");
    }

    std::set<std::string> distinct(labels.begin(), labels.end());
    classes_.assign(distinct.begin(), distinct.end());
    numFeatures_ = static_cast<int>(X[0].size());

    const int n = static_cast<int>(X.size());
    std::vector<int> y(n);
    std::vector<double> w(n, 1.0);
    for (int i = 0; i < n; ++i) {
        y[i] = classIndex(labels[i]);
        auto it = classWeights.find(labels[i]);
        if (it != classWeights.end()) w[i] = it->second;
    }

    trees_.clear();
    trees_.resize(std::max(1, params_.nEstimators));
    for (size_t t = 0; t < trees_.size(); ++t) {
        std::mt19937 rng(params_.seed + static_cast<uint32_t>(t));

        std::vector<int> indices(n);
        if (params_.bootstrap) {
            std::uniform_int_distribution<int> pick(0, n - 1);
            for (int i = 0; i < n; ++i) indices[i] = pick(rng);
        } else {
            for (int i = 0; i < n; ++i) indices[i] = i;
        }

        trees_[t].fit(X, y, w, indices, static_cast<int>(classes_.size()), params_.tree, rng);
    }
}

std::vector<double> RandomForest::predictProba(const float* x) const {
    std::vector<double> proba(classes_.size(), 0.0);
    if (trees_.empty()) return proba;
    for (const auto& tree : trees_) {
        const auto& v = tree.predictProba(x);
        for (size_t c = 0; c < proba.size() && c < v.size(); ++c) proba[c] += v[c];
    }
    for (auto& p : proba) p /= static_cast<double>(trees_.size());
    return proba;
}

int RandomForest::predictIndex(const float* x) const {
    std::vector<double> proba = predictProba(x);
    if (proba.empty()) return -1;
    return static_cast<int>(std::max_element(proba.begin(), proba.end()) - proba.begin());
}

std::string RandomForest::predict(const float* x) const {
    int idx = predictIndex(x);
    return idx < 0 ? std::string() : classes_[idx];
}

std::vector<double> RandomForest::featureImportances() const {
    std::vector<double> imp(numFeatures_, 0.0);
    if (trees_.empty()) return imp;
    for (const auto& tree : trees_) tree.accumulateImportances(imp);
    double sum = 0.0;
    for (double v : imp) sum += v;
    if (sum > 0.0) {
        for (auto& v : imp) v /= sum;
    }
    return imp;
}

int RandomForest::classIndex(const std::string& label) const {
    auto it = std::lower_bound(classes_.begin(), classes_.end(), label);
    if (it == classes_.end() || *it != label) return -1;
    return static_cast<int>(it - classes_.begin());
}

nlohmann::json RandomForest::toJson() const {
    nlohmann::json trees = nlohmann::json::array();
    for (const auto& tree : trees_) trees.push_back(tree.toJson());

    const TreeParams& tp = params_.tree;
    return {
        {"classes", classes_},
        {"num_features", numFeatures_},
        {"params", {
            {"n_estimators", params_.nEstimators},
            {"max_depth", tp.maxDepth},
            {"min_samples_split", tp.minSamplesSplit},
            {"min_samples_leaf", tp.minSamplesLeaf},
            {"max_features", maxFeaturesName(tp.maxFeatures)},
            {"ccp_alpha", tp.ccpAlpha},
            {"bootstrap", params_.bootstrap},
            {"seed", params_.seed},
        }},
        {"trees", std::move(trees)},
    };
}

std::unique_ptr<RandomForest> RandomForest::fromJson(const nlohmann::json& j) {
    if (!j.is_object() || !j.contains("classes") || !j.contains("trees")) return nullptr;

    ForestParams params;
    if (j.contains("params")) {
        const auto& p = j["params"];
        params.nEstimators = p.value("n_estimators", params.nEstimators);
        params.tree.maxDepth = p.value("max_depth", params.tree.maxDepth);
        params.tree.minSamplesSplit = p.value("min_samples_split", params.tree.minSamplesSplit);
        params.tree.minSamplesLeaf = p.value("min_samples_leaf", params.tree.minSamplesLeaf);
        maxFeaturesFromName(p.value("max_features", std::string("sqrt")), params.tree.maxFeatures);
        params.tree.ccpAlpha = p.value("ccp_alpha", params.tree.ccpAlpha);
        params.bootstrap = p.value("bootstrap", params.bootstrap);
        params.seed = p.value("seed", params.seed);
    }

    auto forest = std::make_unique<RandomForest>(params);
    forest->classes_ = j["classes"].get<std::vector<std::string>>();
    // Tree leaf distributions are indexed by sorted class order
    if (!std::is_sorted(forest->classes_.begin(), forest->classes_.end())) return nullptr;
    forest->numFeatures_ = j.value("num_features", 0);

    const int numClasses = static_cast<int>(forest->classes_.size());
    for (const auto& jt : j["trees"]) {
        forest->trees_.push_back(DecisionTree::fromJson(jt, numClasses));
    }
    if (forest->trees_.empty() || numClasses == 0) return nullptr;
    return forest;
}

} // namespace mlbt
