#pragma once

#include "mlbt/decision_tree.h"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace mlbt {

struct ForestParams {
    int nEstimators = 200;
    TreeParams tree;
    bool bootstrap = true;
    uint32_t seed = 42;
};

// Bootstrap ensemble of CART trees; probabilities are the mean of the
// trees' leaf class distributions.
class RandomForest {
    ForestParams params_;
    std::vector<std::string> classes_;   // sorted label names
    int numFeatures_ = 0;
    std::vector<DecisionTree> trees_;

public:
    RandomForest() = default;
    explicit RandomForest(ForestParams params);

    // classWeights: per-label sample weight (labels absent from the map weigh 1)
    void fit(const Matrix& X, const std::vector<std::string>& labels,
             const std::map<std::string, double>& classWeights);

    std::vector<double> predictProba(const float* x) const;
    int predictIndex(const float* x) const;
    std::string predict(const float* x) const;

    // Mean normalized impurity decrease per feature
    std::vector<double> featureImportances() const;

    bool isFitted() const { return !trees_.empty(); }
    const std::vector<std::string>& classes() const { return classes_; }
    int classIndex(const std::string& label) const;   // -1 if unknown
    int numFeatures() const { return numFeatures_; }
    const ForestParams& params() const { return params_; }
    const std::vector<DecisionTree>& trees() const { return trees_; }

    nlohmann::json toJson() const;
    static std::unique_ptr<RandomForest> fromJson(const nlohmann::json& j);
};

} // namespace mlbt
