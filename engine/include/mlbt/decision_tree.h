#pragma once

#include <nlohmann/json.hpp>
#include <cstdint>
#include <random>
#include <string>
#include <vector>

namespace mlbt {

enum class MaxFeatures : uint8_t { SQRT, LOG2, ALL };

const char* maxFeaturesName(MaxFeatures m);
bool maxFeaturesFromName(const std::string& name, MaxFeatures& out);

// Number of candidate features per split for a given feature count (at least 1)
int featureSubsetSize(MaxFeatures m, int numFeatures);

struct TreeParams {
    int maxDepth = 8;
    int minSamplesSplit = 30;
    int minSamplesLeaf = 30;
    MaxFeatures maxFeatures = MaxFeatures::SQRT;
    double ccpAlpha = 0.01;   // minimal cost-complexity pruning strength
};

struct TreeNode {
    int feature = -1;           // -1 = leaf
    float threshold = 0.0f;     // go left when x[feature] <= threshold
    int left = -1;
    int right = -1;
    double impurity = 0.0;      // weighted Gini
    double weight = 0.0;        // weighted samples reaching the node
    int samples = 0;
    std::vector<double> value;  // class distribution, sums to 1

    bool isLeaf() const { return feature < 0; }
};

// Feature matrix, one row per sample
using Matrix = std::vector<std::vector<float>>;

// CART classification tree with Gini impurity and weighted samples.
class DecisionTree {
    int numClasses_ = 0;
    std::vector<TreeNode> nodes_;   // nodes_[0] is the root

public:
    DecisionTree() = default;
    DecisionTree(int numClasses, std::vector<TreeNode> nodes);

    // indices select the training rows (duplicates allowed, as in a bootstrap draw)
    void fit(const Matrix& X, const std::vector<int>& y,
             const std::vector<double>& sampleWeight,
             const std::vector<int>& indices, int numClasses,
             const TreeParams& params, std::mt19937& rng);

    // Class distribution of the leaf x falls into
    const std::vector<double>& predictProba(const float* x) const;

    // Adds this tree's normalized impurity decrease per feature into out
    void accumulateImportances(std::vector<double>& out) const;

    int numClasses() const { return numClasses_; }
    int nodeCount() const { return static_cast<int>(nodes_.size()); }
    int leafCount() const;
    int depth() const;
    const std::vector<TreeNode>& nodes() const { return nodes_; }

    nlohmann::json toJson() const;
    static DecisionTree fromJson(const nlohmann::json& j, int numClasses);

private:
    int build(const Matrix& X, const std::vector<int>& y,
              const std::vector<double>& w, std::vector<int>& idx,
              int depth, const TreeParams& params, std::mt19937& rng);
    void prune(double ccpAlpha);
    void compact();
};

} // namespace mlbt
