#include "mlbt/decision_tree.h"
#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>

namespace mlbt {

// --- MaxFeatures ---

const char* maxFeaturesName(MaxFeatures m) {
    switch (m) {
        case MaxFeatures::SQRT: return "sqrt";
        case MaxFeatures::LOG2: return "log2";
        default:                return "all";
    }
}

bool maxFeaturesFromName(const std::string& name, MaxFeatures& out) {
    if (name == "sqrt") out = MaxFeatures::SQRT;
    else if (name == "log2") out = MaxFeatures::LOG2;
    else if (name == "all" || name == "none") out = MaxFeatures::ALL;
    else return false;
    return true;
}

int featureSubsetSize(MaxFeatures m, int numFeatures) {
    if (numFeatures <= 0) return 0;
    int k = numFeatures;
    if (m == MaxFeatures::SQRT) k = static_cast<int>(std::sqrt(static_cast<double>(numFeatures)));
    else if (m == MaxFeatures::LOG2) k = static_cast<int>(std::log2(static_cast<double>(numFeatures)));
    return std::max(1, std::min(k, numFeatures));
}

// --- DecisionTree ---

namespace {

inline double gini(const std::vector<double>& classWeight, double total) {
    if (total <= 0.0) return 0.0;
    double sumSq = 0.0;
    for (double cw : classWeight) {
        double p = cw / total;
        sumSq += p * p;
    }
    return 1.0 - sumSq;
}

constexpr double EPS = 1e-12;

} // anonymous namespace

DecisionTree::DecisionTree(int numClasses, std::vector<TreeNode> nodes)
    : numClasses_(numClasses), nodes_(std::move(nodes)) {}

void DecisionTree::fit(const Matrix& X, const std::vector<int>& y,
                       const std::vector<double>& sampleWeight,
                       const std::vector<int>& indices, int numClasses,
                       const TreeParams& params, std::mt19937& rng) {
    if (X.empty() || indices.empty()) {
        throw std::invalid_argument("DecisionTree: empty training set");
    }
    numClasses_ = numClasses;
    nodes_.clear();

    std::vector<int> idx = indices;
    build(X, y, sampleWeight, idx, 0, params, rng);
    prune(params.ccpAlpha);
}

int DecisionTree::build(const Matrix& X, const std::vector<int>& y,
                        const std::vector<double>& w, std::vector<int>& idx,
                        int depth, const TreeParams& params, std::mt19937& rng) {
    const int n = static_cast<int>(idx.size());

    std::vector<double> classWeight(numClasses_, 0.0);
    double total = 0.0;
    for (int i : idx) {
        classWeight[y[i]] += w[i];
        total += w[i];
    }

    TreeNode node;
    node.samples = n;
    node.weight = total;
    node.impurity = gini(classWeight, total);
    node.value.assign(numClasses_, 0.0);
    for (int c = 0; c < numClasses_; ++c) {
        node.value[c] = total > 0.0 ? classWeight[c] / total : 1.0 / numClasses_;
    }

    const int nodeId = static_cast<int>(nodes_.size());
    nodes_.push_back(std::move(node));

    bool canSplit = depth < params.maxDepth &&
                    n >= params.minSamplesSplit &&
                    n >= 2 * params.minSamplesLeaf &&
                    n >= 2 &&
                    nodes_[nodeId].impurity > EPS;
    if (!canSplit) return nodeId;

    // Random feature subset for this split
    const int numFeatures = static_cast<int>(X[idx[0]].size());
    std::vector<int> features(numFeatures);
    std::iota(features.begin(), features.end(), 0);
    std::shuffle(features.begin(), features.end(), rng);
    features.resize(featureSubsetSize(params.maxFeatures, numFeatures));

    const int minLeaf = std::max(1, params.minSamplesLeaf);
    double bestScore = total * nodes_[nodeId].impurity;
    int bestFeature = -1;
    float bestThreshold = 0.0f;

    std::vector<int> sorted(idx);
    std::vector<double> leftCW(numClasses_), rightCW(numClasses_);

    for (int f : features) {
        std::stable_sort(sorted.begin(), sorted.end(), [&](int a, int b) {
            return X[a][f] < X[b][f];
        });
        if (X[sorted.front()][f] >= X[sorted.back()][f]) continue;  // constant

        std::fill(leftCW.begin(), leftCW.end(), 0.0);
        double leftW = 0.0;

        for (int pos = 0; pos < n - 1; ++pos) {
            int i = sorted[pos];
            leftCW[y[i]] += w[i];
            leftW += w[i];

            int nLeft = pos + 1;
            int nRight = n - nLeft;
            if (nLeft < minLeaf) continue;
            if (nRight < minLeaf) break;

            float v = X[i][f];
            float vNext = X[sorted[pos + 1]][f];
            if (!(vNext > v)) continue;

            double rightW = total - leftW;
            for (int c = 0; c < numClasses_; ++c) rightCW[c] = classWeight[c] - leftCW[c];

            double score = leftW * gini(leftCW, leftW) + rightW * gini(rightCW, rightW);
            if (score < bestScore - EPS) {
                bestScore = score;
                bestFeature = f;
                float mid = v + (vNext - v) * 0.5f;
                bestThreshold = (mid >= vNext) ? v : mid;
            }
        }
    }

    if (bestFeature < 0) return nodeId;

    std::vector<int> leftIdx, rightIdx;
    leftIdx.reserve(n);
    rightIdx.reserve(n);
    for (int i : idx) {
        if (X[i][bestFeature] <= bestThreshold) leftIdx.push_back(i);
        else rightIdx.push_back(i);
    }
    if (leftIdx.empty() || rightIdx.empty()) return nodeId;

    // Children are appended after this node, so nodes_ may reallocate: index, don't hold refs
    int l = build(X, y, w, leftIdx, depth + 1, params, rng);
    int r = build(X, y, w, rightIdx, depth + 1, params, rng);
    nodes_[nodeId].feature = bestFeature;
    nodes_[nodeId].threshold = bestThreshold;
    nodes_[nodeId].left = l;
    nodes_[nodeId].right = r;
    return nodeId;
}

void DecisionTree::prune(double ccpAlpha) {
    if (ccpAlpha <= 0.0 || nodes_.empty()) return;
    const double total = nodes_[0].weight;
    if (total <= 0.0) return;

    const int n = static_cast<int>(nodes_.size());
    std::vector<double> subtreeRisk(n);
    std::vector<int> leaves(n);
    std::vector<bool> reachable(n);

    // Weakest-link pruning: collapse the internal node with the smallest
    // effective alpha while that alpha does not exceed ccpAlpha.
    while (true) {
        std::fill(reachable.begin(), reachable.end(), false);
        reachable[0] = true;
        for (int i = 0; i < n; ++i) {
            if (!reachable[i] || nodes_[i].isLeaf()) continue;
            reachable[nodes_[i].left] = true;
            reachable[nodes_[i].right] = true;
        }

        // Children always have larger indices than their parent
        for (int i = n - 1; i >= 0; --i) {
            if (!reachable[i]) continue;
            const TreeNode& nd = nodes_[i];
            if (nd.isLeaf()) {
                subtreeRisk[i] = nd.impurity * nd.weight / total;
                leaves[i] = 1;
            } else {
                subtreeRisk[i] = subtreeRisk[nd.left] + subtreeRisk[nd.right];
                leaves[i] = leaves[nd.left] + leaves[nd.right];
            }
        }

        int weakest = -1;
        double minAlpha = 0.0;
        for (int i = 0; i < n; ++i) {
            if (!reachable[i] || nodes_[i].isLeaf()) continue;
            double nodeRisk = nodes_[i].impurity * nodes_[i].weight / total;
            double alpha = (nodeRisk - subtreeRisk[i]) / (leaves[i] - 1);
            if (weakest < 0 || alpha < minAlpha) {
                weakest = i;
                minAlpha = alpha;
            }
        }

        if (weakest < 0 || minAlpha > ccpAlpha) break;

        nodes_[weakest].feature = -1;
        nodes_[weakest].left = -1;
        nodes_[weakest].right = -1;
    }

    compact();
}

void DecisionTree::compact() {
    std::vector<TreeNode> out;
    out.reserve(nodes_.size());

    // Pre-order copy keeps the parent-before-children index invariant
    std::vector<int> stack;
    std::vector<int> remap(nodes_.size(), -1);
    std::vector<int> order;
    stack.push_back(0);
    while (!stack.empty()) {
        int old = stack.back();
        stack.pop_back();
        remap[old] = static_cast<int>(order.size());
        order.push_back(old);
        const TreeNode& nd = nodes_[old];
        if (!nd.isLeaf()) {
            stack.push_back(nd.right);
            stack.push_back(nd.left);
        }
    }

    for (int old : order) {
        TreeNode nd = nodes_[old];
        if (!nd.isLeaf()) {
            nd.left = remap[nd.left];
            nd.right = remap[nd.right];
        }
        out.push_back(std::move(nd));
    }
    nodes_ = std::move(out);
}

const std::vector<double>& DecisionTree::predictProba(const float* x) const {
    if (nodes_.empty()) {
        throw std::logic_error("DecisionTree: predict on an unfitted tree");
    }
    int i = 0;
    while (!nodes_[i].isLeaf()) {
        i = (x[nodes_[i].feature] <= nodes_[i].threshold) ? nodes_[i].left : nodes_[i].right;
    }
    return nodes_[i].value;
}

void DecisionTree::accumulateImportances(std::vector<double>& out) const {
    std::vector<double> local(out.size(), 0.0);
    double sum = 0.0;
    for (const auto& nd : nodes_) {
        if (nd.isLeaf()) continue;
        const TreeNode& l = nodes_[nd.left];
        const TreeNode& r = nodes_[nd.right];
        double decrease = nd.weight * nd.impurity - l.weight * l.impurity - r.weight * r.impurity;
        if (nd.feature < static_cast<int>(local.size())) {
            local[nd.feature] += decrease;
            sum += decrease;
        }
    }
    if (sum <= 0.0) return;
    for (size_t f = 0; f < out.size(); ++f) out[f] += local[f] / sum;
}

int DecisionTree::leafCount() const {
    int count = 0;
    for (const auto& nd : nodes_) {
        if (nd.isLeaf()) count++;
    }
    return count;
}

int DecisionTree::depth() const {
    if (nodes_.empty()) return 0;
    std::vector<int> d(nodes_.size(), 0);
    int maxDepth = 0;
    for (size_t i = 0; i < nodes_.size(); ++i) {
        const TreeNode& nd = nodes_[i];
        maxDepth = std::max(maxDepth, d[i]);
        if (!nd.isLeaf()) {
            d[nd.left] = d[i] + 1;
            d[nd.right] = d[i] + 1;
        }
    }
    return maxDepth;
}

nlohmann::json DecisionTree::toJson() const {
    nlohmann::json nodes = nlohmann::json::array();
    for (const auto& nd : nodes_) {
        nlohmann::json jn;
        jn["f"] = nd.feature;
        jn["t"] = nd.threshold;
        jn["l"] = nd.left;
        jn["r"] = nd.right;
        jn["imp"] = nd.impurity;
        jn["w"] = nd.weight;
        jn["n"] = nd.samples;
        jn["v"] = nd.value;
        nodes.push_back(std::move(jn));
    }
    return nlohmann::json{{"nodes", std::move(nodes)}};
}

DecisionTree DecisionTree::fromJson(const nlohmann::json& j, int numClasses) {
    if (!j.contains("nodes") || !j["nodes"].is_array() || j["nodes"].empty()) {
        throw std::invalid_argument("DecisionTree: missing nodes");
    }
    const int n = static_cast<int>(j["nodes"].size());
    std::vector<TreeNode> nodes;
    nodes.reserve(n);
    for (int i = 0; i < n; ++i) {
        const nlohmann::json& jn = j["nodes"][i];
        TreeNode nd;
        nd.feature = jn.at("f").get<int>();
        nd.threshold = jn.at("t").get<float>();
        nd.left = jn.at("l").get<int>();
        nd.right = jn.at("r").get<int>();
        nd.impurity = jn.value("imp", 0.0);
        nd.weight = jn.value("w", 0.0);
        nd.samples = jn.value("n", 0);
        nd.value = jn.at("v").get<std::vector<double>>();
        if (static_cast<int>(nd.value.size()) != numClasses) {
            throw std::invalid_argument("DecisionTree: class count mismatch");
        }
        // Children follow their parent; rules out cycles
        if (!nd.isLeaf() && (nd.left <= i || nd.left >= n || nd.right <= i || nd.right >= n)) {
            throw std::invalid_argument("DecisionTree: child index out of range");
        }
        nodes.push_back(std::move(nd));
    }
    return DecisionTree(numClasses, std::move(nodes));
}

} // namespace mlbt
