#include "mlbt/sampling.h"
#include <algorithm>
#include <cmath>
#include <random>

namespace mlbt {

namespace {

// Row indices grouped by class id, in ascending class order
std::map<int, std::vector<int>> groupByClass(const std::vector<int>& y) {
    std::map<int, std::vector<int>> groups;
    for (int i = 0; i < static_cast<int>(y.size()); ++i) {
        groups[y[i]].push_back(i);
    }
    return groups;
}

} // anonymous namespace

SplitIndices stratifiedSplit(const std::vector<int>& y, double testFraction, uint32_t seed) {
    std::mt19937 rng(seed);
    SplitIndices out;

    for (auto& kv : groupByClass(y)) {
        std::vector<int>& rows = kv.second;
        std::shuffle(rows.begin(), rows.end(), rng);

        int count = static_cast<int>(rows.size());
        int nTest = static_cast<int>(std::lround(count * testFraction));
        nTest = std::max(0, std::min(nTest, count - 1));

        out.test.insert(out.test.end(), rows.begin(), rows.begin() + nTest);
        out.train.insert(out.train.end(), rows.begin() + nTest, rows.end());
    }

    std::sort(out.train.begin(), out.train.end());
    std::sort(out.test.begin(), out.test.end());
    return out;
}

std::vector<SplitIndices> stratifiedKFold(const std::vector<int>& y, int k, uint32_t seed) {
    std::vector<SplitIndices> folds;
    if (k < 2) return folds;

    std::mt19937 rng(seed);
    std::vector<int> foldOf(y.size(), 0);

    // Round-robin per class, continuing the rotation across classes so fold sizes stay even
    int offset = 0;
    for (auto& kv : groupByClass(y)) {
        std::vector<int>& rows = kv.second;
        std::shuffle(rows.begin(), rows.end(), rng);
        for (size_t i = 0; i < rows.size(); ++i) {
            foldOf[rows[i]] = (offset + static_cast<int>(i)) % k;
        }
        offset += static_cast<int>(rows.size());
    }

    folds.resize(k);
    for (int i = 0; i < static_cast<int>(y.size()); ++i) {
        for (int f = 0; f < k; ++f) {
            if (foldOf[i] == f) folds[f].test.push_back(i);
            else folds[f].train.push_back(i);
        }
    }
    return folds;
}

std::map<std::string, double> computeClassWeights(const std::vector<std::string>& labels) {
    std::map<std::string, int> counts;
    for (const auto& l : labels) counts[l]++;

    std::map<std::string, double> weights;
    if (counts.empty()) return weights;

    const double nSamples = static_cast<double>(labels.size());
    const double nClasses = static_cast<double>(counts.size());

    std::vector<int> sorted;
    for (const auto& kv : counts) {
        weights[kv.first] = nSamples / (nClasses * kv.second);
        sorted.push_back(kv.second);
    }

    std::sort(sorted.begin(), sorted.end());
    size_t mid = sorted.size() / 2;
    double median = (sorted.size() % 2 == 1)
        ? sorted[mid]
        : (sorted[mid - 1] + sorted[mid]) / 2.0;

    for (const auto& kv : counts) {
        if (kv.second < median * 0.2) weights[kv.first] *= 1.5;
    }
    return weights;
}

} // namespace mlbt
