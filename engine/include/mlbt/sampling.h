#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace mlbt {

struct SplitIndices {
    std::vector<int> train;
    std::vector<int> test;
};

// Per-class shuffled split; each class contributes round(count * testFraction)
// rows to test, keeping at least one row of every class in train.
SplitIndices stratifiedSplit(const std::vector<int>& y, double testFraction, uint32_t seed);

// K folds with class proportions preserved; fold k is the test side.
// Classes with fewer than k rows appear in fewer test folds.
std::vector<SplitIndices> stratifiedKFold(const std::vector<int>& y, int k, uint32_t seed);

// Inverse-frequency class weights, n_samples / (n_classes * count), with a
// 1.5x boost for classes below 20% of the median class count.
std::map<std::string, double> computeClassWeights(const std::vector<std::string>& labels);

} // namespace mlbt
