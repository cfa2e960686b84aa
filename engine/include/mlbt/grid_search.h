#pragma once

#include "mlbt/random_forest.h"
#include "mlbt/sampling.h"
#include <atomic>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace mlbt {

struct ParamGrid {
    std::vector<int> nEstimators = {100, 200};
    std::vector<int> maxDepth = {8, 10};
    std::vector<int> minSamplesLeaf = {30, 50};
    std::vector<int> minSamplesSplit = {30, 50};
    std::vector<MaxFeatures> maxFeatures = {MaxFeatures::SQRT, MaxFeatures::LOG2};
    std::vector<double> ccpAlpha = {0.01, 0.02};
};

// Fit a forest on fold.train and predict fold.test. Predictions are ids into
// classNames (sorted), -1 for a label the fold model cannot produce.
std::vector<int> fitAndPredictFold(const Matrix& X, const std::vector<std::string>& labels,
                                   const std::vector<std::string>& classNames,
                                   const std::map<std::string, double>& classWeights,
                                   const ForestParams& params, const SplitIndices& fold);

// Cartesian product of the grid; fields not in the grid come from base
std::vector<ForestParams> expandGrid(const ParamGrid& grid, const ForestParams& base);

struct GridSearchOptions {
    int folds = 5;
    int workers = 0;                         // 0 = hardware concurrency
    uint32_t seed = 42;
    const std::atomic<bool>* cancel = nullptr;  // checked before each fold fit
};

struct GridCandidate {
    ForestParams params;
    int completedFolds = 0;
    double meanAccuracy = 0.0;
    double stdAccuracy = 0.0;
    double meanF1 = 0.0;        // weighted F1
    double stdF1 = 0.0;
};

struct GridSearchResult {
    std::vector<GridCandidate> candidates;
    int bestIndex = -1;          // -1 when no candidate completed every fold

    const GridCandidate* best() const {
        return bestIndex < 0 ? nullptr : &candidates[bestIndex];
    }
};

// Scores every (candidate x fold) fit on a worker pool with stratified
// K-fold cross-validation. The best candidate maximizes mean weighted F1
// among candidates whose folds all completed; ties keep grid order.
GridSearchResult gridSearch(const Matrix& X, const std::vector<std::string>& labels,
                            const std::map<std::string, double>& classWeights,
                            const ParamGrid& grid, const ForestParams& base,
                            const GridSearchOptions& options);

} // namespace mlbt
