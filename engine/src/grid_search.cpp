#include "mlbt/grid_search.h"
#include "mlbt/metrics.h"
#include <algorithm>
#include <future>
#include <set>
#include <thread>

namespace mlbt {

std::vector<ForestParams> expandGrid(const ParamGrid& grid, const ForestParams& base) {
    std::vector<ForestParams> out;
    for (int n : grid.nEstimators)
    for (int depth : grid.maxDepth)
    for (int leaf : grid.minSamplesLeaf)
    for (int split : grid.minSamplesSplit)
    for (MaxFeatures mf : grid.maxFeatures)
    for (double alpha : grid.ccpAlpha) {
        ForestParams p = base;
        p.nEstimators = n;
        p.tree.maxDepth = depth;
        p.tree.minSamplesLeaf = leaf;
        p.tree.minSamplesSplit = split;
        p.tree.maxFeatures = mf;
        p.tree.ccpAlpha = alpha;
        out.push_back(p);
    }
    return out;
}

std::vector<int> fitAndPredictFold(const Matrix& X, const std::vector<std::string>& labels,
                                   const std::vector<std::string>& classNames,
                                   const std::map<std::string, double>& classWeights,
                                   const ForestParams& params, const SplitIndices& fold) {
    Matrix trainX;
    std::vector<std::string> trainY;
    trainX.reserve(fold.train.size());
    trainY.reserve(fold.train.size());
    for (int i : fold.train) {
        trainX.push_back(X[i]);
        trainY.push_back(labels[i]);
    }

    RandomForest forest(params);
    forest.fit(trainX, trainY, classWeights);

    std::vector<int> yPred;
    yPred.reserve(fold.test.size());
    for (int i : fold.test) {
        // Fold model may have seen a subset of classes: map back by name
        std::string pred = forest.predict(X[i].data());
        auto it = std::lower_bound(classNames.begin(), classNames.end(), pred);
        yPred.push_back(it != classNames.end() && *it == pred
                        ? static_cast<int>(it - classNames.begin()) : -1);
    }
    return yPred;
}

namespace {

struct FoldScore {
    bool completed = false;
    double accuracy = 0.0;
    double f1 = 0.0;
};

FoldScore scoreFold(const Matrix& X, const std::vector<std::string>& labels,
                    const std::vector<int>& y, int numClasses,
                    const std::vector<std::string>& classNames,
                    const std::map<std::string, double>& classWeights,
                    const ForestParams& params, const SplitIndices& fold,
                    const std::atomic<bool>* cancel) {
    FoldScore score;
    if (cancel && cancel->load()) return score;
    if (fold.train.empty() || fold.test.empty()) return score;

    std::vector<int> yPred = fitAndPredictFold(X, labels, classNames, classWeights, params, fold);
    std::vector<int> yTrue;
    yTrue.reserve(fold.test.size());
    for (int i : fold.test) yTrue.push_back(y[i]);

    score.completed = true;
    score.accuracy = accuracy(yTrue, yPred);
    score.f1 = weightedF1(yTrue, yPred, numClasses);
    return score;
}

} // anonymous namespace

GridSearchResult gridSearch(const Matrix& X, const std::vector<std::string>& labels,
                            const std::map<std::string, double>& classWeights,
                            const ParamGrid& grid, const ForestParams& base,
                            const GridSearchOptions& options) {
    GridSearchResult result;
    std::vector<ForestParams> combos = expandGrid(grid, base);
    if (combos.empty() || X.empty()) return result;

    std::set<std::string> distinct(labels.begin(), labels.end());
    std::vector<std::string> classNames(distinct.begin(), distinct.end());
    std::vector<int> y(labels.size());
    for (size_t i = 0; i < labels.size(); ++i) {
        y[i] = static_cast<int>(std::lower_bound(classNames.begin(), classNames.end(), labels[i]) -
                                classNames.begin());
    }
    const int numClasses = static_cast<int>(classNames.size());
    std::vector<SplitIndices> folds = stratifiedKFold(y, options.folds, options.seed);

    // One task per (combo, fold); results come back through futures only
    std::vector<std::packaged_task<FoldScore()>> tasks;
    std::vector<std::future<FoldScore>> futures;
    for (const auto& combo : combos) {
        for (const auto& fold : folds) {
            tasks.emplace_back([&X, &labels, &y, numClasses, &classNames, &classWeights,
                                combo, &fold, cancel = options.cancel]() {
                return scoreFold(X, labels, y, numClasses, classNames, classWeights,
                                 combo, fold, cancel);
            });
            futures.push_back(tasks.back().get_future());
        }
    }

    int workers = options.workers > 0
        ? options.workers
        : static_cast<int>(std::max(1u, std::thread::hardware_concurrency()));
    workers = std::max(1, std::min(workers, static_cast<int>(tasks.size())));

    std::atomic<size_t> next{0};
    std::vector<std::thread> pool;
    for (int t = 0; t < workers; ++t) {
        pool.emplace_back([&tasks, &next]() {
            size_t i;
            while ((i = next.fetch_add(1)) < tasks.size()) tasks[i]();
        });
    }
    for (auto& th : pool) th.join();

    const size_t k = folds.size();
    for (size_t c = 0; c < combos.size(); ++c) {
        GridCandidate cand;
        cand.params = combos[c];
        std::vector<double> accs, f1s;
        for (size_t f = 0; f < k; ++f) {
            FoldScore s = futures[c * k + f].get();   // rethrows a fold's exception
            if (!s.completed) continue;
            accs.push_back(s.accuracy);
            f1s.push_back(s.f1);
        }
        cand.completedFolds = static_cast<int>(accs.size());
        MeanStd a = meanStd(accs);
        MeanStd f = meanStd(f1s);
        cand.meanAccuracy = a.mean;
        cand.stdAccuracy = a.stddev;
        cand.meanF1 = f.mean;
        cand.stdF1 = f.stddev;
        result.candidates.push_back(cand);

        bool complete = k > 0 && cand.completedFolds == static_cast<int>(k);
        if (complete && (result.bestIndex < 0 ||
                         cand.meanF1 > result.candidates[result.bestIndex].meanF1)) {
            result.bestIndex = static_cast<int>(c);
        }
    }
    return result;
}

} // namespace mlbt
