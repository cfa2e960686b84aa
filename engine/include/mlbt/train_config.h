#pragma once

#include "mlbt/grid_search.h"
#include "mlbt/random_forest.h"
#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

namespace mlbt {

struct TrainConfig {
    uint32_t seed = 42;
    double testFraction = 0.2;
    int cvFolds = 5;
    int workers = 0;              // grid search threads, 0 = hardware concurrency
    bool verbose = false;         // progress and evaluation report to std::cout
    bool crossValidate = true;    // K-fold re-run of the chosen params after fitting
    ForestParams fixed;           // used when not optimizing
    ParamGrid grid;
    const std::atomic<bool>* cancel = nullptr;
};

// Every key optional; absent keys keep the defaults above.
// {"seed", "test_fraction", "cv_folds", "workers", "verbose", "cross_validate",
//  "forest": {n_estimators, max_depth, ...}, "grid": {n_estimators: [...], ...}}
std::unique_ptr<TrainConfig> loadTrainConfig(const std::string& path);
std::unique_ptr<TrainConfig> loadTrainConfigFromString(const std::string& json);

} // namespace mlbt
