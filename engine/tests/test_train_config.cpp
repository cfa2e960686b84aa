#include <gtest/gtest.h>
#include "mlbt/train_config.h"
#include <nlohmann/json.hpp>

using namespace mlbt;

TEST(TrainConfig, Defaults) {
    TrainConfig cfg;
    EXPECT_EQ(cfg.seed, 42u);
    EXPECT_DOUBLE_EQ(cfg.testFraction, 0.2);
    EXPECT_EQ(cfg.cvFolds, 5);
    EXPECT_FALSE(cfg.verbose);
    EXPECT_EQ(cfg.fixed.nEstimators, 200);
    EXPECT_EQ(cfg.fixed.tree.maxDepth, 8);
    EXPECT_EQ(cfg.fixed.tree.minSamplesLeaf, 30);
    EXPECT_EQ(cfg.fixed.tree.maxFeatures, MaxFeatures::SQRT);
    EXPECT_DOUBLE_EQ(cfg.fixed.tree.ccpAlpha, 0.01);
    EXPECT_EQ(cfg.grid.nEstimators.size(), 2u);
}

TEST(TrainConfig, ParsesOverrides) {
    auto cfg = loadTrainConfigFromString(R"({
        "seed": 7,
        "test_fraction": 0.25,
        "cv_folds": 3,
        "workers": 2,
        "verbose": true,
        "cross_validate": false,
        "forest": {"n_estimators": 50, "max_depth": 6, "max_features": "log2",
                   "bootstrap": false},
        "grid": {"n_estimators": [25], "max_features": ["sqrt", "bogus", "all"]}
    })");
    ASSERT_NE(cfg, nullptr);
    EXPECT_EQ(cfg->seed, 7u);
    EXPECT_DOUBLE_EQ(cfg->testFraction, 0.25);
    EXPECT_EQ(cfg->cvFolds, 3);
    EXPECT_EQ(cfg->workers, 2);
    EXPECT_TRUE(cfg->verbose);
    EXPECT_FALSE(cfg->crossValidate);

    EXPECT_EQ(cfg->fixed.nEstimators, 50);
    EXPECT_EQ(cfg->fixed.tree.maxDepth, 6);
    EXPECT_EQ(cfg->fixed.tree.minSamplesSplit, 30);
    EXPECT_EQ(cfg->fixed.tree.maxFeatures, MaxFeatures::LOG2);
    EXPECT_FALSE(cfg->fixed.bootstrap);
    EXPECT_EQ(cfg->fixed.seed, 7u);

    ASSERT_EQ(cfg->grid.nEstimators.size(), 1u);
    EXPECT_EQ(cfg->grid.nEstimators[0], 25);
    ASSERT_EQ(cfg->grid.maxFeatures.size(), 2u);
    EXPECT_EQ(cfg->grid.maxFeatures[1], MaxFeatures::ALL);
    EXPECT_EQ(cfg->grid.maxDepth.size(), 2u);
}

TEST(TrainConfig, EmptyObjectKeepsDefaults) {
    auto cfg = loadTrainConfigFromString("{}");
    ASSERT_NE(cfg, nullptr);
    EXPECT_EQ(cfg->seed, 42u);
    EXPECT_TRUE(cfg->crossValidate);
}

TEST(TrainConfig, MissingFileReturnsNull) {
    EXPECT_EQ(loadTrainConfig("/nonexistent/train.json"), nullptr);
}

TEST(TrainConfig, MalformedJsonThrows) {
    EXPECT_THROW(loadTrainConfigFromString("{\"seed\": "), nlohmann::json::parse_error);
}
