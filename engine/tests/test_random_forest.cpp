#include <gtest/gtest.h>
#include "mlbt/random_forest.h"
#include <numeric>
#include <stdexcept>

using namespace mlbt;

namespace {

ForestParams smallForest() {
    ForestParams p;
    p.nEstimators = 10;
    p.tree.maxDepth = 4;
    p.tree.minSamplesSplit = 2;
    p.tree.minSamplesLeaf = 1;
    p.tree.maxFeatures = MaxFeatures::ALL;
    p.tree.ccpAlpha = 0.0;
    p.seed = 42;
    return p;
}

// Column 0 decides the label, column 1 is constant
void threshold(Matrix& X, std::vector<std::string>& labels) {
    for (int i = 0; i < 40; ++i) {
        float v = static_cast<float>(i % 10);
        X.push_back({v, 1.0f});
        labels.push_back(v < 5.0f ? "strikeout_pitching" : "power_hitting");
    }
}

} // anonymous namespace

TEST(RandomForest, LearnsThreshold) {
    Matrix X;
    std::vector<std::string> labels;
    threshold(X, labels);

    RandomForest rf(smallForest());
    rf.fit(X, labels, {});
    ASSERT_TRUE(rf.isFitted());
    EXPECT_EQ(rf.trees().size(), 10u);
    EXPECT_EQ(rf.numFeatures(), 2);

    // Classes are kept sorted
    ASSERT_EQ(rf.classes().size(), 2u);
    EXPECT_EQ(rf.classes()[0], "power_hitting");
    EXPECT_EQ(rf.classIndex("strikeout_pitching"), 1);
    EXPECT_EQ(rf.classIndex("small_ball"), -1);

    float lo[] = {1.0f, 1.0f};
    float hi[] = {8.0f, 1.0f};
    EXPECT_EQ(rf.predict(lo), "strikeout_pitching");
    EXPECT_EQ(rf.predict(hi), "power_hitting");

    std::vector<double> p = rf.predictProba(lo);
    EXPECT_NEAR(std::accumulate(p.begin(), p.end(), 0.0), 1.0, 1e-9);
}

TEST(RandomForest, ImportancesFavorInformativeFeature) {
    Matrix X;
    std::vector<std::string> labels;
    threshold(X, labels);

    RandomForest rf(smallForest());
    rf.fit(X, labels, {});
    std::vector<double> imp = rf.featureImportances();
    ASSERT_EQ(imp.size(), 2u);
    EXPECT_NEAR(imp[0] + imp[1], 1.0, 1e-9);
    EXPECT_DOUBLE_EQ(imp[1], 0.0);
}

TEST(RandomForest, SameSeedSameForest) {
    Matrix X;
    std::vector<std::string> labels;
    threshold(X, labels);

    RandomForest a(smallForest());
    RandomForest b(smallForest());
    a.fit(X, labels, {{"power_hitting", 2.0}});
    b.fit(X, labels, {{"power_hitting", 2.0}});
    EXPECT_EQ(a.toJson().dump(), b.toJson().dump());
}

TEST(RandomForest, JsonRoundTrip) {
    Matrix X;
    std::vector<std::string> labels;
    threshold(X, labels);

    RandomForest rf(smallForest());
    rf.fit(X, labels, {});
    auto copy = RandomForest::fromJson(rf.toJson());
    ASSERT_NE(copy, nullptr);
    EXPECT_EQ(copy->params().nEstimators, 10);
    EXPECT_EQ(copy->params().tree.maxFeatures, MaxFeatures::ALL);
    for (const auto& row : X) {
        EXPECT_EQ(copy->predictProba(row.data()), rf.predictProba(row.data()));
    }
}

TEST(RandomForest, FromJsonRejectsUnsortedOrEmpty) {
    Matrix X;
    std::vector<std::string> labels;
    threshold(X, labels);
    RandomForest rf(smallForest());
    rf.fit(X, labels, {});

    nlohmann::json j = rf.toJson();
    j["classes"] = {"strikeout_pitching", "power_hitting"};
    EXPECT_EQ(RandomForest::fromJson(j), nullptr);

    j = rf.toJson();
    j["trees"] = nlohmann::json::array();
    EXPECT_EQ(RandomForest::fromJson(j), nullptr);

    EXPECT_EQ(RandomForest::fromJson(nlohmann::json::array()), nullptr);
}

TEST(RandomForest, FitSizeMismatchThrows) {
    RandomForest rf(smallForest());
    EXPECT_THROW(rf.fit({{1.0f}}, {"a", "b"}, {}), std::invalid_argument);
    EXPECT_FALSE(rf.isFitted());
}
