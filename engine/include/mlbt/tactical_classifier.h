#pragma once

#include "mlbt/feature_table.h"
#include "mlbt/metrics.h"
#include "mlbt/prediction_result.h"
#include "mlbt/random_forest.h"
#include "mlbt/situation.h"
#include "mlbt/train_config.h"
#include <nlohmann/json.hpp>
#include <memory>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace mlbt {

// Fitted forest plus the exact column order it was trained on
struct TrainedModel {
    RandomForest forest;
    std::vector<std::string> featureNames;
};

nlohmann::json modelToJson(const TrainedModel& model);

// nullptr when "feature_names" or "model" is missing or the forest is
// inconsistent with the feature list
std::unique_ptr<TrainedModel> modelFromJson(const nlohmann::json& j);
std::unique_ptr<TrainedModel> loadTrainedModel(const std::string& path);
std::unique_ptr<TrainedModel> loadTrainedModelFromString(const std::string& json);

// Writes to path + ".tmp" then renames over path. False on I/O failure.
bool saveTrainedModel(const TrainedModel& model, const std::string& path);

// --- Evaluation ---

struct ConfidenceStats {
    double mean = 0.0;
    double median = 0.0;
    double stddev = 0.0;
    // percent of predictions whose top probability reaches 0.5 / 0.7 / 0.9
    double above50 = 0.0;
    double above70 = 0.0;
    double above90 = 0.0;
};

struct ClassConfidence {
    std::string label;
    double mean = 0.0;      // mean probability given to the true class
    double median = 0.0;
    double stddev = 0.0;
};

struct CrossValidationSummary {
    int folds = 0;
    MeanStd accuracy;
    MeanStd weightedF1;
    std::vector<std::pair<std::string, MeanStd>> classF1;
};

struct EvaluationReport {
    int trainRows = 0;
    int testRows = 0;
    std::vector<std::string> classes;
    ForestParams params;
    bool optimized = false;
    bool gridFallback = false;     // grid search produced no complete candidate
    int gridCandidates = 0;
    double gridBestF1 = 0.0;
    double gridBestStd = 0.0;

    double accuracy = 0.0;
    std::vector<ClassScore> classReport;
    std::vector<std::vector<int>> confusion;
    std::vector<std::pair<std::string, double>> topFeatures;   // up to 10
    ConfidenceStats confidence;
    std::vector<ClassConfidence> classConfidence;

    bool hasCrossValidation = false;
    CrossValidationSummary crossValidation;
};

void printEvaluation(std::ostream& os, const EvaluationReport& report);

// Trains, persists and serves the tactic model.
class TacticalClassifier {
    TrainConfig config_;
    std::unique_ptr<TrainedModel> model_;

public:
    TacticalClassifier();
    explicit TacticalClassifier(TrainConfig config);

    // Throws TrainingError with fewer than 2 distinct labels (after dropping
    // "other") or when a required column is absent.
    EvaluationReport train(const TrainingSet& data, bool optimize);

    // Percent probabilities >= 5% per category, 2 decimals, descending.
    // Throws ModelNotLoadedError before train/load.
    ProbabilityTable predictProba(const SituationRecord& rec) const;
    ProbabilityTable predictProba(const FeatureRow& row) const;

    // Probabilities plus context, top 3 tactics and recommendations
    PredictionResult analyzeSituation(const SituationRecord& rec) const;

    bool saveModel(const std::string& path) const;
    bool loadModel(const std::string& path);
    void setModel(std::unique_ptr<TrainedModel> model);

    bool isLoaded() const { return model_ != nullptr; }
    const TrainedModel& model() const;
    const TrainConfig& config() const { return config_; }
    TrainConfig& config() { return config_; }
};

} // namespace mlbt
