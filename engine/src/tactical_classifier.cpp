#include "mlbt/tactical_classifier.h"
#include "mlbt/errors.h"
#include "mlbt/grid_search.h"
#include "mlbt/recommendations.h"
#include "mlbt/sampling.h"
#include "mlbt/tactic_taxonomy.h"
#include <algorithm>
#include <cstdio>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <set>

namespace mlbt {

namespace {

constexpr double MIN_REPORTED_PROBABILITY = 0.05;
constexpr size_t TOP_FEATURES = 10;
const char* const MODEL_TYPE = "random_forest";
const char* const REQUIRED_COLUMNS[] = {"inning", "outs", "score_diff", "pressure_index"};

int labelId(const std::vector<std::string>& classes, const std::string& label) {
    auto it = std::lower_bound(classes.begin(), classes.end(), label);
    if (it == classes.end() || *it != label) return -1;
    return static_cast<int>(it - classes.begin());
}

void printParams(std::ostream& os, const ForestParams& p) {
    os << "n_estimators=" << p.nEstimators
       << " max_depth=" << p.tree.maxDepth
       << " min_samples_split=" << p.tree.minSamplesSplit
       << " min_samples_leaf=" << p.tree.minSamplesLeaf
       << " max_features=" << maxFeaturesName(p.tree.maxFeatures)
       << " ccp_alpha=" << p.tree.ccpAlpha;
}

} // anonymous namespace

// --- Persistence ---

nlohmann::json modelToJson(const TrainedModel& model) {
    return {
        {"type", MODEL_TYPE},
        {"feature_names", model.featureNames},
        {"model", model.forest.toJson()},
    };
}

std::unique_ptr<TrainedModel> modelFromJson(const nlohmann::json& j) {
    if (!j.is_object() || !j.contains("feature_names") || !j.contains("model")) return nullptr;
    if (j.contains("type") && j["type"].get<std::string>() != MODEL_TYPE) return nullptr;

    auto forest = RandomForest::fromJson(j["model"]);
    if (!forest) return nullptr;

    auto model = std::make_unique<TrainedModel>();
    model->featureNames = j["feature_names"].get<std::vector<std::string>>();
    if (forest->numFeatures() != static_cast<int>(model->featureNames.size())) return nullptr;
    model->forest = std::move(*forest);
    return model;
}

std::unique_ptr<TrainedModel> loadTrainedModel(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) return nullptr;
    nlohmann::json j = nlohmann::json::parse(file);
    return modelFromJson(j);
}

std::unique_ptr<TrainedModel> loadTrainedModelFromString(const std::string& json) {
    auto j = nlohmann::json::parse(json);
    return modelFromJson(j);
}

bool saveTrainedModel(const TrainedModel& model, const std::string& path) {
    const std::string tmp = path + ".tmp";
    {
        std::ofstream file(tmp);
        if (!file.is_open()) return false;
        file << modelToJson(model).dump();
        file.flush();
        if (!file) {
            file.close();
            std::remove(tmp.c_str());
            return false;
        }
    }
    if (std::rename(tmp.c_str(), path.c_str()) != 0) {
        std::remove(tmp.c_str());
        return false;
    }
    return true;
}

// --- Evaluation report ---

void printEvaluation(std::ostream& os, const EvaluationReport& r) {
    const std::string rule(50, '-');
    os << std::fixed << std::setprecision(3);

    os << "\nTraining rows: " << r.trainRows << ", test rows: " << r.testRows << "\n";
    os << "Parameters: ";
    printParams(os, r.params);
    os << "\n";
    if (r.optimized) {
        if (r.gridFallback) {
            os << "Grid search: no complete candidate, fixed parameters used\n";
        } else {
            os << "Grid search: " << r.gridCandidates << " candidates, best weighted F1 "
               << r.gridBestF1 << " (+/- " << r.gridBestStd * 2 << ")\n";
        }
    }

    os << "\nModel Evaluation:\n" << rule << "\n";
    os << "Accuracy: " << r.accuracy << "\n";

    os << "\nClassification Report:\n";
    os << std::left << std::setw(28) << "" << std::right
       << std::setw(10) << "precision" << std::setw(10) << "recall"
       << std::setw(10) << "f1-score" << std::setw(10) << "support" << "\n";
    for (const auto& s : r.classReport) {
        os << std::left << std::setw(28) << s.label << std::right
           << std::setw(10) << s.precision << std::setw(10) << s.recall
           << std::setw(10) << s.f1 << std::setw(10) << s.support << "\n";
    }

    os << "\nConfusion Matrix:\n";
    for (const auto& row : r.confusion) {
        os << "[";
        for (size_t c = 0; c < row.size(); ++c) os << (c ? " " : "") << std::setw(4) << row[c];
        os << "]\n";
    }

    os << "\nTop Feature Contributions:\n" << rule << "\n";
    os << std::setprecision(2);
    for (const auto& f : r.topFeatures) {
        os << std::left << std::setw(30) << f.first << " "
           << std::right << std::setw(6) << f.second * 100.0 << "%\n";
    }

    os << std::setprecision(3);
    os << "\nPrediction Confidence Analysis:\n" << rule << "\n";
    os << "Mean confidence: " << r.confidence.mean << "\n";
    os << "Median confidence: " << r.confidence.median << "\n";
    os << "Std deviation: " << r.confidence.stddev << "\n";
    os << std::setprecision(1);
    os << "Predictions with confidence >= 0.5: " << r.confidence.above50 << "%\n";
    os << "Predictions with confidence >= 0.7: " << r.confidence.above70 << "%\n";
    os << "Predictions with confidence >= 0.9: " << r.confidence.above90 << "%\n";

    os << std::setprecision(3);
    if (!r.classConfidence.empty()) {
        os << "\nConfidence by Class:\n";
        for (const auto& c : r.classConfidence) {
            os << c.label << ": mean " << c.mean << ", median " << c.median
               << ", std " << c.stddev << "\n";
        }
    }

    if (r.hasCrossValidation) {
        const auto& cv = r.crossValidation;
        os << "\nCross-validation Analysis (" << cv.folds << " folds):\n" << rule << "\n";
        os << "Accuracy: " << cv.accuracy.mean << " (+/- " << cv.accuracy.stddev * 2 << ")\n";
        os << "Weighted F1: " << cv.weightedF1.mean << " (+/- " << cv.weightedF1.stddev * 2 << ")\n";
        os << "\nClass-wise F1 scores:\n";
        for (const auto& c : cv.classF1) {
            os << c.first << ": mean " << c.second.mean << ", std " << c.second.stddev << "\n";
        }
    }
    os.unsetf(std::ios::floatfield);
    os.precision(6);
}

// --- TacticalClassifier ---

TacticalClassifier::TacticalClassifier() = default;

TacticalClassifier::TacticalClassifier(TrainConfig config) : config_(std::move(config)) {}

EvaluationReport TacticalClassifier::train(const TrainingSet& data, bool optimize) {
    if (data.rows.size() != data.labels.size()) {
        throw TrainingError("row/label count mismatch");
    }

    std::vector<FeatureRow> rows;
    std::vector<std::string> labels;
    for (size_t i = 0; i < data.rows.size(); ++i) {
        if (data.labels[i] == "other") continue;
        rows.push_back(data.rows[i]);
        labels.push_back(data.labels[i]);
    }

    std::set<std::string> distinct(labels.begin(), labels.end());
    if (distinct.size() < 2) {
        throw TrainingError("need at least 2 distinct tactic labels, got " +
                            std::to_string(distinct.size()));
    }

    std::vector<std::string> names = collectFeatureNames(rows);
    for (const char* col : REQUIRED_COLUMNS) {
        if (std::find(names.begin(), names.end(), col) == names.end()) {
            throw TrainingError(std::string("missing required column '") + col + "'");
        }
    }

    const std::vector<std::string> classes(distinct.begin(), distinct.end());
    Matrix X;
    std::vector<int> y;
    X.reserve(rows.size());
    y.reserve(rows.size());
    for (size_t i = 0; i < rows.size(); ++i) {
        X.push_back(alignFeatures(rows[i], names));
        y.push_back(labelId(classes, labels[i]));
    }

    std::map<std::string, double> classWeights = computeClassWeights(labels);

    if (config_.verbose) {
        std::cout << "Training on " << rows.size() << " rows, " << names.size()
                  << " features, " << classes.size() << " tactics\n";
    }

    SplitIndices split = stratifiedSplit(y, config_.testFraction, config_.seed);
    Matrix trainX;
    std::vector<std::string> trainLabels;
    for (int i : split.train) {
        trainX.push_back(X[i]);
        trainLabels.push_back(labels[i]);
    }

    EvaluationReport report;
    report.trainRows = static_cast<int>(split.train.size());
    report.testRows = static_cast<int>(split.test.size());
    report.classes = classes;
    report.optimized = optimize;

    ForestParams params = config_.fixed;
    params.seed = config_.seed;

    if (optimize) {
        GridSearchOptions opts;
        opts.folds = config_.cvFolds;
        opts.workers = config_.workers;
        opts.seed = config_.seed;
        opts.cancel = config_.cancel;

        if (config_.verbose) {
            std::cout << "Grid search over " << expandGrid(config_.grid, params).size()
                      << " candidates x " << config_.cvFolds << " folds\n";
        }
        GridSearchResult gs = gridSearch(trainX, trainLabels, classWeights, config_.grid, params, opts);
        report.gridCandidates = static_cast<int>(gs.candidates.size());
        if (const GridCandidate* best = gs.best()) {
            params = best->params;
            report.gridBestF1 = best->meanF1;
            report.gridBestStd = best->stdF1;
        } else {
            report.gridFallback = true;
            if (config_.verbose) {
                std::cout << "Grid search incomplete, using fixed parameters\n";
            }
        }
    }
    report.params = params;

    auto model = std::make_unique<TrainedModel>();
    model->featureNames = names;
    model->forest = RandomForest(params);
    model->forest.fit(trainX, trainLabels, classWeights);
    const RandomForest& forest = model->forest;

    // Held-out evaluation
    std::vector<int> yTrue, yPred;
    std::vector<double> confidences;
    std::vector<std::vector<double>> trueClassProba(classes.size());
    for (int i : split.test) {
        std::vector<double> proba = forest.predictProba(X[i].data());
        int best = static_cast<int>(std::max_element(proba.begin(), proba.end()) - proba.begin());
        yTrue.push_back(y[i]);
        yPred.push_back(labelId(classes, forest.classes()[best]));
        confidences.push_back(proba[best]);

        int own = forest.classIndex(labels[i]);
        if (own >= 0) trueClassProba[y[i]].push_back(proba[own]);
    }

    report.accuracy = accuracy(yTrue, yPred);
    report.classReport = classificationReport(yTrue, yPred, classes);
    report.confusion = confusionMatrix(yTrue, yPred, static_cast<int>(classes.size()));

    std::vector<double> importances = forest.featureImportances();
    std::vector<std::pair<std::string, double>> ranked;
    for (size_t f = 0; f < importances.size() && f < names.size(); ++f) {
        ranked.emplace_back(names[f], importances[f]);
    }
    std::stable_sort(ranked.begin(), ranked.end(),
                     [](const std::pair<std::string, double>& a,
                        const std::pair<std::string, double>& b) { return a.second > b.second; });
    if (ranked.size() > TOP_FEATURES) ranked.resize(TOP_FEATURES);
    report.topFeatures = ranked;

    if (!confidences.empty()) {
        MeanStd ms = meanStd(confidences);
        report.confidence.mean = ms.mean;
        report.confidence.stddev = ms.stddev;
        report.confidence.median = median(confidences);
        auto pctAbove = [&confidences](double threshold) {
            size_t n = std::count_if(confidences.begin(), confidences.end(),
                                     [threshold](double c) { return c >= threshold; });
            return 100.0 * n / confidences.size();
        };
        report.confidence.above50 = pctAbove(0.5);
        report.confidence.above70 = pctAbove(0.7);
        report.confidence.above90 = pctAbove(0.9);
    }
    for (size_t c = 0; c < classes.size(); ++c) {
        if (trueClassProba[c].empty()) continue;
        ClassConfidence cc;
        cc.label = classes[c];
        MeanStd ms = meanStd(trueClassProba[c]);
        cc.mean = ms.mean;
        cc.stddev = ms.stddev;
        cc.median = median(trueClassProba[c]);
        report.classConfidence.push_back(cc);
    }

    model_ = std::move(model);

    // K-fold re-run of the chosen configuration on the full table
    bool cancelled = config_.cancel && config_.cancel->load();
    if (config_.crossValidate && config_.cvFolds >= 2 && !cancelled) {
        std::vector<double> accs, f1s;
        std::vector<std::vector<double>> perClass(classes.size());
        for (const auto& fold : stratifiedKFold(y, config_.cvFolds, config_.seed)) {
            if (fold.train.empty() || fold.test.empty()) continue;
            std::vector<int> foldPred = fitAndPredictFold(X, labels, classes, classWeights, params, fold);
            std::vector<int> foldTrue;
            for (int i : fold.test) foldTrue.push_back(y[i]);

            accs.push_back(accuracy(foldTrue, foldPred));
            f1s.push_back(weightedF1(foldTrue, foldPred, static_cast<int>(classes.size())));
            for (size_t c = 0; c < classes.size(); ++c) {
                perClass[c].push_back(f1ForClass(foldTrue, foldPred, static_cast<int>(c)));
            }
        }
        if (!accs.empty()) {
            report.hasCrossValidation = true;
            report.crossValidation.folds = static_cast<int>(accs.size());
            report.crossValidation.accuracy = meanStd(accs);
            report.crossValidation.weightedF1 = meanStd(f1s);
            for (size_t c = 0; c < classes.size(); ++c) {
                report.crossValidation.classF1.emplace_back(classes[c], meanStd(perClass[c]));
            }
        }
    }

    if (config_.verbose) printEvaluation(std::cout, report);
    return report;
}

ProbabilityTable TacticalClassifier::predictProba(const SituationRecord& rec) const {
    return predictProba(featureRow(rec));
}

ProbabilityTable TacticalClassifier::predictProba(const FeatureRow& row) const {
    if (!model_) throw ModelNotLoadedError();

    std::vector<float> x = alignFeatures(row, model_->featureNames);
    std::vector<double> proba = model_->forest.predictProba(x.data());
    const auto& classes = model_->forest.classes();

    ProbabilityTable table;
    for (TacticCategory c : {TacticCategory::OFFENSIVE, TacticCategory::BASERUNNING,
                             TacticCategory::DEFENSIVE}) {
        table.push_back(CategoryScores{categoryName(c), {}});
    }

    for (size_t i = 0; i < classes.size() && i < proba.size(); ++i) {
        if (proba[i] < MIN_REPORTED_PROBABILITY) continue;
        std::string category = categoryOfTacticName(classes[i]);
        auto it = std::find_if(table.begin(), table.end(),
                               [&category](const CategoryScores& s) { return s.category == category; });
        if (it == table.end()) {
            table.push_back(CategoryScores{category, {}});
            it = table.end() - 1;
        }
        it->tactics.push_back(TacticScore{classes[i], round2(proba[i] * 100.0)});
    }

    sortCategories(table);
    return table;
}

PredictionResult TacticalClassifier::analyzeSituation(const SituationRecord& rec) const {
    PredictionResult result;
    result.probabilities = predictProba(rec);
    result.context = analyzeContext(rec);
    result.topTactics = topTactics(result.probabilities, 3);
    result.recommendations = buildRecommendations(result.topTactics, result.context);
    return result;
}

bool TacticalClassifier::saveModel(const std::string& path) const {
    if (!model_) throw ModelNotLoadedError();
    bool ok = saveTrainedModel(*model_, path);
    if (ok && config_.verbose) std::cout << "Model saved to " << path << "\n";
    return ok;
}

bool TacticalClassifier::loadModel(const std::string& path) {
    auto model = loadTrainedModel(path);
    if (!model) return false;
    model_ = std::move(model);
    if (config_.verbose) {
        std::cout << "Model loaded from " << path << " (" << model_->forest.classes().size()
                  << " tactics, " << model_->featureNames.size() << " features)\n";
    }
    return true;
}

void TacticalClassifier::setModel(std::unique_ptr<TrainedModel> model) {
    model_ = std::move(model);
}

const TrainedModel& TacticalClassifier::model() const {
    if (!model_) throw ModelNotLoadedError();
    return *model_;
}

} // namespace mlbt
