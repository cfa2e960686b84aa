#include "mlbt/feature_extractor.h"
#include "mlbt/inference_enhancer.h"
#include "mlbt/play_parser.h"
#include "mlbt/prediction_result.h"
#include "mlbt/tactic_labeler.h"
#include "mlbt/tactical_classifier.h"
#include "mlbt/train_config.h"
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace mlbt;

namespace {

struct Options {
    std::string command;
    std::vector<std::string> playsPaths;
    std::string statsPath;
    std::string configPath;
    std::string modelPath = "tactical_model.json";
    std::string historyPath;
    std::string outPath;
    bool optimize = false;
    bool flat = false;
    int workers = -1;          // -1 = keep config value
    long seed = -1;
    bool verbose = false;
};

void printUsage() {
    std::cout << "Usage: mlbt_cli <train|predict> [options]\n"
              << "\nCommands:\n"
              << "  train             Label plays and fit the tactic model\n"
              << "  predict           Analyze the latest play of a game feed\n"
              << "\nOptions:\n"
              << "  --plays=PATH      Game feed JSON (repeatable for train)\n"
              << "  --stats=PATH      Player statistics JSON\n"
              << "  --config=PATH     Training config JSON\n"
              << "  --model=PATH      Model file to write/read (default: tactical_model.json)\n"
              << "  --optimize        Grid search hyperparameters (train)\n"
              << "  --workers=N       Grid search threads (default: all cores)\n"
              << "  --seed=N          RNG seed (default: 42)\n"
              << "  --history=PATH    Historical situations JSON (predict)\n"
              << "  --out=PATH        Write the prediction JSON (predict)\n"
              << "  --flat            Write the prediction as flat key-value JSON\n"
              << "  --verbose         Print progress and evaluation\n"
              << "  --help            Show this help\n";
}

Options parseArgs(int argc, char* argv[]) {
    Options opts;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg.find("--plays=") == 0) opts.playsPaths.push_back(arg.substr(8));
        else if (arg.find("--stats=") == 0) opts.statsPath = arg.substr(8);
        else if (arg.find("--config=") == 0) opts.configPath = arg.substr(9);
        else if (arg.find("--model=") == 0) opts.modelPath = arg.substr(8);
        else if (arg.find("--history=") == 0) opts.historyPath = arg.substr(10);
        else if (arg.find("--out=") == 0) opts.outPath = arg.substr(6);
        else if (arg.find("--workers=") == 0) opts.workers = std::stoi(arg.substr(10));
        else if (arg.find("--seed=") == 0) opts.seed = std::stol(arg.substr(7));
        else if (arg == "--optimize") opts.optimize = true;
        else if (arg == "--flat") opts.flat = true;
        else if (arg == "--verbose") opts.verbose = true;
        else if (arg == "--help") { printUsage(); exit(0); }
        else if (opts.command.empty() && arg.find("--") != 0) opts.command = arg;
        else { std::cerr << "Unknown option: " << arg << "\n"; printUsage(); exit(1); }
    }
    return opts;
}

// Situations of every feed, in file order
bool loadSituations(const std::vector<std::string>& paths, const StatsSource* stats,
                    std::vector<SituationRecord>& out, GameContext* lastContext) {
    for (const auto& path : paths) {
        auto feed = loadGameFeed(path);
        if (!feed) {
            std::cerr << "Failed to load plays from: " << path << "\n";
            return false;
        }
        std::vector<SituationRecord> recs = extractSituations(feed->plays, stats);
        out.insert(out.end(), recs.begin(), recs.end());
        if (lastContext) *lastContext = feed->context;
    }
    return true;
}

int runTrain(const Options& opts, const StatsSource* stats) {
    TrainConfig config;
    if (!opts.configPath.empty()) {
        auto loaded = loadTrainConfig(opts.configPath);
        if (!loaded) {
            std::cerr << "Failed to load config from: " << opts.configPath << "\n";
            return 1;
        }
        config = *loaded;
    }
    if (opts.workers >= 0) config.workers = opts.workers;
    if (opts.seed >= 0) {
        config.seed = static_cast<uint32_t>(opts.seed);
        config.fixed.seed = config.seed;
    }
    config.verbose = config.verbose || opts.verbose;

    std::vector<SituationRecord> situations;
    if (!loadSituations(opts.playsPaths, stats, situations, nullptr)) return 1;
    TrainingSet data = buildTrainingSet(situations);
    std::cout << "Situations: " << situations.size() << ", labeled rows: " << data.rows.size() << "\n";

    TacticalClassifier classifier(config);
    auto start = std::chrono::steady_clock::now();
    EvaluationReport report = classifier.train(data, opts.optimize);
    double sec = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();

    if (!config.verbose) printEvaluation(std::cout, report);
    std::cout << "\nTraining time: " << sec << "s\n";

    if (!classifier.saveModel(opts.modelPath)) {
        std::cerr << "Failed to save model to: " << opts.modelPath << "\n";
        return 1;
    }
    std::cout << "Model saved to " << opts.modelPath << "\n";
    return 0;
}

int runPredict(const Options& opts, const StatsSource* stats) {
    TacticalClassifier classifier;
    if (!classifier.loadModel(opts.modelPath)) {
        std::cerr << "Failed to load model from: " << opts.modelPath << "\n";
        return 1;
    }

    std::vector<SituationRecord> situations;
    GameContext context;
    if (!loadSituations(opts.playsPaths, stats, situations, &context)) return 1;
    if (situations.empty()) {
        std::cerr << "No analyzable plays in feed\n";
        return 1;
    }

    InferenceEnhancer enhancer;
    if (!opts.historyPath.empty()) {
        auto corpus = loadHistoricalCorpus(opts.historyPath);
        if (!corpus) {
            std::cerr << "Failed to load history from: " << opts.historyPath << "\n";
            return 1;
        }
        enhancer.setHistoricalCorpus(std::move(*corpus));
    }

    const SituationRecord& current = situations.back();
    PredictionResult result = enhancer.enhance(classifier.analyzeSituation(current), current, situations);
    result.gameContext = context;
    result.hasGameContext = true;

    std::cout << formatPrediction(result) << "\n";

    if (!opts.outPath.empty()) {
        std::ofstream out(opts.outPath);
        if (!out.is_open()) {
            std::cerr << "Failed to write: " << opts.outPath << "\n";
            return 1;
        }
        out << (opts.flat ? flattenPrediction(result) : predictionToJson(result)).dump(2) << "\n";
        if (opts.verbose) std::cout << "Prediction written to " << opts.outPath << "\n";
    }
    return 0;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    Options opts;
    try {
        opts = parseArgs(argc, argv);
    } catch (const std::logic_error& e) {
        // std::stoi/std::stol on a malformed --workers or --seed
        std::cerr << "Invalid numeric option (" << e.what() << ")\n";
        printUsage();
        return 1;
    }
    if (opts.command != "train" && opts.command != "predict") {
        printUsage();
        return 1;
    }
    if (opts.playsPaths.empty()) {
        std::cerr << "--plays is required\n";
        return 1;
    }

    try {
        std::unique_ptr<StatsLookupChain> stats;
        if (!opts.statsPath.empty()) {
            auto source = loadStatsSource(opts.statsPath);
            if (!source) {
                std::cerr << "Failed to load stats from: " << opts.statsPath << "\n";
                return 1;
            }
            stats = std::make_unique<StatsLookupChain>();
            stats->addSource(std::move(source));
        }

        if (opts.command == "train") return runTrain(opts, stats.get());
        return runPredict(opts, stats.get());
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
