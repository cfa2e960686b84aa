#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "mlbt/enums.h"
#include "mlbt/play_event.h"
#include "mlbt/play_parser.h"
#include "mlbt/situation.h"
#include "mlbt/feature_extractor.h"
#include "mlbt/tactic_labeler.h"
#include "mlbt/tactical_classifier.h"
#include "mlbt/inference_enhancer.h"
#include "mlbt/prediction_result.h"

namespace py = pybind11;

namespace {

py::dict tableToDict(const mlbt::ProbabilityTable& table) {
    py::dict out;
    for (const auto& cat : table) {
        py::dict tactics;
        for (const auto& t : cat.tactics) tactics[py::str(t.tactic)] = t.value;
        out[py::str(cat.category)] = tactics;
    }
    return out;
}

} // anonymous namespace

PYBIND11_MODULE(mlbt_engine, m) {
    m.doc() = "MLB tactical feature and probability engine - Python bindings";

    // --- Enums ---
    py::enum_<mlbt::HalfInning>(m, "HalfInning")
        .value("TOP", mlbt::HalfInning::TOP)
        .value("BOTTOM", mlbt::HalfInning::BOTTOM);

    py::enum_<mlbt::TacticCategory>(m, "TacticCategory")
        .value("OFFENSIVE", mlbt::TacticCategory::OFFENSIVE)
        .value("BASERUNNING", mlbt::TacticCategory::BASERUNNING)
        .value("DEFENSIVE", mlbt::TacticCategory::DEFENSIVE);

    // --- RunnerMovement / RawPlay ---
    py::class_<mlbt::RunnerMovement>(m, "RunnerMovement")
        .def(py::init<>())
        .def_readwrite("start", &mlbt::RunnerMovement::start)
        .def_readwrite("end", &mlbt::RunnerMovement::end);

    py::class_<mlbt::RawPlay>(m, "RawPlay")
        .def(py::init<>())
        .def_readwrite("inning", &mlbt::RawPlay::inning)
        .def_readwrite("half", &mlbt::RawPlay::half)
        .def_readwrite("outs", &mlbt::RawPlay::outs)
        .def_readwrite("balls", &mlbt::RawPlay::balls)
        .def_readwrite("strikes", &mlbt::RawPlay::strikes)
        .def_readwrite("home_score", &mlbt::RawPlay::homeScore)
        .def_readwrite("away_score", &mlbt::RawPlay::awayScore)
        .def_readwrite("event", &mlbt::RawPlay::event)
        .def_readwrite("batter_id", &mlbt::RawPlay::batterId)
        .def_readwrite("pitcher_id", &mlbt::RawPlay::pitcherId)
        .def_readwrite("runners", &mlbt::RawPlay::runners);

    // --- SituationRecord ---
    py::class_<mlbt::RunnerState>(m, "RunnerState")
        .def_readonly("num_runners", &mlbt::RunnerState::numRunners)
        .def_readonly("runs_scored", &mlbt::RunnerState::runsScored)
        .def_readonly("scoring_position", &mlbt::RunnerState::scoringPosition);

    py::class_<mlbt::SituationRecord>(m, "SituationRecord")
        .def_readonly("inning", &mlbt::SituationRecord::inning)
        .def_readonly("outs", &mlbt::SituationRecord::outs)
        .def_readonly("result", &mlbt::SituationRecord::result)
        .def_readonly("score_diff", &mlbt::SituationRecord::scoreDiff)
        .def_readonly("runners", &mlbt::SituationRecord::runners)
        .def_readonly("pressure_index", &mlbt::SituationRecord::pressureIndex)
        .def_readonly("game_stage", &mlbt::SituationRecord::gameStage)
        .def_readonly("leverage_index", &mlbt::SituationRecord::leverageIndex)
        .def_readonly("run_expectancy", &mlbt::SituationRecord::runExpectancy)
        .def_readonly("scoring_threat", &mlbt::SituationRecord::scoringThreat)
        .def("to_json", [](const mlbt::SituationRecord& r) {
            return mlbt::situationToJson(r).dump();
        });

    // --- PredictionResult ---
    py::class_<mlbt::PredictionResult>(m, "PredictionResult")
        .def("probabilities", [](const mlbt::PredictionResult& r) {
            return tableToDict(r.probabilities);
        })
        .def("to_json", [](const mlbt::PredictionResult& r) {
            return mlbt::predictionToJson(r).dump();
        })
        .def("to_flat_json", [](const mlbt::PredictionResult& r) {
            return mlbt::flattenPrediction(r).dump();
        })
        .def("format", &mlbt::formatPrediction);

    // --- Feature extraction and labeling ---
    m.def("parse_game_feed", [](const std::string& json) {
        return mlbt::loadGameFeedFromString(json).plays;
    });

    m.def("extract_situation", [](const mlbt::RawPlay& play) {
        return mlbt::extractSituation(play);
    });

    m.def("extract_situations", [](const std::vector<mlbt::RawPlay>& plays) {
        return mlbt::extractSituations(plays);
    });

    m.def("label_situation", [](const mlbt::SituationRecord& rec) {
        mlbt::TacticLabel label = mlbt::labelSituation(rec);
        return py::make_tuple(label.probabilities, label.primary);
    });

    // --- TacticalClassifier ---
    py::class_<mlbt::TacticalClassifier>(m, "TacticalClassifier")
        .def(py::init<>())
        .def("train", [](mlbt::TacticalClassifier& c,
                         const std::vector<mlbt::SituationRecord>& records, bool optimize) {
            py::gil_scoped_release release;
            c.train(mlbt::buildTrainingSet(records), optimize);
        }, py::arg("records"), py::arg("optimize") = false)
        .def("set_verbose", [](mlbt::TacticalClassifier& c, bool v) { c.config().verbose = v; })
        .def("predict_proba", [](const mlbt::TacticalClassifier& c, const mlbt::SituationRecord& rec) {
            return tableToDict(c.predictProba(rec));
        })
        .def("analyze_situation", &mlbt::TacticalClassifier::analyzeSituation)
        .def("save_model", &mlbt::TacticalClassifier::saveModel)
        .def("load_model", &mlbt::TacticalClassifier::loadModel)
        .def("is_loaded", &mlbt::TacticalClassifier::isLoaded);

    // --- InferenceEnhancer ---
    py::class_<mlbt::InferenceEnhancer>(m, "InferenceEnhancer")
        .def(py::init<>())
        .def("set_historical_corpus", [](mlbt::InferenceEnhancer& e, const std::string& json) {
            e.setHistoricalCorpus(std::move(*mlbt::loadHistoricalCorpusFromString(json)));
        })
        .def("enhance", &mlbt::InferenceEnhancer::enhance,
             py::arg("base"), py::arg("current"), py::arg("recent_plays"));
}
