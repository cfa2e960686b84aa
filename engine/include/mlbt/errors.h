#pragma once

#include <stdexcept>
#include <string>

namespace mlbt {

// Malformed or out-of-range play record
class FeatureExtractionError : public std::runtime_error {
public:
    explicit FeatureExtractionError(const std::string& msg)
        : std::runtime_error("feature extraction: " + msg) {}
};

// Insufficient labels or missing columns at fit time
class TrainingError : public std::runtime_error {
public:
    explicit TrainingError(const std::string& msg)
        : std::runtime_error("training: " + msg) {}
};

// Inference attempted before a model was trained or loaded
class ModelNotLoadedError : public std::runtime_error {
public:
    ModelNotLoadedError()
        : std::runtime_error("no model trained or loaded") {}
};

} // namespace mlbt
