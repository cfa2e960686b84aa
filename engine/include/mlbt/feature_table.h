#pragma once

#include "mlbt/situation.h"
#include <string>
#include <utility>
#include <vector>

namespace mlbt {

// Ordered (column, value) pairs of one model input row
using FeatureRow = std::vector<std::pair<std::string, double>>;

// Numeric model inputs of a situation: game state, runner state, derived
// metrics, player statistics when present, one-hot half inning and result.
// Identifiers and label columns are excluded.
FeatureRow featureRow(const SituationRecord& rec);

// Union of column names across rows, in first-seen order
std::vector<std::string> collectFeatureNames(const std::vector<FeatureRow>& rows);

// Project a row onto a schema: missing columns are 0, extra columns dropped,
// schema order enforced. Non-finite values become 0.
std::vector<float> alignFeatures(const FeatureRow& row, const std::vector<std::string>& names);

bool hasColumn(const FeatureRow& row, const std::string& name);

// Labeled table handed to the classifier
struct TrainingSet {
    std::vector<FeatureRow> rows;
    std::vector<std::string> labels;   // primary tactic per row
};

} // namespace mlbt
