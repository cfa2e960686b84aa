#pragma once

#include <string>
#include <vector>

namespace mlbt {

struct ClassScore {
    std::string label;
    double precision = 0.0;
    double recall = 0.0;
    double f1 = 0.0;
    int support = 0;
};

// Labels are class ids in [0, numClasses)
double accuracy(const std::vector<int>& yTrue, const std::vector<int>& yPred);

// One-vs-rest F1 for class c; 0 when precision + recall is 0
double f1ForClass(const std::vector<int>& yTrue, const std::vector<int>& yPred, int c);

// Support-weighted mean of per-class F1 over classes present in yTrue
double weightedF1(const std::vector<int>& yTrue, const std::vector<int>& yPred, int numClasses);

std::vector<ClassScore> classificationReport(const std::vector<int>& yTrue,
                                             const std::vector<int>& yPred,
                                             const std::vector<std::string>& classNames);

// cm[true][pred]
std::vector<std::vector<int>> confusionMatrix(const std::vector<int>& yTrue,
                                              const std::vector<int>& yPred, int numClasses);

struct MeanStd {
    double mean = 0.0;
    double stddev = 0.0;   // population standard deviation
};

MeanStd meanStd(const std::vector<double>& values);
double median(std::vector<double> values);

} // namespace mlbt
