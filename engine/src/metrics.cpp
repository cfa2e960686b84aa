#include "mlbt/metrics.h"
#include <algorithm>
#include <cmath>

namespace mlbt {

namespace {

struct Counts {
    int tp = 0;
    int fp = 0;
    int fn = 0;
};

Counts countsFor(const std::vector<int>& yTrue, const std::vector<int>& yPred, int c) {
    Counts k;
    size_t n = std::min(yTrue.size(), yPred.size());
    for (size_t i = 0; i < n; ++i) {
        bool t = yTrue[i] == c;
        bool p = yPred[i] == c;
        if (t && p) k.tp++;
        else if (p) k.fp++;
        else if (t) k.fn++;
    }
    return k;
}

inline double safeDiv(double a, double b) {
    return b > 0.0 ? a / b : 0.0;
}

} // anonymous namespace

double accuracy(const std::vector<int>& yTrue, const std::vector<int>& yPred) {
    size_t n = std::min(yTrue.size(), yPred.size());
    if (n == 0) return 0.0;
    int correct = 0;
    for (size_t i = 0; i < n; ++i) {
        if (yTrue[i] == yPred[i]) correct++;
    }
    return static_cast<double>(correct) / n;
}

double f1ForClass(const std::vector<int>& yTrue, const std::vector<int>& yPred, int c) {
    Counts k = countsFor(yTrue, yPred, c);
    double precision = safeDiv(k.tp, k.tp + k.fp);
    double recall = safeDiv(k.tp, k.tp + k.fn);
    return safeDiv(2.0 * precision * recall, precision + recall);
}

double weightedF1(const std::vector<int>& yTrue, const std::vector<int>& yPred, int numClasses) {
    if (yTrue.empty()) return 0.0;
    std::vector<int> support(numClasses, 0);
    for (int t : yTrue) {
        if (t >= 0 && t < numClasses) support[t]++;
    }
    double sum = 0.0;
    int total = 0;
    for (int c = 0; c < numClasses; ++c) {
        if (support[c] == 0) continue;
        sum += support[c] * f1ForClass(yTrue, yPred, c);
        total += support[c];
    }
    return safeDiv(sum, total);
}

std::vector<ClassScore> classificationReport(const std::vector<int>& yTrue,
                                             const std::vector<int>& yPred,
                                             const std::vector<std::string>& classNames) {
    std::vector<ClassScore> report;
    for (int c = 0; c < static_cast<int>(classNames.size()); ++c) {
        Counts k = countsFor(yTrue, yPred, c);
        ClassScore s;
        s.label = classNames[c];
        s.precision = safeDiv(k.tp, k.tp + k.fp);
        s.recall = safeDiv(k.tp, k.tp + k.fn);
        s.f1 = safeDiv(2.0 * s.precision * s.recall, s.precision + s.recall);
        s.support = k.tp + k.fn;
        report.push_back(s);
    }
    return report;
}

std::vector<std::vector<int>> confusionMatrix(const std::vector<int>& yTrue,
                                              const std::vector<int>& yPred, int numClasses) {
    std::vector<std::vector<int>> cm(numClasses, std::vector<int>(numClasses, 0));
    size_t n = std::min(yTrue.size(), yPred.size());
    for (size_t i = 0; i < n; ++i) {
        int t = yTrue[i];
        int p = yPred[i];
        if (t >= 0 && t < numClasses && p >= 0 && p < numClasses) cm[t][p]++;
    }
    return cm;
}

MeanStd meanStd(const std::vector<double>& values) {
    MeanStd ms;
    if (values.empty()) return ms;
    double sum = 0.0;
    for (double v : values) sum += v;
    ms.mean = sum / values.size();
    double sq = 0.0;
    for (double v : values) sq += (v - ms.mean) * (v - ms.mean);
    ms.stddev = std::sqrt(sq / values.size());
    return ms;
}

double median(std::vector<double> values) {
    if (values.empty()) return 0.0;
    std::sort(values.begin(), values.end());
    size_t mid = values.size() / 2;
    if (values.size() % 2 == 1) return values[mid];
    return (values[mid - 1] + values[mid]) / 2.0;
}

} // namespace mlbt
