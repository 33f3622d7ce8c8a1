#pragma once
// Evaluation.hpp
// Accuracy with a normal-approximation confidence interval, and a confusion
// matrix over the sorted union of true and predicted labels.

#include <ostream>
#include <string>
#include <vector>

struct EvaluationReport {
    size_t total = 0;
    size_t correct = 0;
    double accuracy = 0.0;
    double ci_low = 0.0;
    double ci_high = 0.0;

    std::vector<std::string> labels;
    // confusion[true][predicted], indexed like labels
    std::vector<std::vector<size_t>> confusion;
};

// Throws DimensionMismatchError on length mismatch or empty input
EvaluationReport evaluate(const std::vector<std::string>& truth,
                          const std::vector<std::string>& predicted,
                          double z = 1.96);

void print_report(const EvaluationReport& report, std::ostream& out);
