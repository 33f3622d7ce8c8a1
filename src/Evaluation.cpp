#include "Evaluation.hpp"
#include "ClassifierErrors.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <set>

EvaluationReport evaluate(const std::vector<std::string>& truth,
                          const std::vector<std::string>& predicted,
                          double z) {
    if (truth.size() != predicted.size() || truth.empty()) {
        throw DimensionMismatchError("Cannot evaluate " + std::to_string(predicted.size()) +
                                     " predictions against " + std::to_string(truth.size()) + " labels");
    }

    EvaluationReport report;
    std::set<std::string> label_set(truth.begin(), truth.end());
    label_set.insert(predicted.begin(), predicted.end());
    report.labels.assign(label_set.begin(), label_set.end());

    const size_t k = report.labels.size();
    report.confusion.assign(k, std::vector<size_t>(k, 0));

    auto index_of = [&](const std::string& label) {
        return static_cast<size_t>(std::lower_bound(report.labels.begin(), report.labels.end(), label) -
                                   report.labels.begin());
    };

    for (size_t i = 0; i < truth.size(); ++i) {
        report.confusion[index_of(truth[i])][index_of(predicted[i])]++;
        if (truth[i] == predicted[i]) report.correct++;
    }

    report.total = truth.size();
    report.accuracy = static_cast<double>(report.correct) / static_cast<double>(report.total);

    double half_width = z * std::sqrt(report.accuracy * (1.0 - report.accuracy) / static_cast<double>(report.total));
    report.ci_low = std::max(0.0, report.accuracy - half_width);
    report.ci_high = std::min(1.0, report.accuracy + half_width);
    return report;
}

void print_report(const EvaluationReport& report, std::ostream& out) {
    out << "Accuracy: " << std::fixed << std::setprecision(4) << report.accuracy
        << " (" << report.correct << "/" << report.total << "), 95% CI ["
        << report.ci_low << ", " << report.ci_high << "]\n";

    size_t width = 10;
    for (const auto& label : report.labels) width = std::max(width, label.size() + 2);

    out << "\nConfusion matrix (rows: true, columns: predicted)\n";
    out << std::left << std::setw(static_cast<int>(width)) << "";
    for (const auto& label : report.labels) out << std::setw(static_cast<int>(width)) << label;
    out << "\n";

    for (size_t r = 0; r < report.labels.size(); ++r) {
        out << std::setw(static_cast<int>(width)) << report.labels[r];
        for (size_t c = 0; c < report.labels.size(); ++c) {
            out << std::setw(static_cast<int>(width)) << report.confusion[r][c];
        }
        out << "\n";
    }
}
