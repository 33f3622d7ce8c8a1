#include "NaiveBayesTrainer.hpp"
#include "ClassifierErrors.hpp"
#include "WorkerPool.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>
#include <mutex>
#include <set>

namespace {
constexpr double kPriorSumTolerance = 1e-6;
}

NaiveBayesTrainer::NaiveBayesTrainer(double alpha, std::optional<std::map<std::string, double>> prior_override)
    : alpha_(alpha), prior_override_(std::move(prior_override)) {}

std::vector<std::vector<long long>> NaiveBayesTrainer::class_term_totals(
    const std::vector<SparseCountVector>& train_vectors,
    const std::vector<int>& class_of_document,
    size_t num_classes,
    size_t vocabulary_size,
    WorkerPool* pool) {
    std::vector<std::vector<long long>> totals(num_classes, std::vector<long long>(vocabulary_size, 0));
    std::mutex merge_mutex;

    for_each_chunk(pool, train_vectors.size(), [&](size_t begin, size_t end) {
        std::vector<std::vector<long long>> partial(num_classes, std::vector<long long>(vocabulary_size, 0));
        for (size_t d = begin; d < end; ++d) {
            auto& row = partial[class_of_document[d]];
            for (const auto& e : train_vectors[d].entries) row[e.first] += e.second;
        }

        std::lock_guard<std::mutex> lock(merge_mutex);
        for (size_t c = 0; c < num_classes; ++c) {
            for (size_t t = 0; t < vocabulary_size; ++t) totals[c][t] += partial[c][t];
        }
    });

    return totals;
}

void NaiveBayesTrainer::validate(const std::vector<std::string>& train_labels) const {
    if (!std::isfinite(alpha_) || alpha_ < 0.0) {
        throw InvalidConfigError("laplace_alpha must be a finite value >= 0, got " + std::to_string(alpha_));
    }
    if (!prior_override_) return;

    const auto& priors = *prior_override_;
    std::set<std::string> classes(train_labels.begin(), train_labels.end());
    if (priors.size() != classes.size()) {
        throw InvalidConfigError("prior_override names " + std::to_string(priors.size()) +
                                 " classes but training data has " + std::to_string(classes.size()));
    }

    double sum = 0.0;
    for (const auto& label : classes) {
        auto it = priors.find(label);
        if (it == priors.end()) {
            throw InvalidConfigError("prior_override is missing class " + label);
        }
        double p = it->second;
        if (!std::isfinite(p) || p < 0.0 || p > 1.0) {
            throw InvalidConfigError("prior_override[" + label + "] must lie in [0, 1]");
        }
        sum += p;
    }
    if (std::fabs(sum - 1.0) > kPriorSumTolerance) {
        throw InvalidConfigError("prior_override must sum to 1, got " + std::to_string(sum));
    }
}

std::vector<double> NaiveBayesTrainer::resolve_log_priors(const std::vector<std::string>& classes,
                                                          const std::vector<size_t>& class_counts,
                                                          size_t total_documents) const {
    std::vector<double> log_priors(classes.size());
    for (size_t c = 0; c < classes.size(); ++c) {
        double p = prior_override_ ? prior_override_->at(classes[c])
                                   : static_cast<double>(class_counts[c]) / static_cast<double>(total_documents);
        log_priors[c] = std::log(p);
    }
    return log_priors;
}

NaiveBayesModel NaiveBayesTrainer::fit(const Vocabulary& vocabulary,
                                       const std::vector<SparseCountVector>& train_vectors,
                                       const std::vector<std::string>& train_labels,
                                       WorkerPool* pool) const {
    // 1. Validate everything up front
    if (train_vectors.size() != train_labels.size() || train_vectors.empty()) {
        throw DimensionMismatchError("Got " + std::to_string(train_vectors.size()) + " vectors and " +
                                     std::to_string(train_labels.size()) + " labels");
    }
    if (vocabulary.empty()) {
        throw EmptyVocabularyError("Cannot fit against an empty vocabulary");
    }
    for (const auto& vec : train_vectors) check_encoded_against(vec, vocabulary);
    validate(train_labels);

    // 2. Class set, ordered
    std::set<std::string> class_set(train_labels.begin(), train_labels.end());
    std::vector<std::string> classes(class_set.begin(), class_set.end());

    std::vector<int> class_of_document(train_labels.size());
    std::vector<size_t> class_counts(classes.size(), 0);
    for (size_t d = 0; d < train_labels.size(); ++d) {
        auto it = std::lower_bound(classes.begin(), classes.end(), train_labels[d]);
        int c = static_cast<int>(it - classes.begin());
        class_of_document[d] = c;
        class_counts[c]++;
    }

    // 3. Priors
    std::vector<double> log_priors = resolve_log_priors(classes, class_counts, train_labels.size());

    // 4. T_ct
    const size_t V = vocabulary.size();
    const size_t C = classes.size();
    auto totals = class_term_totals(train_vectors, class_of_document, C, V, pool);

    // 5. Smoothed log-likelihoods, term-major
    std::vector<double> log_likelihood(V * C);
    for (size_t c = 0; c < C; ++c) {
        long long class_total = 0;
        for (long long n : totals[c]) class_total += n;

        double denominator = static_cast<double>(class_total) + alpha_ * static_cast<double>(V);
        for (size_t t = 0; t < V; ++t) {
            double numerator = static_cast<double>(totals[c][t]) + alpha_;
            // A class with no mass at all (alpha = 0, no tokens) gets log(0) everywhere
            log_likelihood[t * C + c] = (denominator > 0.0) ? std::log(numerator / denominator)
                                                            : -std::numeric_limits<double>::infinity();
        }
    }

    std::cout << "[NaiveBayesTrainer] Fit " << train_vectors.size() << " documents, "
              << C << " classes, " << V << " terms, alpha=" << alpha_ << "\n";

    return NaiveBayesModel(vocabulary, std::move(classes), std::move(log_priors),
                           std::move(log_likelihood), alpha_);
}
