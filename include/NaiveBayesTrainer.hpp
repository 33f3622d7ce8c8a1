#pragma once
// NaiveBayesTrainer.hpp
// Fits a multinomial Naive Bayes model with additive (Laplace) smoothing:
//   P(t|c) = (T_ct + alpha) / (sum_t' T_ct' + alpha * |V|)
// where T_ct is the count of term t summed over training documents of class c.
// Priors are count(c) / N unless an explicit override is supplied.
// All inputs are validated before any aggregation starts.

#include <map>
#include <optional>
#include <string>
#include <vector>
#include "DocumentTermEncoder.hpp"
#include "NaiveBayesModel.hpp"

class WorkerPool;

class NaiveBayesTrainer {
public:
    explicit NaiveBayesTrainer(double alpha = 1.0,
                               std::optional<std::map<std::string, double>> prior_override = std::nullopt);

    // Checks alpha and that the prior override covers exactly the observed
    // label set; throws InvalidConfigError. Cheap, so callers can run it
    // before tokenizing a corpus.
    void validate(const std::vector<std::string>& train_labels) const;

    // Throws InvalidConfigError, DimensionMismatchError
    NaiveBayesModel fit(const Vocabulary& vocabulary,
                        const std::vector<SparseCountVector>& train_vectors,
                        const std::vector<std::string>& train_labels,
                        WorkerPool* pool = nullptr) const;

    // T_ct indexed [class][term]; partial totals per chunk are summed
    static std::vector<std::vector<long long>> class_term_totals(
        const std::vector<SparseCountVector>& train_vectors,
        const std::vector<int>& class_of_document,
        size_t num_classes,
        size_t vocabulary_size,
        WorkerPool* pool = nullptr);

    double alpha() const { return alpha_; }

private:
    double alpha_;
    std::optional<std::map<std::string, double>> prior_override_;

    std::vector<double> resolve_log_priors(const std::vector<std::string>& classes,
                                           const std::vector<size_t>& class_counts,
                                           size_t total_documents) const;
};
