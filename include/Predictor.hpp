#pragma once
// Predictor.hpp
// Scores sparse count vectors against a trained model:
//   score(c) = log P(c) + sum over nonzero terms of count * log P(t|c)
// The arg-max wins; ties go to the lexicographically smallest label.
// An all-zero vector scores the priors alone.

#include <map>
#include <string>
#include <vector>
#include "DocumentTermEncoder.hpp"
#include "NaiveBayesModel.hpp"

class WorkerPool;

struct PredictionResult {
    std::string label;
    std::map<std::string, double> scores_by_class;
};

class Predictor {
public:
    explicit Predictor(const NaiveBayesModel& model) : model_(model) {}
    // Holds a reference; the model must outlive the predictor
    explicit Predictor(NaiveBayesModel&&) = delete;

    // Throws UntrainedModelError, DimensionMismatchError
    PredictionResult predict(const SparseCountVector& document_vector) const;

    // Independent per document; output order matches input order
    std::vector<PredictionResult> predict_batch(const std::vector<SparseCountVector>& document_vectors,
                                                WorkerPool* pool = nullptr) const;

private:
    const NaiveBayesModel& model_;

    void require_trained() const;
};
