#include "Predictor.hpp"
#include "ClassifierErrors.hpp"
#include "WorkerPool.hpp"

void Predictor::require_trained() const {
    if (!model_.is_trained()) {
        throw UntrainedModelError("predict called on a model that never completed fit");
    }
}

PredictionResult Predictor::predict(const SparseCountVector& document_vector) const {
    require_trained();
    check_encoded_against(document_vector, model_.vocabulary());

    const size_t num_classes = model_.num_classes();
    std::vector<double> scores(num_classes);
    for (size_t c = 0; c < num_classes; ++c) scores[c] = model_.log_prior(c);

    for (const auto& [term, count] : document_vector.entries) {
        if (count <= 0) continue;
        const double* row = model_.term_row(term);
        for (size_t c = 0; c < num_classes; ++c) scores[c] += count * row[c];
    }

    // Classes are sorted, so keeping the first maximum breaks ties toward the smallest label
    size_t best = 0;
    for (size_t c = 1; c < num_classes; ++c) {
        if (scores[c] > scores[best]) best = c;
    }

    PredictionResult result;
    result.label = model_.classes()[best];
    for (size_t c = 0; c < num_classes; ++c) {
        result.scores_by_class[model_.classes()[c]] = scores[c];
    }
    return result;
}

std::vector<PredictionResult> Predictor::predict_batch(const std::vector<SparseCountVector>& document_vectors,
                                                       WorkerPool* pool) const {
    require_trained();

    std::vector<PredictionResult> results(document_vectors.size());
    for_each_chunk(pool, document_vectors.size(), [&](size_t begin, size_t end) {
        for (size_t i = begin; i < end; ++i) {
            results[i] = predict(document_vectors[i]);
        }
    });
    return results;
}
