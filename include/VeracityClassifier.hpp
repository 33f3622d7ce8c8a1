#pragma once
// VeracityClassifier.hpp
// End-to-end pipeline: tokenize -> build vocabulary -> encode -> fit -> predict.
// Owns the configuration, the tokenizer, the trained model and (when more
// than one thread is configured) a worker pool shared by all batch stages.

#include <memory>
#include <string>
#include <vector>
#include "ClassifierConfig.hpp"
#include "NaiveBayesModel.hpp"
#include "Predictor.hpp"
#include "Tokenizer.hpp"
#include "WorkerPool.hpp"

class VeracityClassifier {
public:
    // Throws InvalidConfigError
    explicit VeracityClassifier(ClassifierConfig config = ClassifierConfig());

    // Replaces the model only when training succeeds
    const NaiveBayesModel& fit(const std::vector<Document>& corpus, const std::vector<std::string>& labels);

    // Throws UntrainedModelError before fit or load
    PredictionResult predict(const Document& document) const;
    std::vector<PredictionResult> predict_batch(const std::vector<Document>& documents) const;

    bool is_trained() const { return model_.is_trained(); }
    const NaiveBayesModel& model() const { return model_; }
    const Tokenizer& tokenizer() const { return tokenizer_; }
    const ClassifierConfig& config() const { return config_; }

    // Model plus tokenizer settings, as JSON
    bool save(const std::string& model_path) const;

    // False if the file cannot be opened; malformed content throws ModelFormatError
    bool load(const std::string& model_path);

private:
    ClassifierConfig config_;
    Tokenizer tokenizer_;
    NaiveBayesModel model_;
    std::unique_ptr<WorkerPool> pool_;

    void require_trained() const;
};
