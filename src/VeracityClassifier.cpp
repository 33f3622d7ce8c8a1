#include "VeracityClassifier.hpp"
#include "ClassifierErrors.hpp"
#include "DocumentTermEncoder.hpp"
#include "NaiveBayesTrainer.hpp"
#include "Vocabulary.hpp"
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {
ClassifierConfig validated(ClassifierConfig config) {
    config.validate();
    return config;
}
}

VeracityClassifier::VeracityClassifier(ClassifierConfig config)
    : config_(validated(std::move(config))), tokenizer_(config_) {
    size_t threads = config_.resolved_threads();
    if (threads > 1) pool_ = std::make_unique<WorkerPool>(threads);
}

void VeracityClassifier::require_trained() const {
    if (!model_.is_trained()) {
        throw UntrainedModelError("Classifier has not been fit or loaded");
    }
}

const NaiveBayesModel& VeracityClassifier::fit(const std::vector<Document>& corpus,
                                               const std::vector<std::string>& labels) {
    if (corpus.size() != labels.size() || corpus.empty()) {
        throw DimensionMismatchError("Got " + std::to_string(corpus.size()) + " documents and " +
                                     std::to_string(labels.size()) + " labels");
    }

    NaiveBayesTrainer trainer(config_.laplace_alpha, config_.prior_override);
    trainer.validate(labels);

    auto start = std::chrono::steady_clock::now();
    std::cout << "[VeracityClassifier] Training on " << corpus.size() << " documents\n";

    std::vector<TokenSequence> sequences = tokenizer_.tokenize_batch(corpus, pool_.get());
    Vocabulary vocabulary = Vocabulary::build(sequences, config_.min_doc_frequency_fraction);

    DocumentTermEncoder encoder(vocabulary);
    std::vector<SparseCountVector> vectors = encoder.encode_batch(sequences, pool_.get());

    model_ = trainer.fit(vocabulary, vectors, labels, pool_.get());

    auto end = std::chrono::steady_clock::now();
    auto duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count();
    std::cout << "[VeracityClassifier] Model trained in " << duration_ms << "ms ("
              << model_.num_classes() << " classes, " << model_.vocabulary().size() << " terms)\n";

    return model_;
}

PredictionResult VeracityClassifier::predict(const Document& document) const {
    require_trained();

    DocumentTermEncoder encoder(model_.vocabulary());
    return Predictor(model_).predict(encoder.encode(tokenizer_.tokenize(document)));
}

std::vector<PredictionResult> VeracityClassifier::predict_batch(const std::vector<Document>& documents) const {
    require_trained();

    std::vector<TokenSequence> sequences = tokenizer_.tokenize_batch(documents, pool_.get());
    DocumentTermEncoder encoder(model_.vocabulary());
    std::vector<SparseCountVector> vectors = encoder.encode_batch(sequences, pool_.get());
    return Predictor(model_).predict_batch(vectors, pool_.get());
}

bool VeracityClassifier::save(const std::string& model_path) const {
    require_trained();

    try {
        fs::path outp(model_path);
        if (outp.has_parent_path()) fs::create_directories(outp.parent_path());
    } catch (const std::exception& e) {
        std::cerr << "Warning: could not create directories: " << e.what() << "\n";
    }

    std::ofstream out(model_path);
    if (!out.is_open()) {
        std::cerr << "[VeracityClassifier] Could not create file " << model_path << "\n";
        return false;
    }

    std::vector<std::string> stopwords(tokenizer_.stopwords().begin(), tokenizer_.stopwords().end());
    std::sort(stopwords.begin(), stopwords.end());

    // The dictionary words travel with the model; the path is informational
    json j = model_.to_json();
    j["tokenizer"] = {
        {"normalization_mode", normalization_mode_name(tokenizer_.mode())},
        {"stopwords", stopwords},
        {"lemma_dictionary_path", config_.lemma_dictionary_path},
        {"lemma_dictionary", tokenizer_.lemmatizer().dictionary_words()}
    };

    out << j.dump(-1);
    std::cout << "[VeracityClassifier] Saved model to " << model_path << "\n";
    return true;
}

bool VeracityClassifier::load(const std::string& model_path) {
    std::ifstream in(model_path);
    if (!in.is_open()) {
        std::cerr << "[VeracityClassifier] Could not open model file " << model_path << "\n";
        return false;
    }

    json j;
    try {
        in >> j;
    } catch (const json::parse_error& e) {
        throw ModelFormatError("Model JSON parse error in " + model_path + ": " + e.what());
    }

    NaiveBayesModel loaded = NaiveBayesModel::from_json(j);

    if (!j.contains("tokenizer")) {
        throw ModelFormatError("Model file has no tokenizer settings: " + model_path);
    }

    // Tokenization comes entirely from the model file, never from this
    // classifier's config, so restored predictions match training
    ClassifierConfig config = config_;
    std::vector<std::string> dictionary;
    try {
        const json& tok = j["tokenizer"];
        config.normalization_mode = parse_normalization_mode(tok.at("normalization_mode").get<std::string>());
        auto words = tok.at("stopwords").get<std::vector<std::string>>();
        config.stopwords = std::unordered_set<std::string>(words.begin(), words.end());
        config.lemma_dictionary_path = tok.value("lemma_dictionary_path", std::string());
        dictionary = tok.at("lemma_dictionary").get<std::vector<std::string>>();
    } catch (const json::exception& e) {
        throw ModelFormatError(std::string("Malformed tokenizer settings: ") + e.what());
    } catch (const InvalidConfigError& e) {
        throw ModelFormatError(std::string("Malformed tokenizer settings: ") + e.what());
    }

    Tokenizer tokenizer(config.stopwords, config.normalization_mode);
    for (const auto& word : dictionary) tokenizer.lemmatizer().add_word(word);

    tokenizer_ = std::move(tokenizer);
    config_ = std::move(config);
    model_ = std::move(loaded);

    std::cout << "[VeracityClassifier] Loaded model: " << model_.num_classes() << " classes, "
              << model_.vocabulary().size() << " terms\n";
    return true;
}
