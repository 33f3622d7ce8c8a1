#pragma once
// ClassifierConfig.hpp
// Recognized options for tokenization, vocabulary pruning and training.
// Loaded from a JSON file; every field has a default.

#include <map>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>
#include <nlohmann/json.hpp>

enum class NormalizationMode {
    LemmatizeThenStem,
    StemOnly,
    LemmatizeOnly
};

std::string normalization_mode_name(NormalizationMode mode);
NormalizationMode parse_normalization_mode(const std::string& name);

struct ClassifierConfig {
    std::unordered_set<std::string> stopwords;
    double min_doc_frequency_fraction = 0.01;
    double laplace_alpha = 1.0;
    std::optional<std::map<std::string, double>> prior_override;
    NormalizationMode normalization_mode = NormalizationMode::LemmatizeThenStem;
    std::string lemma_dictionary_path;
    size_t num_threads = 1;

    // Corpus layout (used by the corpus reader and CLI tools)
    std::vector<std::string> text_fields{"statement"};
    std::string label_field = "label";

    ClassifierConfig();

    // Throws InvalidConfigError on any malformed option
    void validate() const;

    // Effective worker count (0 means hardware concurrency)
    size_t resolved_threads() const;

    static ClassifierConfig from_json(const nlohmann::json& j);
    static ClassifierConfig load(const std::string& config_path);
};

// Built-in English stopword list
const std::unordered_set<std::string>& default_stopwords();

// One stopword per line, lowercased; throws InvalidConfigError if unreadable
std::unordered_set<std::string> load_stopwords_from_file(const std::string& path);
