#pragma once
// Vocabulary.hpp
// Fixed, index-assigned term set derived from a training corpus.
// Uses document frequency (a term counts once per document) and drops terms
// whose document-frequency fraction falls below the configured threshold.
// Surviving terms are indexed in lexicographic order, so the same corpus
// always produces the same indices.
// Saved as JSON with word_to_index (object) and index_to_word (array).

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>

using TokenSequence = std::vector<std::string>;

class Vocabulary {
public:
    Vocabulary() = default;

    // Terms in index order; throws ModelFormatError on duplicates
    explicit Vocabulary(std::vector<std::string> terms);

    // Throws InvalidConfigError for a fraction outside [0, 1] and
    // EmptyVocabularyError when no term survives pruning
    static Vocabulary build(const std::vector<TokenSequence>& training_sequences,
                            double min_doc_frequency_fraction = 0.01);

    // Lookups
    int get_word_index(const std::string& word) const;
    std::string get_word(int index) const;
    bool contains_word(const std::string& word) const { return get_word_index(word) != -1; }
    size_t size() const { return index_to_word_.size(); }
    bool empty() const { return index_to_word_.empty(); }
    const std::vector<std::string>& terms() const { return index_to_word_; }

    // FNV-1a over the ordered term list; equal only for identical indexing
    uint64_t fingerprint() const { return fingerprint_; }

    nlohmann::json to_json() const;
    static Vocabulary from_json(const nlohmann::json& j);

    bool save_to_json(const std::string& output_path) const;
    bool load_from_json(const std::string& vocabulary_path);

private:
    std::unordered_map<std::string, int> word_to_index_;
    std::vector<std::string> index_to_word_;
    uint64_t fingerprint_ = 0;

    static uint64_t compute_fingerprint(const std::vector<std::string>& terms);
};
