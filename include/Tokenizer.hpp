#pragma once
// Tokenizer.hpp
// Raw text -> ordered multiset of normalized tokens.
// Fixed pipeline: lowercase, strip punctuation and digits, split on whitespace,
// drop stopwords, then lemmatize and/or stem according to the normalization mode.

#include <initializer_list>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>
#include "ClassifierConfig.hpp"
#include "Lemmatizer.hpp"
#include "PorterStemmer.hpp"

class WorkerPool;

// One unit of input: raw text fields, joined by a single space
struct Document {
    std::vector<std::string> fields;

    Document() = default;
    Document(std::initializer_list<std::string> f) : fields(f) {}
    explicit Document(std::vector<std::string> f) : fields(std::move(f)) {}

    std::string text() const;
};

using TokenSequence = std::vector<std::string>;

class Tokenizer {
public:
    // Loads the lemma dictionary named in the config; throws InvalidConfigError if unreadable.
    // Stopwords are cleaned the same way as text.
    explicit Tokenizer(const ClassifierConfig& config);
    Tokenizer(const std::unordered_set<std::string>& stopwords, NormalizationMode mode);

    // Deterministic; empty input yields an empty sequence
    TokenSequence tokenize(const std::string& raw_text) const;
    TokenSequence tokenize(const Document& document) const { return tokenize(document.text()); }

    // Output order matches input order
    std::vector<TokenSequence> tokenize_batch(const std::vector<Document>& documents, WorkerPool* pool = nullptr) const;

    // Lemmatize and/or stem one already-cleaned word
    std::string normalize(const std::string& word) const;

    const std::unordered_set<std::string>& stopwords() const { return stopwords_; }
    NormalizationMode mode() const { return mode_; }
    Lemmatizer& lemmatizer() { return lemmatizer_; }
    const Lemmatizer& lemmatizer() const { return lemmatizer_; }

private:
    std::unordered_set<std::string> stopwords_;
    NormalizationMode mode_;
    Lemmatizer lemmatizer_;
    PorterStemmer stemmer_;

    static std::string clean(const std::string& raw_text);
    static std::unordered_set<std::string> clean_stopwords(const std::unordered_set<std::string>& words);
};
