#include "Vocabulary.hpp"
#include "ClassifierErrors.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <unordered_set>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {
constexpr uint64_t kFnvOffsetBasis = 14695981039346656037ULL;
constexpr uint64_t kFnvPrime = 1099511628211ULL;
}

Vocabulary::Vocabulary(std::vector<std::string> terms) : index_to_word_(std::move(terms)) {
    word_to_index_.reserve(index_to_word_.size());
    for (size_t i = 0; i < index_to_word_.size(); ++i) {
        if (!word_to_index_.emplace(index_to_word_[i], static_cast<int>(i)).second) {
            throw ModelFormatError("Duplicate vocabulary term: " + index_to_word_[i]);
        }
    }
    fingerprint_ = compute_fingerprint(index_to_word_);
}

uint64_t Vocabulary::compute_fingerprint(const std::vector<std::string>& terms) {
    uint64_t hash = kFnvOffsetBasis;
    for (const auto& term : terms) {
        for (unsigned char c : term) {
            hash ^= c;
            hash *= kFnvPrime;
        }
        // Separator so {"ab","c"} and {"a","bc"} differ
        hash ^= 0;
        hash *= kFnvPrime;
    }
    return hash;
}

Vocabulary Vocabulary::build(const std::vector<TokenSequence>& training_sequences,
                             double min_doc_frequency_fraction) {
    if (!(min_doc_frequency_fraction >= 0.0 && min_doc_frequency_fraction <= 1.0)) {
        throw InvalidConfigError("min_doc_frequency_fraction must lie in [0, 1], got " +
                                 std::to_string(min_doc_frequency_fraction));
    }

    std::unordered_map<std::string, int> doc_frequencies;
    doc_frequencies.reserve(65536);

    for (const auto& tokens : training_sequences) {
        std::unordered_set<std::string> doc_set;
        for (const auto& tok : tokens) {
            if (doc_set.insert(tok).second) doc_frequencies[tok]++;
        }
    }

    const double total_documents = static_cast<double>(training_sequences.size());

    std::vector<std::string> significant;
    for (const auto& p : doc_frequencies) {
        if (static_cast<double>(p.second) / total_documents >= min_doc_frequency_fraction) {
            significant.push_back(p.first);
        }
    }

    std::cout << "[Vocabulary] Documents: " << training_sequences.size()
              << ", unique terms: " << doc_frequencies.size()
              << ", retained: " << significant.size() << "\n";

    if (significant.empty()) {
        throw EmptyVocabularyError("No term reaches a document frequency fraction of " +
                                   std::to_string(min_doc_frequency_fraction) + " across " +
                                   std::to_string(training_sequences.size()) + " documents");
    }

    std::sort(significant.begin(), significant.end());
    return Vocabulary(std::move(significant));
}

int Vocabulary::get_word_index(const std::string& word) const {
    auto it = word_to_index_.find(word);
    return (it == word_to_index_.end()) ? -1 : it->second;
}

std::string Vocabulary::get_word(int index) const {
    if (index < 0 || static_cast<size_t>(index) >= index_to_word_.size()) return "";
    return index_to_word_[index];
}

json Vocabulary::to_json() const {
    json j;
    j["index_to_word"] = index_to_word_;
    j["total_words"] = index_to_word_.size();
    return j;
}

Vocabulary Vocabulary::from_json(const json& j) {
    try {
        const json& words = j.contains("index_to_word") ? j["index_to_word"] : j;
        return Vocabulary(words.get<std::vector<std::string>>());
    } catch (const json::exception& e) {
        throw ModelFormatError(std::string("Malformed vocabulary: ") + e.what());
    }
}

bool Vocabulary::save_to_json(const std::string& output_path) const {
    try {
        fs::path outp(output_path);
        if (outp.has_parent_path()) fs::create_directories(outp.parent_path());
    } catch (const std::exception& e) {
        std::cerr << "Warning: could not create directories: " << e.what() << "\n";
    }

    std::ofstream out(output_path);
    if (!out.is_open()) {
        std::cerr << "Error: could not create file " << output_path << "\n";
        return false;
    }

    json j = to_json();
    j["word_to_index"] = word_to_index_;
    out << j.dump(2) << "\n";
    std::cout << "[Vocabulary] Saved " << size() << " terms to " << output_path << "\n";
    return true;
}

bool Vocabulary::load_from_json(const std::string& vocabulary_path) {
    std::ifstream in(vocabulary_path);
    if (!in.is_open()) {
        std::cerr << "Error: could not open " << vocabulary_path << "\n";
        return false;
    }

    try {
        json j;
        in >> j;
        *this = from_json(j);
    } catch (const std::exception& e) {
        std::cerr << "[Vocabulary] Could not parse " << vocabulary_path << ": " << e.what() << "\n";
        return false;
    }

    std::cout << "[Vocabulary] Loaded " << size() << " terms\n";
    return !empty();
}
