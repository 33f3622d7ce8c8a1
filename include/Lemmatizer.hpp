#pragma once
// Lemmatizer.hpp
// Dictionary lemmatizer: maps an inflected word to an existing-word root.
// Irregular forms come from a built-in table. Regular forms are found by
// detaching noun, verb and adjective suffixes and keeping the first candidate
// present in the word dictionary. Unknown words are returned unchanged.

#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

class Lemmatizer {
public:
    Lemmatizer();

    // Word list, one word per line
    bool load_dictionary(const std::string& path);
    void add_word(const std::string& word);

    std::string lemmatize(const std::string& word) const;

    size_t dictionary_size() const { return dictionary_.size(); }

    // Sorted, for persistence
    std::vector<std::string> dictionary_words() const;

private:
    std::unordered_map<std::string, std::string> irregular_;
    std::unordered_set<std::string> dictionary_;

    void load_irregular_forms();
};
