#include "Lemmatizer.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <utility>
#include <vector>

namespace {
// Tried in order: noun, verb, adjective
const std::vector<std::pair<std::string, std::string>> kDetachmentRules = {
    {"s", ""}, {"ses", "s"}, {"xes", "x"}, {"zes", "z"}, {"ches", "ch"},
    {"shes", "sh"}, {"men", "man"}, {"ies", "y"},
    {"s", ""}, {"ies", "y"}, {"es", "e"}, {"es", ""}, {"ed", "e"},
    {"ed", ""}, {"ing", "e"}, {"ing", ""},
    {"er", ""}, {"est", ""}, {"er", "e"}, {"est", "e"}
};
}

Lemmatizer::Lemmatizer() {
    load_irregular_forms();
}

void Lemmatizer::load_irregular_forms() {
    static const char* forms[][2] = {
        // nouns
        {"children", "child"}, {"men", "man"}, {"women", "woman"}, {"people", "person"},
        {"mice", "mouse"}, {"geese", "goose"}, {"feet", "foot"}, {"teeth", "tooth"},
        {"lives", "life"}, {"wives", "wife"}, {"knives", "knife"}, {"leaves", "leaf"},
        {"wolves", "wolf"}, {"halves", "half"}, {"selves", "self"}, {"thieves", "thief"},
        {"analyses", "analysis"}, {"crises", "crisis"}, {"theses", "thesis"},
        {"criteria", "criterion"}, {"phenomena", "phenomenon"}, {"data", "datum"},
        {"media", "medium"}, {"indices", "index"}, {"matrices", "matrix"},
        // verbs
        {"went", "go"}, {"gone", "go"}, {"said", "say"}, {"made", "make"},
        {"took", "take"}, {"taken", "take"}, {"got", "get"}, {"gotten", "get"},
        {"gave", "give"}, {"given", "give"}, {"came", "come"}, {"saw", "see"},
        {"seen", "see"}, {"knew", "know"}, {"known", "know"}, {"thought", "think"},
        {"told", "tell"}, {"found", "find"}, {"became", "become"}, {"began", "begin"},
        {"begun", "begin"}, {"kept", "keep"}, {"brought", "bring"}, {"bought", "buy"},
        {"paid", "pay"}, {"ran", "run"}, {"won", "win"}, {"lost", "lose"},
        {"spent", "spend"}, {"built", "build"}, {"sent", "send"}, {"held", "hold"},
        {"stood", "stand"}, {"meant", "mean"}, {"wrote", "write"}, {"written", "write"},
        {"fell", "fall"}, {"fallen", "fall"}, {"chose", "choose"}, {"chosen", "choose"},
        {"spoke", "speak"}, {"spoken", "speak"}, {"led", "lead"}, {"fought", "fight"},
        {"taught", "teach"}, {"sought", "seek"}, {"caught", "catch"}, {"drove", "drive"},
        {"driven", "drive"}, {"grew", "grow"}, {"grown", "grow"}, {"rose", "rise"},
        {"risen", "rise"}, {"shot", "shoot"}, {"struck", "strike"}, {"sold", "sell"},
        {"felt", "feel"}, {"heard", "hear"}, {"met", "meet"}, {"understood", "understand"},
        // adjectives
        {"better", "good"}, {"best", "good"}, {"worse", "bad"}, {"worst", "bad"},
        {"farther", "far"}, {"further", "far"}, {"less", "little"}, {"least", "little"}
    };
    for (const auto& f : forms) irregular_[f[0]] = f[1];
}

bool Lemmatizer::load_dictionary(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        std::cerr << "[Lemmatizer] Could not open dictionary: " << path << "\n";
        return false;
    }

    std::string line;
    while (std::getline(in, line)) {
        auto start = line.find_first_not_of(" \t\r\n");
        if (start == std::string::npos) continue;
        auto end = line.find_last_not_of(" \t\r\n");
        add_word(line.substr(start, end - start + 1));
    }

    std::cout << "[Lemmatizer] Loaded " << dictionary_.size() << " dictionary words\n";
    return true;
}

void Lemmatizer::add_word(const std::string& word) {
    std::string w = word;
    std::transform(w.begin(), w.end(), w.begin(), [](unsigned char c){ return std::tolower(c); });
    if (!w.empty()) dictionary_.insert(w);
}

std::vector<std::string> Lemmatizer::dictionary_words() const {
    std::vector<std::string> words(dictionary_.begin(), dictionary_.end());
    std::sort(words.begin(), words.end());
    return words;
}

std::string Lemmatizer::lemmatize(const std::string& word) const {
    auto irr = irregular_.find(word);
    if (irr != irregular_.end()) return irr->second;

    if (dictionary_.empty() || dictionary_.count(word)) return word;

    for (const auto& [suffix, replacement] : kDetachmentRules) {
        if (word.size() <= suffix.size()) continue;
        if (word.compare(word.size() - suffix.size(), suffix.size(), suffix) != 0) continue;

        std::string candidate = word.substr(0, word.size() - suffix.size()) + replacement;
        if (dictionary_.count(candidate)) return candidate;
    }
    return word;
}
