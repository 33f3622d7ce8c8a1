#pragma once
// PorterStemmer.hpp
// Suffix-stripping stemmer (M.F. Porter, 1980), steps 1a through 5b.
// Input is expected lowercase ASCII; words of length <= 2 are returned as-is.

#include <string>

class PorterStemmer {
public:
    std::string stem(const std::string& word) const;

private:
    // Working buffer: b[0..k] is the current word, j marks the end of the stem
    struct State {
        std::string b;
        int k = 0;
        int j = 0;
    };

    static bool cons(const State& s, int i);
    static int measure(const State& s);
    static bool vowel_in_stem(const State& s);
    static bool double_consonant(const State& s, int i);
    static bool cvc(const State& s, int i);
    static bool ends(State& s, const std::string& suffix);
    static void set_to(State& s, const std::string& replacement);
    static void replace_if_measured(State& s, const std::string& replacement);

    static void step1ab(State& s);
    static void step1c(State& s);
    static void step2(State& s);
    static void step3(State& s);
    static void step4(State& s);
    static void step5(State& s);
};
