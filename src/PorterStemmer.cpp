#include "PorterStemmer.hpp"
#include <utility>
#include <vector>

namespace {
using SuffixRule = std::pair<const char*, const char*>;

// Longer suffixes precede the shorter ones they contain
const std::vector<SuffixRule> kStep2Rules = {
    {"ational", "ate"}, {"tional", "tion"}, {"enci", "ence"}, {"anci", "ance"},
    {"izer", "ize"}, {"bli", "ble"}, {"alli", "al"}, {"entli", "ent"},
    {"eli", "e"}, {"ousli", "ous"}, {"ization", "ize"}, {"ation", "ate"},
    {"ator", "ate"}, {"alism", "al"}, {"iveness", "ive"}, {"fulness", "ful"},
    {"ousness", "ous"}, {"aliti", "al"}, {"iviti", "ive"}, {"biliti", "ble"},
    {"logi", "log"}
};

const std::vector<SuffixRule> kStep3Rules = {
    {"icate", "ic"}, {"ative", ""}, {"alize", "al"}, {"iciti", "ic"},
    {"ical", "ic"}, {"ful", ""}, {"ness", ""}
};

const std::vector<const char*> kStep4Suffixes = {
    "al", "ance", "ence", "er", "ic", "able", "ible", "ant", "ement", "ment",
    "ent", "ion", "ou", "ism", "ate", "iti", "ous", "ive", "ize"
};
}

bool PorterStemmer::cons(const State& s, int i) {
    switch (s.b[i]) {
        case 'a': case 'e': case 'i': case 'o': case 'u':
            return false;
        case 'y':
            return (i == 0) ? true : !cons(s, i - 1);
        default:
            return true;
    }
}

// Number of VC sequences in b[0..j]
int PorterStemmer::measure(const State& s) {
    int n = 0;
    int i = 0;
    while (true) {
        if (i > s.j) return n;
        if (!cons(s, i)) break;
        i++;
    }
    i++;
    while (true) {
        while (true) {
            if (i > s.j) return n;
            if (cons(s, i)) break;
            i++;
        }
        i++;
        n++;
        while (true) {
            if (i > s.j) return n;
            if (!cons(s, i)) break;
            i++;
        }
        i++;
    }
}

bool PorterStemmer::vowel_in_stem(const State& s) {
    for (int i = 0; i <= s.j; i++) {
        if (!cons(s, i)) return true;
    }
    return false;
}

bool PorterStemmer::double_consonant(const State& s, int i) {
    if (i < 1) return false;
    if (s.b[i] != s.b[i - 1]) return false;
    return cons(s, i);
}

// consonant-vowel-consonant ending at i, where the last consonant is not w, x or y
bool PorterStemmer::cvc(const State& s, int i) {
    if (i < 2 || !cons(s, i) || cons(s, i - 1) || !cons(s, i - 2)) return false;
    char ch = s.b[i];
    return !(ch == 'w' || ch == 'x' || ch == 'y');
}

bool PorterStemmer::ends(State& s, const std::string& suffix) {
    int length = static_cast<int>(suffix.size());
    if (length > s.k + 1) return false;
    if (s.b.compare(s.k - length + 1, length, suffix) != 0) return false;
    s.j = s.k - length;
    return true;
}

void PorterStemmer::set_to(State& s, const std::string& replacement) {
    s.b = s.b.substr(0, s.j + 1) + replacement;
    s.k = static_cast<int>(s.b.size()) - 1;
}

void PorterStemmer::replace_if_measured(State& s, const std::string& replacement) {
    if (measure(s) > 0) set_to(s, replacement);
}

// Plurals and -ed / -ing
void PorterStemmer::step1ab(State& s) {
    if (s.b[s.k] == 's') {
        if (ends(s, "sses")) {
            s.k -= 2;
        } else if (ends(s, "ies")) {
            set_to(s, "i");
        } else if (s.b[s.k - 1] != 's') {
            s.k--;
        }
    }

    if (ends(s, "eed")) {
        if (measure(s) > 0) s.k--;
    } else if ((ends(s, "ed") || ends(s, "ing")) && vowel_in_stem(s)) {
        s.k = s.j;
        if (ends(s, "at")) {
            set_to(s, "ate");
        } else if (ends(s, "bl")) {
            set_to(s, "ble");
        } else if (ends(s, "iz")) {
            set_to(s, "ize");
        } else if (double_consonant(s, s.k)) {
            s.k--;
            char ch = s.b[s.k];
            if (ch == 'l' || ch == 's' || ch == 'z') s.k++;
        } else {
            s.j = s.k;
            if (measure(s) == 1 && cvc(s, s.k)) set_to(s, "e");
        }
    }
}

// Terminal y to i when another vowel is in the stem
void PorterStemmer::step1c(State& s) {
    if (ends(s, "y") && vowel_in_stem(s)) s.b[s.k] = 'i';
}

void PorterStemmer::step2(State& s) {
    if (s.k < 1) return;
    for (const auto& [suffix, replacement] : kStep2Rules) {
        if (ends(s, suffix)) {
            replace_if_measured(s, replacement);
            return;
        }
    }
}

void PorterStemmer::step3(State& s) {
    for (const auto& [suffix, replacement] : kStep3Rules) {
        if (ends(s, suffix)) {
            replace_if_measured(s, replacement);
            return;
        }
    }
}

// Strip -ant, -ence etc. in context <c>vcvc<v>
void PorterStemmer::step4(State& s) {
    if (s.k < 1) return;
    for (const char* suffix : kStep4Suffixes) {
        if (!ends(s, suffix)) continue;
        if (std::string(suffix) == "ion") {
            if (s.j < 0 || (s.b[s.j] != 's' && s.b[s.j] != 't')) return;
        }
        if (measure(s) > 1) s.k = s.j;
        return;
    }
}

// Remove a final -e if m > 1, and change -ll to -l if m > 1
void PorterStemmer::step5(State& s) {
    s.j = s.k;
    if (s.b[s.k] == 'e') {
        int a = measure(s);
        if (a > 1 || (a == 1 && !cvc(s, s.k - 1))) s.k--;
    }
    if (s.b[s.k] == 'l' && double_consonant(s, s.k) && measure(s) > 1) s.k--;
}

std::string PorterStemmer::stem(const std::string& word) const {
    if (word.size() <= 2) return word;

    State s;
    s.b = word;
    s.k = static_cast<int>(word.size()) - 1;
    s.j = 0;

    step1ab(s);
    if (s.k > 0) {
        step1c(s);
        step2(s);
        step3(s);
        step4(s);
        step5(s);
    }
    return s.b.substr(0, s.k + 1);
}
