#include "Tokenizer.hpp"
#include "ClassifierErrors.hpp"
#include "WorkerPool.hpp"
#include <cctype>
#include <sstream>

namespace {
enum class CharClass { Word, Separator, Deleted };

// Length of the UTF-8 sequence starting at pos, or 0 if it is malformed
size_t decode_utf8(const std::string& s, size_t pos, char32_t& code_point) {
    unsigned char lead = static_cast<unsigned char>(s[pos]);
    size_t length;
    if (lead >= 0xC2 && lead <= 0xDF) {
        length = 2;
        code_point = lead & 0x1F;
    } else if (lead >= 0xE0 && lead <= 0xEF) {
        length = 3;
        code_point = lead & 0x0F;
    } else if (lead >= 0xF0 && lead <= 0xF4) {
        length = 4;
        code_point = lead & 0x07;
    } else {
        return 0;
    }
    if (pos + length > s.size()) return 0;

    for (size_t k = 1; k < length; ++k) {
        unsigned char next = static_cast<unsigned char>(s[pos + k]);
        if ((next & 0xC0) != 0x80) return 0;
        code_point = (code_point << 6) | (next & 0x3F);
    }
    return length;
}

// Latin-1 punctuation and the General Punctuation block. Dashes and the
// Unicode spaces separate words; quotes, apostrophes, bullets and the rest
// are deleted in place like their ASCII counterparts.
CharClass classify(char32_t cp) {
    if (cp <= 0x9F) return CharClass::Separator;  // C1 controls
    if (cp == 0xA0) return CharClass::Separator;
    if (cp <= 0xBF || cp == 0xD7 || cp == 0xF7) return CharClass::Deleted;
    if (cp >= 0x2000 && cp <= 0x206F) {
        if (cp <= 0x200A || (cp >= 0x2012 && cp <= 0x2015) ||
            cp == 0x2028 || cp == 0x2029 || cp == 0x202F || cp == 0x205F) {
            return CharClass::Separator;
        }
        return CharClass::Deleted;
    }
    if (cp == 0x3000) return CharClass::Separator;
    if (cp == 0xFEFF) return CharClass::Deleted;
    return CharClass::Word;
}
}

std::string Document::text() const {
    std::string joined;
    for (size_t i = 0; i < fields.size(); ++i) {
        if (i > 0) joined += ' ';
        joined += fields[i];
    }
    return joined;
}

Tokenizer::Tokenizer(const ClassifierConfig& config)
    : stopwords_(clean_stopwords(config.stopwords)), mode_(config.normalization_mode) {
    if (!config.lemma_dictionary_path.empty() && !lemmatizer_.load_dictionary(config.lemma_dictionary_path)) {
        throw InvalidConfigError("Could not load lemma dictionary: " + config.lemma_dictionary_path);
    }
}

Tokenizer::Tokenizer(const std::unordered_set<std::string>& stopwords, NormalizationMode mode)
    : stopwords_(clean_stopwords(stopwords)), mode_(mode) {}

// Stopwords go through the same cleaning as text, so "Don't" matches "dont"
std::unordered_set<std::string> Tokenizer::clean_stopwords(const std::unordered_set<std::string>& words) {
    std::unordered_set<std::string> cleaned;
    for (const auto& w : words) {
        std::stringstream ss(clean(w));
        std::string piece;
        while (ss >> piece) cleaned.insert(piece);
    }
    return cleaned;
}

// Lowercase, delete punctuation and digits, turn control characters into spaces.
// UTF-8 punctuation is handled the same way; other non-ASCII characters
// (and bytes that are not valid UTF-8) are kept as word characters.
std::string Tokenizer::clean(const std::string& raw_text) {
    std::string clean_text;
    clean_text.reserve(raw_text.size());

    for (size_t i = 0; i < raw_text.size();) {
        unsigned char c = static_cast<unsigned char>(raw_text[i]);
        if (c >= 0x80) {
            char32_t code_point = 0;
            size_t length = decode_utf8(raw_text, i, code_point);
            if (length == 0) {
                clean_text += static_cast<char>(c);
                ++i;
                continue;
            }
            switch (classify(code_point)) {
                case CharClass::Word: clean_text.append(raw_text, i, length); break;
                case CharClass::Separator: clean_text += ' '; break;
                case CharClass::Deleted: break;
            }
            i += length;
            continue;
        }

        if (std::isalpha(c)) {
            clean_text += static_cast<char>(std::tolower(c));
        } else if (std::isdigit(c) || std::ispunct(c)) {
            // deleted in place
        } else {
            clean_text += ' ';
        }
        ++i;
    }
    return clean_text;
}

std::string Tokenizer::normalize(const std::string& word) const {
    switch (mode_) {
        case NormalizationMode::StemOnly:
            return stemmer_.stem(word);
        case NormalizationMode::LemmatizeOnly:
            return lemmatizer_.lemmatize(word);
        case NormalizationMode::LemmatizeThenStem:
            break;
    }
    return stemmer_.stem(lemmatizer_.lemmatize(word));
}

TokenSequence Tokenizer::tokenize(const std::string& raw_text) const {
    TokenSequence tokens;
    if (raw_text.empty()) return tokens;

    std::stringstream ss(clean(raw_text));
    std::string word;
    while (ss >> word) {
        if (stopwords_.count(word)) continue;

        std::string reduced = normalize(word);
        if (!reduced.empty()) tokens.push_back(std::move(reduced));
    }
    return tokens;
}

std::vector<TokenSequence> Tokenizer::tokenize_batch(const std::vector<Document>& documents, WorkerPool* pool) const {
    std::vector<TokenSequence> sequences(documents.size());
    for_each_chunk(pool, documents.size(), [&](size_t begin, size_t end) {
        for (size_t i = begin; i < end; ++i) {
            sequences[i] = tokenize(documents[i]);
        }
    });
    return sequences;
}
