#include "ClassifierConfig.hpp"
#include "ClassifierErrors.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <iostream>
#include <thread>

using json = nlohmann::json;

namespace {
constexpr double kPriorSumTolerance = 1e-6;
}

std::string normalization_mode_name(NormalizationMode mode) {
    switch (mode) {
        case NormalizationMode::LemmatizeThenStem: return "lemmatize_then_stem";
        case NormalizationMode::StemOnly: return "stem_only";
        case NormalizationMode::LemmatizeOnly: return "lemmatize_only";
    }
    return "lemmatize_then_stem";
}

NormalizationMode parse_normalization_mode(const std::string& name) {
    if (name == "lemmatize_then_stem") return NormalizationMode::LemmatizeThenStem;
    if (name == "stem_only") return NormalizationMode::StemOnly;
    if (name == "lemmatize_only") return NormalizationMode::LemmatizeOnly;
    throw InvalidConfigError("Unknown normalization_mode: " + name);
}

// English stopwords, with apostrophes already stripped the way the tokenizer strips them
const std::unordered_set<std::string>& default_stopwords() {
    static const std::unordered_set<std::string> defaults = {
        "i","me","my","myself","we","our","ours","ourselves","you","your","yours",
        "yourself","yourselves","he","him","his","himself","she","her","hers","herself",
        "it","its","itself","they","them","their","theirs","themselves","what","which",
        "who","whom","this","that","these","those","am","is","are","was","were","be",
        "been","being","have","has","had","having","do","does","did","doing","would",
        "should","could","ought","a","an","the","and","but","if","or","because","as",
        "until","while","of","at","by","for","with","about","against","between","into",
        "through","during","before","after","above","below","to","from","up","down",
        "in","out","on","off","over","under","again","further","then","once","here",
        "there","when","where","why","how","all","any","both","each","few","more",
        "most","other","some","such","no","nor","not","only","own","same","so","than",
        "too","very","s","t","can","will","just","don","now","im","youre","hes","shes",
        "theyre","ive","youve","weve","theyve","youd","theyd","youll","theyll",
        "isnt","arent","wasnt","werent","hasnt","havent","hadnt","doesnt","dont","didnt","wont","wouldnt",
        "shant","shouldnt","cant","cannot","couldnt","mustnt","lets","thats","whos",
        "whats","heres","theres","whens","wheres","whys","hows"
    };
    return defaults;
}

std::unordered_set<std::string> load_stopwords_from_file(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) throw InvalidConfigError("Stopwords file not found: " + path);

    std::unordered_set<std::string> words;
    std::string line;
    while (std::getline(in, line)) {
        auto start = line.find_first_not_of(" \t\r\n");
        if (start == std::string::npos) continue;
        auto end = line.find_last_not_of(" \t\r\n");
        std::string tok = line.substr(start, end - start + 1);
        std::transform(tok.begin(), tok.end(), tok.begin(), [](unsigned char c){ return std::tolower(c); });
        if (!tok.empty()) words.insert(tok);
    }
    return words;
}

ClassifierConfig::ClassifierConfig() : stopwords(default_stopwords()) {}

void ClassifierConfig::validate() const {
    if (!std::isfinite(laplace_alpha) || laplace_alpha < 0.0) {
        throw InvalidConfigError("laplace_alpha must be a finite value >= 0, got " + std::to_string(laplace_alpha));
    }
    if (!(min_doc_frequency_fraction >= 0.0 && min_doc_frequency_fraction <= 1.0)) {
        throw InvalidConfigError("min_doc_frequency_fraction must lie in [0, 1], got " +
                                 std::to_string(min_doc_frequency_fraction));
    }
    if (prior_override) {
        if (prior_override->empty()) throw InvalidConfigError("prior_override is empty");
        double sum = 0.0;
        for (const auto& [label, p] : *prior_override) {
            if (!std::isfinite(p) || p < 0.0 || p > 1.0) {
                throw InvalidConfigError("prior_override[" + label + "] must lie in [0, 1]");
            }
            sum += p;
        }
        if (std::fabs(sum - 1.0) > kPriorSumTolerance) {
            throw InvalidConfigError("prior_override must sum to 1, got " + std::to_string(sum));
        }
    }
    if (text_fields.empty()) throw InvalidConfigError("text_fields must name at least one field");
}

size_t ClassifierConfig::resolved_threads() const {
    if (num_threads != 0) return num_threads;
    size_t hw = std::thread::hardware_concurrency();
    return hw == 0 ? 4 : hw;
}

ClassifierConfig ClassifierConfig::from_json(const json& j) {
    ClassifierConfig config;
    try {
        if (j.contains("stopwords")) {
            config.stopwords.clear();
            for (const auto& w : j["stopwords"]) {
                std::string tok = w.get<std::string>();
                std::transform(tok.begin(), tok.end(), tok.begin(), [](unsigned char c){ return std::tolower(c); });
                if (!tok.empty()) config.stopwords.insert(tok);
            }
        }
        if (j.contains("stopwords_path")) {
            config.stopwords = load_stopwords_from_file(j["stopwords_path"].get<std::string>());
        }
        config.min_doc_frequency_fraction = j.value("min_doc_frequency_fraction", config.min_doc_frequency_fraction);
        config.laplace_alpha = j.value("laplace_alpha", config.laplace_alpha);
        if (j.contains("prior_override") && !j["prior_override"].is_null()) {
            std::map<std::string, double> priors;
            for (auto& el : j["prior_override"].items()) {
                priors[el.key()] = el.value().get<double>();
            }
            config.prior_override = std::move(priors);
        }
        if (j.contains("normalization_mode")) {
            config.normalization_mode = parse_normalization_mode(j["normalization_mode"].get<std::string>());
        }
        config.lemma_dictionary_path = j.value("lemma_dictionary_path", config.lemma_dictionary_path);
        if (j.contains("num_threads")) {
            int threads = j["num_threads"].get<int>();
            if (threads < 0) throw InvalidConfigError("num_threads must be >= 0");
            config.num_threads = static_cast<size_t>(threads);
        }
        if (j.contains("text_fields")) {
            config.text_fields = j["text_fields"].get<std::vector<std::string>>();
        }
        config.label_field = j.value("label_field", config.label_field);
    } catch (const json::exception& e) {
        throw InvalidConfigError(std::string("Malformed configuration: ") + e.what());
    }

    config.validate();
    return config;
}

ClassifierConfig ClassifierConfig::load(const std::string& config_path) {
    std::ifstream f(config_path);
    if (!f.is_open()) {
        throw InvalidConfigError("Could not open config file: " + config_path);
    }

    json j;
    try {
        f >> j;
    } catch (const json::parse_error& e) {
        throw InvalidConfigError("Config JSON parse error in " + config_path + ": " + e.what());
    }

    std::cout << "[ClassifierConfig] Loaded " << config_path << "\n";
    return from_json(j);
}
