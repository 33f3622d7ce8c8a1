#include "CorpusReader.hpp"
#include "ClassifierErrors.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <iostream>
#include <numeric>
#include <random>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {
// Column layout of the LIAR statement files
const char* kLiarColumns[] = {
    "id", "label", "statement", "subject", "speaker", "speaker_job", "state",
    "party", "barely_true_count", "false_count", "half_true_count",
    "mostly_true_count", "pants_on_fire_count", "context"
};

// Labels may be strings or numbers; integral numbers print without a decimal point
bool value_to_label(const json& v, std::string& out) {
    if (v.is_null()) return false;
    if (v.is_string()) {
        out = v.get<std::string>();
        return true;
    }
    if (v.is_number_integer()) {
        out = std::to_string(v.get<long long>());
        return true;
    }
    if (v.is_number_float()) {
        double d = v.get<double>();
        out = (std::floor(d) == d) ? std::to_string(static_cast<long long>(d)) : v.dump();
        return true;
    }
    out = v.dump();
    return true;
}

std::vector<std::string> split_tabs(const std::string& line) {
    std::vector<std::string> cells;
    size_t start = 0;
    while (true) {
        size_t tab = line.find('\t', start);
        if (tab == std::string::npos) {
            cells.push_back(line.substr(start));
            break;
        }
        cells.push_back(line.substr(start, tab - start));
        start = tab + 1;
    }
    if (!cells.empty() && !cells.back().empty() && cells.back().back() == '\r') cells.back().pop_back();
    return cells;
}
}

CorpusReader::CorpusReader(const ClassifierConfig& config)
    : text_fields_(config.text_fields), label_field_(config.label_field) {}

int CorpusReader::liar_column(const std::string& field) {
    const int n = static_cast<int>(sizeof(kLiarColumns) / sizeof(kLiarColumns[0]));
    for (int i = 0; i < n; ++i) {
        if (field == kLiarColumns[i]) return i;
    }
    // Bare column numbers are accepted too
    if (!field.empty() && field.size() < 4 && std::all_of(field.begin(), field.end(), [](unsigned char c){ return std::isdigit(c); })) {
        return std::stoi(field);
    }
    return -1;
}

bool CorpusReader::read(const std::string& path, LabeledCorpus& corpus, bool labels_required) const {
    std::ifstream in(path);
    if (!in.is_open()) {
        std::cerr << "[CorpusReader] Could not open " << path << "\n";
        return false;
    }

    bool is_tsv = path.size() >= 4 && path.compare(path.size() - 4, 4, ".tsv") == 0;
    try {
        corpus = is_tsv ? parse_tsv(in, labels_required) : parse_jsonl(in, labels_required);
    } catch (const InvalidConfigError& e) {
        std::cerr << "[CorpusReader] " << e.what() << "\n";
        return false;
    }

    std::cout << "[CorpusReader] Loaded " << corpus.size() << " documents from " << path;
    if (corpus.skipped_lines > 0) std::cout << " (" << corpus.skipped_lines << " lines skipped)";
    std::cout << "\n";
    return true;
}

LabeledCorpus CorpusReader::parse_jsonl(std::istream& in, bool labels_required) const {
    LabeledCorpus corpus;
    std::string line;
    size_t line_number = 0;

    while (std::getline(in, line)) {
        line_number++;
        if (line.find_first_not_of(" \t\r\n") == std::string::npos) continue;

        json record;
        try {
            record = json::parse(line);
        } catch (const json::parse_error&) {
            std::cerr << "[CorpusReader] Skipping malformed line " << line_number << "\n";
            corpus.skipped_lines++;
            continue;
        }
        if (!record.is_object()) {
            corpus.skipped_lines++;
            continue;
        }

        std::string label;
        bool has_label = record.contains(label_field_) && value_to_label(record[label_field_], label);
        if (!has_label && labels_required) {
            std::cerr << "[CorpusReader] Line " << line_number << " has no '" << label_field_ << "'\n";
            corpus.skipped_lines++;
            continue;
        }

        Document doc;
        for (const auto& field : text_fields_) {
            if (!record.contains(field) || record[field].is_null()) continue;
            const json& v = record[field];
            doc.fields.push_back(v.is_string() ? v.get<std::string>() : v.dump());
        }

        corpus.documents.push_back(std::move(doc));
        corpus.labels.push_back(label);
    }
    return corpus;
}

LabeledCorpus CorpusReader::parse_tsv(std::istream& in, bool labels_required) const {
    int label_column = liar_column(label_field_);
    if (label_column < 0) throw InvalidConfigError("Unknown TSV label column: " + label_field_);

    std::vector<int> text_columns;
    for (const auto& field : text_fields_) {
        int column = liar_column(field);
        if (column < 0) throw InvalidConfigError("Unknown TSV text column: " + field);
        text_columns.push_back(column);
    }

    LabeledCorpus corpus;
    std::string line;
    while (std::getline(in, line)) {
        if (line.find_first_not_of(" \t\r\n") == std::string::npos) continue;

        std::vector<std::string> cells = split_tabs(line);
        bool has_label = label_column < static_cast<int>(cells.size()) && !cells[label_column].empty();
        if (!has_label && labels_required) {
            corpus.skipped_lines++;
            continue;
        }

        Document doc;
        for (int column : text_columns) {
            if (column < static_cast<int>(cells.size()) && !cells[column].empty()) doc.fields.push_back(cells[column]);
        }

        corpus.documents.push_back(std::move(doc));
        corpus.labels.push_back(has_label ? cells[label_column] : std::string());
    }
    return corpus;
}

std::pair<LabeledCorpus, LabeledCorpus> split_corpus(const LabeledCorpus& corpus,
                                                     double test_fraction,
                                                     unsigned int seed) {
    if (!(test_fraction >= 0.0 && test_fraction < 1.0)) {
        throw InvalidConfigError("test_fraction must lie in [0, 1), got " + std::to_string(test_fraction));
    }

    std::vector<size_t> order(corpus.size());
    std::iota(order.begin(), order.end(), 0);
    std::mt19937 rng(seed);
    std::shuffle(order.begin(), order.end(), rng);

    size_t test_count = static_cast<size_t>(std::llround(test_fraction * static_cast<double>(corpus.size())));

    std::pair<LabeledCorpus, LabeledCorpus> parts;
    for (size_t i = 0; i < order.size(); ++i) {
        LabeledCorpus& target = (i < test_count) ? parts.second : parts.first;
        target.documents.push_back(corpus.documents[order[i]]);
        target.labels.push_back(corpus.labels[order[i]]);
    }
    return parts;
}
