#pragma once
// CorpusReader.hpp
// Loads labeled statements from JSON Lines or LIAR-style TSV files.
// Text fields named in the config are joined into one Document per record.

#include <istream>
#include <string>
#include <utility>
#include <vector>
#include "ClassifierConfig.hpp"
#include "Tokenizer.hpp"

struct LabeledCorpus {
    std::vector<Document> documents;
    std::vector<std::string> labels;
    size_t skipped_lines = 0;

    size_t size() const { return documents.size(); }
};

class CorpusReader {
public:
    explicit CorpusReader(const ClassifierConfig& config);

    // Records without a label are skipped when labels are required, otherwise kept with ""
    bool read(const std::string& path, LabeledCorpus& corpus, bool labels_required = true) const;

    LabeledCorpus parse_jsonl(std::istream& in, bool labels_required = true) const;
    LabeledCorpus parse_tsv(std::istream& in, bool labels_required = true) const;

private:
    std::vector<std::string> text_fields_;
    std::string label_field_;

    static int liar_column(const std::string& field);
};

// Deterministic shuffle with an explicit seed; returns {train, test}.
// Throws InvalidConfigError unless 0 <= test_fraction < 1.
std::pair<LabeledCorpus, LabeledCorpus> split_corpus(const LabeledCorpus& corpus,
                                                     double test_fraction,
                                                     unsigned int seed);
