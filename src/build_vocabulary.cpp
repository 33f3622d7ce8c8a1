#include "ClassifierConfig.hpp"
#include "CorpusReader.hpp"
#include "Tokenizer.hpp"
#include "Vocabulary.hpp"
#include "WorkerPool.hpp"
#include <algorithm>
#include <iostream>
#include <memory>
#include <string>

using namespace std;

int main(int argc, char* argv[]) {
    string input_path = "data/processed/train.jsonl";
    string output_path = "data/processed/vocabulary.json";
    string config_path;

    if (argc >= 2) input_path = argv[1];
    if (argc >= 3) output_path = argv[2];
    if (argc >= 4) config_path = argv[3];

    cout << "Building vocabulary from: " << input_path << "\n";
    cout << "Output: " << output_path << "\n\n";

    try {
        ClassifierConfig config = config_path.empty() ? ClassifierConfig() : ClassifierConfig::load(config_path);

        CorpusReader reader(config);
        LabeledCorpus corpus;
        if (!reader.read(input_path, corpus, false)) {
            cerr << "Error: Failed to read corpus\n";
            return 1;
        }

        unique_ptr<WorkerPool> pool;
        if (config.resolved_threads() > 1) pool = make_unique<WorkerPool>(config.resolved_threads());

        Tokenizer tokenizer(config);
        auto sequences = tokenizer.tokenize_batch(corpus.documents, pool.get());
        Vocabulary vocabulary = Vocabulary::build(sequences, config.min_doc_frequency_fraction);

        if (!vocabulary.save_to_json(output_path)) {
            cerr << "Error: Failed to save vocabulary\n";
            return 1;
        }

        cout << "\nVocabulary built successfully!\n";
        cout << "Total terms: " << vocabulary.size() << "\n";

        Vocabulary check;
        if (check.load_from_json(output_path) && check.fingerprint() == vocabulary.fingerprint()) {
            cout << "Verification: Vocabulary loads correctly\n";
            cout << "\nFirst 10 terms:\n";
            for (size_t i = 0; i < min((size_t)10, check.size()); ++i) {
                cout << "  [" << i << "] " << check.get_word(static_cast<int>(i)) << "\n";
            }
        }
    } catch (const exception& e) {
        cerr << "\nERROR: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
