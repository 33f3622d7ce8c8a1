#include "ClassifierConfig.hpp"
#include "CorpusReader.hpp"
#include "Evaluation.hpp"
#include "VeracityClassifier.hpp"
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

// Reads one statement per line from stdin
static LabeledCorpus read_stdin() {
    LabeledCorpus corpus;
    std::string line;
    while (std::getline(std::cin, line)) {
        if (line.empty()) continue;
        corpus.documents.push_back(Document{line});
        corpus.labels.emplace_back();
    }
    return corpus;
}

int main(int argc, char* argv[]) {
    if (argc < 3) {
        std::cerr << "Usage: " << argv[0] << " <model.json> <corpus.jsonl|corpus.tsv|-> [config.json]\n";
        return 1;
    }

    const std::string model_path = argv[1];
    const std::string input_path = argv[2];

    try {
        ClassifierConfig config = argc >= 4 ? ClassifierConfig::load(argv[3]) : ClassifierConfig();

        VeracityClassifier classifier(config);
        if (!classifier.load(model_path)) {
            std::cerr << "Failed to load model.\n";
            return 1;
        }

        LabeledCorpus corpus;
        if (input_path == "-") {
            corpus = read_stdin();
        } else {
            CorpusReader reader(config);
            if (!reader.read(input_path, corpus, false)) {
                std::cerr << "Error: Failed to read input\n";
                return 1;
            }
        }

        std::vector<PredictionResult> results = classifier.predict_batch(corpus.documents);

        std::cout << "\n" << std::string(60, '-') << "\n";
        std::cout << std::left << std::setw(8) << "Doc" << std::setw(20) << "Predicted" << "Scores\n";
        std::cout << std::string(60, '-') << "\n";

        std::vector<std::string> predicted;
        predicted.reserve(results.size());
        for (size_t i = 0; i < results.size(); ++i) {
            std::cout << std::left << std::setw(8) << i << std::setw(20) << results[i].label;
            for (const auto& [label, score] : results[i].scores_by_class) {
                std::cout << label << "=" << std::fixed << std::setprecision(3) << score << " ";
            }
            std::cout << "\n";
            predicted.push_back(results[i].label);
        }
        std::cout << std::string(60, '-') << "\n";

        // Evaluate only when every document came with a label
        bool labeled = !corpus.labels.empty();
        for (const auto& label : corpus.labels) {
            if (label.empty()) {
                labeled = false;
                break;
            }
        }
        if (labeled) {
            std::cout << "\n";
            print_report(evaluate(corpus.labels, predicted), std::cout);
        }
    } catch (const std::exception& e) {
        std::cerr << "\nERROR: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
