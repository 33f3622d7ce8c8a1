#include "ClassifierConfig.hpp"
#include "CorpusReader.hpp"
#include "Evaluation.hpp"
#include "VeracityClassifier.hpp"
#include <chrono>
#include <iostream>
#include <string>
#include <vector>

namespace {
void print_usage(const char* program) {
    std::cerr << "Usage: " << program
              << " <corpus.jsonl|corpus.tsv> <model.json> [config.json] [--test-fraction F] [--seed S]\n";
}
}

int main(int argc, char* argv[]) {
    std::vector<std::string> positional;
    double test_fraction = 0.0;
    unsigned int seed = 42;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--test-fraction" && i + 1 < argc) {
                test_fraction = std::stod(argv[++i]);
            } else if (arg == "--seed" && i + 1 < argc) {
                seed = static_cast<unsigned int>(std::stoul(argv[++i]));
            } else if (arg == "--help" || arg == "-h") {
                print_usage(argv[0]);
                return 0;
            } else {
                positional.push_back(arg);
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Invalid numeric argument: " << e.what() << "\n";
        print_usage(argv[0]);
        return 1;
    }

    if (positional.size() < 2) {
        print_usage(argv[0]);
        return 1;
    }

    const std::string corpus_path = positional[0];
    const std::string model_path = positional[1];

    try {
        ClassifierConfig config = positional.size() >= 3 ? ClassifierConfig::load(positional[2]) : ClassifierConfig();

        std::cout << "[Main] Reading corpus: " << corpus_path << "\n";
        CorpusReader reader(config);
        LabeledCorpus corpus;
        if (!reader.read(corpus_path, corpus)) {
            std::cerr << "Error: Failed to read corpus\n";
            return 1;
        }

        auto [train, test] = split_corpus(corpus, test_fraction, seed);
        std::cout << "[Main] Train: " << train.size() << " documents, test: " << test.size() << " documents\n";

        VeracityClassifier classifier(config);
        classifier.fit(train.documents, train.labels);

        if (!classifier.save(model_path)) {
            std::cerr << "Error: Failed to save model\n";
            return 1;
        }

        if (test.size() > 0) {
            auto start = std::chrono::steady_clock::now();
            std::vector<PredictionResult> results = classifier.predict_batch(test.documents);
            auto end = std::chrono::steady_clock::now();

            std::vector<std::string> predicted;
            predicted.reserve(results.size());
            for (const auto& r : results) predicted.push_back(r.label);

            std::cout << "\nHeld-out evaluation ("
                      << std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count() << " ms)\n";
            std::cout << std::string(40, '-') << "\n";
            print_report(evaluate(test.labels, predicted), std::cout);
        }
    } catch (const std::exception& e) {
        std::cerr << "\nERROR: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
