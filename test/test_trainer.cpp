#include <catch2/catch_all.hpp>
#include <catch2/catch_test_macros.hpp>
#include "ClassifierErrors.hpp"
#include "NaiveBayesTrainer.hpp"
#include "Predictor.hpp"
#include "Tokenizer.hpp"
#include "WorkerPool.hpp"
#include <cmath>

using Catch::Matchers::WithinAbs;

namespace {
// bird=0, cat=1, dog=2, fish=3
// class A: "cat cat dog", "cat"    -> T_A = {cat 3, dog 1}, 4 tokens
// class B: "fish fish bird"        -> T_B = {fish 2, bird 1}, 3 tokens
struct PetCorpus {
    Vocabulary vocab{std::vector<std::string>{"bird", "cat", "dog", "fish"}};
    std::vector<SparseCountVector> vectors;
    std::vector<std::string> labels{"A", "A", "B"};

    PetCorpus() {
        DocumentTermEncoder encoder(vocab);
        vectors = encoder.encode_batch({{"cat", "cat", "dog"}, {"cat"}, {"fish", "fish", "bird"}});
    }
};

double row_sum(const NaiveBayesModel& model, size_t c) {
    double sum = 0.0;
    for (size_t t = 0; t < model.vocabulary().size(); ++t) sum += std::exp(model.log_likelihood(t, c));
    return sum;
}
}

TEST_CASE("Trainer computes Laplace-smoothed likelihoods", "[trainer]") {
    PetCorpus corpus;
    NaiveBayesModel model = NaiveBayesTrainer(1.0).fit(corpus.vocab, corpus.vectors, corpus.labels);

    REQUIRE(model.is_trained());
    REQUIRE(model.classes() == std::vector<std::string>{"A", "B"});
    REQUIRE(model.alpha() == 1.0);

    const size_t A = model.class_index("A");
    const size_t B = model.class_index("B");

    REQUIRE_THAT(std::exp(model.log_likelihood(1, A)), WithinAbs(4.0 / 8.0, 1e-12));
    REQUIRE_THAT(std::exp(model.log_likelihood(2, A)), WithinAbs(2.0 / 8.0, 1e-12));
    REQUIRE_THAT(std::exp(model.log_likelihood(3, A)), WithinAbs(1.0 / 8.0, 1e-12));
    REQUIRE_THAT(std::exp(model.log_likelihood(0, A)), WithinAbs(1.0 / 8.0, 1e-12));

    REQUIRE_THAT(std::exp(model.log_likelihood(3, B)), WithinAbs(3.0 / 7.0, 1e-12));
    REQUIRE_THAT(std::exp(model.log_likelihood(0, B)), WithinAbs(2.0 / 7.0, 1e-12));
    REQUIRE_THAT(std::exp(model.log_likelihood(1, B)), WithinAbs(1.0 / 7.0, 1e-12));
    REQUIRE_THAT(std::exp(model.log_likelihood(2, B)), WithinAbs(1.0 / 7.0, 1e-12));

    REQUIRE_THAT(std::exp(model.log_prior(A)), WithinAbs(2.0 / 3.0, 1e-12));
    REQUIRE_THAT(std::exp(model.log_prior(B)), WithinAbs(1.0 / 3.0, 1e-12));
}

TEST_CASE("Two-document pet corpus from raw text", "[trainer]") {
    Tokenizer tokenizer({}, NormalizationMode::StemOnly);
    std::vector<TokenSequence> sequences = tokenizer.tokenize_batch({Document{"cat dog cat"}, Document{"fish fish bird"}});
    Vocabulary vocab = Vocabulary::build(sequences, 0.0);
    REQUIRE(vocab.terms() == std::vector<std::string>{"bird", "cat", "dog", "fish"});

    DocumentTermEncoder encoder(vocab);
    std::vector<SparseCountVector> vectors = encoder.encode_batch(sequences);

    auto totals = NaiveBayesTrainer::class_term_totals(vectors, {0, 1}, 2, vocab.size());
    REQUIRE(totals[0] == std::vector<long long>{0, 2, 1, 0});
    REQUIRE(totals[1] == std::vector<long long>{1, 0, 0, 2});

    NaiveBayesModel model = NaiveBayesTrainer(1.0).fit(vocab, vectors, {"A", "B"});
    const size_t A = model.class_index("A");

    // (T + 1) / (3 + 4)
    REQUIRE_THAT(std::exp(model.log_likelihood(1, A)), WithinAbs(3.0 / 7.0, 1e-12));
    REQUIRE_THAT(std::exp(model.log_likelihood(2, A)), WithinAbs(2.0 / 7.0, 1e-12));
    REQUIRE_THAT(std::exp(model.log_likelihood(3, A)), WithinAbs(1.0 / 7.0, 1e-12));
    REQUIRE_THAT(std::exp(model.log_likelihood(0, A)), WithinAbs(1.0 / 7.0, 1e-12));

    Predictor predictor(model);
    REQUIRE(predictor.predict(encoder.encode(tokenizer.tokenize("cat cat"))).label == "A");
}

TEST_CASE("Likelihood rows and priors are distributions", "[trainer]") {
    PetCorpus corpus;
    double alpha = GENERATE(0.0, 0.5, 1.0, 3.0);
    CAPTURE(alpha);

    NaiveBayesModel model = NaiveBayesTrainer(alpha).fit(corpus.vocab, corpus.vectors, corpus.labels);

    double prior_sum = 0.0;
    for (size_t c = 0; c < model.num_classes(); ++c) {
        REQUIRE_THAT(row_sum(model, c), WithinAbs(1.0, 1e-9));
        prior_sum += std::exp(model.log_prior(c));
    }
    REQUIRE_THAT(prior_sum, WithinAbs(1.0, 1e-9));
}

TEST_CASE("Zero alpha leaves unseen terms with zero probability", "[trainer]") {
    PetCorpus corpus;
    NaiveBayesModel model = NaiveBayesTrainer(0.0).fit(corpus.vocab, corpus.vectors, corpus.labels);
    const size_t A = model.class_index("A");

    REQUIRE_THAT(std::exp(model.log_likelihood(1, A)), WithinAbs(3.0 / 4.0, 1e-12));
    REQUIRE(std::isinf(model.log_likelihood(3, A)));
    REQUIRE(model.log_likelihood(3, A) < 0.0);
    REQUIRE(std::exp(model.log_likelihood(0, A)) == 0.0);
}

TEST_CASE("Positive alpha gives every term positive probability", "[trainer]") {
    PetCorpus corpus;
    NaiveBayesModel model = NaiveBayesTrainer(0.01).fit(corpus.vocab, corpus.vectors, corpus.labels);

    for (size_t t = 0; t < model.vocabulary().size(); ++t) {
        for (size_t c = 0; c < model.num_classes(); ++c) {
            REQUIRE(std::isfinite(model.log_likelihood(t, c)));
            REQUIRE(std::exp(model.log_likelihood(t, c)) > 0.0);
        }
    }
}

TEST_CASE("Trainer rejects mismatched or empty input", "[trainer]") {
    PetCorpus corpus;
    NaiveBayesTrainer trainer;

    std::vector<std::string> short_labels{"A", "B"};
    REQUIRE_THROWS_AS(trainer.fit(corpus.vocab, corpus.vectors, short_labels), DimensionMismatchError);
    REQUIRE_THROWS_AS(trainer.fit(corpus.vocab, {}, {}), DimensionMismatchError);
    REQUIRE_THROWS_AS(trainer.fit(Vocabulary(), corpus.vectors, corpus.labels), EmptyVocabularyError);
}

TEST_CASE("Trainer rejects vectors from another vocabulary", "[trainer]") {
    PetCorpus corpus;
    Vocabulary other(std::vector<std::string>{"ant", "bee", "cow", "eel"});
    REQUIRE_THROWS_AS(NaiveBayesTrainer().fit(other, corpus.vectors, corpus.labels), DimensionMismatchError);
}

TEST_CASE("Trainer rejects an invalid alpha", "[trainer]") {
    PetCorpus corpus;
    REQUIRE_THROWS_AS(NaiveBayesTrainer(-1.0).fit(corpus.vocab, corpus.vectors, corpus.labels),
                      InvalidConfigError);
    REQUIRE_THROWS_AS(NaiveBayesTrainer(std::nan("")).fit(corpus.vocab, corpus.vectors, corpus.labels),
                      InvalidConfigError);
    REQUIRE_THROWS_AS(NaiveBayesTrainer(INFINITY).validate(corpus.labels), InvalidConfigError);
}

TEST_CASE("Prior override replaces empirical priors", "[trainer]") {
    PetCorpus corpus;

    SECTION("valid override") {
        std::map<std::string, double> priors{{"A", 0.25}, {"B", 0.75}};
        NaiveBayesModel model = NaiveBayesTrainer(1.0, priors).fit(corpus.vocab, corpus.vectors, corpus.labels);
        REQUIRE_THAT(std::exp(model.log_prior(model.class_index("A"))), WithinAbs(0.25, 1e-12));
        REQUIRE_THAT(std::exp(model.log_prior(model.class_index("B"))), WithinAbs(0.75, 1e-12));
    }
    SECTION("missing class") {
        std::map<std::string, double> priors{{"A", 1.0}};
        REQUIRE_THROWS_AS(NaiveBayesTrainer(1.0, priors).validate(corpus.labels), InvalidConfigError);
    }
    SECTION("unknown class") {
        std::map<std::string, double> priors{{"A", 0.5}, {"C", 0.5}};
        REQUIRE_THROWS_AS(NaiveBayesTrainer(1.0, priors).validate(corpus.labels), InvalidConfigError);
    }
    SECTION("extra class") {
        std::map<std::string, double> priors{{"A", 0.4}, {"B", 0.4}, {"C", 0.2}};
        REQUIRE_THROWS_AS(NaiveBayesTrainer(1.0, priors).validate(corpus.labels), InvalidConfigError);
    }
    SECTION("does not sum to one") {
        std::map<std::string, double> priors{{"A", 0.5}, {"B", 0.6}};
        REQUIRE_THROWS_AS(NaiveBayesTrainer(1.0, priors).fit(corpus.vocab, corpus.vectors, corpus.labels),
                          InvalidConfigError);
    }
    SECTION("entry out of range") {
        std::map<std::string, double> priors{{"A", -0.5}, {"B", 1.5}};
        REQUIRE_THROWS_AS(NaiveBayesTrainer(1.0, priors).validate(corpus.labels), InvalidConfigError);
    }
}

TEST_CASE("Training is deterministic", "[trainer]") {
    PetCorpus corpus;
    NaiveBayesTrainer trainer(1.0);
    NaiveBayesModel first = trainer.fit(corpus.vocab, corpus.vectors, corpus.labels);
    NaiveBayesModel second = trainer.fit(corpus.vocab, corpus.vectors, corpus.labels);
    REQUIRE(first.to_json() == second.to_json());
}

TEST_CASE("Parallel class totals equal serial totals", "[trainer]") {
    Vocabulary vocab(std::vector<std::string>{"a", "b", "c", "d", "e"});
    DocumentTermEncoder encoder(vocab);

    std::vector<TokenSequence> docs;
    std::vector<std::string> labels;
    const char* letters[] = {"a", "b", "c", "d", "e", "z"};
    for (size_t i = 0; i < 500; ++i) {
        TokenSequence seq;
        for (size_t j = 0; j < 1 + i % 9; ++j) seq.push_back(letters[(i * 7 + j * 3) % 6]);
        docs.push_back(seq);
        labels.push_back(i % 3 == 0 ? "true" : (i % 3 == 1 ? "false" : "half-true"));
    }
    auto vectors = encoder.encode_batch(docs);

    WorkerPool pool(4);
    NaiveBayesTrainer trainer(1.0);
    NaiveBayesModel serial = trainer.fit(vocab, vectors, labels);
    NaiveBayesModel parallel = trainer.fit(vocab, vectors, labels, &pool);

    // Totals are integers, so the merge order cannot change the result
    REQUIRE(serial.to_json() == parallel.to_json());
}
