#include <catch2/catch_all.hpp>
#include <catch2/catch_test_macros.hpp>
#include "Tokenizer.hpp"
#include "WorkerPool.hpp"

using Tokens = std::vector<std::string>;

TEST_CASE("Tokenizer lowercases, drops stopwords and stems", "[tokenizer]") {
    Tokenizer tokenizer({"the", "on"}, NormalizationMode::StemOnly);
    REQUIRE(tokenizer.tokenize("The cats sat on the mat!") == Tokens{"cat", "sat", "mat"});
}

TEST_CASE("Tokenizer deletes punctuation in place and removes digits", "[tokenizer]") {
    Tokenizer tokenizer({}, NormalizationMode::LemmatizeOnly);
    REQUIRE(tokenizer.tokenize("Don't stop") == Tokens{"dont", "stop"});
    REQUIRE(tokenizer.tokenize("covid19 in 2020, 45%") == Tokens{"covid", "in"});
    REQUIRE(tokenizer.tokenize("123 !!! 4.5").empty());
}

TEST_CASE("Tokenizer keeps repetition and document order", "[tokenizer]") {
    Tokenizer tokenizer({}, NormalizationMode::StemOnly);
    REQUIRE(tokenizer.tokenize("tax tax cut\ttax\n") == Tokens{"tax", "tax", "cut", "tax"});
}

TEST_CASE("Tokenizer is deterministic", "[tokenizer]") {
    ClassifierConfig config;
    Tokenizer tokenizer(config);
    const std::string text = "Says the Annies List political group supports third-trimester abortions on demand.";

    auto first = tokenizer.tokenize(text);
    auto second = tokenizer.tokenize(text);
    REQUIRE_FALSE(first.empty());
    REQUIRE(first == second);
}

TEST_CASE("Empty input yields an empty sequence", "[tokenizer]") {
    Tokenizer tokenizer(ClassifierConfig{});
    REQUIRE(tokenizer.tokenize("").empty());
    REQUIRE(tokenizer.tokenize("   \t\n").empty());
    REQUIRE(tokenizer.tokenize(Document{}).empty());
}

TEST_CASE("Default mode lemmatizes then stems", "[tokenizer]") {
    Tokenizer tokenizer(ClassifierConfig{});
    REQUIRE(tokenizer.tokenize("Children went running") == Tokens{"child", "go", "run"});
}

TEST_CASE("Lemmatize-only mode uses the dictionary", "[tokenizer]") {
    Tokenizer tokenizer({}, NormalizationMode::LemmatizeOnly);
    tokenizer.lemmatizer().add_word("policy");
    tokenizer.lemmatizer().add_word("tax");

    REQUIRE(tokenizer.tokenize("policies taxes") == Tokens{"policy", "tax"});
}

TEST_CASE("Stopwords are removed before reduction", "[tokenizer]") {
    Tokenizer tokenizer({"running"}, NormalizationMode::StemOnly);
    REQUIRE(tokenizer.tokenize("running runs") == Tokens{"run"});
}

TEST_CASE("Non-ASCII letters are kept as word characters", "[tokenizer]") {
    Tokenizer tokenizer({}, NormalizationMode::LemmatizeOnly);
    REQUIRE(tokenizer.tokenize("Caf\xC3\xA9 au lait") == Tokens{"caf\xC3\xA9", "au", "lait"});
    // Not valid UTF-8: passed through byte for byte
    REQUIRE(tokenizer.tokenize("ab\xFF" "cd") == Tokens{"ab\xFF" "cd"});
}

TEST_CASE("Typographic punctuation is stripped like ASCII punctuation", "[tokenizer]") {
    Tokenizer tokenizer({"dont"}, NormalizationMode::StemOnly);

    // curly quotes, em dash, typographic apostrophe
    REQUIRE(tokenizer.tokenize("\xE2\x80\x9CTaxes\xE2\x80\x9D rose\xE2\x80\x94sharply, don\xE2\x80\x99t") ==
            Tokens{"tax", "rose", "sharpli"});

    Tokenizer plain({}, NormalizationMode::LemmatizeOnly);
    // guillemets, inverted exclamation, ellipsis, en dash, no-break space
    REQUIRE(plain.tokenize("\xC2\xABjobs\xC2\xBB \xC2\xA1now\xE2\x80\xA6 war\xE2\x80\x93peace tax\xC2\xA0" "cut") ==
            Tokens{"jobs", "now", "war", "peace", "tax", "cut"});
}

TEST_CASE("Configured stopwords are cleaned before matching", "[tokenizer]") {
    Tokenizer tokenizer({"Don't", "U.S."}, NormalizationMode::StemOnly);
    REQUIRE(tokenizer.stopwords() == std::unordered_set<std::string>{"dont", "us"});
    REQUIRE(tokenizer.tokenize("Don\xE2\x80\x99t blame U.S. farms") == Tokens{"blame", "farm"});
}

TEST_CASE("Document fields are joined with a space", "[tokenizer]") {
    Document doc{"Obama said", "taxes rose"};
    REQUIRE(doc.text() == "Obama said taxes rose");

    Tokenizer tokenizer({}, NormalizationMode::StemOnly);
    REQUIRE(tokenizer.tokenize(doc) == Tokens{"obama", "said", "tax", "rose"});
}

TEST_CASE("Batch tokenization on a pool matches serial tokenization", "[tokenizer]") {
    Tokenizer tokenizer(ClassifierConfig{});
    std::vector<Document> docs;
    for (int i = 0; i < 50; ++i) {
        docs.push_back(Document{"Statement number " + std::to_string(i) + " about jobs and taxes"});
    }

    WorkerPool pool(4);
    auto parallel = tokenizer.tokenize_batch(docs, &pool);
    auto serial = tokenizer.tokenize_batch(docs);

    REQUIRE(parallel.size() == docs.size());
    REQUIRE(parallel == serial);
}
