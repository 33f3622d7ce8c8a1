#pragma once
// DocumentTermEncoder.hpp
// Maps token sequences to sparse count vectors over a frozen vocabulary.
// Out-of-vocabulary tokens are skipped; a document with none in the
// vocabulary becomes an all-zero (empty) vector.

#include <cstdint>
#include <string>
#include <utility>
#include <vector>
#include "Vocabulary.hpp"

class WorkerPool;

// Index-sorted (vocabulary index, count) pairs with count > 0.
// Tagged with the vocabulary it was encoded against.
struct SparseCountVector {
    size_t dimension = 0;
    uint64_t vocabulary_fingerprint = 0;
    std::vector<std::pair<int, int>> entries;

    int count_at(int index) const;
    long long total_count() const;
    bool is_zero() const { return entries.empty(); }
};

class DocumentTermEncoder {
public:
    explicit DocumentTermEncoder(const Vocabulary& vocabulary) : vocabulary_(vocabulary) {}
    // Holds a reference; the vocabulary must outlive the encoder
    explicit DocumentTermEncoder(Vocabulary&&) = delete;

    SparseCountVector encode(const TokenSequence& tokens) const;

    // Output order matches input order
    std::vector<SparseCountVector> encode_batch(const std::vector<TokenSequence>& sequences,
                                                WorkerPool* pool = nullptr) const;

    const Vocabulary& vocabulary() const { return vocabulary_; }

private:
    const Vocabulary& vocabulary_;
};

// Throws DimensionMismatchError unless the vector was encoded against this vocabulary
void check_encoded_against(const SparseCountVector& vector, const Vocabulary& vocabulary);
