#include "DocumentTermEncoder.hpp"
#include "ClassifierErrors.hpp"
#include "WorkerPool.hpp"
#include <algorithm>
#include <map>

int SparseCountVector::count_at(int index) const {
    auto it = std::lower_bound(entries.begin(), entries.end(), index,
                               [](const std::pair<int, int>& e, int idx) { return e.first < idx; });
    if (it == entries.end() || it->first != index) return 0;
    return it->second;
}

long long SparseCountVector::total_count() const {
    long long total = 0;
    for (const auto& e : entries) total += e.second;
    return total;
}

SparseCountVector DocumentTermEncoder::encode(const TokenSequence& tokens) const {
    std::map<int, int> tf_counts;
    for (const auto& token : tokens) {
        int id = vocabulary_.get_word_index(token);
        if (id != -1) tf_counts[id]++;
    }

    SparseCountVector vec;
    vec.dimension = vocabulary_.size();
    vec.vocabulary_fingerprint = vocabulary_.fingerprint();
    vec.entries.assign(tf_counts.begin(), tf_counts.end());
    return vec;
}

std::vector<SparseCountVector> DocumentTermEncoder::encode_batch(const std::vector<TokenSequence>& sequences,
                                                                 WorkerPool* pool) const {
    std::vector<SparseCountVector> vectors(sequences.size());
    for_each_chunk(pool, sequences.size(), [&](size_t begin, size_t end) {
        for (size_t i = begin; i < end; ++i) {
            vectors[i] = encode(sequences[i]);
        }
    });
    return vectors;
}

void check_encoded_against(const SparseCountVector& vector, const Vocabulary& vocabulary) {
    if (vector.dimension != vocabulary.size()) {
        throw DimensionMismatchError("Vector has dimension " + std::to_string(vector.dimension) +
                                     " but the vocabulary has " + std::to_string(vocabulary.size()) + " terms");
    }
    if (vector.vocabulary_fingerprint != vocabulary.fingerprint()) {
        throw DimensionMismatchError("Vector was encoded against a different vocabulary");
    }
    for (const auto& e : vector.entries) {
        if (e.first < 0 || static_cast<size_t>(e.first) >= vocabulary.size()) {
            throw DimensionMismatchError("Vector index " + std::to_string(e.first) + " is out of range");
        }
    }
}
