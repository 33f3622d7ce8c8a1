#pragma once
// ClassifierErrors.hpp
// Exception taxonomy for the classifier pipeline.
// Everything derives from ClassifierError so callers can catch one type.

#include <stdexcept>
#include <string>

class ClassifierError : public std::runtime_error {
public:
    explicit ClassifierError(const std::string& message) : std::runtime_error(message) {}
};

// Vocabulary pruning removed every term (or the corpus had none)
class EmptyVocabularyError : public ClassifierError {
public:
    explicit EmptyVocabularyError(const std::string& message) : ClassifierError(message) {}
};

// Malformed prior override, negative alpha, invalid fraction, bad file paths
class InvalidConfigError : public ClassifierError {
public:
    explicit InvalidConfigError(const std::string& message) : ClassifierError(message) {}
};

// Label/vector count mismatch, or a vector encoded against another vocabulary
class DimensionMismatchError : public ClassifierError {
public:
    explicit DimensionMismatchError(const std::string& message) : ClassifierError(message) {}
};

class UntrainedModelError : public ClassifierError {
public:
    explicit UntrainedModelError(const std::string& message) : ClassifierError(message) {}
};

// Persisted model file could not be parsed
class ModelFormatError : public ClassifierError {
public:
    explicit ModelFormatError(const std::string& message) : ClassifierError(message) {}
};
