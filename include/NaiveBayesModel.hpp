#pragma once
// NaiveBayesModel.hpp
// Trained multinomial Naive Bayes parameters: per-class log-prior, a
// term x class log-likelihood table, the vocabulary it was fit on and the
// smoothing constant. A default-constructed model is untrained.
// Classes are held in lexicographic order; that order is the class index.

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "Vocabulary.hpp"

class NaiveBayesModel {
public:
    NaiveBayesModel() = default;

    // log_likelihood is term-major: entry (t, c) lives at t * classes.size() + c.
    // Throws DimensionMismatchError when the shapes disagree.
    NaiveBayesModel(Vocabulary vocabulary,
                    std::vector<std::string> classes,
                    std::vector<double> log_priors,
                    std::vector<double> log_likelihood,
                    double alpha);

    bool is_trained() const { return trained_; }

    const Vocabulary& vocabulary() const { return vocabulary_; }
    const std::vector<std::string>& classes() const { return classes_; }
    size_t num_classes() const { return classes_.size(); }
    double alpha() const { return alpha_; }

    // -1 when the label was never seen in training
    int class_index(const std::string& label) const;

    double log_prior(size_t class_index) const { return log_priors_[class_index]; }
    double log_likelihood(size_t term_index, size_t class_index) const {
        return log_likelihood_[term_index * classes_.size() + class_index];
    }

    // Pointer to the num_classes() log-likelihoods of one term
    const double* term_row(size_t term_index) const { return log_likelihood_.data() + term_index * classes_.size(); }

    // Persisted layout; -inf entries are written as null
    nlohmann::json to_json() const;
    static NaiveBayesModel from_json(const nlohmann::json& j);

private:
    Vocabulary vocabulary_;
    std::vector<std::string> classes_;
    std::vector<double> log_priors_;
    std::vector<double> log_likelihood_;
    double alpha_ = 1.0;
    bool trained_ = false;
};
