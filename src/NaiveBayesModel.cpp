#include "NaiveBayesModel.hpp"
#include "ClassifierErrors.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

using json = nlohmann::json;

namespace {
const char* kFormatName = "veracity-naive-bayes";
constexpr int kFormatVersion = 1;

json log_value_to_json(double v) {
    if (std::isinf(v) && v < 0) return nullptr;
    return v;
}

double log_value_from_json(const json& v) {
    if (v.is_null()) return -std::numeric_limits<double>::infinity();
    return v.get<double>();
}
}

NaiveBayesModel::NaiveBayesModel(Vocabulary vocabulary,
                                 std::vector<std::string> classes,
                                 std::vector<double> log_priors,
                                 std::vector<double> log_likelihood,
                                 double alpha)
    : vocabulary_(std::move(vocabulary)),
      classes_(std::move(classes)),
      log_priors_(std::move(log_priors)),
      log_likelihood_(std::move(log_likelihood)),
      alpha_(alpha) {
    if (classes_.empty()) {
        throw DimensionMismatchError("A model needs at least one class");
    }
    if (!std::is_sorted(classes_.begin(), classes_.end()) ||
        std::adjacent_find(classes_.begin(), classes_.end()) != classes_.end()) {
        throw ModelFormatError("Class labels must be distinct and in lexicographic order");
    }
    if (log_priors_.size() != classes_.size()) {
        throw DimensionMismatchError("Expected " + std::to_string(classes_.size()) + " priors, got " +
                                     std::to_string(log_priors_.size()));
    }
    if (log_likelihood_.size() != vocabulary_.size() * classes_.size()) {
        throw DimensionMismatchError("Likelihood table has " + std::to_string(log_likelihood_.size()) +
                                     " entries, expected " + std::to_string(vocabulary_.size()) + " x " +
                                     std::to_string(classes_.size()));
    }
    trained_ = true;
}

int NaiveBayesModel::class_index(const std::string& label) const {
    auto it = std::lower_bound(classes_.begin(), classes_.end(), label);
    if (it == classes_.end() || *it != label) return -1;
    return static_cast<int>(it - classes_.begin());
}

json NaiveBayesModel::to_json() const {
    if (!trained_) throw UntrainedModelError("Cannot serialize a model that was never fit");

    json j;
    j["format"] = kFormatName;
    j["version"] = kFormatVersion;
    j["alpha"] = alpha_;
    j["classes"] = classes_;

    json priors = json::array();
    for (double p : log_priors_) priors.push_back(log_value_to_json(p));
    j["log_priors"] = priors;

    j["vocabulary"] = vocabulary_.terms();

    const size_t num_classes = classes_.size();
    json table = json::array();
    for (size_t t = 0; t < vocabulary_.size(); ++t) {
        json row = json::array();
        for (size_t c = 0; c < num_classes; ++c) row.push_back(log_value_to_json(log_likelihood(t, c)));
        table.push_back(std::move(row));
    }
    j["log_likelihood"] = std::move(table);
    return j;
}

NaiveBayesModel NaiveBayesModel::from_json(const json& j) {
    try {
        if (j.value("format", std::string()) != kFormatName) {
            throw ModelFormatError("Not a veracity model file");
        }
        int version = j.value("version", 0);
        if (version != kFormatVersion) {
            throw ModelFormatError("Unsupported model version " + std::to_string(version));
        }

        Vocabulary vocabulary(j.at("vocabulary").get<std::vector<std::string>>());
        auto classes = j.at("classes").get<std::vector<std::string>>();

        std::vector<double> priors;
        for (const auto& p : j.at("log_priors")) priors.push_back(log_value_from_json(p));

        const json& table = j.at("log_likelihood");
        if (table.size() != vocabulary.size()) {
            throw DimensionMismatchError("Likelihood table has " + std::to_string(table.size()) +
                                         " rows but the vocabulary has " + std::to_string(vocabulary.size()) +
                                         " terms");
        }

        std::vector<double> likelihood;
        likelihood.reserve(vocabulary.size() * classes.size());
        for (const auto& row : table) {
            if (row.size() != classes.size()) {
                throw DimensionMismatchError("Likelihood row has " + std::to_string(row.size()) +
                                             " entries, expected " + std::to_string(classes.size()));
            }
            for (const auto& v : row) likelihood.push_back(log_value_from_json(v));
        }

        return NaiveBayesModel(std::move(vocabulary), std::move(classes), std::move(priors),
                               std::move(likelihood), j.at("alpha").get<double>());
    } catch (const json::exception& e) {
        throw ModelFormatError(std::string("Malformed model: ") + e.what());
    }
}
