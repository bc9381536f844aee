#ifndef NOCTURNA_BACKEND_FORECASTING_FORECAST_TYPES_H
#define NOCTURNA_BACKEND_FORECASTING_FORECAST_TYPES_H

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace nocturna::backend::forecasting {

enum class AlgorithmKind { Linear, Exponential, Seasonal, MovingAverage, Ensemble };

const char* toString(AlgorithmKind k);

struct Prediction {
    int year = 0;
    double value = 0.0;
    double min = 0.0;
    double max = 0.0;
};

struct PredictionModel {
    std::string name;
    AlgorithmKind kind = AlgorithmKind::Linear;
    std::map<std::string, double> parameters; // always carries "annual_change"
    std::vector<Prediction> predictions;      // one per forecast year, ascending

    double parameter(const std::string& key, double fallback = 0.0) const {
        auto it = parameters.find(key);
        return it == parameters.end() ? fallback : it->second;
    }
};

enum class QualityGrade { Excellent, Good, Fair, Poor };

const char* toString(QualityGrade g);

struct ValidationResult {
    std::string modelName;
    AlgorithmKind kind = AlgorithmKind::Linear;
    double mae = 0.0;
    QualityGrade grade = QualityGrade::Poor;
    std::size_t trainingSize = 0;
    std::size_t heldOut = 0;
};

struct UncertaintyBand {
    int year = 0;
    double lowerBound = 0.0;
    double upperBound = 0.0;
};

struct SkippedModel {
    std::string name;
    AlgorithmKind kind = AlgorithmKind::Linear;
    std::string reason;
};

struct EnsembleResult {
    std::vector<PredictionModel> models;       // successfully fitted models only
    std::vector<ValidationResult> validation;  // at most one per fitted model
    PredictionModel ensembleModel;
    std::vector<UncertaintyBand> uncertainty;  // one per forecast year
    std::vector<SkippedModel> skipped;
    std::size_t historyYears = 0;
    int yearsForward = 0;

    const ValidationResult* validationFor(const std::string& modelName) const {
        for (const auto& v : validation) {
            if (v.modelName == modelName) return &v;
        }
        return nullptr;
    }
    const PredictionModel* model(const std::string& modelName) const {
        for (const auto& m : models) {
            if (m.name == modelName) return &m;
        }
        return nullptr;
    }
};

} // namespace nocturna::backend::forecasting

#endif // NOCTURNA_BACKEND_FORECASTING_FORECAST_TYPES_H
