#pragma once

#include "ForecastTypes.h"
#include "common/YearlySeries.h"

#include <map>
#include <memory>
#include <string>

namespace nocturna::backend::forecasting {

// Result of fitting one model family to a concrete history.
class IFittedModel {
public:
    virtual ~IFittedModel() = default;

    // Model value for any year, inside the history or beyond it.
    virtual double valueAt(int year) const = 0;

    // Family specific coefficients reported with the predictions.
    virtual std::map<std::string, double> parameters() const = 0;
};

// Model family. Stateless; fit() may be called concurrently.
class IForecastModel {
public:
    virtual ~IForecastModel() = default;

    virtual AlgorithmKind kind() const = 0;
    virtual std::string name() const = 0;

    // Throws ModelFitError when the history does not support this family.
    virtual std::unique_ptr<IFittedModel> fit(const common::YearlySeries& history) const = 0;
};

} // namespace nocturna::backend::forecasting
