#pragma once
#include <memory>
#include <string>
#include <vector>
#include <unordered_map>

#include "IForecastModel.h"

namespace nocturna::backend::forecasting {

struct ModelSpec {
    std::string name; // canonical lowercase identifier
    std::unordered_map<std::string,std::string> params; // key->value (already trimmed)
};

struct ModelSpecParseResult {
    std::vector<ModelSpec> models; // empty if error
    bool ok = false;               // false if any fatal parse error
    std::string error;             // description (first error encountered)
};

// Parse the forecast model list (NOCTURNA_FORECAST_MODELS / --models):
//   MODEL ("," MODEL)*
//   MODEL := IDENT [ "(" PARAM_LIST ")" ]
//   PARAM_LIST := PARAM ("," PARAM)*
//   PARAM := KEY "=" VALUE
// Whitespace ignored around tokens. IDENT/KEY are [A-Za-z0-9_-]+ . VALUE runs to the next ',' or ')'.
ModelSpecParseResult parseModelSpec(const std::string& spec);

// linear, exponential, moving_average, seasonal with default parameters.
std::vector<ModelSpec> defaultModelSpecs();

// Instantiates a model family from its spec. Recognized names / params:
//   linear
//   exponential
//   moving_average(window=INT>=1, nudge=0|1)
//   seasonal(min_lag=INT>=1, max_lag=INT, min_correlation=FLOAT)
// Throws InvalidRequestError on unknown names, unknown keys or bad values.
std::unique_ptr<IForecastModel> createForecastModel(const ModelSpec& spec);

} // namespace nocturna::backend::forecasting
