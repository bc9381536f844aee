#include "forecasting/ModelSpecParser.h"
#include "forecasting/ForecastModels.h"
#include "common/Errors.h"
#include <cctype>
#include <initializer_list>

namespace nocturna::backend::forecasting {

namespace {
void trim(std::string& s) {
    size_t b = 0;
    while (b < s.size() && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    size_t e = s.size();
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    s = s.substr(b, e - b);
}
bool isIdentChar(char c) { return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-'; }
void lower(std::string& s) {
    for (char& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

// Split on commas outside parentheses; empty pieces dropped.
std::vector<std::string> splitTopLevel(const std::string& text) {
    std::vector<std::string> out;
    std::string token;
    int depth = 0;
    for (char c : text) {
        if (c == '(') ++depth;
        else if (c == ')' && depth > 0) --depth;
        if (c == ',' && depth == 0) {
            trim(token);
            if (!token.empty()) out.push_back(token);
            token.clear();
        } else {
            token.push_back(c);
        }
    }
    trim(token);
    if (!token.empty()) out.push_back(token);
    return out;
}

ModelSpecParseResult fail(std::string message) {
    ModelSpecParseResult r;
    r.ok = false;
    r.error = std::move(message);
    return r;
}

int intParam(const ModelSpec& spec, const std::string& key, int def) {
    auto it = spec.params.find(key);
    if (it == spec.params.end()) return def;
    try {
        size_t used = 0;
        int v = std::stoi(it->second, &used);
        if (used == it->second.size()) return v;
    } catch (const std::logic_error&) {
    }
    throw common::InvalidRequestError(spec.name + ": parameter '" + key + "' is not an integer: " + it->second);
}

double doubleParam(const ModelSpec& spec, const std::string& key, double def) {
    auto it = spec.params.find(key);
    if (it == spec.params.end()) return def;
    try {
        size_t used = 0;
        double v = std::stod(it->second, &used);
        if (used == it->second.size()) return v;
    } catch (const std::logic_error&) {
    }
    throw common::InvalidRequestError(spec.name + ": parameter '" + key + "' is not a number: " + it->second);
}

void rejectUnknownKeys(const ModelSpec& spec, std::initializer_list<const char*> known) {
    for (const auto& kv : spec.params) {
        bool ok = false;
        for (const char* k : known) ok = ok || kv.first == k;
        if (!ok) throw common::InvalidRequestError(spec.name + ": unknown parameter '" + kv.first + "'");
    }
}
}

ModelSpecParseResult parseModelSpec(const std::string& spec) {
    const auto segments = splitTopLevel(spec);
    if (segments.empty()) return fail("empty model spec");

    ModelSpecParseResult result;
    for (const auto& seg : segments) {
        ModelSpec out;
        std::string head = seg;
        std::string paramBlock;
        const size_t lp = seg.find('(');
        if (lp != std::string::npos) {
            const size_t rp = seg.rfind(')');
            if (rp == std::string::npos || rp < lp) return fail("unmatched '(' in model: " + seg);
            std::string trailing = seg.substr(rp + 1);
            trim(trailing);
            if (!trailing.empty()) return fail("unexpected text after ')' in model: " + seg);
            head = seg.substr(0, lp);
            paramBlock = seg.substr(lp + 1, rp - lp - 1);
        }
        trim(head);
        if (head.empty()) return fail("missing model identifier in segment: " + seg);
        for (char c : head) {
            if (!isIdentChar(c)) return fail("invalid char in model name: " + head);
        }
        lower(head);
        out.name = head;

        for (const auto& param : splitTopLevel(paramBlock)) {
            const size_t eq = param.find('=');
            if (eq == std::string::npos) return fail("param missing '=' in model '" + head + "': " + param);
            std::string key = param.substr(0, eq);
            std::string value = param.substr(eq + 1);
            trim(key);
            trim(value);
            if (key.empty() || value.empty()) return fail("empty key or value in model '" + head + "'");
            lower(key);
            out.params[key] = value;
        }
        result.models.push_back(std::move(out));
    }
    result.ok = true;
    return result;
}

std::vector<ModelSpec> defaultModelSpecs() {
    return {{"linear", {}}, {"exponential", {}}, {"moving_average", {}}, {"seasonal", {}}};
}

std::unique_ptr<IForecastModel> createForecastModel(const ModelSpec& spec) {
    if (spec.name == "linear") {
        rejectUnknownKeys(spec, {});
        return std::make_unique<LinearTrendModel>();
    }
    if (spec.name == "exponential") {
        rejectUnknownKeys(spec, {});
        return std::make_unique<ExponentialTrendModel>();
    }
    if (spec.name == "moving_average" || spec.name == "movingaverage") {
        rejectUnknownKeys(spec, {"window", "nudge"});
        MovingAverageModel::Config cfg;
        cfg.window = intParam(spec, "window", cfg.window);
        cfg.trendNudge = intParam(spec, "nudge", cfg.trendNudge ? 1 : 0) != 0;
        if (cfg.window < 1) throw common::InvalidRequestError("moving_average: window must be >= 1");
        return std::make_unique<MovingAverageModel>(cfg);
    }
    if (spec.name == "seasonal") {
        rejectUnknownKeys(spec, {"min_lag", "max_lag", "min_correlation"});
        SeasonalCycleModel::Config cfg;
        cfg.minLag = intParam(spec, "min_lag", cfg.minLag);
        cfg.maxLag = intParam(spec, "max_lag", cfg.maxLag);
        cfg.minCorrelation = doubleParam(spec, "min_correlation", cfg.minCorrelation);
        if (cfg.minLag < 1 || cfg.maxLag < cfg.minLag) {
            throw common::InvalidRequestError("seasonal: need 1 <= min_lag <= max_lag");
        }
        return std::make_unique<SeasonalCycleModel>(cfg);
    }
    throw common::InvalidRequestError("unknown forecast model '" + spec.name + "'");
}

} // namespace nocturna::backend::forecasting
