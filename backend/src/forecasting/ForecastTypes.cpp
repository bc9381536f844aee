#include "ForecastTypes.h"

namespace nocturna::backend::forecasting {

const char* toString(AlgorithmKind k) {
    switch (k) {
        case AlgorithmKind::Linear: return "linear";
        case AlgorithmKind::Exponential: return "exponential";
        case AlgorithmKind::Seasonal: return "seasonal";
        case AlgorithmKind::MovingAverage: return "movingAverage";
        case AlgorithmKind::Ensemble: return "ensemble";
    }
    return "linear";
}

const char* toString(QualityGrade g) {
    switch (g) {
        case QualityGrade::Excellent: return "excellent";
        case QualityGrade::Good: return "good";
        case QualityGrade::Fair: return "fair";
        case QualityGrade::Poor: return "poor";
    }
    return "poor";
}

} // namespace nocturna::backend::forecasting
