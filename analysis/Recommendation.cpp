#include "Recommendation.h"
#include <QStringList>
#include <QtGlobal>
#include <cmath>

namespace RailConflict::Analysis {

QVariantMap Recommendation::toVariantMap() const {
    return QVariantMap{
        {"id", id},
        {"type", recommendationTypeToString(type)},
        {"description", description},
        {"explanation", explanation},
        {"impact", impact},
        {"confidence", confidence},
        {"sourceConflictId", sourceConflictId}
    };
}

QString recommendationTypeToString(RecommendationType type) {
    switch (type) {
        case RecommendationType::HOLD:     return "hold";
        case RecommendationType::ROUTE:    return "route";
        case RecommendationType::PRIORITY: return "priority";
        default:                           return "priority";
    }
}

RecommendationType inferRecommendationType(const QString& description) {
    if (description.contains("hold", Qt::CaseInsensitive)) {
        return RecommendationType::HOLD;
    }

    static const QStringList routeKeywords = {"reroute", "re-route", "route via", "alternate path", "alternative path"};
    for (const QString& keyword : routeKeywords) {
        if (description.contains(keyword, Qt::CaseInsensitive)) {
            return RecommendationType::ROUTE;
        }
    }

    return RecommendationType::PRIORITY;
}

int clampConfidence(double confidence) {
    if (!std::isfinite(confidence)) {
        return 0;
    }
    // Bound before narrowing; out-of-range doubles must not reach lround
    return static_cast<int>(std::lround(qBound(0.0, confidence, 100.0)));
}

} // namespace RailConflict::Analysis
