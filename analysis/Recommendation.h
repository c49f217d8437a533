#pragma once

#include <QString>
#include <QVariantMap>

namespace RailConflict::Analysis {

enum class RecommendationType {
    PRIORITY,
    HOLD,
    ROUTE
};

struct Recommendation {
    QString id;
    RecommendationType type = RecommendationType::PRIORITY;
    QString description;
    QString explanation;
    QString impact;
    int confidence = 75;        // 0-100
    QString sourceConflictId;   // set when synthesised from a conflict

    QVariantMap toVariantMap() const;
};

QString recommendationTypeToString(RecommendationType type);

// Case-insensitive keyword match on the description. "hold" wins over routing keywords.
RecommendationType inferRecommendationType(const QString& description);

int clampConfidence(double confidence);

} // namespace RailConflict::Analysis
