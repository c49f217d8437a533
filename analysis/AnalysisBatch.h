#pragma once

#include <QString>
#include <QStringList>
#include <QList>
#include <QVariantMap>
#include <QJsonObject>
#include <QJsonValue>
#include <QMetaType>
#include <optional>

namespace RailConflict::Analysis {

// Recommendation-like record as delivered by the analysis service
struct RecommendationRecord {
    std::optional<QString> id;
    std::optional<QString> description;
    std::optional<QString> impact;
    std::optional<double> confidence;
};

// Conflict as computed by the analysis service. start/end are minutes from scenario start.
struct RawConflictRecord {
    QString block;
    QString trainA;
    QString trainB;
    std::optional<double> startMinutes;
    std::optional<double> endMinutes;
};

struct BlockDecision {
    QString block;
    QStringList trains;
    double windowMinutes = 0.0;
    QVariantMap decision;    // trainId -> "PROCEED" / "HOLD"
};

struct KpiImpact {
    QString throughput;
    QString averageDelay;
    QString safety;
};

// Opaque to the engine; passed through to presentation
struct AnalysisStructure {
    QList<BlockDecision> conflictsAndDecisions;
    QString reasoning;
    QString reroutingOrStaggering;
    KpiImpact kpiImpact;
    QStringList eventLog;
    QString fairness;
    QString optimizationStrategy;
    QString modelSummary;
    QJsonObject raw;

    QVariantMap toVariantMap() const;
    static AnalysisStructure fromJson(const QJsonObject& object);
};

struct AnalysisBatch {
    QList<RecommendationRecord> recommendations;
    std::optional<QString> narrative;
    std::optional<AnalysisStructure> structure;
    std::optional<QList<RawConflictRecord>> conflicts;   // absent: keep current conflicts

    bool hasConflictList() const { return conflicts.has_value(); }

    // Accepts the analysis service response: recommendations, analysis, analysis_struct, conflicts
    static AnalysisBatch fromJson(const QJsonObject& object);
};

std::optional<QString> optionalString(const QJsonValue& value);
std::optional<double> optionalNumber(const QJsonValue& value);

} // namespace RailConflict::Analysis

Q_DECLARE_METATYPE(RailConflict::Analysis::AnalysisBatch)
