#include "AnalysisBatch.h"
#include <QJsonArray>
#include <QJsonDocument>
#include <QDebug>
#include <cmath>

namespace RailConflict::Analysis {

std::optional<QString> optionalString(const QJsonValue& value) {
    if (value.isString()) {
        return value.toString();
    }
    if (value.isDouble()) {
        return QString::number(value.toDouble());
    }
    return std::nullopt;
}

std::optional<double> optionalNumber(const QJsonValue& value) {
    if (value.isDouble()) {
        const double number = value.toDouble();
        if (std::isfinite(number)) {
            return number;
        }
        return std::nullopt;
    }
    if (value.isString()) {
        bool ok = false;
        const double number = value.toString().trimmed().toDouble(&ok);
        if (ok && std::isfinite(number)) {
            return number;
        }
    }
    return std::nullopt;
}

namespace {

QString stringifyValue(const QJsonValue& value) {
    if (value.isString()) {
        return value.toString();
    }
    if (value.isDouble()) {
        return QString::number(value.toDouble());
    }
    if (value.isBool()) {
        return value.toBool() ? "true" : "false";
    }
    if (value.isObject()) {
        return QString::fromUtf8(QJsonDocument(value.toObject()).toJson(QJsonDocument::Compact));
    }
    if (value.isArray()) {
        return QString::fromUtf8(QJsonDocument(value.toArray()).toJson(QJsonDocument::Compact));
    }
    return QString();
}

RecommendationRecord parseRecommendationRecord(const QJsonObject& object) {
    RecommendationRecord record;
    record.id = optionalString(object.value("id"));
    record.description = optionalString(object.value("description"));
    record.impact = optionalString(object.value("impact"));
    record.confidence = optionalNumber(object.value("confidence"));
    return record;
}

RawConflictRecord parseRawConflictRecord(const QJsonObject& object) {
    RawConflictRecord record;
    record.block = object.value("block").toString();
    record.trainA = optionalString(object.value("trainA")).value_or(QString());
    record.trainB = optionalString(object.value("trainB")).value_or(QString());
    record.startMinutes = optionalNumber(object.value("start"));
    record.endMinutes = optionalNumber(object.value("end"));
    return record;
}

} // namespace

QVariantMap AnalysisStructure::toVariantMap() const {
    QVariantList decisions;
    for (const BlockDecision& entry : conflictsAndDecisions) {
        decisions.append(QVariantMap{
            {"block", entry.block},
            {"trains", entry.trains},
            {"windowMinutes", entry.windowMinutes},
            {"decision", entry.decision}
        });
    }

    return QVariantMap{
        {"conflictsAndDecisions", decisions},
        {"reasoning", reasoning},
        {"reroutingOrStaggering", reroutingOrStaggering},
        {"kpiImpact", QVariantMap{
            {"throughput", kpiImpact.throughput},
            {"averageDelay", kpiImpact.averageDelay},
            {"safety", kpiImpact.safety}
        }},
        {"eventLog", eventLog},
        {"fairness", fairness},
        {"optimizationStrategy", optimizationStrategy},
        {"modelSummary", modelSummary}
    };
}

AnalysisStructure AnalysisStructure::fromJson(const QJsonObject& object) {
    AnalysisStructure structure;
    structure.raw = object;

    for (const QJsonValue& entryValue : object.value("conflicts_and_decisions").toArray()) {
        if (!entryValue.isObject()) {
            continue;
        }
        const QJsonObject entryObject = entryValue.toObject();

        BlockDecision entry;
        entry.block = entryObject.value("block").toString();
        for (const QJsonValue& train : entryObject.value("trains").toArray()) {
            entry.trains.append(stringifyValue(train));
        }
        entry.windowMinutes = optionalNumber(entryObject.value("window_min")).value_or(0.0);
        entry.decision = entryObject.value("decision").toObject().toVariantMap();
        structure.conflictsAndDecisions.append(entry);
    }

    structure.reasoning = stringifyValue(object.value("reasoning"));
    structure.reroutingOrStaggering = stringifyValue(object.value("rerouting_or_staggering"));

    const QJsonObject kpi = object.value("kpi_impact").toObject();
    structure.kpiImpact.throughput = stringifyValue(kpi.value("throughput"));
    structure.kpiImpact.averageDelay = stringifyValue(kpi.value("average_delay"));
    structure.kpiImpact.safety = stringifyValue(kpi.value("safety"));

    for (const QJsonValue& line : object.value("event_log").toArray()) {
        structure.eventLog.append(stringifyValue(line));
    }

    structure.fairness = stringifyValue(object.value("fairness"));
    structure.optimizationStrategy = stringifyValue(object.value("optimization_strategy"));
    structure.modelSummary = stringifyValue(object.value("model_summary"));

    return structure;
}

AnalysisBatch AnalysisBatch::fromJson(const QJsonObject& object) {
    AnalysisBatch batch;

    const QJsonValue recommendations = object.value("recommendations");
    if (recommendations.isArray()) {
        for (const QJsonValue& entry : recommendations.toArray()) {
            // Non-object entries become empty records and pick up defaults downstream
            batch.recommendations.append(entry.isObject()
                                             ? parseRecommendationRecord(entry.toObject())
                                             : RecommendationRecord());
        }
    } else if (!recommendations.isUndefined() && !recommendations.isNull()) {
        qWarning() << "AnalysisBatch: 'recommendations' is not an array, ignoring";
    }

    const QJsonValue analysis = object.value("analysis");
    if (analysis.isString() && !analysis.toString().isEmpty()) {
        batch.narrative = analysis.toString();
    }

    const QJsonValue analysisStruct = object.value("analysis_struct");
    if (analysisStruct.isObject()) {
        batch.structure = AnalysisStructure::fromJson(analysisStruct.toObject());
    }

    const QJsonValue conflicts = object.value("conflicts");
    if (conflicts.isArray()) {
        QList<RawConflictRecord> records;
        for (const QJsonValue& entry : conflicts.toArray()) {
            records.append(entry.isObject() ? parseRawConflictRecord(entry.toObject()) : RawConflictRecord());
        }
        batch.conflicts = records;
    }

    return batch;
}

} // namespace RailConflict::Analysis
