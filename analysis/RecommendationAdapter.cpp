#include "RecommendationAdapter.h"
#include <QDebug>
#include <cmath>

namespace RailConflict::Analysis {

QVariantMap AdapterReport::toVariantMap() const {
    return QVariantMap{
        {"recommendationsReceived", recommendationsReceived},
        {"recommendationsDefaulted", recommendationsDefaulted},
        {"conflictsReceived", conflictsReceived},
        {"conflictsAccepted", conflictsAccepted},
        {"conflictsSkipped", conflictsSkipped()},
        {"conflictsMissingBlock", conflictsMissingBlock},
        {"conflictsInvalidTrains", conflictsInvalidTrains},
        {"conflictsInvalidWindow", conflictsInvalidWindow}
    };
}

RecommendationAdapter::RecommendationAdapter(int defaultConfidence)
    : m_defaultConfidence(clampConfidence(defaultConfidence))
{
}

Recommendation RecommendationAdapter::adaptRecommendation(const RecommendationRecord& record, int index,
                                                          const std::optional<QString>& narrative,
                                                          bool* usedDefaults) const {
    bool defaulted = false;
    Recommendation recommendation;

    if (record.id.has_value() && !record.id->trimmed().isEmpty()) {
        recommendation.id = record.id->trimmed();
    } else {
        recommendation.id = QString("AR%1").arg(index);
        defaulted = true;
    }

    if (record.description.has_value() && !record.description->isEmpty()) {
        recommendation.description = *record.description;
    } else {
        recommendation.description = DEFAULT_DESCRIPTION;
        defaulted = true;
    }

    recommendation.type = inferRecommendationType(recommendation.description);

    if (narrative.has_value() && !narrative->isEmpty()) {
        recommendation.explanation = *narrative;
    } else {
        recommendation.explanation = DEFAULT_EXPLANATION;
    }

    if (record.impact.has_value()) {
        recommendation.impact = *record.impact;
    } else {
        defaulted = true;
    }

    // Zero confidence counts as missing, as the analysis service never emits it deliberately
    if (record.confidence.has_value() && *record.confidence != 0.0) {
        recommendation.confidence = clampConfidence(*record.confidence);
    } else {
        recommendation.confidence = m_defaultConfidence;
        defaulted = true;
    }

    if (usedDefaults) {
        *usedDefaults = defaulted;
    }
    return recommendation;
}

QList<Recommendation> RecommendationAdapter::adaptRecommendations(const QList<RecommendationRecord>& records,
                                                                  const std::optional<QString>& narrative,
                                                                  AdapterReport* report) const {
    QList<Recommendation> recommendations;
    recommendations.reserve(records.size());

    int defaultedCount = 0;
    for (int i = 0; i < records.size(); ++i) {
        bool defaulted = false;
        recommendations.append(adaptRecommendation(records.at(i), i, narrative, &defaulted));
        if (defaulted) {
            defaultedCount++;
        }
    }

    if (report) {
        report->recommendationsReceived = records.size();
        report->recommendationsDefaulted = defaultedCount;
    }
    return recommendations;
}

QList<Detection::ConflictCandidate> RecommendationAdapter::adaptRawConflicts(const QList<RawConflictRecord>& records,
                                                                             qint64 referenceEpochMs,
                                                                             AdapterReport* report) const {
    QList<Detection::ConflictCandidate> candidates;
    AdapterReport local;
    local.conflictsReceived = records.size();

    for (const RawConflictRecord& record : records) {
        const QString block = record.block.trimmed();
        if (block.isEmpty()) {
            local.conflictsMissingBlock++;
            continue;
        }

        const QString trainA = record.trainA.trimmed();
        const QString trainB = record.trainB.trimmed();
        if (trainA.isEmpty() || trainB.isEmpty() || trainA == trainB) {
            local.conflictsInvalidTrains++;
            continue;
        }

        if (!record.startMinutes.has_value() || !record.endMinutes.has_value() ||
            std::fabs(*record.startMinutes) > MAX_WINDOW_MINUTES ||
            std::fabs(*record.endMinutes) > MAX_WINDOW_MINUTES) {
            local.conflictsInvalidWindow++;
            continue;
        }

        const qint64 overlapStart = referenceEpochMs +
            static_cast<qint64>(std::llround(*record.startMinutes * Detection::ConflictSweepDetector::MS_PER_MINUTE));
        const qint64 overlapEnd = referenceEpochMs +
            static_cast<qint64>(std::llround(*record.endMinutes * Detection::ConflictSweepDetector::MS_PER_MINUTE));
        const int overlapMinutes = Detection::ConflictSweepDetector::roundedOverlapMinutes(overlapEnd - overlapStart);

        if (overlapMinutes <= 0) {
            local.conflictsInvalidWindow++;
            continue;
        }

        Detection::ConflictCandidate candidate;
        candidate.blockKey = block;
        candidate.trainA = trainA;
        candidate.trainB = trainB;
        candidate.overlapMinutes = overlapMinutes;
        candidate.overlapStart = overlapStart;
        candidate.overlapEnd = overlapEnd;
        candidates.append(candidate);
    }

    local.conflictsAccepted = candidates.size();
    if (local.conflictsSkipped() > 0) {
        qWarning() << "RecommendationAdapter: Skipped" << local.conflictsSkipped() << "of"
                   << local.conflictsReceived << "analysis conflicts"
                   << "(missing block:" << local.conflictsMissingBlock
                   << "invalid trains:" << local.conflictsInvalidTrains
                   << "invalid window:" << local.conflictsInvalidWindow << ")";
    }

    if (report) {
        report->conflictsReceived = local.conflictsReceived;
        report->conflictsAccepted = local.conflictsAccepted;
        report->conflictsMissingBlock = local.conflictsMissingBlock;
        report->conflictsInvalidTrains = local.conflictsInvalidTrains;
        report->conflictsInvalidWindow = local.conflictsInvalidWindow;
    }
    return candidates;
}

QList<Registry::Conflict> RecommendationAdapter::adaptConflicts(const QList<RawConflictRecord>& records,
                                                                const Detection::SeverityClassifier& classifier,
                                                                qint64 referenceEpochMs,
                                                                AdapterReport* report) const {
    QList<Registry::Conflict> conflicts;
    for (const Detection::ConflictCandidate& candidate : adaptRawConflicts(records, referenceEpochMs, report)) {
        conflicts.append(Registry::Conflict::fromCandidate(candidate,
                                                           classifier.classify(candidate.overlapMinutes),
                                                           Registry::ConflictSource::ANALYSIS));
    }
    return conflicts;
}

Recommendation RecommendationAdapter::synthesizeFromConflict(const Registry::Conflict& conflict) const {
    Recommendation recommendation;
    recommendation.id = QString("REC-%1").arg(conflict.id);
    recommendation.sourceConflictId = conflict.id;
    recommendation.description = QString("Resolve block contention on %1: %2 (%3 vs %4)")
                                     .arg(conflict.blockKey, conflict.suggestedAction,
                                          conflict.trainA, conflict.trainB);
    recommendation.type = inferRecommendationType(recommendation.description);
    recommendation.explanation = QString("%1 minute overlap on %2 classified as %3 severity")
                                     .arg(conflict.overlapMinutes)
                                     .arg(conflict.blockKey, Detection::severityToString(conflict.severity));
    recommendation.impact = QString("-%1 min potential delay").arg(conflict.overlapMinutes);

    switch (conflict.severity) {
        case Detection::Severity::HIGH:   recommendation.confidence = 80; break;
        case Detection::Severity::MEDIUM: recommendation.confidence = 70; break;
        case Detection::Severity::LOW:    recommendation.confidence = 60; break;
    }

    return recommendation;
}

QList<Recommendation> RecommendationAdapter::synthesizeFromConflicts(const QList<Registry::Conflict>& conflicts) const {
    QList<Recommendation> recommendations;
    recommendations.reserve(conflicts.size());
    for (const Registry::Conflict& conflict : conflicts) {
        recommendations.append(synthesizeFromConflict(conflict));
    }
    return recommendations;
}

} // namespace RailConflict::Analysis
