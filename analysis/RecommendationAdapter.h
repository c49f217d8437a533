#pragma once

#include "AnalysisBatch.h"
#include "Recommendation.h"
#include "../detection/ConflictSweepDetector.h"
#include "../detection/SeverityClassifier.h"
#include "../registry/Conflict.h"
#include <QString>
#include <QList>
#include <QVariantMap>
#include <optional>

namespace RailConflict::Analysis {

struct AdapterReport {
    int recommendationsReceived = 0;
    int recommendationsDefaulted = 0;   // at least one field filled from defaults
    int conflictsReceived = 0;
    int conflictsAccepted = 0;
    int conflictsMissingBlock = 0;
    int conflictsInvalidTrains = 0;
    int conflictsInvalidWindow = 0;

    int conflictsSkipped() const { return conflictsReceived - conflictsAccepted; }
    QVariantMap toVariantMap() const;
};

// Boundary translator between the analysis service's loose payloads and engine types.
class RecommendationAdapter {
public:
    static constexpr int DEFAULT_CONFIDENCE = 75;
    static constexpr const char* DEFAULT_DESCRIPTION = "Recommendation";
    static constexpr const char* DEFAULT_EXPLANATION =
        "Heuristic recommendation based on conflict and precedence analysis.";
    // Minute offsets beyond this cannot be anchored in epoch ms
    static constexpr double MAX_WINDOW_MINUTES = 2147483647.0;

    explicit RecommendationAdapter(int defaultConfidence = DEFAULT_CONFIDENCE);

    QList<Recommendation> adaptRecommendations(const QList<RecommendationRecord>& records,
                                               const std::optional<QString>& narrative,
                                               AdapterReport* report = nullptr) const;

    Recommendation adaptRecommendation(const RecommendationRecord& record, int index,
                                       const std::optional<QString>& narrative,
                                       bool* usedDefaults = nullptr) const;

    // Minute offsets are anchored at referenceEpochMs so analysis conflicts share
    // the millisecond time base of detected ones.
    QList<Detection::ConflictCandidate> adaptRawConflicts(const QList<RawConflictRecord>& records,
                                                          qint64 referenceEpochMs,
                                                          AdapterReport* report = nullptr) const;

    // Candidates still go through the classifier; analysis output never bypasses it.
    QList<Registry::Conflict> adaptConflicts(const QList<RawConflictRecord>& records,
                                             const Detection::SeverityClassifier& classifier,
                                             qint64 referenceEpochMs,
                                             AdapterReport* report = nullptr) const;

    Recommendation synthesizeFromConflict(const Registry::Conflict& conflict) const;
    QList<Recommendation> synthesizeFromConflicts(const QList<Registry::Conflict>& conflicts) const;

    int defaultConfidence() const { return m_defaultConfidence; }

private:
    int m_defaultConfidence;
};

} // namespace RailConflict::Analysis
