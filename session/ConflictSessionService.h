#pragma once

#include "../config/EngineConfig.h"
#include "../schedule/ScheduleNormalizer.h"
#include "../detection/ConflictSweepDetector.h"
#include "../detection/SeverityClassifier.h"
#include "../analysis/AnalysisBatch.h"
#include "../analysis/RecommendationAdapter.h"
#include "../registry/ConflictRegistry.h"
#include <QObject>
#include <QString>
#include <QJsonArray>
#include <QJsonObject>
#include <QVariantMap>
#include <QVariantList>
#include <QDateTime>
#include <QDebug>
#include <memory>
#include <optional>

namespace RailConflict::Collaborator {
class CollaboratorClient;
}

namespace RailConflict::Session {

enum class BatchKind {
    SCHEDULE,
    ANALYSIS
};

struct BatchSummary {
    BatchKind kind = BatchKind::SCHEDULE;
    int rowsReceived = 0;
    int rowsSkipped = 0;
    int conflicts = 0;
    int recommendations = 0;
    int lifecycleCarriedForward = 0;
    bool conflictsReplaced = false;
    double elapsedMs = 0.0;
    QDateTime appliedAt;

    QVariantMap toVariantMap() const;
};

// One analysis session: owns the registry and runs the
// normalize -> sweep -> classify -> replace pipeline for every complete batch.
class ConflictSessionService : public QObject {
    Q_OBJECT
    Q_PROPERTY(int activeConflicts READ activeConflicts NOTIFY conflictsChanged)
    Q_PROPERTY(bool allRegistered READ allRegistered NOTIFY allRegisteredChanged)
    Q_PROPERTY(QString analysisText READ analysisText NOTIFY analysisChanged)
    Q_PROPERTY(QString lastError READ lastError NOTIFY lastErrorChanged)

public:
    explicit ConflictSessionService(const Config::EngineConfig& config = Config::EngineConfig(),
                                    QObject* parent = nullptr);
    ~ConflictSessionService();

    Registry::ConflictRegistry* registry() const { return m_registry.get(); }
    const Config::EngineConfig& config() const { return m_config; }

    // Wire collaborator replies straight into this session
    void attachCollaborator(Collaborator::CollaboratorClient* client);

    // Properties
    int activeConflicts() const;
    bool allRegistered() const;
    QString analysisText() const { return m_analysisText; }
    QString lastError() const { return m_lastError; }

    // Analysis conflicts arrive as minute offsets; this anchors them in epoch ms
    void setAnalysisReferenceEpoch(qint64 referenceEpochMs) { m_analysisReferenceEpochMs = referenceEpochMs; }
    qint64 analysisReferenceEpoch() const { return m_analysisReferenceEpochMs; }

    // Batches
    BatchSummary applyStops(const QList<Schedule::RawStop>& stops);
    BatchSummary applyAnalysisBatch(const Analysis::AnalysisBatch& batch);
    Q_INVOKABLE QVariantMap applySchedule(const QJsonArray& schedule);
    Q_INVOKABLE QVariantMap applyAnalysisJson(const QJsonObject& analysis);

    // Failed fetches keep the last-known conflicts and recommendations
    Q_INVOKABLE void reportCollaboratorFailure(const QString& endpoint, const QString& error);

    // Operator actions
    Q_INVOKABLE RailConflict::Registry::TransitionResult registerConflict(const QString& conflictId);
    Q_INVOKABLE RailConflict::Registry::TransitionResult confirmConflict(const QString& conflictId);
    Q_INVOKABLE RailConflict::Registry::TransitionResult acceptRecommendation(const QString& recommendationId);

    // Presentation
    QList<Registry::Conflict> conflicts() const;
    QList<Analysis::Recommendation> recommendations() const;
    std::optional<Analysis::AnalysisStructure> analysisStructure() const { return m_analysisStructure; }
    std::optional<BatchSummary> lastBatch() const { return m_lastBatch; }
    Schedule::NormalizationReport lastNormalizationReport() const { return m_lastNormalization; }
    Analysis::AdapterReport lastAdapterReport() const { return m_lastAdapterReport; }

    Q_INVOKABLE QVariantList getConflicts() const;
    Q_INVOKABLE QVariantList getRecommendations() const;
    Q_INVOKABLE QVariantMap getAnalysisStructure() const;
    Q_INVOKABLE QVariantMap getStatistics() const;

signals:
    void conflictsChanged();
    void allRegisteredChanged(bool allRegistered);
    void recommendationsChanged();
    void analysisChanged();
    void lastErrorChanged();

    void batchApplied(const QVariantMap& summary);
    void collaboratorFailed(const QString& endpoint, const QString& error);
    void actionRejected(const QString& entityId, const QString& action, const QString& reason);

private:
    void recordBatch(const BatchSummary& summary);
    void clearLastError();
    void logPerformanceWarning(const QString& operation, double elapsedMs) const;

private:
    Config::EngineConfig m_config;
    std::unique_ptr<Registry::ConflictRegistry> m_registry;
    Detection::ConflictSweepDetector m_detector;
    Detection::SeverityClassifier m_classifier;
    Analysis::RecommendationAdapter m_adapter;

    qint64 m_analysisReferenceEpochMs = 0;

    // Pass-through analysis output
    QString m_analysisText;
    std::optional<Analysis::AnalysisStructure> m_analysisStructure;

    // Diagnostics
    QString m_lastError;
    std::optional<BatchSummary> m_lastBatch;
    Schedule::NormalizationReport m_lastNormalization;
    Analysis::AdapterReport m_lastAdapterReport;
    Detection::SweepStatistics m_lastSweep;

    // Statistics
    int m_scheduleBatches = 0;
    int m_analysisBatches = 0;
    int m_totalRowsSkipped = 0;
    int m_collaboratorFailures = 0;

    static constexpr double BATCH_WARNING_THRESHOLD_MS = 250.0;
};

QString batchKindToString(BatchKind kind);

} // namespace RailConflict::Session
