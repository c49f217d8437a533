#include "ConflictSessionService.h"
#include "../collaborator/CollaboratorClient.h"
#include <QElapsedTimer>

namespace RailConflict::Session {

namespace {

Detection::SeverityThresholds thresholdsFrom(const Config::EngineConfig& config) {
    Detection::SeverityThresholds thresholds;
    thresholds.highMinutes = config.highThresholdMinutes;
    thresholds.mediumMinutes = config.mediumThresholdMinutes;
    return thresholds;
}

} // namespace

QVariantMap BatchSummary::toVariantMap() const {
    return QVariantMap{
        {"kind", batchKindToString(kind)},
        {"rowsReceived", rowsReceived},
        {"rowsSkipped", rowsSkipped},
        {"conflicts", conflicts},
        {"recommendations", recommendations},
        {"lifecycleCarriedForward", lifecycleCarriedForward},
        {"conflictsReplaced", conflictsReplaced},
        {"elapsedMs", elapsedMs},
        {"appliedAt", appliedAt}
    };
}

QString batchKindToString(BatchKind kind) {
    return kind == BatchKind::ANALYSIS ? "ANALYSIS" : "SCHEDULE";
}

ConflictSessionService::ConflictSessionService(const Config::EngineConfig& config, QObject* parent)
    : QObject(parent)
    , m_config(config)
    , m_registry(std::make_unique<Registry::ConflictRegistry>())
    , m_classifier(thresholdsFrom(config))
    , m_adapter(config.defaultConfidence)
{
    m_registry->setPreserveLifecycleOnReplace(m_config.preserveLifecycleOnReplace);

    connect(m_registry.get(), &Registry::ConflictRegistry::conflictsChanged,
            this, &ConflictSessionService::conflictsChanged);
    connect(m_registry.get(), &Registry::ConflictRegistry::allRegisteredChanged,
            this, &ConflictSessionService::allRegisteredChanged);
    connect(m_registry.get(), &Registry::ConflictRegistry::recommendationsChanged,
            this, &ConflictSessionService::recommendationsChanged);
    connect(m_registry.get(), &Registry::ConflictRegistry::transitionRejected,
            this, &ConflictSessionService::actionRejected);

    qDebug() << "ConflictSessionService: Session started with config" << m_config.toVariantMap();
}

ConflictSessionService::~ConflictSessionService() = default;

void ConflictSessionService::attachCollaborator(Collaborator::CollaboratorClient* client) {
    if (!client) {
        qWarning() << "ConflictSessionService: Cannot attach null collaborator client";
        return;
    }

    connect(client, &Collaborator::CollaboratorClient::scheduleReceived,
            this, [this](const QJsonArray& schedule) { applySchedule(schedule); });
    connect(client, &Collaborator::CollaboratorClient::analysisReceived,
            this, [this](const Analysis::AnalysisBatch& batch) { applyAnalysisBatch(batch); });
    connect(client, &Collaborator::CollaboratorClient::fetchFailed,
            this, &ConflictSessionService::reportCollaboratorFailure);
}

int ConflictSessionService::activeConflicts() const {
    return m_registry->conflictCount();
}

bool ConflictSessionService::allRegistered() const {
    return m_registry->allRegistered();
}

BatchSummary ConflictSessionService::applyStops(const QList<Schedule::RawStop>& stops) {
    QElapsedTimer timer;
    timer.start();

    const Schedule::NormalizationResult normalized = Schedule::normalizeStops(stops);
    m_lastNormalization = normalized.report;

    const QList<Detection::ConflictCandidate> candidates = m_detector.detect(normalized.legs, &m_lastSweep);

    QList<Registry::Conflict> conflicts;
    conflicts.reserve(candidates.size());
    for (const Detection::ConflictCandidate& candidate : candidates) {
        conflicts.append(Registry::Conflict::fromCandidate(candidate, m_classifier.classify(candidate.overlapMinutes)));
    }

    const Registry::ReplaceSummary replaced = m_registry->replaceConflicts(conflicts);
    // Replacement uses the stored ids, so synthesise from the registry's view
    const QList<Analysis::Recommendation> recommendations = m_adapter.synthesizeFromConflicts(m_registry->conflicts());
    m_registry->replaceRecommendations(recommendations);

    BatchSummary summary;
    summary.kind = BatchKind::SCHEDULE;
    summary.rowsReceived = normalized.report.totalRows;
    summary.rowsSkipped = normalized.report.skipped();
    summary.conflicts = replaced.newCount;
    summary.recommendations = recommendations.size();
    summary.lifecycleCarriedForward = replaced.lifecycleCarriedForward;
    summary.conflictsReplaced = true;
    summary.elapsedMs = timer.nsecsElapsed() / 1000000.0;
    summary.appliedAt = QDateTime::currentDateTime();

    m_scheduleBatches++;
    m_totalRowsSkipped += summary.rowsSkipped;
    recordBatch(summary);

    qDebug() << "[ConflictSessionService > applyStops]" << summary.rowsReceived << "rows,"
             << normalized.legs.size() << "legs," << summary.conflicts << "conflicts in"
             << summary.elapsedMs << "ms";

    return summary;
}

QVariantMap ConflictSessionService::applySchedule(const QJsonArray& schedule) {
    return applyStops(Schedule::parseScheduleJson(schedule)).toVariantMap();
}

BatchSummary ConflictSessionService::applyAnalysisBatch(const Analysis::AnalysisBatch& batch) {
    QElapsedTimer timer;
    timer.start();

    Analysis::AdapterReport report;
    const QList<Analysis::Recommendation> recommendations =
        m_adapter.adaptRecommendations(batch.recommendations, batch.narrative, &report);

    BatchSummary summary;
    summary.kind = BatchKind::ANALYSIS;
    summary.rowsReceived = batch.recommendations.size();

    if (batch.hasConflictList()) {
        const QList<Registry::Conflict> conflicts =
            m_adapter.adaptConflicts(*batch.conflicts, m_classifier, m_analysisReferenceEpochMs, &report);
        const Registry::ReplaceSummary replaced = m_registry->replaceConflicts(conflicts);

        summary.rowsReceived += batch.conflicts->size();
        summary.rowsSkipped = report.conflictsSkipped();
        summary.conflicts = replaced.newCount;
        summary.lifecycleCarriedForward = replaced.lifecycleCarriedForward;
        summary.conflictsReplaced = true;
    } else {
        summary.conflicts = m_registry->conflictCount();
    }

    // Recommendations are superseded as a set on every analysis batch
    m_registry->replaceRecommendations(recommendations);
    summary.recommendations = recommendations.size();

    m_analysisText = batch.narrative.value_or(QString());
    m_analysisStructure = batch.structure;
    emit analysisChanged();

    m_lastAdapterReport = report;
    summary.elapsedMs = timer.nsecsElapsed() / 1000000.0;
    summary.appliedAt = QDateTime::currentDateTime();

    m_analysisBatches++;
    m_totalRowsSkipped += summary.rowsSkipped;
    recordBatch(summary);

    qDebug() << "[ConflictSessionService > applyAnalysisBatch]" << summary.recommendations << "recommendations,"
             << (summary.conflictsReplaced ? QString::number(summary.conflicts) : QString("unchanged"))
             << "conflicts in" << summary.elapsedMs << "ms";

    return summary;
}

QVariantMap ConflictSessionService::applyAnalysisJson(const QJsonObject& analysis) {
    return applyAnalysisBatch(Analysis::AnalysisBatch::fromJson(analysis)).toVariantMap();
}

void ConflictSessionService::reportCollaboratorFailure(const QString& endpoint, const QString& error) {
    m_collaboratorFailures++;
    m_lastError = QString("%1: %2").arg(endpoint, error);

    qCritical() << "ConflictSessionService: Collaborator failure on" << endpoint << "-" << error;
    qCritical() << "ConflictSessionService: Keeping last-known state:" << m_registry->conflictCount()
                << "conflicts," << m_registry->recommendationCount() << "recommendations";

    emit lastErrorChanged();
    emit collaboratorFailed(endpoint, error);
}

Registry::TransitionResult ConflictSessionService::registerConflict(const QString& conflictId) {
    return m_registry->registerConflict(conflictId);
}

Registry::TransitionResult ConflictSessionService::confirmConflict(const QString& conflictId) {
    return m_registry->confirmConflict(conflictId);
}

Registry::TransitionResult ConflictSessionService::acceptRecommendation(const QString& recommendationId) {
    Registry::TransitionResult result = m_registry->acceptRecommendation(recommendationId);
    if (result.isRejected()) {
        emit actionRejected(recommendationId, "acceptRecommendation", result.getReason());
    }
    return result;
}

QList<Registry::Conflict> ConflictSessionService::conflicts() const {
    return m_registry->conflicts();
}

QList<Analysis::Recommendation> ConflictSessionService::recommendations() const {
    return m_registry->recommendations();
}

QVariantList ConflictSessionService::getConflicts() const {
    return m_registry->getConflicts();
}

QVariantList ConflictSessionService::getRecommendations() const {
    return m_registry->getRecommendations();
}

QVariantMap ConflictSessionService::getAnalysisStructure() const {
    if (!m_analysisStructure) {
        return QVariantMap();
    }
    return m_analysisStructure->toVariantMap();
}

QVariantMap ConflictSessionService::getStatistics() const {
    QVariantMap statistics = m_registry->getRegistryStatistics();
    statistics["scheduleBatches"] = m_scheduleBatches;
    statistics["analysisBatches"] = m_analysisBatches;
    statistics["totalRowsSkipped"] = m_totalRowsSkipped;
    statistics["collaboratorFailures"] = m_collaboratorFailures;
    statistics["lastError"] = m_lastError;
    statistics["lastNormalization"] = m_lastNormalization.toVariantMap();
    statistics["lastAdapterReport"] = m_lastAdapterReport.toVariantMap();
    statistics["lastSweep"] = QVariantMap{
        {"legsScanned", m_lastSweep.legsScanned},
        {"pairsCompared", m_lastSweep.pairsCompared},
        {"candidatesFound", m_lastSweep.candidatesFound},
        {"elapsedMs", m_lastSweep.elapsedMs}
    };
    if (m_lastBatch) {
        statistics["lastBatch"] = m_lastBatch->toVariantMap();
    }
    return statistics;
}

void ConflictSessionService::recordBatch(const BatchSummary& summary) {
    m_lastBatch = summary;
    clearLastError();

    if (summary.elapsedMs > BATCH_WARNING_THRESHOLD_MS) {
        logPerformanceWarning(batchKindToString(summary.kind), summary.elapsedMs);
    }

    emit batchApplied(summary.toVariantMap());
}

void ConflictSessionService::clearLastError() {
    if (m_lastError.isEmpty()) {
        return;
    }
    m_lastError.clear();
    emit lastErrorChanged();
}

void ConflictSessionService::logPerformanceWarning(const QString& operation, double elapsedMs) const {
    qWarning() << "ConflictSessionService: Slow batch:" << elapsedMs << "ms for" << operation
               << "(threshold:" << BATCH_WARNING_THRESHOLD_MS << "ms)";
}

} // namespace RailConflict::Session
