#pragma once

#include "Conflict.h"
#include "TransitionResult.h"
#include "../analysis/Recommendation.h"
#include <QObject>
#include <QString>
#include <QStringList>
#include <QList>
#include <QHash>
#include <QVariantMap>
#include <QVariantList>
#include <QDebug>
#include <mutex>
#include <optional>

namespace RailConflict::Registry {

struct ReplaceSummary {
    int previousCount = 0;
    int newCount = 0;
    int lifecycleCarriedForward = 0;
};

// Session-scoped owner of the active conflict and recommendation sets.
// All mutations are serialized; batch replacement swaps the whole set.
class ConflictRegistry : public QObject {
    Q_OBJECT
    Q_PROPERTY(int conflictCount READ conflictCount NOTIFY conflictsChanged)
    Q_PROPERTY(int registeredCount READ registeredCount NOTIFY conflictsChanged)
    Q_PROPERTY(int confirmedCount READ confirmedCount NOTIFY conflictsChanged)
    Q_PROPERTY(bool allRegistered READ allRegistered NOTIFY allRegisteredChanged)
    Q_PROPERTY(int recommendationCount READ recommendationCount NOTIFY recommendationsChanged)

public:
    explicit ConflictRegistry(QObject* parent = nullptr);
    ~ConflictRegistry();

    // Keep REGISTERED/CONFIRMED state for conflicts whose id survives a replace
    void setPreserveLifecycleOnReplace(bool preserve);
    bool preserveLifecycleOnReplace() const;

    // Properties
    int conflictCount() const;
    int registeredCount() const;
    int confirmedCount() const;
    int recommendationCount() const;
    bool allRegistered() const;

    // Snapshots
    QList<Conflict> conflicts() const;
    std::optional<Conflict> conflict(const QString& conflictId) const;
    QList<Analysis::Recommendation> recommendations() const;

    // Batch replacement
    ReplaceSummary replaceConflicts(const QList<Conflict>& conflicts);
    void replaceRecommendations(const QList<Analysis::Recommendation>& recommendations);
    void clear();

    // Operator actions
    Q_INVOKABLE TransitionResult registerConflict(const QString& conflictId);
    Q_INVOKABLE TransitionResult confirmConflict(const QString& conflictId);
    Q_INVOKABLE TransitionResult acceptRecommendation(const QString& recommendationId);

    // QML helpers
    Q_INVOKABLE QVariantList getConflicts() const;
    Q_INVOKABLE QVariantMap getConflict(const QString& conflictId) const;
    Q_INVOKABLE QVariantList getRecommendations() const;
    Q_INVOKABLE QVariantMap getRegistryStatistics() const;

signals:
    void conflictsChanged();
    void allRegisteredChanged(bool allRegistered);
    void recommendationsChanged();

    void conflictsReplaced(int previousCount, int newCount);
    void conflictRegistered(const QString& conflictId);
    void conflictConfirmed(const QString& conflictId);
    void transitionRejected(const QString& conflictId, const QString& action, const QString& reason);
    void recommendationAccepted(const QString& recommendationId);

private:
    // Callers hold m_mutex
    int indexOfConflictLocked(const QString& conflictId) const;
    bool allRegisteredLocked() const;
    int countInStateLocked(LifecycleState state) const;

    void notifyConflictChange(bool allRegisteredBefore);

private:
    mutable std::mutex m_mutex;

    QList<Conflict> m_conflicts;                     // detection order
    QHash<QString, int> m_conflictIndex;             // id -> position in m_conflicts
    QList<Analysis::Recommendation> m_recommendations;

    bool m_preserveLifecycleOnReplace = false;

    // Statistics
    int m_batchesReplaced = 0;
    int m_totalRegistrations = 0;
    int m_totalConfirmations = 0;
    int m_rejectedTransitions = 0;
    int m_acceptedRecommendations = 0;
};

} // namespace RailConflict::Registry
