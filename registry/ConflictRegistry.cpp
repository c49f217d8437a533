#include "ConflictRegistry.h"

namespace RailConflict::Registry {

ConflictRegistry::ConflictRegistry(QObject* parent)
    : QObject(parent)
{
}

ConflictRegistry::~ConflictRegistry() = default;

void ConflictRegistry::setPreserveLifecycleOnReplace(bool preserve) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_preserveLifecycleOnReplace = preserve;
}

bool ConflictRegistry::preserveLifecycleOnReplace() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_preserveLifecycleOnReplace;
}

int ConflictRegistry::conflictCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_conflicts.size();
}

int ConflictRegistry::registeredCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return countInStateLocked(LifecycleState::REGISTERED);
}

int ConflictRegistry::confirmedCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return countInStateLocked(LifecycleState::CONFIRMED);
}

int ConflictRegistry::recommendationCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_recommendations.size();
}

bool ConflictRegistry::allRegistered() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return allRegisteredLocked();
}

QList<Conflict> ConflictRegistry::conflicts() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_conflicts;
}

std::optional<Conflict> ConflictRegistry::conflict(const QString& conflictId) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    const int index = indexOfConflictLocked(conflictId);
    if (index < 0) {
        return std::nullopt;
    }
    return m_conflicts.at(index);
}

QList<Analysis::Recommendation> ConflictRegistry::recommendations() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_recommendations;
}

ReplaceSummary ConflictRegistry::replaceConflicts(const QList<Conflict>& conflicts) {
    ReplaceSummary summary;
    bool allRegisteredBefore = false;

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        allRegisteredBefore = allRegisteredLocked();
        summary.previousCount = m_conflicts.size();

        QList<Conflict> next;
        QHash<QString, int> nextIndex;
        next.reserve(conflicts.size());

        for (const Conflict& incoming : conflicts) {
            const int existing = nextIndex.value(incoming.id, -1);
            if (existing >= 0) {
                // Same pair and overlap start from two legs of one train: keep the longer overlap
                Conflict& kept = next[existing];
                if (incoming.overlapMinutes > kept.overlapMinutes) {
                    const LifecycleState state = kept.lifecycleState;
                    kept = incoming;
                    kept.lifecycleState = state;
                }
                qWarning() << "ConflictRegistry: Duplicate conflict id in batch, keeping longest overlap:"
                           << incoming.id << kept.overlapMinutes << "min";
                continue;
            }

            Conflict entry = incoming;
            entry.lifecycleState = LifecycleState::DETECTED;

            if (m_preserveLifecycleOnReplace) {
                const int previous = indexOfConflictLocked(entry.id);
                if (previous >= 0 && m_conflicts.at(previous).lifecycleState != LifecycleState::DETECTED) {
                    entry.lifecycleState = m_conflicts.at(previous).lifecycleState;
                    summary.lifecycleCarriedForward++;
                }
            }

            nextIndex.insert(entry.id, next.size());
            next.append(entry);
        }

        // Whole-set swap
        m_conflicts.swap(next);
        m_conflictIndex.swap(nextIndex);
        m_batchesReplaced++;
        summary.newCount = m_conflicts.size();
    }

    qDebug() << "ConflictRegistry: Replaced" << summary.previousCount << "conflicts with"
             << summary.newCount << "(lifecycle carried forward:" << summary.lifecycleCarriedForward << ")";

    emit conflictsReplaced(summary.previousCount, summary.newCount);
    notifyConflictChange(allRegisteredBefore);
    return summary;
}

void ConflictRegistry::replaceRecommendations(const QList<Analysis::Recommendation>& recommendations) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_recommendations = recommendations;
    }

    qDebug() << "ConflictRegistry: Recommendation set replaced," << recommendations.size() << "active";
    emit recommendationsChanged();
}

void ConflictRegistry::clear() {
    bool allRegisteredBefore = false;
    int previousCount = 0;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        allRegisteredBefore = allRegisteredLocked();
        previousCount = m_conflicts.size();
        m_conflicts.clear();
        m_conflictIndex.clear();
        m_recommendations.clear();
    }

    emit conflictsReplaced(previousCount, 0);
    emit recommendationsChanged();
    notifyConflictChange(allRegisteredBefore);
}

TransitionResult ConflictRegistry::registerConflict(const QString& conflictId) {
    TransitionResult result;
    bool allRegisteredBefore = false;

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        allRegisteredBefore = allRegisteredLocked();

        const int index = indexOfConflictLocked(conflictId);
        if (index < 0) {
            m_rejectedTransitions++;
            result = TransitionResult::notFound(conflictId);
        } else {
            Conflict& conflict = m_conflicts[index];
            const QString fromState = lifecycleStateToString(conflict.lifecycleState);

            if (conflict.lifecycleState != LifecycleState::DETECTED) {
                result = TransitionResult::noOp(QString("Conflict already %1").arg(fromState));
                result.setEntityId(conflictId).setStates(fromState, fromState);
            } else {
                conflict.lifecycleState = LifecycleState::REGISTERED;
                m_totalRegistrations++;
                result = TransitionResult::applied("Conflict registered");
                result.setEntityId(conflictId).setStates(fromState, lifecycleStateToString(conflict.lifecycleState));
            }
        }
    }

    if (result.isApplied()) {
        qDebug() << "ConflictRegistry: Conflict" << conflictId << "registered";
        emit conflictRegistered(conflictId);
        notifyConflictChange(allRegisteredBefore);
    } else if (result.isRejected()) {
        qWarning() << "ConflictRegistry: Register rejected for" << conflictId << "-" << result.getReason();
        emit transitionRejected(conflictId, "register", result.getReason());
    }

    return result;
}

TransitionResult ConflictRegistry::confirmConflict(const QString& conflictId) {
    TransitionResult result;
    bool allRegisteredBefore = false;

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        allRegisteredBefore = allRegisteredLocked();

        const int index = indexOfConflictLocked(conflictId);
        if (index < 0) {
            m_rejectedTransitions++;
            result = TransitionResult::notFound(conflictId);
        } else {
            Conflict& conflict = m_conflicts[index];
            const QString fromState = lifecycleStateToString(conflict.lifecycleState);

            switch (conflict.lifecycleState) {
                case LifecycleState::DETECTED:
                    m_rejectedTransitions++;
                    result = TransitionResult::rejected("Conflict must be registered before it can be confirmed",
                                                        "CONFIRM_REQUIRES_REGISTERED");
                    result.setEntityId(conflictId).setStates(fromState, fromState);
                    break;
                case LifecycleState::REGISTERED:
                    conflict.lifecycleState = LifecycleState::CONFIRMED;
                    m_totalConfirmations++;
                    result = TransitionResult::applied("Conflict confirmed");
                    result.setEntityId(conflictId).setStates(fromState, lifecycleStateToString(conflict.lifecycleState));
                    break;
                case LifecycleState::CONFIRMED:
                    result = TransitionResult::noOp("Conflict already CONFIRMED");
                    result.setEntityId(conflictId).setStates(fromState, fromState);
                    break;
            }
        }
    }

    if (result.isApplied()) {
        qDebug() << "ConflictRegistry: Conflict" << conflictId << "confirmed";
        emit conflictConfirmed(conflictId);
        notifyConflictChange(allRegisteredBefore);
    } else if (result.isRejected()) {
        qWarning() << "ConflictRegistry: Confirm rejected for" << conflictId << "-" << result.getReason();
        emit transitionRejected(conflictId, "confirm", result.getReason());
    }

    return result;
}

TransitionResult ConflictRegistry::acceptRecommendation(const QString& recommendationId) {
    bool removed = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (int i = 0; i < m_recommendations.size(); ++i) {
            if (m_recommendations.at(i).id == recommendationId) {
                m_recommendations.removeAt(i);
                m_acceptedRecommendations++;
                removed = true;
                break;
            }
        }
    }

    if (!removed) {
        qWarning() << "ConflictRegistry: Recommendation" << recommendationId << "not active";
        return TransitionResult::notFound(recommendationId);
    }

    qDebug() << "ConflictRegistry: Recommendation" << recommendationId << "accepted";
    emit recommendationAccepted(recommendationId);
    emit recommendationsChanged();

    auto result = TransitionResult::applied("Recommendation accepted");
    result.setEntityId(recommendationId);
    return result;
}

QVariantList ConflictRegistry::getConflicts() const {
    QVariantList result;
    for (const Conflict& conflict : conflicts()) {
        result.append(conflict.toVariantMap());
    }
    return result;
}

QVariantMap ConflictRegistry::getConflict(const QString& conflictId) const {
    const auto found = conflict(conflictId);
    if (!found) {
        return QVariantMap{{"error", "Conflict not found"}};
    }
    return found->toVariantMap();
}

QVariantList ConflictRegistry::getRecommendations() const {
    QVariantList result;
    for (const Analysis::Recommendation& recommendation : recommendations()) {
        result.append(recommendation.toVariantMap());
    }
    return result;
}

QVariantMap ConflictRegistry::getRegistryStatistics() const {
    std::lock_guard<std::mutex> lock(m_mutex);

    int high = 0;
    int medium = 0;
    int low = 0;
    for (const Conflict& conflict : m_conflicts) {
        switch (conflict.severity) {
            case Detection::Severity::HIGH:   high++; break;
            case Detection::Severity::MEDIUM: medium++; break;
            case Detection::Severity::LOW:    low++; break;
        }
    }

    return QVariantMap{
        {"activeConflicts", m_conflicts.size()},
        {"detected", countInStateLocked(LifecycleState::DETECTED)},
        {"registered", countInStateLocked(LifecycleState::REGISTERED)},
        {"confirmed", countInStateLocked(LifecycleState::CONFIRMED)},
        {"resolved", countInStateLocked(LifecycleState::CONFIRMED)},
        {"highSeverity", high},
        {"mediumSeverity", medium},
        {"lowSeverity", low},
        {"allRegistered", allRegisteredLocked()},
        {"activeRecommendations", m_recommendations.size()},
        {"batchesReplaced", m_batchesReplaced},
        {"totalRegistrations", m_totalRegistrations},
        {"totalConfirmations", m_totalConfirmations},
        {"rejectedTransitions", m_rejectedTransitions},
        {"acceptedRecommendations", m_acceptedRecommendations}
    };
}

int ConflictRegistry::indexOfConflictLocked(const QString& conflictId) const {
    return m_conflictIndex.value(conflictId, -1);
}

bool ConflictRegistry::allRegisteredLocked() const {
    if (m_conflicts.isEmpty()) {
        return false;
    }
    for (const Conflict& conflict : m_conflicts) {
        if (!conflict.isRegistered()) {
            return false;
        }
    }
    return true;
}

int ConflictRegistry::countInStateLocked(LifecycleState state) const {
    int count = 0;
    for (const Conflict& conflict : m_conflicts) {
        if (conflict.lifecycleState == state) {
            count++;
        }
    }
    return count;
}

void ConflictRegistry::notifyConflictChange(bool allRegisteredBefore) {
    emit conflictsChanged();

    const bool allRegisteredNow = allRegistered();
    if (allRegisteredNow != allRegisteredBefore) {
        emit allRegisteredChanged(allRegisteredNow);
    }
}

} // namespace RailConflict::Registry
