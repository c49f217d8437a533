#include "Conflict.h"

namespace RailConflict::Registry {

Conflict Conflict::fromCandidate(const Detection::ConflictCandidate& candidate,
                                 const Detection::Classification& classification,
                                 ConflictSource source) {
    Conflict conflict;
    conflict.id = candidate.conflictId();
    conflict.blockKey = candidate.blockKey;
    conflict.trainA = candidate.trainA;
    conflict.trainB = candidate.trainB;
    conflict.overlapMinutes = candidate.overlapMinutes;
    conflict.overlapStart = candidate.overlapStart;
    conflict.overlapEnd = candidate.overlapEnd;
    conflict.severity = classification.severity;
    conflict.suggestedAction = classification.suggestedAction;
    conflict.lifecycleState = LifecycleState::DETECTED;
    conflict.source = source;
    return conflict;
}

QVariantMap Conflict::toVariantMap() const {
    return QVariantMap{
        {"id", id},
        {"trainA", trainA},
        {"trainB", trainB},
        {"conflictPoint", conflictPoint()},
        {"blockKey", blockKey},
        {"timeToConflict", timeToConflictMinutes},
        {"overlapMinutes", overlapMinutes},
        {"overlapStart", overlapStart},
        {"overlapEnd", overlapEnd},
        {"severity", Detection::severityToString(severity)},
        {"suggestedAction", suggestedAction},
        {"lifecycleState", lifecycleStateToString(lifecycleState)},
        {"registered", isRegistered()},
        {"confirmed", isConfirmed()},
        {"source", conflictSourceToString(source)}
    };
}

QString lifecycleStateToString(LifecycleState state) {
    switch (state) {
        case LifecycleState::DETECTED:   return "DETECTED";
        case LifecycleState::REGISTERED: return "REGISTERED";
        case LifecycleState::CONFIRMED:  return "CONFIRMED";
        default:                         return "UNKNOWN";
    }
}

QString conflictSourceToString(ConflictSource source) {
    return source == ConflictSource::ANALYSIS ? "ANALYSIS" : "DETECTION";
}

} // namespace RailConflict::Registry
