#pragma once

#include "../detection/ConflictSweepDetector.h"
#include "../detection/SeverityClassifier.h"
#include <QString>
#include <QVariantMap>

namespace RailConflict::Registry {

enum class LifecycleState {
    DETECTED,      // Created by detection or received from analysis
    REGISTERED,    // Operator acknowledged, mitigation intended
    CONFIRMED      // Operator verified mitigation; terminal for the session
};

enum class ConflictSource {
    DETECTION,
    ANALYSIS
};

struct Conflict {
    QString id;
    QString blockKey;
    QString trainA;
    QString trainB;
    int overlapMinutes = 0;
    qint64 overlapStart = 0;
    qint64 overlapEnd = 0;
    double timeToConflictMinutes = 0.0;
    Detection::Severity severity = Detection::Severity::LOW;
    QString suggestedAction;
    LifecycleState lifecycleState = LifecycleState::DETECTED;
    ConflictSource source = ConflictSource::DETECTION;

    QString conflictPoint() const { return blockKey; }
    bool isRegistered() const {
        return lifecycleState == LifecycleState::REGISTERED ||
               lifecycleState == LifecycleState::CONFIRMED;
    }
    bool isConfirmed() const { return lifecycleState == LifecycleState::CONFIRMED; }

    static Conflict fromCandidate(const Detection::ConflictCandidate& candidate,
                                  const Detection::Classification& classification,
                                  ConflictSource source = ConflictSource::DETECTION);

    QVariantMap toVariantMap() const;
};

QString lifecycleStateToString(LifecycleState state);
QString conflictSourceToString(ConflictSource source);

} // namespace RailConflict::Registry
