#pragma once

#include "../schedule/ScheduleNormalizer.h"
#include <QString>
#include <QList>
#include <QVariantMap>

namespace RailConflict::Detection {

// Two legs of different trains overlapping on the same block.
// trainA is the leg encountered first in sweep order.
struct ConflictCandidate {
    QString blockKey;
    QString trainA;
    QString trainB;
    int overlapMinutes = 0;
    qint64 overlapStart = 0;   // epoch ms
    qint64 overlapEnd = 0;     // epoch ms

    // Stable across re-detection of an unchanged schedule
    QString conflictId() const;
    QVariantMap toVariantMap() const;
};

QString makeConflictId(const QString& blockKey, const QString& trainA,
                       const QString& trainB, qint64 overlapStart);

struct SweepStatistics {
    int legsScanned = 0;
    int pairsCompared = 0;
    int candidatesFound = 0;
    double elapsedMs = 0.0;
};

class ConflictSweepDetector {
public:
    static constexpr qint64 MS_PER_MINUTE = 60000;

    // Pure; safe to call concurrently on independent inputs.
    QList<ConflictCandidate> detect(const QList<Schedule::Leg>& legs,
                                    SweepStatistics* statistics = nullptr) const;

    static void sortLegs(QList<Schedule::Leg>& legs);
    static int roundedOverlapMinutes(qint64 overlapMs);
};

} // namespace RailConflict::Detection
