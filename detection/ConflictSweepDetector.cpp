#include "ConflictSweepDetector.h"
#include <QElapsedTimer>
#include <QDebug>
#include <algorithm>
#include <limits>

namespace RailConflict::Detection {

QString makeConflictId(const QString& blockKey, const QString& trainA,
                       const QString& trainB, qint64 overlapStart) {
    return QString("%1-%2-%3-%4").arg(blockKey, trainA, trainB, QString::number(overlapStart));
}

QString ConflictCandidate::conflictId() const {
    return makeConflictId(blockKey, trainA, trainB, overlapStart);
}

QVariantMap ConflictCandidate::toVariantMap() const {
    return QVariantMap{
        {"id", conflictId()},
        {"blockKey", blockKey},
        {"trainA", trainA},
        {"trainB", trainB},
        {"overlapMinutes", overlapMinutes},
        {"overlapStart", overlapStart},
        {"overlapEnd", overlapEnd}
    };
}

void ConflictSweepDetector::sortLegs(QList<Schedule::Leg>& legs) {
    std::stable_sort(legs.begin(), legs.end(),
                     [](const Schedule::Leg& a, const Schedule::Leg& b) {
                         if (a.start != b.start) return a.start < b.start;
                         if (a.blockKey != b.blockKey) return a.blockKey < b.blockKey;
                         return a.trainId < b.trainId;
                     });
}

int ConflictSweepDetector::roundedOverlapMinutes(qint64 overlapMs) {
    if (overlapMs <= 0) {
        return 0;
    }
    // Half-up rounding on whole minutes, saturating at INT_MAX
    const qint64 minutes = overlapMs / MS_PER_MINUTE + (overlapMs % MS_PER_MINUTE >= MS_PER_MINUTE / 2 ? 1 : 0);
    return static_cast<int>(std::min<qint64>(minutes, std::numeric_limits<int>::max()));
}

QList<ConflictCandidate> ConflictSweepDetector::detect(const QList<Schedule::Leg>& legs,
                                                       SweepStatistics* statistics) const {
    QElapsedTimer timer;
    timer.start();

    QList<Schedule::Leg> sorted = legs;
    sortLegs(sorted);

    QList<ConflictCandidate> candidates;
    int pairsCompared = 0;

    for (int i = 0; i < sorted.size(); ++i) {
        const Schedule::Leg& current = sorted[i];

        for (int j = i + 1; j < sorted.size(); ++j) {
            const Schedule::Leg& next = sorted[j];

            // Start-sorted: nothing further can overlap the current window
            if (next.start > current.end) {
                break;
            }
            pairsCompared++;

            if (current.blockKey != next.blockKey || current.trainId == next.trainId) {
                continue;
            }

            const qint64 overlapStart = std::max(current.start, next.start);
            const qint64 overlapEnd = std::min(current.end, next.end);
            const int overlapMinutes = roundedOverlapMinutes(overlapEnd - overlapStart);

            if (overlapMinutes <= 0) {
                continue;
            }

            ConflictCandidate candidate;
            candidate.blockKey = current.blockKey;
            candidate.trainA = current.trainId;
            candidate.trainB = next.trainId;
            candidate.overlapMinutes = overlapMinutes;
            candidate.overlapStart = overlapStart;
            candidate.overlapEnd = overlapEnd;
            candidates.append(candidate);
        }
    }

    if (statistics) {
        statistics->legsScanned = sorted.size();
        statistics->pairsCompared = pairsCompared;
        statistics->candidatesFound = candidates.size();
        statistics->elapsedMs = timer.nsecsElapsed() / 1000000.0;
    }

    qDebug() << "ConflictSweepDetector: Scanned" << sorted.size() << "legs,"
             << pairsCompared << "pairs compared," << candidates.size() << "conflicts";

    return candidates;
}

} // namespace RailConflict::Detection
