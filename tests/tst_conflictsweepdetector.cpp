#include <QtTest>
#include <limits>
#include <thread>
#include <vector>
#include "detection/ConflictSweepDetector.h"

using namespace RailConflict::Detection;
using RailConflict::Schedule::Leg;

namespace {

constexpr qint64 MINUTE = ConflictSweepDetector::MS_PER_MINUTE;

Leg makeLeg(const QString& train, const QString& block, qint64 startMin, qint64 endMin) {
    Leg leg;
    leg.trainId = train;
    leg.blockKey = block;
    leg.start = startMin * MINUTE;
    leg.end = endMin * MINUTE;
    return leg;
}

} // namespace

class TestConflictSweepDetector : public QObject {
    Q_OBJECT

private slots:
    void overlappingLegsProduceConflict();
    void touchingWindowsDoNotConflict();
    void containedWindowConflicts();
    void differentBlocksDoNotConflict();
    void sameTrainDoesNotConflict();
    void subMinuteOverlapIsDiscarded();
    void overlapRoundsHalfUp();
    void conflictIdsAreStableAcrossRuns();
    void resultIsIndependentOfInputOrder();
    void threeTrainsProduceAllPairs();
    void statisticsAreReported();
    void emptyInputYieldsNothing();
    void concurrentDetectionOnIndependentInputs();
};

void TestConflictSweepDetector::overlappingLegsProduceConflict() {
    ConflictSweepDetector detector;
    const auto conflicts = detector.detect({
        makeLeg("T1", "A->B", 0, 10),
        makeLeg("T2", "A->B", 5, 15)
    });

    QCOMPARE(conflicts.size(), 1);
    const ConflictCandidate& conflict = conflicts.first();
    QCOMPARE(conflict.blockKey, QString("A->B"));
    QCOMPARE(conflict.trainA, QString("T1"));
    QCOMPARE(conflict.trainB, QString("T2"));
    QCOMPARE(conflict.overlapMinutes, 5);
    QCOMPARE(conflict.overlapStart, 5 * MINUTE);
    QCOMPARE(conflict.overlapEnd, 10 * MINUTE);
    QCOMPARE(conflict.conflictId(), QString("A->B-T1-T2-%1").arg(5 * MINUTE));
}

void TestConflictSweepDetector::touchingWindowsDoNotConflict() {
    ConflictSweepDetector detector;
    const auto conflicts = detector.detect({
        makeLeg("T1", "A->B", 0, 10),
        makeLeg("T2", "A->B", 10, 20)
    });

    QVERIFY(conflicts.isEmpty());
}

void TestConflictSweepDetector::containedWindowConflicts() {
    ConflictSweepDetector detector;
    const auto conflicts = detector.detect({
        makeLeg("T1", "A->B", 0, 3),
        makeLeg("T2", "A->B", 1, 2)
    });

    QCOMPARE(conflicts.size(), 1);
    QCOMPARE(conflicts.first().overlapMinutes, 1);
    QCOMPARE(conflicts.first().overlapStart, 1 * MINUTE);
    QCOMPARE(conflicts.first().overlapEnd, 2 * MINUTE);
}

void TestConflictSweepDetector::differentBlocksDoNotConflict() {
    ConflictSweepDetector detector;
    const auto conflicts = detector.detect({
        makeLeg("T1", "A->B", 0, 10),
        makeLeg("T2", "B->A", 0, 10)
    });

    QVERIFY(conflicts.isEmpty());
}

void TestConflictSweepDetector::sameTrainDoesNotConflict() {
    ConflictSweepDetector detector;
    const auto conflicts = detector.detect({
        makeLeg("T1", "A->B", 0, 10),
        makeLeg("T1", "A->B", 5, 15)
    });

    QVERIFY(conflicts.isEmpty());
}

void TestConflictSweepDetector::subMinuteOverlapIsDiscarded() {
    Leg first = makeLeg("T1", "A->B", 0, 10);
    Leg second = makeLeg("T2", "A->B", 0, 20);
    second.start = first.end - 29 * 1000;

    ConflictSweepDetector detector;
    QVERIFY(detector.detect({first, second}).isEmpty());
}

void TestConflictSweepDetector::overlapRoundsHalfUp() {
    QCOMPARE(ConflictSweepDetector::roundedOverlapMinutes(0), 0);
    QCOMPARE(ConflictSweepDetector::roundedOverlapMinutes(-MINUTE), 0);
    QCOMPARE(ConflictSweepDetector::roundedOverlapMinutes(29999), 0);
    QCOMPARE(ConflictSweepDetector::roundedOverlapMinutes(30000), 1);
    QCOMPARE(ConflictSweepDetector::roundedOverlapMinutes(89999), 1);
    QCOMPARE(ConflictSweepDetector::roundedOverlapMinutes(90000), 2);

    // Saturates instead of wrapping
    QCOMPARE(ConflictSweepDetector::roundedOverlapMinutes(std::numeric_limits<qint64>::max()),
             std::numeric_limits<int>::max());
    QCOMPARE(ConflictSweepDetector::roundedOverlapMinutes(qint64(std::numeric_limits<int>::max()) * MINUTE * 2),
             std::numeric_limits<int>::max());
}

void TestConflictSweepDetector::conflictIdsAreStableAcrossRuns() {
    const QList<Leg> legs{
        makeLeg("T1", "A->B", 0, 10),
        makeLeg("T2", "A->B", 5, 15),
        makeLeg("T3", "B->C", 20, 30),
        makeLeg("T4", "B->C", 22, 28)
    };

    ConflictSweepDetector detector;
    const auto first = detector.detect(legs);
    const auto second = detector.detect(legs);

    QCOMPARE(first.size(), 2);
    QCOMPARE(first.size(), second.size());
    for (int i = 0; i < first.size(); ++i) {
        QCOMPARE(first.at(i).conflictId(), second.at(i).conflictId());
    }
}

void TestConflictSweepDetector::resultIsIndependentOfInputOrder() {
    const QList<Leg> forward{
        makeLeg("T1", "A->B", 0, 10),
        makeLeg("T2", "A->B", 5, 15)
    };
    const QList<Leg> reversed{forward.at(1), forward.at(0)};

    ConflictSweepDetector detector;
    const auto a = detector.detect(forward);
    const auto b = detector.detect(reversed);

    QCOMPARE(a.size(), 1);
    QCOMPARE(b.size(), 1);
    QCOMPARE(a.first().conflictId(), b.first().conflictId());
}

void TestConflictSweepDetector::threeTrainsProduceAllPairs() {
    ConflictSweepDetector detector;
    const auto conflicts = detector.detect({
        makeLeg("T1", "A->B", 0, 10),
        makeLeg("T2", "A->B", 2, 12),
        makeLeg("T3", "A->B", 4, 14)
    });

    QCOMPARE(conflicts.size(), 3);

    QStringList pairs;
    for (const ConflictCandidate& conflict : conflicts) {
        pairs.append(conflict.trainA + "/" + conflict.trainB);
    }
    QVERIFY(pairs.contains("T1/T2"));
    QVERIFY(pairs.contains("T1/T3"));
    QVERIFY(pairs.contains("T2/T3"));
}

void TestConflictSweepDetector::statisticsAreReported() {
    SweepStatistics statistics;
    ConflictSweepDetector detector;
    detector.detect({
        makeLeg("T1", "A->B", 0, 10),
        makeLeg("T2", "A->B", 5, 15),
        makeLeg("T3", "C->D", 100, 110)
    }, &statistics);

    QCOMPARE(statistics.legsScanned, 3);
    QCOMPARE(statistics.candidatesFound, 1);
    // Third leg starts after both windows close and is never paired
    QCOMPARE(statistics.pairsCompared, 1);
    QVERIFY(statistics.elapsedMs >= 0.0);
}

void TestConflictSweepDetector::emptyInputYieldsNothing() {
    SweepStatistics statistics;
    ConflictSweepDetector detector;
    QVERIFY(detector.detect({}, &statistics).isEmpty());
    QCOMPARE(statistics.legsScanned, 0);
}

void TestConflictSweepDetector::concurrentDetectionOnIndependentInputs() {
    constexpr int INPUTS = 4;
    constexpr int ROUNDS = 50;

    QList<QList<Leg>> inputs;
    for (int n = 0; n < INPUTS; ++n) {
        QList<Leg> legs;
        for (int i = 0; i <= n + 1; ++i) {
            legs.append(makeLeg(QString("T%1").arg(i), QString("B%1->C").arg(n), i * 2, i * 2 + 10));
        }
        inputs.append(legs);
    }

    const ConflictSweepDetector detector;
    QList<QStringList> expected;
    for (const QList<Leg>& legs : inputs) {
        QStringList ids;
        for (const ConflictCandidate& candidate : detector.detect(legs)) {
            ids.append(candidate.conflictId());
        }
        expected.append(ids);
    }

    std::vector<QStringList> mismatches(INPUTS);
    std::vector<std::thread> threads;
    for (int n = 0; n < INPUTS; ++n) {
        threads.emplace_back([&, n]() {
            for (int round = 0; round < ROUNDS; ++round) {
                QStringList ids;
                for (const ConflictCandidate& candidate : detector.detect(inputs.at(n))) {
                    ids.append(candidate.conflictId());
                }
                if (ids != expected.at(n)) {
                    mismatches[n].append(ids.join(","));
                }
            }
        });
    }
    for (std::thread& thread : threads) {
        thread.join();
    }

    for (int n = 0; n < INPUTS; ++n) {
        QVERIFY2(mismatches[n].isEmpty(), qPrintable(mismatches[n].join(" | ")));
        QVERIFY(!expected.at(n).isEmpty());
    }
}

QTEST_APPLESS_MAIN(TestConflictSweepDetector)
#include "tst_conflictsweepdetector.moc"
