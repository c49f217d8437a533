#include <QtTest>
#include <QSignalSpy>
#include <atomic>
#include <thread>
#include <vector>
#include "registry/ConflictRegistry.h"

using namespace RailConflict::Registry;
using RailConflict::Detection::Severity;
using RailConflict::Analysis::Recommendation;

namespace {

Conflict makeConflict(const QString& id, Severity severity = Severity::HIGH) {
    Conflict conflict;
    conflict.id = id;
    conflict.blockKey = "A->B";
    conflict.trainA = "T1";
    conflict.trainB = "T2";
    conflict.overlapMinutes = 5;
    conflict.severity = severity;
    return conflict;
}

QList<Conflict> makeBatch(const QString& prefix, int size) {
    QList<Conflict> batch;
    for (int i = 0; i < size; ++i) {
        batch.append(makeConflict(QString("%1%2").arg(prefix).arg(i)));
    }
    return batch;
}

Recommendation makeRecommendation(const QString& id) {
    Recommendation recommendation;
    recommendation.id = id;
    recommendation.description = "Hold T2";
    return recommendation;
}

} // namespace

class TestConflictRegistry : public QObject {
    Q_OBJECT

private slots:
    void emptyRegistryIsNotAllRegistered();
    void registerMovesToRegistered();
    void registerTwiceIsNoOp();
    void confirmRequiresRegistration();
    void confirmAfterRegister();
    void confirmTwiceIsNoOp();
    void unknownIdIsNotFound();
    void allRegisteredTracksEveryConflict();
    void replaceResetsLifecycle();
    void replacePreservesLifecycleWhenEnabled();
    void replaceDropsDuplicateIds();
    void duplicateIdKeepsLongestOverlap();
    void acceptRecommendationRemovesIt();
    void acceptUnknownRecommendationFails();
    void statisticsCountSeverities();
    void clearEmptiesBothSets();
    void concurrentActionsSeeWholeBatches();
};

void TestConflictRegistry::emptyRegistryIsNotAllRegistered() {
    ConflictRegistry registry;
    QCOMPARE(registry.conflictCount(), 0);
    QVERIFY(!registry.allRegistered());
}

void TestConflictRegistry::registerMovesToRegistered() {
    ConflictRegistry registry;
    registry.replaceConflicts({makeConflict("C1")});
    QSignalSpy registeredSpy(&registry, &ConflictRegistry::conflictRegistered);

    const TransitionResult result = registry.registerConflict("C1");

    QVERIFY(result.isApplied());
    QCOMPARE(result.getFromState(), QString("DETECTED"));
    QCOMPARE(result.getToState(), QString("REGISTERED"));
    QCOMPARE(registry.conflict("C1")->lifecycleState, LifecycleState::REGISTERED);
    QCOMPARE(registry.registeredCount(), 1);
    QCOMPARE(registeredSpy.count(), 1);
    QCOMPARE(registeredSpy.first().at(0).toString(), QString("C1"));
}

void TestConflictRegistry::registerTwiceIsNoOp() {
    ConflictRegistry registry;
    registry.replaceConflicts({makeConflict("C1")});
    registry.registerConflict("C1");

    QSignalSpy changedSpy(&registry, &ConflictRegistry::conflictsChanged);
    const TransitionResult second = registry.registerConflict("C1");

    QVERIFY(second.isNoOp());
    QVERIFY(second.isAccepted());
    QCOMPARE(registry.conflict("C1")->lifecycleState, LifecycleState::REGISTERED);
    QCOMPARE(changedSpy.count(), 0);
}

void TestConflictRegistry::confirmRequiresRegistration() {
    ConflictRegistry registry;
    registry.replaceConflicts({makeConflict("C1")});
    QSignalSpy rejectedSpy(&registry, &ConflictRegistry::transitionRejected);

    QTest::ignoreMessage(QtWarningMsg, QRegularExpression("Confirm rejected"));
    const TransitionResult result = registry.confirmConflict("C1");

    QVERIFY(result.isRejected());
    QCOMPARE(result.getStatus(), TransitionResult::Status::REJECTED);
    QCOMPARE(result.getRuleId(), QString("CONFIRM_REQUIRES_REGISTERED"));
    QCOMPARE(registry.conflict("C1")->lifecycleState, LifecycleState::DETECTED);
    QCOMPARE(rejectedSpy.count(), 1);
    QCOMPARE(rejectedSpy.first().at(1).toString(), QString("confirm"));
}

void TestConflictRegistry::confirmAfterRegister() {
    ConflictRegistry registry;
    registry.replaceConflicts({makeConflict("C1")});
    registry.registerConflict("C1");
    QSignalSpy confirmedSpy(&registry, &ConflictRegistry::conflictConfirmed);

    const TransitionResult result = registry.confirmConflict("C1");

    QVERIFY(result.isApplied());
    const auto conflict = registry.conflict("C1");
    QVERIFY(conflict.has_value());
    QVERIFY(conflict->isConfirmed());
    QVERIFY(conflict->isRegistered());
    QCOMPARE(registry.confirmedCount(), 1);
    QCOMPARE(confirmedSpy.count(), 1);
}

void TestConflictRegistry::confirmTwiceIsNoOp() {
    ConflictRegistry registry;
    registry.replaceConflicts({makeConflict("C1")});
    registry.registerConflict("C1");
    registry.confirmConflict("C1");

    QVERIFY(registry.confirmConflict("C1").isNoOp());
    QVERIFY(registry.registerConflict("C1").isNoOp());
    QCOMPARE(registry.conflict("C1")->lifecycleState, LifecycleState::CONFIRMED);
}

void TestConflictRegistry::unknownIdIsNotFound() {
    ConflictRegistry registry;
    registry.replaceConflicts({makeConflict("C1")});

    QTest::ignoreMessage(QtWarningMsg, QRegularExpression("Register rejected"));
    const TransitionResult result = registry.registerConflict("missing");

    QCOMPARE(result.getStatus(), TransitionResult::Status::NOT_FOUND);
    QVERIFY(result.isRejected());
    QCOMPARE(result.getRuleId(), QString("NOT_FOUND"));
    QCOMPARE(registry.conflict("C1")->lifecycleState, LifecycleState::DETECTED);
    QVERIFY(!registry.conflict("missing").has_value());
    QVERIFY(registry.getConflict("missing").contains("error"));
}

void TestConflictRegistry::allRegisteredTracksEveryConflict() {
    ConflictRegistry registry;
    QSignalSpy allSpy(&registry, &ConflictRegistry::allRegisteredChanged);
    registry.replaceConflicts({makeConflict("C1"), makeConflict("C2")});

    registry.registerConflict("C1");
    QVERIFY(!registry.allRegistered());
    QCOMPARE(allSpy.count(), 0);

    registry.registerConflict("C2");
    QVERIFY(registry.allRegistered());
    QCOMPARE(allSpy.count(), 1);
    QCOMPARE(allSpy.last().at(0).toBool(), true);

    // Confirmed conflicts remain registered
    registry.confirmConflict("C1");
    QVERIFY(registry.allRegistered());
    QCOMPARE(allSpy.count(), 1);
}

void TestConflictRegistry::replaceResetsLifecycle() {
    ConflictRegistry registry;
    registry.replaceConflicts({makeConflict("C1")});
    registry.registerConflict("C1");
    QVERIFY(registry.allRegistered());

    QSignalSpy replacedSpy(&registry, &ConflictRegistry::conflictsReplaced);
    const ReplaceSummary summary = registry.replaceConflicts({makeConflict("C1"), makeConflict("C2")});

    QCOMPARE(summary.previousCount, 1);
    QCOMPARE(summary.newCount, 2);
    QCOMPARE(summary.lifecycleCarriedForward, 0);
    QCOMPARE(registry.conflict("C1")->lifecycleState, LifecycleState::DETECTED);
    QVERIFY(!registry.allRegistered());
    QCOMPARE(replacedSpy.count(), 1);
}

void TestConflictRegistry::replacePreservesLifecycleWhenEnabled() {
    ConflictRegistry registry;
    registry.setPreserveLifecycleOnReplace(true);
    registry.replaceConflicts({makeConflict("C1"), makeConflict("C2")});
    registry.registerConflict("C1");
    registry.confirmConflict("C1");
    registry.registerConflict("C2");

    const ReplaceSummary summary = registry.replaceConflicts({makeConflict("C1"), makeConflict("C3")});

    QCOMPARE(summary.lifecycleCarriedForward, 1);
    QCOMPARE(registry.conflict("C1")->lifecycleState, LifecycleState::CONFIRMED);
    QCOMPARE(registry.conflict("C3")->lifecycleState, LifecycleState::DETECTED);
    QVERIFY(!registry.conflict("C2").has_value());
}

void TestConflictRegistry::replaceDropsDuplicateIds() {
    ConflictRegistry registry;
    Conflict shorter = makeConflict("C1", Severity::MEDIUM);
    shorter.overlapMinutes = 2;

    QTest::ignoreMessage(QtWarningMsg, QRegularExpression("Duplicate conflict id"));
    const ReplaceSummary summary = registry.replaceConflicts({makeConflict("C1"), shorter});

    QCOMPARE(summary.newCount, 1);
    QCOMPARE(registry.conflict("C1")->severity, Severity::HIGH);
    QCOMPARE(registry.conflict("C1")->overlapMinutes, 5);
}

void TestConflictRegistry::duplicateIdKeepsLongestOverlap() {
    ConflictRegistry registry;
    Conflict shorter = makeConflict("C1", Severity::MEDIUM);
    shorter.overlapMinutes = 3;
    Conflict longer = makeConflict("C1", Severity::HIGH);
    longer.overlapMinutes = 12;

    QTest::ignoreMessage(QtWarningMsg, QRegularExpression("Duplicate conflict id"));
    const ReplaceSummary summary = registry.replaceConflicts({shorter, makeConflict("C2"), longer});

    QCOMPARE(summary.newCount, 2);
    QCOMPARE(registry.conflicts().first().id, QString("C1"));
    QCOMPARE(registry.conflict("C1")->overlapMinutes, 12);
    QCOMPARE(registry.conflict("C1")->severity, Severity::HIGH);
    QCOMPARE(registry.conflict("C1")->lifecycleState, LifecycleState::DETECTED);
}

void TestConflictRegistry::acceptRecommendationRemovesIt() {
    ConflictRegistry registry;
    registry.replaceRecommendations({makeRecommendation("AR0"), makeRecommendation("AR1")});
    QSignalSpy acceptedSpy(&registry, &ConflictRegistry::recommendationAccepted);

    const TransitionResult result = registry.acceptRecommendation("AR0");

    QVERIFY(result.isApplied());
    QCOMPARE(registry.recommendationCount(), 1);
    QCOMPARE(registry.recommendations().first().id, QString("AR1"));
    QCOMPARE(acceptedSpy.count(), 1);
}

void TestConflictRegistry::acceptUnknownRecommendationFails() {
    ConflictRegistry registry;
    registry.replaceRecommendations({makeRecommendation("AR0")});

    QTest::ignoreMessage(QtWarningMsg, QRegularExpression("not active"));
    const TransitionResult result = registry.acceptRecommendation("AR9");

    QCOMPARE(result.getStatus(), TransitionResult::Status::NOT_FOUND);
    QCOMPARE(registry.recommendationCount(), 1);
}

void TestConflictRegistry::statisticsCountSeverities() {
    ConflictRegistry registry;
    registry.replaceConflicts({
        makeConflict("C1", Severity::HIGH),
        makeConflict("C2", Severity::MEDIUM),
        makeConflict("C3", Severity::LOW),
        makeConflict("C4", Severity::LOW)
    });
    registry.registerConflict("C1");
    registry.confirmConflict("C1");

    const QVariantMap stats = registry.getRegistryStatistics();
    QCOMPARE(stats.value("activeConflicts").toInt(), 4);
    QCOMPARE(stats.value("highSeverity").toInt(), 1);
    QCOMPARE(stats.value("mediumSeverity").toInt(), 1);
    QCOMPARE(stats.value("lowSeverity").toInt(), 2);
    QCOMPARE(stats.value("confirmed").toInt(), 1);
    QCOMPARE(stats.value("resolved").toInt(), 1);
    QCOMPARE(stats.value("detected").toInt(), 3);
    QCOMPARE(stats.value("allRegistered").toBool(), false);

    const QVariantList conflicts = registry.getConflicts();
    QCOMPARE(conflicts.size(), 4);
    QCOMPARE(conflicts.first().toMap().value("lifecycleState").toString(), QString("CONFIRMED"));
    QCOMPARE(conflicts.first().toMap().value("severity").toString(), QString("high"));
}

void TestConflictRegistry::clearEmptiesBothSets() {
    ConflictRegistry registry;
    registry.replaceConflicts({makeConflict("C1")});
    registry.replaceRecommendations({makeRecommendation("AR0")});

    registry.clear();

    QCOMPARE(registry.conflictCount(), 0);
    QCOMPARE(registry.recommendationCount(), 0);
    QVERIFY(!registry.allRegistered());
}

void TestConflictRegistry::concurrentActionsSeeWholeBatches() {
    constexpr int BATCH_SIZE = 6;
    constexpr int REPLACEMENTS = 300;
    constexpr int ACTION_THREADS = 4;

    ConflictRegistry registry;
    const QList<Conflict> batchA = makeBatch("A", BATCH_SIZE);
    const QList<Conflict> batchB = makeBatch("B", BATCH_SIZE);
    registry.replaceConflicts(batchA);

    std::atomic<bool> done{false};
    std::atomic<int> tornSnapshots{0};
    std::atomic<int> inconsistentResults{0};

    std::vector<std::thread> threads;

    // Operator actions against ids of both batches while the set is swapped underneath
    for (int t = 0; t < ACTION_THREADS; ++t) {
        threads.emplace_back([&, t]() {
            int round = 0;
            while (!done.load()) {
                const QString prefix = (round + t) % 2 == 0 ? "A" : "B";
                const QString id = QString("%1%2").arg(prefix).arg(round % BATCH_SIZE);

                const TransitionResult registered = registry.registerConflict(id);
                const TransitionResult confirmed = registry.confirmConflict(id);
                if (registered.isApplied() && registered.getToState() != "REGISTERED") {
                    inconsistentResults++;
                }
                if (confirmed.isApplied() && confirmed.getFromState() != "REGISTERED") {
                    inconsistentResults++;
                }
                round++;
            }
        });
    }

    // Reader: every snapshot must be exactly one batch
    threads.emplace_back([&]() {
        while (!done.load()) {
            const QList<Conflict> snapshot = registry.conflicts();
            if (snapshot.size() != BATCH_SIZE) {
                tornSnapshots++;
                continue;
            }
            const QChar prefix = snapshot.first().id.at(0);
            for (const Conflict& conflict : snapshot) {
                if (conflict.id.at(0) != prefix) {
                    tornSnapshots++;
                    break;
                }
            }

            const QVariantMap stats = registry.getRegistryStatistics();
            const int states = stats.value("detected").toInt() + stats.value("registered").toInt() +
                               stats.value("confirmed").toInt();
            if (states != stats.value("activeConflicts").toInt()) {
                inconsistentResults++;
            }
        }
    });

    for (int i = 0; i < REPLACEMENTS; ++i) {
        registry.replaceConflicts(i % 2 == 0 ? batchB : batchA);
    }
    done.store(true);

    for (std::thread& thread : threads) {
        thread.join();
    }

    QCOMPARE(tornSnapshots.load(), 0);
    QCOMPARE(inconsistentResults.load(), 0);
    QCOMPARE(registry.conflictCount(), BATCH_SIZE);

    const QVariantMap stats = registry.getRegistryStatistics();
    QCOMPARE(stats.value("batchesReplaced").toInt(), REPLACEMENTS + 1);
    QVERIFY(stats.value("totalConfirmations").toInt() <= stats.value("totalRegistrations").toInt());
}

QTEST_GUILESS_MAIN(TestConflictRegistry)
#include "tst_conflictregistry.moc"
