#include <QCoreApplication>
#include <QCommandLineParser>
#include <QCommandLineOption>
#include <QEventLoop>
#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonValue>
#include <QTextStream>
#include <QDateTime>
#include <QDebug>
#include <optional>
#include "config/EngineConfig.h"
#include "session/ConflictSessionService.h"
#include "collaborator/CollaboratorClient.h"

using namespace RailConflict;

namespace {

enum ExitCode {
    EXIT_OK = 0,
    EXIT_INPUT_FAILED = 1,
    EXIT_UNREGISTERED = 2
};

bool readFile(const QString& path, QByteArray* contents) {
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        qCritical() << "Cannot open" << path << ":" << file.errorString();
        return false;
    }
    *contents = file.readAll();
    return true;
}

bool waitForHealth(Collaborator::CollaboratorClient* client) {
    QEventLoop loop;
    bool healthy = false;

    QObject::connect(client, &Collaborator::CollaboratorClient::healthChecked,
                     &loop, [&](bool ok) { healthy = ok; loop.quit(); }, Qt::QueuedConnection);

    client->checkHealth();
    loop.exec();
    return healthy;
}

// Blocks on the collaborator until a complete batch arrives or the fetch fails
bool waitForCollaborator(Collaborator::CollaboratorClient* client) {
    QEventLoop loop;
    bool succeeded = false;

    QObject::connect(client, &Collaborator::CollaboratorClient::scheduleReceived,
                     &loop, [&](const QJsonArray&) { succeeded = true; loop.quit(); }, Qt::QueuedConnection);
    QObject::connect(client, &Collaborator::CollaboratorClient::analysisReceived,
                     &loop, [&](const Analysis::AnalysisBatch&) { succeeded = true; loop.quit(); }, Qt::QueuedConnection);
    QObject::connect(client, &Collaborator::CollaboratorClient::fetchFailed,
                     &loop, [&](const QString&, const QString&) { loop.quit(); }, Qt::QueuedConnection);

    loop.exec();
    return succeeded;
}

void printConflicts(QTextStream& out, const Session::ConflictSessionService& session) {
    const QList<Registry::Conflict> conflicts = session.conflicts();
    out << "Conflicts (" << conflicts.size() << ")\n";
    if (conflicts.isEmpty()) {
        out << "  No conflicts detected - all tracks clear\n";
        return;
    }

    for (const Registry::Conflict& conflict : conflicts) {
        out << "  [" << Detection::severityToString(conflict.severity).toUpper() << "] "
            << conflict.trainA << " vs " << conflict.trainB
            << " at " << conflict.conflictPoint()
            << " from " << QDateTime::fromMSecsSinceEpoch(conflict.overlapStart, Qt::UTC).toString(Qt::ISODate)
            << " for " << conflict.overlapMinutes << " min"
            << " | " << Registry::lifecycleStateToString(conflict.lifecycleState) << "\n"
            << "      id: " << conflict.id << "\n"
            << "      action: " << conflict.suggestedAction << "\n";
    }
}

void printRecommendations(QTextStream& out, const Session::ConflictSessionService& session) {
    const QList<Analysis::Recommendation> recommendations = session.recommendations();
    out << "Recommendations (" << recommendations.size() << ")\n";
    for (const Analysis::Recommendation& recommendation : recommendations) {
        out << "  [" << Analysis::recommendationTypeToString(recommendation.type) << "] "
            << recommendation.description
            << " - Impact: " << recommendation.impact
            << " (Confidence: " << recommendation.confidence << "%)\n";
    }

    if (!session.analysisText().isEmpty()) {
        out << "Analysis\n  " << session.analysisText() << "\n";
    }

    const auto structure = session.analysisStructure();
    if (structure) {
        out << "Detailed analysis\n";
        for (const Analysis::BlockDecision& entry : structure->conflictsAndDecisions) {
            out << "  " << entry.block << ": " << entry.trains.join(" vs ") << " -> "
                << QJsonDocument(QJsonObject::fromVariantMap(entry.decision)).toJson(QJsonDocument::Compact) << "\n";
        }
        out << "  Reasoning: " << structure->reasoning << "\n"
            << "  Rerouting/Staggering: " << structure->reroutingOrStaggering << "\n"
            << "  KPI impact: throughput " << structure->kpiImpact.throughput
            << ", delay " << structure->kpiImpact.averageDelay
            << ", safety " << structure->kpiImpact.safety << "\n";
        for (const QString& line : structure->eventLog) {
            out << "  - " << line << "\n";
        }
        out << "  Fairness: " << structure->fairness << "\n"
            << "  Optimization: " << structure->optimizationStrategy << "\n";
    }
}

void printStatistics(QTextStream& out, const Session::ConflictSessionService& session) {
    const QVariantMap statistics = session.getStatistics();
    out << "Active: " << statistics.value("activeConflicts").toInt()
        << "  Registered: " << statistics.value("registered").toInt()
        << "  Resolved: " << statistics.value("resolved").toInt()
        << "  Rows skipped: " << statistics.value("totalRowsSkipped").toInt() << "\n";
    out << (session.allRegistered() ? "All conflicts registered - ready to proceed\n"
                                    : "Conflicts pending registration\n");
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("railconflict");
    QCoreApplication::setApplicationVersion("1.0.0");

    QCommandLineParser parser;
    parser.setApplicationDescription("Detects overlapping block occupancy between scheduled trains");
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption scheduleOption("schedule", "Schedule batch (JSON array or {\"schedule\": [...]}).", "file");
    QCommandLineOption analysisOption("analysis", "Analysis batch from the analysis service.", "file");
    QCommandLineOption configOption("config", "Engine configuration file.", "file");
    QCommandLineOption fetchOption("fetch", "Fetch the schedule from the schedule service.");
    QCommandLineOption analyzeOption("analyze", "Send a scenario to the analysis service.", "file");
    QCommandLineOption numTrainsOption("num-trains", "Trains to request with --fetch.", "count", "10");
    QCommandLineOption startOption("start", "Scenario start time (ISO-8601) for --fetch.", "time",
                                   Collaborator::CollaboratorClient::DEFAULT_START_TIME);
    QCommandLineOption referenceEpochOption("reference-epoch",
                                            "Scenario start (ISO-8601 or epoch ms) that analysis minute offsets are anchored at. Defaults to --start.",
                                            "time");
    QCommandLineOption healthOption("health", "Check collaborator health before any request.");
    QCommandLineOption registerAllOption("register-all", "Register every active conflict.");
    QCommandLineOption confirmAllOption("confirm-all", "Confirm every registered conflict.");

    parser.addOptions({scheduleOption, analysisOption, configOption, fetchOption, analyzeOption,
                       numTrainsOption, startOption, referenceEpochOption, healthOption,
                       registerAllOption, confirmAllOption});
    parser.process(app);

    Config::EngineConfig config;
    if (parser.isSet(configOption) && !config.loadFromFile(parser.value(configOption))) {
        qWarning() << "Continuing with default configuration";
    }
    config.applyEnvironment();

    Session::ConflictSessionService session(config);
    Collaborator::CollaboratorClient client(config.collaboratorBaseUrl, config.collaboratorTimeoutMs);
    session.attachCollaborator(&client);

    bool inputFailed = false;

    const QString referenceText = parser.isSet(referenceEpochOption) ? parser.value(referenceEpochOption)
                                                                     : parser.value(startOption);
    bool numericReference = false;
    const qint64 referenceMs = referenceText.toLongLong(&numericReference);
    const auto reference = numericReference ? std::optional<qint64>(referenceMs)
                                            : Schedule::parseTimestamp(QJsonValue(referenceText));
    if (reference) {
        session.setAnalysisReferenceEpoch(*reference);
    } else {
        qCritical() << "Invalid reference epoch:" << referenceText;
        inputFailed = true;
    }

    if (parser.isSet(healthOption)) {
        const bool healthy = waitForHealth(&client);
        qInfo() << "Collaborator at" << client.baseUrl().toString() << (healthy ? "is healthy" : "is unavailable");
        if (!healthy) {
            inputFailed = true;
        }
    }

    if (parser.isSet(fetchOption)) {
        client.fetchSchedule(parser.value(numTrainsOption).toInt(), parser.value(startOption));
        if (!waitForCollaborator(&client)) {
            qCritical() << "Schedule fetch failed:" << session.lastError();
            inputFailed = true;
        }
    }

    if (parser.isSet(scheduleOption)) {
        QByteArray contents;
        QJsonArray schedule;
        QString error;
        if (!readFile(parser.value(scheduleOption), &contents)) {
            inputFailed = true;
        } else if (!Collaborator::CollaboratorClient::decodeScheduleBody(contents, &schedule, &error)) {
            qCritical() << "Unusable schedule file:" << error;
            inputFailed = true;
        } else {
            session.applySchedule(schedule);
        }
    }

    if (parser.isSet(analyzeOption)) {
        QByteArray contents;
        QJsonObject scenario;
        QString error;
        if (!readFile(parser.value(analyzeOption), &contents)) {
            inputFailed = true;
        } else if (!Collaborator::CollaboratorClient::decodeScenarioBody(contents, &scenario, &error)) {
            qCritical() << "Unusable scenario file:" << error;
            inputFailed = true;
        } else {
            client.requestAnalysis(scenario);
            if (!waitForCollaborator(&client)) {
                qCritical() << "Analysis request failed:" << session.lastError();
                inputFailed = true;
            }
        }
    }

    if (parser.isSet(analysisOption)) {
        QByteArray contents;
        Analysis::AnalysisBatch batch;
        QString error;
        if (!readFile(parser.value(analysisOption), &contents)) {
            inputFailed = true;
        } else if (!Collaborator::CollaboratorClient::decodeAnalysisBody(contents, &batch, &error)) {
            qCritical() << "Unusable analysis file:" << error;
            inputFailed = true;
        } else {
            session.applyAnalysisBatch(batch);
        }
    }

    const QList<Registry::Conflict> active = session.conflicts();
    if (parser.isSet(registerAllOption) || parser.isSet(confirmAllOption)) {
        for (const Registry::Conflict& conflict : active) {
            session.registerConflict(conflict.id);
        }
    }
    if (parser.isSet(confirmAllOption)) {
        for (const Registry::Conflict& conflict : active) {
            session.confirmConflict(conflict.id);
        }
    }

    QTextStream out(stdout);
    printConflicts(out, session);
    printRecommendations(out, session);
    printStatistics(out, session);
    out.flush();

    if (inputFailed) {
        return EXIT_INPUT_FAILED;
    }
    if (!active.isEmpty() && !session.allRegistered()) {
        return EXIT_UNREGISTERED;
    }
    return EXIT_OK;
}
