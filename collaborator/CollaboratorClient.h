#pragma once

#include "../analysis/AnalysisBatch.h"
#include <QObject>
#include <QString>
#include <QUrl>
#include <QHash>
#include <QJsonArray>
#include <QJsonObject>
#include <QByteArray>
#include <QVariantMap>
#include <QDebug>

class QNetworkAccessManager;
class QNetworkReply;

namespace RailConflict::Collaborator {

// HTTP client for the schedule-generation and analysis services.
// Only complete batches are delivered; a reply superseded by a newer request to the
// same endpoint is discarded.
class CollaboratorClient : public QObject {
    Q_OBJECT
    Q_PROPERTY(int pendingRequests READ pendingRequests NOTIFY pendingRequestsChanged)
    Q_PROPERTY(QUrl baseUrl READ baseUrl CONSTANT)

public:
    static constexpr const char* SCHEDULE_ENDPOINT = "/run-simulation";
    static constexpr const char* ANALYSIS_ENDPOINT = "/analyze-scenario";
    static constexpr const char* HEALTH_ENDPOINT = "/health";
    static constexpr const char* DEFAULT_START_TIME = "2025-09-19T08:00:00";

    explicit CollaboratorClient(const QUrl& baseUrl, int timeoutMs, QObject* parent = nullptr);
    ~CollaboratorClient();

    QUrl baseUrl() const { return m_baseUrl; }
    int pendingRequests() const { return m_pending.size(); }

    Q_INVOKABLE void fetchSchedule(int numTrains = 10, const QString& startTimeIso = DEFAULT_START_TIME);
    Q_INVOKABLE void requestAnalysis(const QJsonObject& scenario);
    Q_INVOKABLE void checkHealth();
    Q_INVOKABLE QVariantMap getClientStatistics() const;

    // Response decoding, independent of the transport
    static bool decodeScheduleBody(const QByteArray& body, QJsonArray* schedule, QString* error);
    static bool decodeAnalysisBody(const QByteArray& body, Analysis::AnalysisBatch* batch, QString* error);
    // Scenario files sent to the analysis service must be a JSON object
    static bool decodeScenarioBody(const QByteArray& body, QJsonObject* scenario, QString* error);

signals:
    void pendingRequestsChanged();
    void scheduleReceived(const QJsonArray& schedule);
    void analysisReceived(const RailConflict::Analysis::AnalysisBatch& batch);
    void healthChecked(bool healthy);
    void fetchFailed(const QString& endpoint, const QString& error);

private:
    QUrl endpointUrl(const QString& endpoint) const;
    QNetworkReply* post(const QString& endpoint, const QJsonObject& body);
    void track(QNetworkReply* reply, const QString& endpoint);
    void handleReply(QNetworkReply* reply);
    bool readReply(QNetworkReply* reply, QByteArray* body, QString* error) const;

private:
    QNetworkAccessManager* m_network;
    QUrl m_baseUrl;
    int m_timeoutMs;

    QHash<QNetworkReply*, quint64> m_pending;       // reply -> sequence
    QHash<QString, quint64> m_latestSequence;       // endpoint -> newest issued sequence
    quint64 m_nextSequence = 1;

    // Statistics
    int m_totalRequests = 0;
    int m_failedRequests = 0;
    int m_discardedReplies = 0;
};

} // namespace RailConflict::Collaborator
