#include "CollaboratorClient.h"
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QJsonDocument>
#include <QJsonParseError>

namespace RailConflict::Collaborator {

CollaboratorClient::CollaboratorClient(const QUrl& baseUrl, int timeoutMs, QObject* parent)
    : QObject(parent)
    , m_network(new QNetworkAccessManager(this))
    , m_baseUrl(baseUrl)
    , m_timeoutMs(timeoutMs)
{
    if (!m_baseUrl.isValid()) {
        qCritical() << "CollaboratorClient: Invalid base URL" << baseUrl;
    }
}

CollaboratorClient::~CollaboratorClient() {
    // Replies are children of the manager; drop bookkeeping so no signals fire late
    for (auto it = m_pending.begin(); it != m_pending.end(); ++it) {
        it.key()->disconnect(this);
        it.key()->abort();
    }
    m_pending.clear();
}

void CollaboratorClient::fetchSchedule(int numTrains, const QString& startTimeIso) {
    QJsonObject body{
        {"num_trains", qMax(0, numTrains)},
        {"start_time_iso", startTimeIso}
    };
    track(post(SCHEDULE_ENDPOINT, body), SCHEDULE_ENDPOINT);
}

void CollaboratorClient::requestAnalysis(const QJsonObject& scenario) {
    track(post(ANALYSIS_ENDPOINT, scenario), ANALYSIS_ENDPOINT);
}

void CollaboratorClient::checkHealth() {
    QNetworkRequest request(endpointUrl(HEALTH_ENDPOINT));
    request.setTransferTimeout(m_timeoutMs);
    track(m_network->get(request), HEALTH_ENDPOINT);
}

QVariantMap CollaboratorClient::getClientStatistics() const {
    return QVariantMap{
        {"baseUrl", m_baseUrl.toString()},
        {"timeoutMs", m_timeoutMs},
        {"pendingRequests", m_pending.size()},
        {"totalRequests", m_totalRequests},
        {"failedRequests", m_failedRequests},
        {"discardedReplies", m_discardedReplies}
    };
}

QUrl CollaboratorClient::endpointUrl(const QString& endpoint) const {
    QUrl url = m_baseUrl;
    QString path = url.path();
    while (path.endsWith('/')) {
        path.chop(1);
    }
    url.setPath(path + endpoint);
    return url;
}

QNetworkReply* CollaboratorClient::post(const QString& endpoint, const QJsonObject& body) {
    const QUrl url = endpointUrl(endpoint);

    QNetworkRequest request(url);
    request.setHeader(QNetworkRequest::ContentTypeHeader, "application/json");
    request.setTransferTimeout(m_timeoutMs);

    qDebug() << "CollaboratorClient: POST" << url.toString();
    return m_network->post(request, QJsonDocument(body).toJson(QJsonDocument::Compact));
}

void CollaboratorClient::track(QNetworkReply* reply, const QString& endpoint) {
    const quint64 sequence = m_nextSequence++;
    m_totalRequests++;

    reply->setProperty("endpoint", endpoint);
    m_pending.insert(reply, sequence);
    m_latestSequence.insert(endpoint, sequence);

    connect(reply, &QNetworkReply::finished, this, [this, reply]() { handleReply(reply); });
    emit pendingRequestsChanged();
}

bool CollaboratorClient::readReply(QNetworkReply* reply, QByteArray* body, QString* error) const {
    const int httpStatus = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();

    if (reply->error() != QNetworkReply::NoError) {
        *error = httpStatus > 0
            ? QString("HTTP %1: %2").arg(httpStatus).arg(reply->errorString())
            : reply->errorString();
        return false;
    }
    if (httpStatus != 0 && (httpStatus < 200 || httpStatus >= 300)) {
        *error = QString("HTTP %1").arg(httpStatus);
        return false;
    }

    *body = reply->readAll();
    return true;
}

void CollaboratorClient::handleReply(QNetworkReply* reply) {
    reply->deleteLater();

    if (!m_pending.contains(reply)) {
        return;
    }
    const quint64 sequence = m_pending.take(reply);
    const QString endpoint = reply->property("endpoint").toString();
    emit pendingRequestsChanged();

    if (sequence != m_latestSequence.value(endpoint)) {
        m_discardedReplies++;
        qDebug() << "CollaboratorClient: Discarding stale reply from" << endpoint << "sequence" << sequence;
        return;
    }

    QByteArray body;
    QString error;
    if (!readReply(reply, &body, &error)) {
        m_failedRequests++;
        if (endpoint == HEALTH_ENDPOINT) {
            emit healthChecked(false);
        }
        qCritical() << "CollaboratorClient:" << endpoint << "failed:" << error;
        emit fetchFailed(endpoint, error);
        return;
    }

    if (endpoint == SCHEDULE_ENDPOINT) {
        QJsonArray schedule;
        if (!decodeScheduleBody(body, &schedule, &error)) {
            m_failedRequests++;
            qCritical() << "CollaboratorClient: Unusable schedule response:" << error;
            emit fetchFailed(endpoint, error);
            return;
        }
        emit scheduleReceived(schedule);
    } else if (endpoint == ANALYSIS_ENDPOINT) {
        Analysis::AnalysisBatch batch;
        if (!decodeAnalysisBody(body, &batch, &error)) {
            m_failedRequests++;
            qCritical() << "CollaboratorClient: Unusable analysis response:" << error;
            emit fetchFailed(endpoint, error);
            return;
        }
        emit analysisReceived(batch);
    } else if (endpoint == HEALTH_ENDPOINT) {
        const QJsonObject status = QJsonDocument::fromJson(body).object();
        emit healthChecked(status.value("status").toString() == "ok");
    }
}

bool CollaboratorClient::decodeScheduleBody(const QByteArray& body, QJsonArray* schedule, QString* error) {
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(body, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        *error = QString("Invalid JSON: %1").arg(parseError.errorString());
        return false;
    }

    // Bare array or {"schedule": [...]}
    if (doc.isArray()) {
        *schedule = doc.array();
        return true;
    }

    const QJsonObject root = doc.object();
    if (root.contains("error")) {
        *error = root.value("error").toString();
        return false;
    }
    if (!root.value("schedule").isArray()) {
        *error = "Response has no schedule array";
        return false;
    }

    *schedule = root.value("schedule").toArray();
    return true;
}

bool CollaboratorClient::decodeAnalysisBody(const QByteArray& body, Analysis::AnalysisBatch* batch, QString* error) {
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(body, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        *error = QString("Invalid JSON: %1").arg(parseError.errorString());
        return false;
    }
    if (!doc.isObject()) {
        *error = "Analysis response is not an object";
        return false;
    }

    const QJsonObject root = doc.object();
    if (root.contains("error")) {
        *error = root.value("error").toString();
        return false;
    }

    *batch = Analysis::AnalysisBatch::fromJson(root);
    return true;
}

bool CollaboratorClient::decodeScenarioBody(const QByteArray& body, QJsonObject* scenario, QString* error) {
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(body, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        *error = QString("Invalid JSON: %1").arg(parseError.errorString());
        return false;
    }
    if (!doc.isObject()) {
        *error = "Scenario is not an object";
        return false;
    }

    *scenario = doc.object();
    return true;
}

} // namespace RailConflict::Collaborator
