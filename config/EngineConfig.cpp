#include "EngineConfig.h"
#include <QFile>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QtGlobal>
#include <QDebug>

namespace RailConflict::Config {

bool EngineConfig::loadFromFile(const QString& path) {
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        qWarning() << "EngineConfig: Cannot open config file:" << path << "- using defaults";
        return false;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);

    if (parseError.error != QJsonParseError::NoError) {
        qWarning() << "EngineConfig: Invalid JSON in" << path << ":" << parseError.errorString();
        return false;
    }
    if (!doc.isObject()) {
        qWarning() << "EngineConfig: Config root must be an object:" << path;
        return false;
    }

    return applyJson(doc.object());
}

bool EngineConfig::applyJson(const QJsonObject& root) {
    bool valid = true;

    const QJsonObject collaborator = root.value("collaborator").toObject();
    if (collaborator.contains("baseUrl")) {
        const QUrl url(collaborator.value("baseUrl").toString(), QUrl::StrictMode);
        if (url.isValid() && !url.scheme().isEmpty() && !url.host().isEmpty()) {
            collaboratorBaseUrl = url;
        } else {
            qWarning() << "EngineConfig: Ignoring invalid collaborator.baseUrl" << collaborator.value("baseUrl");
            valid = false;
        }
    }
    if (collaborator.contains("timeoutMs")) {
        collaboratorTimeoutMs = qBound(MIN_COLLABORATOR_TIMEOUT_MS,
                                       collaborator.value("timeoutMs").toInt(collaboratorTimeoutMs),
                                       MAX_COLLABORATOR_TIMEOUT_MS);
    }

    const QJsonObject detection = root.value("detection").toObject();
    const int high = detection.value("highThresholdMinutes").toInt(highThresholdMinutes);
    const int medium = detection.value("mediumThresholdMinutes").toInt(mediumThresholdMinutes);
    if (medium < 1 || high < medium) {
        qWarning() << "EngineConfig: Ignoring inconsistent severity thresholds high =" << high
                   << "medium =" << medium;
        valid = false;
    } else {
        highThresholdMinutes = high;
        mediumThresholdMinutes = medium;
    }

    const QJsonObject recommendations = root.value("recommendations").toObject();
    if (recommendations.contains("defaultConfidence")) {
        defaultConfidence = qBound(0, recommendations.value("defaultConfidence").toInt(defaultConfidence), 100);
    }

    const QJsonObject registry = root.value("registry").toObject();
    if (registry.contains("preserveLifecycleOnReplace")) {
        preserveLifecycleOnReplace = registry.value("preserveLifecycleOnReplace").toBool(preserveLifecycleOnReplace);
    }

    return valid;
}

void EngineConfig::applyEnvironment() {
    const QString url = qEnvironmentVariable(COLLABORATOR_URL_ENV);
    if (url.isEmpty()) {
        return;
    }

    const QUrl parsed(url, QUrl::StrictMode);
    if (parsed.isValid() && !parsed.host().isEmpty()) {
        collaboratorBaseUrl = parsed;
        qDebug() << "EngineConfig: Collaborator URL overridden from environment:" << parsed.toString();
    } else {
        qWarning() << "EngineConfig: Ignoring invalid" << COLLABORATOR_URL_ENV << "value" << url;
    }
}

QVariantMap EngineConfig::toVariantMap() const {
    return QVariantMap{
        {"collaboratorBaseUrl", collaboratorBaseUrl.toString()},
        {"collaboratorTimeoutMs", collaboratorTimeoutMs},
        {"highThresholdMinutes", highThresholdMinutes},
        {"mediumThresholdMinutes", mediumThresholdMinutes},
        {"defaultConfidence", defaultConfidence},
        {"preserveLifecycleOnReplace", preserveLifecycleOnReplace}
    };
}

} // namespace RailConflict::Config
