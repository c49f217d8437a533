#pragma once

#include <QString>
#include <QUrl>
#include <QVariantMap>
#include <QJsonObject>

namespace RailConflict::Config {

struct EngineConfig {
    static constexpr const char* DEFAULT_COLLABORATOR_URL = "http://127.0.0.1:8000";
    static constexpr const char* COLLABORATOR_URL_ENV = "RAILCONFLICT_COLLABORATOR_URL";
    static constexpr int DEFAULT_COLLABORATOR_TIMEOUT_MS = 12000;
    static constexpr int DEFAULT_HIGH_THRESHOLD_MINUTES = 5;
    static constexpr int DEFAULT_MEDIUM_THRESHOLD_MINUTES = 2;
    static constexpr int DEFAULT_RECOMMENDATION_CONFIDENCE = 75;
    static constexpr int MIN_COLLABORATOR_TIMEOUT_MS = 100;
    static constexpr int MAX_COLLABORATOR_TIMEOUT_MS = 120000;

    QUrl collaboratorBaseUrl = QUrl(DEFAULT_COLLABORATOR_URL);
    int collaboratorTimeoutMs = DEFAULT_COLLABORATOR_TIMEOUT_MS;
    int highThresholdMinutes = DEFAULT_HIGH_THRESHOLD_MINUTES;
    int mediumThresholdMinutes = DEFAULT_MEDIUM_THRESHOLD_MINUTES;
    int defaultConfidence = DEFAULT_RECOMMENDATION_CONFIDENCE;
    bool preserveLifecycleOnReplace = false;

    // Missing keys keep their current value. Returns false if the file is unreadable or invalid.
    bool loadFromFile(const QString& path);
    bool applyJson(const QJsonObject& root);
    void applyEnvironment();

    QVariantMap toVariantMap() const;
};

} // namespace RailConflict::Config
