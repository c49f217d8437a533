#include "SeverityClassifier.h"
#include <QDebug>

namespace RailConflict::Detection {

SeverityClassifier::SeverityClassifier(const SeverityThresholds& thresholds)
    : m_thresholds(thresholds)
{
    if (m_thresholds.mediumMinutes > m_thresholds.highMinutes) {
        qWarning() << "SeverityClassifier: medium threshold" << m_thresholds.mediumMinutes
                   << "exceeds high threshold" << m_thresholds.highMinutes << "- clamping";
        m_thresholds.mediumMinutes = m_thresholds.highMinutes;
    }
}

Severity SeverityClassifier::severityFor(int overlapMinutes) const {
    if (overlapMinutes >= m_thresholds.highMinutes) {
        return Severity::HIGH;
    }
    if (overlapMinutes >= m_thresholds.mediumMinutes) {
        return Severity::MEDIUM;
    }
    return Severity::LOW;
}

QString SeverityClassifier::suggestedActionFor(Severity severity) const {
    return severity == Severity::HIGH ? QString(HOLD_ACTION) : QString(REDUCE_SPEED_ACTION);
}

Classification SeverityClassifier::classify(int overlapMinutes) const {
    Classification classification;
    classification.severity = severityFor(overlapMinutes);
    classification.suggestedAction = suggestedActionFor(classification.severity);
    return classification;
}

QString severityToString(Severity severity) {
    switch (severity) {
        case Severity::HIGH:   return "high";
        case Severity::MEDIUM: return "medium";
        case Severity::LOW:    return "low";
        default:               return "low";
    }
}

Severity stringToSeverity(const QString& severityStr) {
    const QString normalized = severityStr.trimmed().toLower();
    if (normalized == "high") return Severity::HIGH;
    if (normalized == "medium") return Severity::MEDIUM;
    return Severity::LOW;
}

} // namespace RailConflict::Detection
