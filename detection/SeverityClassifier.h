#pragma once

#include <QString>

namespace RailConflict::Detection {

enum class Severity {
    LOW,
    MEDIUM,
    HIGH
};

struct Classification {
    Severity severity = Severity::LOW;
    QString suggestedAction;
};

// Overlap-minute thresholds. Defaults are the operational headway rules.
struct SeverityThresholds {
    int highMinutes = 5;
    int mediumMinutes = 2;
};

class SeverityClassifier {
public:
    static constexpr const char* HOLD_ACTION = "Hold lower-priority train for headway";
    static constexpr const char* REDUCE_SPEED_ACTION = "Reduce speed for minor deconfliction";

    SeverityClassifier() = default;
    explicit SeverityClassifier(const SeverityThresholds& thresholds);

    Classification classify(int overlapMinutes) const;
    Severity severityFor(int overlapMinutes) const;
    QString suggestedActionFor(Severity severity) const;

    const SeverityThresholds& thresholds() const { return m_thresholds; }

private:
    SeverityThresholds m_thresholds;
};

QString severityToString(Severity severity);
Severity stringToSeverity(const QString& severityStr);

} // namespace RailConflict::Detection
