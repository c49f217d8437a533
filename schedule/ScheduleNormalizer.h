#pragma once

#include <QString>
#include <QStringList>
#include <QList>
#include <QVariantMap>
#include <QJsonArray>
#include <QJsonObject>
#include <optional>

namespace RailConflict::Schedule {

// One row of a schedule batch. Every field may be absent.
struct RawStop {
    std::optional<QString> trainId;
    QString fromBlock;
    QString toBlock;
    std::optional<qint64> arriveTimestamp;   // epoch ms
    std::optional<qint64> departTimestamp;   // epoch ms

    QString blockKey() const;
};

// One train's occupancy of one directed block. end > start always holds.
struct Leg {
    QString trainId;
    QString blockKey;
    qint64 start = 0;
    qint64 end = 0;

    qint64 durationMs() const { return end - start; }
};

struct NormalizationReport {
    int totalRows = 0;
    int accepted = 0;
    int missingTrain = 0;
    int missingTimestamp = 0;
    int emptyBlock = 0;
    int nonPositiveDuration = 0;

    int skipped() const { return totalRows - accepted; }
    QVariantMap toVariantMap() const;
};

struct NormalizationResult {
    QList<Leg> legs;
    NormalizationReport report;
};

QString makeBlockKey(const QString& fromBlock, const QString& toBlock);

// Never throws. Invalid rows are dropped and counted in the report.
NormalizationResult normalizeStops(const QList<RawStop>& stops);

// Schedule source rows: train_id, from_code, to_code, arrive_time_iso, depart_time_iso.
// Timestamps are ISO-8601 strings or integral epoch milliseconds.
QList<RawStop> parseScheduleJson(const QJsonArray& schedule);
RawStop parseStopObject(const QJsonObject& stopObject);
std::optional<qint64> parseTimestamp(const QJsonValue& value);

} // namespace RailConflict::Schedule
