#include "ScheduleNormalizer.h"
#include <QDateTime>
#include <QHash>
#include <QDebug>
#include <cmath>

namespace RailConflict::Schedule {

QString makeBlockKey(const QString& fromBlock, const QString& toBlock) {
    const QString from = fromBlock.trimmed();
    const QString to = toBlock.trimmed();
    if (from.isEmpty() || to.isEmpty()) {
        return QString();
    }
    return QString("%1->%2").arg(from, to);
}

QString RawStop::blockKey() const {
    return makeBlockKey(fromBlock, toBlock);
}

QVariantMap NormalizationReport::toVariantMap() const {
    return QVariantMap{
        {"totalRows", totalRows},
        {"accepted", accepted},
        {"skipped", skipped()},
        {"missingTrain", missingTrain},
        {"missingTimestamp", missingTimestamp},
        {"emptyBlock", emptyBlock},
        {"nonPositiveDuration", nonPositiveDuration}
    };
}

NormalizationResult normalizeStops(const QList<RawStop>& stops) {
    NormalizationResult result;
    result.report.totalRows = stops.size();

    // Group per train, keeping first-seen train order
    QStringList trainOrder;
    QHash<QString, QList<const RawStop*>> byTrain;

    for (const RawStop& stop : stops) {
        if (!stop.trainId.has_value() || stop.trainId->trimmed().isEmpty()) {
            result.report.missingTrain++;
            continue;
        }
        const QString trainId = stop.trainId->trimmed();
        if (!byTrain.contains(trainId)) {
            trainOrder.append(trainId);
        }
        byTrain[trainId].append(&stop);
    }

    for (const QString& trainId : trainOrder) {
        for (const RawStop* stop : byTrain.value(trainId)) {
            if (!stop->arriveTimestamp.has_value() || !stop->departTimestamp.has_value()) {
                result.report.missingTimestamp++;
                continue;
            }

            const QString key = stop->blockKey();
            if (key.isEmpty()) {
                result.report.emptyBlock++;
                continue;
            }

            const qint64 start = *stop->arriveTimestamp;
            const qint64 end = *stop->departTimestamp;
            if (end <= start) {
                result.report.nonPositiveDuration++;
                continue;
            }

            Leg leg;
            leg.trainId = trainId;
            leg.blockKey = key;
            leg.start = start;
            leg.end = end;
            result.legs.append(leg);
        }
    }

    result.report.accepted = result.legs.size();

    if (result.report.skipped() > 0) {
        qWarning() << "ScheduleNormalizer: Skipped" << result.report.skipped() << "of"
                   << result.report.totalRows << "rows"
                   << "(missing train:" << result.report.missingTrain
                   << "missing timestamp:" << result.report.missingTimestamp
                   << "empty block:" << result.report.emptyBlock
                   << "non-positive duration:" << result.report.nonPositiveDuration << ")";
    }

    return result;
}

namespace {
constexpr double MAX_EPOCH_MS = 1.0e15;
}

std::optional<qint64> parseTimestamp(const QJsonValue& value) {
    if (value.isDouble()) {
        const double raw = value.toDouble();
        // Beyond roughly +-30000 years the value is not an epoch timestamp
        if (!std::isfinite(raw) || std::fabs(raw) > MAX_EPOCH_MS) {
            return std::nullopt;
        }
        return static_cast<qint64>(std::llround(raw));
    }

    if (value.isString()) {
        const QString text = value.toString().trimmed();
        if (text.isEmpty()) {
            return std::nullopt;
        }

        QDateTime parsed = QDateTime::fromString(text, Qt::ISODateWithMs);
        if (!parsed.isValid()) {
            parsed = QDateTime::fromString(text, Qt::ISODate);
        }
        if (!parsed.isValid()) {
            return std::nullopt;
        }
        // Schedule times without an offset are wall-clock times of the network
        if (parsed.timeSpec() == Qt::LocalTime) {
            parsed.setTimeSpec(Qt::UTC);
        }
        return parsed.toMSecsSinceEpoch();
    }

    return std::nullopt;
}

RawStop parseStopObject(const QJsonObject& stopObject) {
    RawStop stop;

    const QJsonValue trainValue = stopObject.value("train_id");
    if (trainValue.isString() && !trainValue.toString().trimmed().isEmpty()) {
        stop.trainId = trainValue.toString().trimmed();
    } else if (trainValue.isDouble()) {
        stop.trainId = QString::number(trainValue.toInteger());
    }

    stop.fromBlock = stopObject.value("from_code").toString();
    stop.toBlock = stopObject.value("to_code").toString();
    stop.arriveTimestamp = parseTimestamp(stopObject.value("arrive_time_iso"));
    stop.departTimestamp = parseTimestamp(stopObject.value("depart_time_iso"));

    return stop;
}

QList<RawStop> parseScheduleJson(const QJsonArray& schedule) {
    QList<RawStop> stops;
    stops.reserve(schedule.size());

    for (const QJsonValue& row : schedule) {
        // Non-object rows still count as rows; they carry no train id
        stops.append(row.isObject() ? parseStopObject(row.toObject()) : RawStop());
    }

    return stops;
}

} // namespace RailConflict::Schedule
