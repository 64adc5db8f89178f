#include "cutline/event_validator.hpp"

#include "cutline/common.hpp"

#include <QJsonObject>
#include <QLocale>
#include <QDebug>

#include <cmath>

namespace cutline {

namespace {

// Alias names under which feeds deliver the absolute instant, in priority order.
const char *const kTimestampKeys[] = {"timestamp", "datetime", "dateTime"};

QString numberToString(double v)
{
    return QString::number(v, 'g', QLocale::FloatingPointShortest);
}

// Non-empty strings and non-zero numbers count as "present"; anything else
// (missing, null, empty, 0, bool, object) makes the caller use its default.
std::optional<QString> presentText(const QJsonValue &v)
{
    if (v.isString()) {
        const QString s = v.toString();
        if (!s.isEmpty())
            return s;
        return std::nullopt;
    }
    if (v.isDouble()) {
        const double d = v.toDouble();
        if (d != 0.0 && std::isfinite(d))
            return numberToString(d);
    }
    return std::nullopt;
}

double readConfidence(const QJsonValue &v)
{
    if (v.isDouble()) {
        const double d = v.toDouble();
        if (std::isfinite(d))
            return d;
    } else if (v.isString()) {
        bool ok = false;
        const double d = v.toString().trimmed().toDouble(&ok);
        if (ok && std::isfinite(d))
            return d;
    }
    return kDefaultConfidence;
}

std::optional<QString> readTimestamp(const QJsonObject &obj)
{
    for (const char *key : kTimestampKeys) {
        const QJsonValue v = obj.value(QLatin1String(key));
        if (v.isUndefined() || v.isNull())
            continue;

        // First non-null alias wins even if it turns out to be unusable.
        QString s;
        if (v.isString()) {
            s = v.toString();
        } else if (v.isDouble()) {
            s = numberToString(v.toDouble());
        }
        if (s.isEmpty())
            return std::nullopt;
        return s;
    }
    return std::nullopt;
}

} // namespace

std::optional<DetectionEvent> eventFromRecord(const QJsonValue &record, int position)
{
    if (!record.isObject()) {
        return std::nullopt;
    }

    const QJsonObject obj = record.toObject();

    // Size gates everything else
    const QJsonValue sizeVal = obj.value(QStringLiteral("size"));
    if (!sizeVal.isString()) {
        return std::nullopt;
    }
    const std::optional<SizeCategory> size = categoryFromString(sizeVal.toString());
    if (!size.has_value()) {
        return std::nullopt;
    }

    DetectionEvent ev;
    ev.size = *size;

    // Clock offset "HH:MM:SS"
    const QJsonValue timeVal = obj.value(QStringLiteral("time"));
    if (timeVal.isString() && !timeVal.toString().isEmpty()) {
        ev.timeOffset = hmsToSeconds(timeVal.toString());
    }

    ev.confidence = readConfidence(obj.value(QStringLiteral("confidence")));

    ev.source = presentText(obj.value(QStringLiteral("source")))
                    .value_or(defaultSourceLabel());

    ev.id = presentText(obj.value(QStringLiteral("id")))
                .value_or(eventIdForPosition(position));

    ev.absoluteTimestamp = readTimestamp(obj);

    return ev;
}

std::vector<DetectionEvent> validateEvents(const QJsonArray &records)
{
    std::vector<DetectionEvent> results;
    results.reserve(static_cast<std::size_t>(records.size()));

    int position = 0;
    for (const QJsonValue &v : records) {
        ++position;
        std::optional<DetectionEvent> ev = eventFromRecord(v, position);
        if (ev.has_value()) {
            results.push_back(std::move(*ev));
        }
    }

    if (static_cast<int>(results.size()) != records.size()) {
        qDebug() << "EventValidator: dropped"
                 << records.size() - static_cast<int>(results.size())
                 << "of" << records.size() << "records";
    }

    return results;
}

} // namespace cutline
