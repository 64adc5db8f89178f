#include "cutline/common.hpp"

#include <QDate>
#include <QStringList>
#include <QTimeZone>

#include <algorithm>
#include <cmath>
#include <limits>

namespace cutline {

QString defaultSourceLabel()
{
    return QStringLiteral("Cutting Table 1");
}

QString eventIdForPosition(int position)
{
    return QStringLiteral("EVT-%1").arg(position, 4, 10, QLatin1Char('0'));
}

QString formatHms(qint64 seconds)
{
    const qint64 s = std::max<qint64>(0, seconds);
    const qint64 h = s / 3600;
    const qint64 m = (s % 3600) / 60;
    const qint64 sec = s % 60;

    return QStringLiteral("%1:%2:%3")
        .arg(h, 2, 10, QLatin1Char('0'))
        .arg(m, 2, 10, QLatin1Char('0'))
        .arg(sec, 2, 10, QLatin1Char('0'));
}

qint64 hmsToSeconds(const QString &hms)
{
    const QStringList parts = hms.split(QLatin1Char(':'));
    if (parts.size() != 3) {
        return 0;
    }

    double values[3] = {0.0, 0.0, 0.0};
    for (int i = 0; i < 3; ++i) {
        const QString part = parts.at(i).trimmed();
        if (part.isEmpty()) {
            continue; // an empty component counts as zero
        }
        bool ok = false;
        const double v = part.toDouble(&ok);
        if (!ok || !std::isfinite(v)) {
            return 0;
        }
        values[i] = v;
    }

    const double total = std::floor(values[0] * 3600.0 + values[1] * 60.0 + values[2]);
    if (!(total > 0.0)) {
        return 0;
    }
    // Past the qint64 range the cast is undefined; saturate instead.
    if (total >= 9.0e18) {
        return std::numeric_limits<qint64>::max();
    }
    return static_cast<qint64>(total);
}

QString minuteLabel(int index)
{
    return QStringLiteral("00:%1").arg(index, 2, 10, QLatin1Char('0'));
}

std::optional<QDateTime> parseDateTime(const QString &s)
{
    const QString trimmed = s.trimmed();
    if (trimmed.isEmpty()) {
        return std::nullopt;
    }

    // A bare calendar date is midnight UTC; date-times without a zone
    // designator stay local.
    if (trimmed.size() == 10) {
        const QDate date = QDate::fromString(trimmed, Qt::ISODate);
        if (date.isValid()) {
            return QDateTime(date, QTime(0, 0), QTimeZone(QTimeZone::UTC));
        }
    }

    QDateTime dt = QDateTime::fromString(trimmed, Qt::ISODateWithMs);
    if (!dt.isValid()) {
        dt = QDateTime::fromString(trimmed, Qt::ISODate);
    }
    if (!dt.isValid()) {
        return std::nullopt;
    }

    return dt;
}

} // namespace cutline
