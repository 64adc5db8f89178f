#include "cutline/time_range.hpp"

#include "cutline/common.hpp"

#include <QDateTime>
#include <QDebug>

#include <algorithm>
#include <iterator>

namespace cutline {

namespace {

std::vector<DetectionEvent> filterAbsolute(const std::vector<DetectionEvent> &events,
                                           const TimeRangeFilter &filter)
{
    const std::optional<QDateTime> from = parseDateTime(filter.from);
    const std::optional<QDateTime> to = parseDateTime(filter.to);

    if (!filter.from.trimmed().isEmpty() && !from.has_value()) {
        qWarning() << "TimeRangeFilter: ignoring unparseable lower bound" << filter.from;
    }
    if (!filter.to.trimmed().isEmpty() && !to.has_value()) {
        qWarning() << "TimeRangeFilter: ignoring unparseable upper bound" << filter.to;
    }

    std::vector<DetectionEvent> out;
    for (const DetectionEvent &ev : events) {
        // Only events with a usable instant take part in absolute mode.
        if (!ev.absoluteTimestamp.has_value())
            continue;
        const std::optional<QDateTime> ts = parseDateTime(*ev.absoluteTimestamp);
        if (!ts.has_value())
            continue;

        if (from.has_value() && *ts < *from)
            continue;
        if (to.has_value() && *ts > *to)
            continue;

        out.push_back(ev);
    }
    return out;
}

std::vector<DetectionEvent> filterRelative(const std::vector<DetectionEvent> &events,
                                           RelativeRange range)
{
    if (range == RelativeRange::All || events.empty()) {
        return events;
    }

    qint64 maxOffset = 0;
    for (const DetectionEvent &ev : events) {
        maxOffset = std::max(maxOffset, ev.timeOffset);
    }

    // Window trails the newest event, not the nominal session end.
    const qint64 minOffset = std::max<qint64>(0, maxOffset - rangeMinutes(range) * 60);

    std::vector<DetectionEvent> out;
    std::copy_if(events.begin(), events.end(), std::back_inserter(out),
                 [minOffset, maxOffset](const DetectionEvent &ev) {
                     return ev.timeOffset >= minOffset && ev.timeOffset <= maxOffset;
                 });
    return out;
}

} // namespace

int rangeMinutes(RelativeRange r)
{
    switch (r) {
    case RelativeRange::All:
        return 0;
    case RelativeRange::Last5Minutes:
        return 5;
    case RelativeRange::Last10Minutes:
        return 10;
    case RelativeRange::Last30Minutes:
        return 30;
    case RelativeRange::Last60Minutes:
        return 60;
    }

    return 0;
}

QString rangeToString(RelativeRange r)
{
    switch (r) {
    case RelativeRange::All:
        return QStringLiteral("all");
    case RelativeRange::Last5Minutes:
        return QStringLiteral("5m");
    case RelativeRange::Last10Minutes:
        return QStringLiteral("10m");
    case RelativeRange::Last30Minutes:
        return QStringLiteral("30m");
    case RelativeRange::Last60Minutes:
        return QStringLiteral("60m");
    }

    return QStringLiteral("all");
}

std::optional<RelativeRange> rangeFromString(const QString &s)
{
    const QString lower = s.trimmed().toLower();

    if (lower == QLatin1String("all"))
        return RelativeRange::All;
    if (lower == QLatin1String("5m"))
        return RelativeRange::Last5Minutes;
    if (lower == QLatin1String("10m"))
        return RelativeRange::Last10Minutes;
    if (lower == QLatin1String("30m"))
        return RelativeRange::Last30Minutes;
    if (lower == QLatin1String("60m"))
        return RelativeRange::Last60Minutes;

    return std::nullopt;
}

bool TimeRangeFilter::isAbsolute() const
{
    return !from.trimmed().isEmpty() || !to.trimmed().isEmpty();
}

std::vector<DetectionEvent> applyTimeRange(const std::vector<DetectionEvent> &events,
                                           const TimeRangeFilter &filter)
{
    if (filter.isAbsolute()) {
        return filterAbsolute(events, filter);
    }
    return filterRelative(events, filter.relative);
}

} // namespace cutline
