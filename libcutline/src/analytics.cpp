#include "cutline/analytics.hpp"

#include "cutline/common.hpp"

#include <QJsonArray>
#include <QDebug>

namespace cutline {

QueryParameters parseQueryParameters(const RawQueryParameters &raw)
{
    QueryParameters params;

    if (!raw.range.trimmed().isEmpty()) {
        const std::optional<RelativeRange> range = rangeFromString(raw.range);
        if (range.has_value()) {
            params.timeRange.relative = *range;
        } else {
            qWarning() << "QueryParameters: unknown time range" << raw.range << "- using all";
            params.timeRange.relative = RelativeRange::All;
        }
    }

    params.timeRange.from = raw.from.trimmed();
    params.timeRange.to = raw.to.trimmed();

    if (!raw.minConfidence.trimmed().isEmpty()) {
        const std::optional<double> threshold = confidenceThresholdFromString(raw.minConfidence);
        if (threshold.has_value()) {
            params.display.minConfidence = *threshold;
        } else {
            qWarning() << "QueryParameters: unknown confidence threshold" << raw.minConfidence
                       << "- not filtering by confidence";
            params.display.minConfidence = 0.0;
        }
    }

    if (!raw.size.trimmed().isEmpty()) {
        bool recognized = false;
        params.display.size = categoryFilterFromString(raw.size, &recognized);
        if (!recognized) {
            qWarning() << "QueryParameters: unknown size" << raw.size << "- showing all sizes";
        }
    }

    return params;
}

AnalyticsReport buildReport(const Session &session, const QueryParameters &params)
{
    AnalyticsReport report;

    const std::vector<DetectionEvent> inRange = applyTimeRange(session.events(), params.timeRange);
    report.timeFilteredCount = static_cast<int>(inRange.size());

    // Chart side
    report.buckets = aggregateByMinute(inRange);
    report.totals = sessionTotals(report.buckets);
    report.throughput = throughputPerMinute(report.totals);
    report.peak = findPeakWindow(report.buckets);

    // Table / export side
    report.displayEvents = applyDisplayFilter(inRange, params.display);

    return report;
}

QJsonObject reportToJson(const AnalyticsReport &report, const Session &session)
{
    QJsonObject obj;

    QJsonObject sessionObj;
    sessionObj.insert(QStringLiteral("origin"), originToString(session.origin()));
    sessionObj.insert(QStringLiteral("event_count"), static_cast<qint64>(session.events().size()));
    if (!session.seed().isEmpty()) {
        sessionObj.insert(QStringLiteral("seed"), session.seed());
    }
    obj.insert(QStringLiteral("session"), sessionObj);

    QJsonObject totals;
    totals.insert(QStringLiteral("total"), report.totals.total());
    for (SizeCategory c : allCategories()) {
        totals.insert(categoryToString(c), report.totals.count(c));
    }
    obj.insert(QStringLiteral("totals"), totals);
    obj.insert(QStringLiteral("time_filtered"), report.timeFilteredCount);
    obj.insert(QStringLiteral("per_minute"), report.throughput);

    QJsonObject peak;
    peak.insert(QStringLiteral("count"), report.peak.count);
    peak.insert(QStringLiteral("start"), minuteLabel(report.peak.startIndex));
    peak.insert(QStringLiteral("end"), minuteLabel(report.peak.endIndex));
    obj.insert(QStringLiteral("peak_window"), peak);

    QJsonArray minutes;
    for (const MinuteBucket &b : report.buckets) {
        QJsonObject point;
        point.insert(QStringLiteral("minute"), minuteLabel(b.index));
        point.insert(QStringLiteral("total"), b.total());
        for (SizeCategory c : allCategories()) {
            point.insert(categoryToString(c), b.counts.count(c));
        }
        minutes.append(point);
    }
    obj.insert(QStringLiteral("minutes"), minutes);

    QJsonArray events;
    for (const DetectionEvent &ev : report.displayEvents) {
        events.append(eventToJson(ev));
    }
    obj.insert(QStringLiteral("events"), events);

    return obj;
}

} // namespace cutline
