#pragma once

#include <QJsonObject>
#include <QString>

#include <vector>

#include "cutline/aggregation.hpp"
#include "cutline/display_filter.hpp"
#include "cutline/session.hpp"
#include "cutline/time_range.hpp"

namespace cutline {

struct QueryParameters
{
    TimeRangeFilter timeRange;
    DisplayFilter display;
};

// Parameter values as a caller hands them over (command line, settings).
// Empty strings mean "not given".
struct RawQueryParameters
{
    QString range;
    QString from;
    QString to;
    QString minConfidence;
    QString size;
};

// Unrecognised values are logged and treated as "no filter" for that
// criterion; absent ones keep their defaults.
QueryParameters parseQueryParameters(const RawQueryParameters &raw);

// Everything derived from one session under one set of parameters.
struct AnalyticsReport
{
    int timeFilteredCount = 0;
    std::vector<MinuteBucket> buckets;
    CategoryCounts totals;
    double throughput = 0.0;
    PeakWindow peak;

    // Source for both the event table and the CSV export.
    std::vector<DetectionEvent> displayEvents;
};

AnalyticsReport buildReport(const Session &session, const QueryParameters &params);

QJsonObject reportToJson(const AnalyticsReport &report, const Session &session);

} // namespace cutline
