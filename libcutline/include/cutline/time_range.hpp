#pragma once

#include <QString>

#include <optional>
#include <vector>

#include "cutline/event.hpp"

namespace cutline {

enum class RelativeRange {
    All,
    Last5Minutes,
    Last10Minutes,
    Last30Minutes,
    Last60Minutes
};

// Window length in minutes; 0 for All.
int rangeMinutes(RelativeRange r);

// "all", "5m", "10m", "30m", "60m"
QString rangeToString(RelativeRange r);
std::optional<RelativeRange> rangeFromString(const QString &s);

struct TimeRangeFilter
{
    RelativeRange relative = RelativeRange::All;

    // Absolute bounds as given by the caller. Either one being non-blank
    // switches the filter to absolute mode.
    QString from;
    QString to;

    bool isAbsolute() const;
};

std::vector<DetectionEvent> applyTimeRange(const std::vector<DetectionEvent> &events,
                                           const TimeRangeFilter &filter);

} // namespace cutline
