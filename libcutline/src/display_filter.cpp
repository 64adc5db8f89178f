#include "cutline/display_filter.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>

namespace cutline {

const std::array<double, 5> &confidenceThresholds()
{
    static const std::array<double, 5> thresholds = {0.5, 0.6, 0.7, 0.8, 0.9};
    return thresholds;
}

std::optional<double> confidenceThresholdFromString(const QString &s)
{
    QString text = s.trimmed();
    double scale = 1.0;
    if (text.endsWith(QLatin1Char('%'))) {
        text.chop(1);
        scale = 100.0;
    }

    bool ok = false;
    const double value = text.trimmed().toDouble(&ok) / scale;
    if (!ok || !std::isfinite(value)) {
        return std::nullopt;
    }

    for (double t : confidenceThresholds()) {
        if (std::abs(t - value) < 1e-9) {
            return t;
        }
    }
    return std::nullopt;
}

std::optional<SizeCategory> categoryFilterFromString(const QString &s, bool *recognized)
{
    const QString trimmed = s.trimmed();

    if (trimmed.compare(QLatin1String("all"), Qt::CaseInsensitive) == 0) {
        if (recognized)
            *recognized = true;
        return std::nullopt;
    }

    const std::optional<SizeCategory> c = categoryFromString(trimmed);
    if (recognized)
        *recognized = c.has_value();
    return c;
}

bool passesDisplayFilter(const DetectionEvent &ev, const DisplayFilter &filter)
{
    if (ev.confidence < filter.minConfidence)
        return false;
    if (filter.size.has_value() && ev.size != *filter.size)
        return false;
    return true;
}

std::vector<DetectionEvent> applyDisplayFilter(const std::vector<DetectionEvent> &events,
                                               const DisplayFilter &filter)
{
    std::vector<DetectionEvent> out;
    std::copy_if(events.begin(), events.end(), std::back_inserter(out),
                 [&filter](const DetectionEvent &ev) {
                     return passesDisplayFilter(ev, filter);
                 });
    return out;
}

} // namespace cutline
