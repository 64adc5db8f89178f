#pragma once

#include <QString>

#include <array>
#include <optional>
#include <vector>

#include "cutline/event.hpp"

namespace cutline {

constexpr double kDefaultConfidenceThreshold = 0.7;

// Thresholds a caller may pick from.
const std::array<double, 5> &confidenceThresholds();

// Accepts exactly the values in confidenceThresholds(), as decimals ("0.8")
// or percentages ("80%").
std::optional<double> confidenceThresholdFromString(const QString &s);

// "All" (any case) selects every category and yields nullopt, as does an
// unknown name; `recognized` tells the two apart.
std::optional<SizeCategory> categoryFilterFromString(const QString &s, bool *recognized = nullptr);

struct DisplayFilter
{
    double minConfidence = kDefaultConfidenceThreshold;
    std::optional<SizeCategory> size;   // nullopt = all categories
};

bool passesDisplayFilter(const DetectionEvent &ev, const DisplayFilter &filter);

// List for both the event table and the CSV export; keeps input order.
std::vector<DetectionEvent> applyDisplayFilter(const std::vector<DetectionEvent> &events,
                                               const DisplayFilter &filter);

} // namespace cutline
