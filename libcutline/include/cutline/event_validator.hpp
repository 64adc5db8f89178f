#pragma once

#include <QJsonArray>
#include <QJsonValue>

#include <optional>
#include <vector>

#include "cutline/event.hpp"

namespace cutline {

// Normalise one raw feed record. `position` is the record's 1-based index in
// the feed and only matters when the record carries no id of its own.
// Returns nullopt when the record's size is not one of the known categories.
std::optional<DetectionEvent> eventFromRecord(const QJsonValue &record, int position);

// Normalise a whole feed array; records that fail validation are dropped.
std::vector<DetectionEvent> validateEvents(const QJsonArray &records);

} // namespace cutline
