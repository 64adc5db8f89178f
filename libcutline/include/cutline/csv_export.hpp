#pragma once

#include <QString>
#include <QStringList>

#include <vector>

#include "cutline/event.hpp"

namespace cutline {

// Header plus one quoted row per event, in list order, joined with '\n'.
QString eventsToCsv(const std::vector<DetectionEvent> &events);

// Writes eventsToCsv() to `filePath`, replacing any existing file.
bool exportToCsv(const QString &filePath, const std::vector<DetectionEvent> &events);

// Reads CSV text back into rows of fields. Handles quoted fields with
// doubled quotes, embedded commas and line breaks; accepts \n and \r\n.
std::vector<QStringList> parseCsv(const QString &text);

} // namespace cutline
