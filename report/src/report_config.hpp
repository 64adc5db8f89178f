#pragma once

#include <QString>

#include <optional>

#include "cutline/analytics.hpp"

class QCoreApplication;

namespace cutline {

struct ReportConfig
{
    QString feed;                       // explicit path or URL; wins over feedDirectory
    QString feedDirectory = QStringLiteral(".");
    std::optional<qint64> branch;
    QString sessionName = QStringLiteral("demo");

    RawQueryParameters query;

    QString csvPath;                    // "-" writes to stdout
    bool json = false;
    std::optional<QString> series;      // category name or "All"
    bool verbose = false;

    QString settingsPath;               // file the settings were read from

    // Where the feed is read from.
    QString feedLocation() const;
};

// Rejects option combinations that cannot be honoured, such as a JSON
// report and a CSV export both going to stdout.
bool validateReportConfig(const ReportConfig &config, QString *error);

// Command line first, then the settings file, then built-in defaults.
// Returns false with `error` set when an option value is malformed.
bool loadReportConfig(const QCoreApplication &app, ReportConfig *out, QString *error);

} // namespace cutline
