#include "report_config.hpp"

#include "cutline/feed_source.hpp"

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDir>
#include <QFileInfo>
#include <QSettings>
#include <QStandardPaths>
#include <QDebug>

namespace cutline {

namespace {

// Settings keys
constexpr const char *kKeyFeedSource    = "feed/source";
constexpr const char *kKeyFeedDirectory = "feed/directory";
constexpr const char *kKeyFeedBranch    = "feed/branch";
constexpr const char *kKeyFeedSession   = "feed/session";
constexpr const char *kKeyRange         = "filters/range";
constexpr const char *kKeyMinConfidence = "filters/min-confidence";
constexpr const char *kKeySize          = "filters/size";

QString defaultSettingsPath()
{
    const QString dir = QStandardPaths::writableLocation(QStandardPaths::AppConfigLocation);
    return QDir(dir).filePath(QStringLiteral("cutline-report.ini"));
}

QString pick(const QCommandLineParser &parser, const QCommandLineOption &option,
             const QSettings &settings, const char *key, const QString &fallback)
{
    if (parser.isSet(option)) {
        return parser.value(option);
    }
    return settings.value(QLatin1String(key), fallback).toString();
}

} // namespace

QString ReportConfig::feedLocation() const
{
    if (!feed.isEmpty()) {
        return feed;
    }
    return QDir(feedDirectory).filePath(feedFileName(branch));
}

bool validateReportConfig(const ReportConfig &config, QString *error)
{
    if (config.json && config.csvPath == QLatin1String("-")) {
        *error = QStringLiteral("--json and --csv - both write to stdout; give --csv a file");
        return false;
    }
    return true;
}

bool loadReportConfig(const QCoreApplication &app, ReportConfig *out, QString *error)
{
    QCommandLineParser parser;
    parser.setApplicationDescription(
        QStringLiteral("Summarise a cutting-line detection feed and export the filtered events."));
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption feedOpt(QStringLiteral("feed"),
        QStringLiteral("Feed document path or http(s) URL."), QStringLiteral("location"));
    const QCommandLineOption feedDirOpt(QStringLiteral("feed-dir"),
        QStringLiteral("Directory holding pizza-events*.json."), QStringLiteral("dir"));
    const QCommandLineOption branchOpt(QStringLiteral("branch"),
        QStringLiteral("Branch location id; selects pizza-events-<id>.json."), QStringLiteral("id"));
    const QCommandLineOption sessionOpt(QStringLiteral("session"),
        QStringLiteral("Session name seeding the synthetic fallback."), QStringLiteral("name"));
    const QCommandLineOption rangeOpt(QStringLiteral("range"),
        QStringLiteral("Trailing window: all, 5m, 10m, 30m, 60m."), QStringLiteral("range"));
    const QCommandLineOption fromOpt(QStringLiteral("from"),
        QStringLiteral("Absolute lower bound (ISO-8601)."), QStringLiteral("datetime"));
    const QCommandLineOption toOpt(QStringLiteral("to"),
        QStringLiteral("Absolute upper bound (ISO-8601)."), QStringLiteral("datetime"));
    const QCommandLineOption confidenceOpt(QStringLiteral("min-confidence"),
        QStringLiteral("Confidence threshold: 0.5, 0.6, 0.7, 0.8 or 0.9."), QStringLiteral("value"));
    const QCommandLineOption sizeOpt(QStringLiteral("size"),
        QStringLiteral("Size filter: All, Small, Medium, Large, XL."), QStringLiteral("size"));
    const QCommandLineOption csvOpt(QStringLiteral("csv"),
        QStringLiteral("Write the filtered events as CSV ('-' for stdout)."), QStringLiteral("file"));
    const QCommandLineOption jsonOpt(QStringLiteral("json"),
        QStringLiteral("Print the report as JSON."));
    const QCommandLineOption seriesOpt(QStringLiteral("series"),
        QStringLiteral("Print the per-minute series for a size (or All)."), QStringLiteral("size"));
    const QCommandLineOption configOpt(QStringLiteral("config"),
        QStringLiteral("Settings file to read instead of the default."), QStringLiteral("file"));
    const QCommandLineOption verboseOpt(QStringList{QStringLiteral("v"), QStringLiteral("verbose")},
        QStringLiteral("Enable debug logging."));

    parser.addOptions({feedOpt, feedDirOpt, branchOpt, sessionOpt, rangeOpt, fromOpt, toOpt,
                       confidenceOpt, sizeOpt, csvOpt, jsonOpt, seriesOpt, configOpt, verboseOpt});

    // Exits on --help, --version and unknown options.
    parser.process(app);

    out->settingsPath = parser.isSet(configOpt) ? parser.value(configOpt) : defaultSettingsPath();
    if (parser.isSet(configOpt) && !QFileInfo::exists(out->settingsPath)) {
        *error = QStringLiteral("settings file %1 does not exist").arg(out->settingsPath);
        return false;
    }

    const QSettings settings(out->settingsPath, QSettings::IniFormat);
    if (settings.status() != QSettings::NoError) {
        *error = QStringLiteral("cannot read settings file %1").arg(out->settingsPath);
        return false;
    }

    out->feed = pick(parser, feedOpt, settings, kKeyFeedSource, QString());
    out->feedDirectory = pick(parser, feedDirOpt, settings, kKeyFeedDirectory, out->feedDirectory);
    out->sessionName = pick(parser, sessionOpt, settings, kKeyFeedSession, out->sessionName);

    const QString branch = pick(parser, branchOpt, settings, kKeyFeedBranch, QString()).trimmed();
    if (!branch.isEmpty()) {
        bool ok = false;
        const qint64 id = branch.toLongLong(&ok);
        if (!ok || id < 0) {
            *error = QStringLiteral("--branch expects a numeric location id, got \"%1\"").arg(branch);
            return false;
        }
        out->branch = id;
    }

    out->query.range = pick(parser, rangeOpt, settings, kKeyRange, QString());
    out->query.from = parser.value(fromOpt);
    out->query.to = parser.value(toOpt);
    out->query.minConfidence = pick(parser, confidenceOpt, settings, kKeyMinConfidence, QString());
    out->query.size = pick(parser, sizeOpt, settings, kKeySize, QString());

    out->csvPath = parser.value(csvOpt);
    out->json = parser.isSet(jsonOpt);
    if (parser.isSet(seriesOpt)) {
        out->series = parser.value(seriesOpt);
    }
    out->verbose = parser.isSet(verboseOpt);

    return validateReportConfig(*out, error);
}

} // namespace cutline
