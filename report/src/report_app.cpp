#include "report_app.hpp"

#include "cutline/common.hpp"
#include "cutline/csv_export.hpp"
#include "cutline/feed_source.hpp"

#include <QCoreApplication>
#include <QJsonDocument>
#include <QTextStream>
#include <QDebug>

#include <cstdio>

namespace cutline {

ReportApp::ReportApp(const ReportConfig &config, QObject *parent)
    : QObject(parent)
    , config_(config)
    , source_(createFeedSource(config.feedLocation(), this))
    , loader_(source_)
{
    loader_.setSessionName(config_.sessionName);

    connect(&loader_, &SessionLoader::sessionReady,
            this, &ReportApp::handleSessionReady);
}

void ReportApp::start()
{
    qInfo() << "ReportApp: loading feed from" << source_->description();
    loader_.reload();
}

void ReportApp::handleSessionReady(const cutline::Session &session)
{
    const QueryParameters params = parseQueryParameters(config_.query);
    const AnalyticsReport report = buildReport(session, params);

    QTextStream out(stdout);

    if (config_.json) {
        const QJsonDocument doc(reportToJson(report, session));
        out << doc.toJson(QJsonDocument::Indented);
    } else if (config_.csvPath != QLatin1String("-")) {
        printSummary(out, session, params, report);
    }

    if (config_.series.has_value()) {
        printSeries(out, report);
    }
    out.flush();

    const bool csvOk = writeCsv(report);
    QCoreApplication::exit(csvOk ? 0 : 1);
}

void ReportApp::printSummary(QTextStream &out, const Session &session,
                             const QueryParameters &params, const AnalyticsReport &report) const
{
    out << "Session:     " << originToString(session.origin())
        << " (" << session.events().size() << " events";
    if (!session.seed().isEmpty()) {
        out << ", seed " << session.seed();
    }
    out << ")\n";

    if (params.timeRange.isAbsolute()) {
        out << "Range:       " << (params.timeRange.from.isEmpty() ? QStringLiteral("-") : params.timeRange.from)
            << " .. " << (params.timeRange.to.isEmpty() ? QStringLiteral("-") : params.timeRange.to) << "\n";
    } else {
        out << "Range:       " << rangeToString(params.timeRange.relative) << "\n";
    }
    out << "In range:    " << report.timeFilteredCount << "\n";

    out << "Total:       " << report.totals.total() << " (";
    bool first = true;
    for (SizeCategory c : allCategories()) {
        if (!first)
            out << ", ";
        out << categoryToString(c) << ' ' << report.totals.count(c);
        first = false;
    }
    out << ")\n";

    out << "Per minute:  " << QString::number(report.throughput, 'f', 1) << "\n";
    out << "Peak " << kPeakWindowMinutes << " min: " << report.peak.count
        << " (" << minuteLabel(report.peak.startIndex)
        << " - " << minuteLabel(report.peak.endIndex) << ")\n";

    out << "Shown:       " << report.displayEvents.size()
        << " events (confidence >= " << params.display.minConfidence
        << ", size " << (params.display.size.has_value()
                             ? categoryToString(*params.display.size)
                             : QStringLiteral("All"))
        << ")\n";
}

void ReportApp::printSeries(QTextStream &out, const AnalyticsReport &report) const
{
    bool recognized = false;
    const std::optional<SizeCategory> category = categoryFilterFromString(*config_.series, &recognized);
    if (!recognized) {
        qWarning() << "ReportApp: unknown series size" << *config_.series << "- plotting totals";
    }

    const std::vector<int> series = projectSeries(report.buckets, category);
    for (std::size_t i = 0; i < series.size(); ++i) {
        out << minuteLabel(static_cast<int>(i)) << ' ' << series[i] << "\n";
    }
}

bool ReportApp::writeCsv(const AnalyticsReport &report) const
{
    if (config_.csvPath.isEmpty()) {
        return true;
    }

    if (config_.csvPath == QLatin1String("-")) {
        QTextStream out(stdout);
        out << eventsToCsv(report.displayEvents) << "\n";
        return true;
    }

    if (!exportToCsv(config_.csvPath, report.displayEvents)) {
        qCritical() << "ReportApp: CSV export failed";
        return false;
    }

    qInfo() << "ReportApp: wrote" << report.displayEvents.size() << "events to" << config_.csvPath;
    return true;
}

} // namespace cutline
