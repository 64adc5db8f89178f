#pragma once

#include <QObject>

#include "cutline/analytics.hpp"
#include "cutline/session_loader.hpp"

#include "report_config.hpp"

class QTextStream;

namespace cutline {

class FeedSource;

// Acquires one session, prints the report and quits the event loop.
class ReportApp : public QObject
{
    Q_OBJECT
public:
    explicit ReportApp(const ReportConfig &config, QObject *parent = nullptr);

public slots:
    void start();

private slots:
    void handleSessionReady(const cutline::Session &session);

private:
    void printSummary(QTextStream &out, const Session &session,
                      const QueryParameters &params, const AnalyticsReport &report) const;
    void printSeries(QTextStream &out, const AnalyticsReport &report) const;
    bool writeCsv(const AnalyticsReport &report) const;

    ReportConfig   config_;
    FeedSource    *source_ = nullptr;
    SessionLoader  loader_;
};

} // namespace cutline
