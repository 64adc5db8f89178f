#include <gtest/gtest.h>

#include "cutline/analytics.hpp"
#include "cutline/synthetic_events.hpp"

#include <QJsonArray>
#include <QJsonObject>

using namespace cutline;

namespace {

DetectionEvent makeEvent(const QString &id, qint64 offset, SizeCategory size, double confidence)
{
    DetectionEvent ev;
    ev.id = id;
    ev.timeOffset = offset;
    ev.size = size;
    ev.confidence = confidence;
    ev.source = defaultSourceLabel();
    return ev;
}

Session demoSession()
{
    const QString seed = syntheticSeedFor(QString());
    return Session(generateSyntheticEvents(seed), SessionOrigin::Synthetic, 0, seed);
}

} // namespace

// ====================
// Parameter parsing
// ====================

TEST(ParseQueryParametersTest, EmptyKeepsDefaults) {
    const QueryParameters params = parseQueryParameters(RawQueryParameters());
    EXPECT_EQ(params.timeRange.relative, RelativeRange::All);
    EXPECT_FALSE(params.timeRange.isAbsolute());
    EXPECT_DOUBLE_EQ(params.display.minConfidence, 0.7);
    EXPECT_FALSE(params.display.size.has_value());
}

TEST(ParseQueryParametersTest, KnownValues) {
    RawQueryParameters raw;
    raw.range = QStringLiteral("30m");
    raw.minConfidence = QStringLiteral("0.9");
    raw.size = QStringLiteral("Medium");
    raw.from = QStringLiteral(" 2024-01-01T10:00:00Z ");

    const QueryParameters params = parseQueryParameters(raw);
    EXPECT_EQ(params.timeRange.relative, RelativeRange::Last30Minutes);
    EXPECT_EQ(params.timeRange.from, QStringLiteral("2024-01-01T10:00:00Z"));
    EXPECT_TRUE(params.timeRange.isAbsolute());
    EXPECT_DOUBLE_EQ(params.display.minConfidence, 0.9);
    EXPECT_EQ(params.display.size, SizeCategory::Medium);
}

TEST(ParseQueryParametersTest, UnknownValuesMeanNoFilter) {
    RawQueryParameters raw;
    raw.range = QStringLiteral("fortnight");
    raw.minConfidence = QStringLiteral("0.75");
    raw.size = QStringLiteral("Huge");

    const QueryParameters params = parseQueryParameters(raw);
    EXPECT_EQ(params.timeRange.relative, RelativeRange::All);
    EXPECT_DOUBLE_EQ(params.display.minConfidence, 0.0);
    EXPECT_FALSE(params.display.size.has_value());
}

// ====================
// Report
// ====================

TEST(BuildReportTest, ChartAndTableAgree) {
    const Session session = demoSession();

    QueryParameters params;
    params.timeRange.relative = RelativeRange::Last30Minutes;
    params.display.minConfidence = 0.8;

    const AnalyticsReport report = buildReport(session, params);
    const auto inRange = applyTimeRange(session.events(), params.timeRange);

    EXPECT_EQ(report.timeFilteredCount, static_cast<int>(inRange.size()));
    EXPECT_EQ(report.totals.total(), report.timeFilteredCount);
    EXPECT_EQ(report.buckets.size(), 60u);
    EXPECT_EQ(report.displayEvents, applyDisplayFilter(inRange, params.display));
    EXPECT_DOUBLE_EQ(report.throughput, throughputPerMinute(report.totals));
    EXPECT_EQ(report.peak.count, findPeakWindow(report.buckets).count);
}

TEST(BuildReportTest, DisplayFilterDoesNotTouchChart) {
    const Session session(std::vector<DetectionEvent>{
                              makeEvent(QStringLiteral("lo"), 10, SizeCategory::Small, 0.5),
                              makeEvent(QStringLiteral("hi"), 20, SizeCategory::XL, 0.95),
                          },
                          SessionOrigin::Feed);

    QueryParameters params;
    params.display.size = SizeCategory::XL;

    const AnalyticsReport report = buildReport(session, params);
    EXPECT_EQ(report.totals.total(), 2);
    EXPECT_EQ(report.totals.count(SizeCategory::Small), 1);
    ASSERT_EQ(report.displayEvents.size(), 1u);
    EXPECT_EQ(report.displayEvents[0].id, QStringLiteral("hi"));
}

TEST(BuildReportTest, EmptyRangeGivesZeroReport) {
    const Session session(std::vector<DetectionEvent>{
                              makeEvent(QStringLiteral("a"), 10, SizeCategory::Small, 0.9),
                          },
                          SessionOrigin::Feed);

    QueryParameters params;
    params.timeRange.from = QStringLiteral("2024-01-01T00:00:00Z");   // no event has a timestamp

    const AnalyticsReport report = buildReport(session, params);
    EXPECT_EQ(report.timeFilteredCount, 0);
    EXPECT_EQ(report.totals.total(), 0);
    EXPECT_DOUBLE_EQ(report.throughput, 0.0);
    EXPECT_EQ(report.peak.count, 0);
    EXPECT_EQ(report.peak.startIndex, 0);
    EXPECT_TRUE(report.displayEvents.empty());
}

TEST(ReportToJsonTest, CarriesSummaryAndSeries) {
    const Session session = demoSession();
    const AnalyticsReport report = buildReport(session, QueryParameters());
    const QJsonObject obj = reportToJson(report, session);

    const QJsonObject sessionObj = obj.value(QStringLiteral("session")).toObject();
    EXPECT_EQ(sessionObj.value(QStringLiteral("origin")).toString(), QStringLiteral("synthetic"));
    EXPECT_EQ(sessionObj.value(QStringLiteral("event_count")).toInt(), 220);
    EXPECT_EQ(sessionObj.value(QStringLiteral("seed")).toString(), QStringLiteral("demo:events"));

    const QJsonObject totals = obj.value(QStringLiteral("totals")).toObject();
    EXPECT_EQ(totals.value(QStringLiteral("total")).toInt(), 220);
    EXPECT_EQ(totals.value(QStringLiteral("XL")).toInt(), 13);

    EXPECT_DOUBLE_EQ(obj.value(QStringLiteral("per_minute")).toDouble(), 3.7);

    const QJsonObject peak = obj.value(QStringLiteral("peak_window")).toObject();
    EXPECT_TRUE(peak.value(QStringLiteral("start")).toString().startsWith(QStringLiteral("00:")));

    const QJsonArray minutes = obj.value(QStringLiteral("minutes")).toArray();
    ASSERT_EQ(minutes.size(), 60);
    EXPECT_EQ(minutes.at(0).toObject().value(QStringLiteral("minute")).toString(), QStringLiteral("00:00"));
    EXPECT_EQ(minutes.at(59).toObject().value(QStringLiteral("minute")).toString(), QStringLiteral("00:59"));

    EXPECT_EQ(obj.value(QStringLiteral("events")).toArray().size(),
              static_cast<int>(report.displayEvents.size()));
}
