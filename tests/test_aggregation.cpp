#include <gtest/gtest.h>

#include "cutline/aggregation.hpp"
#include "cutline/synthetic_events.hpp"

#include <algorithm>

using namespace cutline;

namespace {

DetectionEvent makeEvent(qint64 offset, SizeCategory size)
{
    DetectionEvent ev;
    ev.id = QStringLiteral("EVT-%1").arg(offset);
    ev.timeOffset = offset;
    ev.size = size;
    ev.confidence = 0.9;
    return ev;
}

// Buckets whose totals follow `totals`, all counted as Medium.
std::vector<MinuteBucket> bucketsWithTotals(const std::vector<int> &totals)
{
    std::vector<MinuteBucket> buckets(totals.size());
    for (std::size_t i = 0; i < totals.size(); ++i) {
        buckets[i].index = static_cast<int>(i);
        for (int k = 0; k < totals[i]; ++k) {
            buckets[i].counts.add(SizeCategory::Medium);
        }
    }
    return buckets;
}

int categorySum(const CategoryCounts &counts)
{
    int sum = 0;
    for (SizeCategory c : allCategories()) {
        sum += counts.count(c);
    }
    return sum;
}

} // namespace

// ====================
// Minute buckets
// ====================

TEST(AggregateByMinuteTest, AlwaysSixtyBuckets) {
    const auto empty = aggregateByMinute({});
    ASSERT_EQ(empty.size(), 60u);
    for (int i = 0; i < 60; ++i) {
        EXPECT_EQ(empty[static_cast<std::size_t>(i)].index, i);
        EXPECT_EQ(empty[static_cast<std::size_t>(i)].total(), 0);
    }
}

TEST(AggregateByMinuteTest, EventsLandInTheirMinute) {
    const std::vector<DetectionEvent> events = {
        makeEvent(0, SizeCategory::Small),
        makeEvent(59, SizeCategory::Large),
        makeEvent(60, SizeCategory::XL),
        makeEvent(3599, SizeCategory::Medium),
        makeEvent(7200, SizeCategory::Small),   // past the session: last bucket
    };

    const auto buckets = aggregateByMinute(events);
    EXPECT_EQ(buckets[0].total(), 2);
    EXPECT_EQ(buckets[0].counts.count(SizeCategory::Small), 1);
    EXPECT_EQ(buckets[0].counts.count(SizeCategory::Large), 1);
    EXPECT_EQ(buckets[1].total(), 1);
    EXPECT_EQ(buckets[1].counts.count(SizeCategory::XL), 1);
    EXPECT_EQ(buckets[59].total(), 2);
    EXPECT_EQ(buckets[59].counts.count(SizeCategory::Medium), 1);
    EXPECT_EQ(buckets[59].counts.count(SizeCategory::Small), 1);
}

TEST(AggregateByMinuteTest, TotalsMatchCategoryCountsAndInput) {
    const auto events = generateSyntheticEvents(QStringLiteral("bucket-invariant:events"));
    const auto buckets = aggregateByMinute(events);

    int grand = 0;
    for (const MinuteBucket &b : buckets) {
        EXPECT_EQ(b.total(), categorySum(b.counts)) << "bucket " << b.index;
        grand += b.total();
    }
    EXPECT_EQ(grand, static_cast<int>(events.size()));
}

TEST(AggregateByMinuteTest, OrderDoesNotMatter) {
    auto events = generateSyntheticEvents(QStringLiteral("order:events"));
    const auto forward = aggregateByMinute(events);

    std::reverse(events.begin(), events.end());
    const auto backward = aggregateByMinute(events);

    for (std::size_t i = 0; i < forward.size(); ++i) {
        for (SizeCategory c : allCategories()) {
            EXPECT_EQ(forward[i].counts.count(c), backward[i].counts.count(c));
        }
    }
}

// ====================
// Totals and throughput
// ====================

TEST(SessionTotalsTest, SumsEveryBucket) {
    const std::vector<DetectionEvent> events = {
        makeEvent(0, SizeCategory::Small),
        makeEvent(600, SizeCategory::Small),
        makeEvent(1200, SizeCategory::XL),
    };

    const CategoryCounts totals = sessionTotals(aggregateByMinute(events));
    EXPECT_EQ(totals.total(), 3);
    EXPECT_EQ(totals.count(SizeCategory::Small), 2);
    EXPECT_EQ(totals.count(SizeCategory::Medium), 0);
    EXPECT_EQ(totals.count(SizeCategory::XL), 1);
    EXPECT_EQ(totals.total(), categorySum(totals));
}

TEST(ThroughputTest, RoundsToOneDecimal) {
    CategoryCounts totals;
    for (int i = 0; i < 220; ++i) {
        totals.add(SizeCategory::Large);
    }
    EXPECT_DOUBLE_EQ(throughputPerMinute(totals), 3.7);
    EXPECT_DOUBLE_EQ(throughputPerMinute(CategoryCounts()), 0.0);

    CategoryCounts three;
    for (int i = 0; i < 3; ++i) {
        three.add(SizeCategory::Small);
    }
    EXPECT_DOUBLE_EQ(throughputPerMinute(three), 0.1);   // 0.05 rounds up
}

// ====================
// Peak window
// ====================

TEST(FindPeakWindowTest, HighBucketPullsWindowForward) {
    std::vector<int> totals(60, 0);
    for (int i = 0; i < 10; ++i) {
        totals[static_cast<std::size_t>(i)] = 5;
    }
    totals[10] = 100;

    const PeakWindow peak = findPeakWindow(bucketsWithTotals(totals));
    EXPECT_EQ(peak.count, 145);
    EXPECT_EQ(peak.startIndex, 1);
    EXPECT_EQ(peak.endIndex, 10);
}

TEST(FindPeakWindowTest, TiesKeepEarliestStart) {
    std::vector<int> totals(60, 1);
    const PeakWindow peak = findPeakWindow(bucketsWithTotals(totals));
    EXPECT_EQ(peak.count, 10);
    EXPECT_EQ(peak.startIndex, 0);
    EXPECT_EQ(peak.endIndex, 9);
}

TEST(FindPeakWindowTest, BeatsEveryOtherWindow) {
    const auto buckets = aggregateByMinute(generateSyntheticEvents(QStringLiteral("peak:events")));
    const PeakWindow peak = findPeakWindow(buckets);

    for (int start = 0; start + 10 <= 60; ++start) {
        int sum = 0;
        for (int j = 0; j < 10; ++j) {
            sum += buckets[static_cast<std::size_t>(start + j)].total();
        }
        EXPECT_GE(peak.count, sum);
        if (start < peak.startIndex) {
            EXPECT_LT(sum, peak.count) << "earlier window " << start << " ties the peak";
        }
    }
    EXPECT_EQ(peak.endIndex - peak.startIndex, 9);
}

TEST(FindPeakWindowTest, LastWindowReachable) {
    std::vector<int> totals(60, 0);
    totals[59] = 3;
    const PeakWindow peak = findPeakWindow(bucketsWithTotals(totals));
    EXPECT_EQ(peak.count, 3);
    EXPECT_EQ(peak.startIndex, 50);
    EXPECT_EQ(peak.endIndex, 59);
}

TEST(FindPeakWindowTest, EmptyOrShortSeriesGivesZeroWindow) {
    const PeakWindow empty = findPeakWindow(aggregateByMinute({}));
    EXPECT_EQ(empty.count, 0);
    EXPECT_EQ(empty.startIndex, 0);
    EXPECT_EQ(empty.endIndex, 9);

    const PeakWindow shortSeries = findPeakWindow(bucketsWithTotals({4, 4, 4}));
    EXPECT_EQ(shortSeries.count, 0);
    EXPECT_EQ(shortSeries.startIndex, 0);
}

// ====================
// Series projection
// ====================

TEST(ProjectSeriesTest, TotalOrSingleCategory) {
    const std::vector<DetectionEvent> events = {
        makeEvent(0, SizeCategory::Small),
        makeEvent(1, SizeCategory::XL),
        makeEvent(61, SizeCategory::XL),
    };
    const auto buckets = aggregateByMinute(events);

    const std::vector<int> all = projectSeries(buckets, std::nullopt);
    ASSERT_EQ(all.size(), 60u);
    EXPECT_EQ(all[0], 2);
    EXPECT_EQ(all[1], 1);

    const std::vector<int> xl = projectSeries(buckets, SizeCategory::XL);
    EXPECT_EQ(xl[0], 1);
    EXPECT_EQ(xl[1], 1);

    const std::vector<int> small = projectSeries(buckets, SizeCategory::Small);
    EXPECT_EQ(small[0], 1);
    EXPECT_EQ(small[1], 0);
}
