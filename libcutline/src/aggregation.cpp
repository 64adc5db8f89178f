#include "cutline/aggregation.hpp"

#include <algorithm>
#include <cmath>

namespace cutline {

void CategoryCounts::add(SizeCategory c)
{
    ++counts_[static_cast<std::size_t>(categoryIndex(c))];
    ++total_;
}

void CategoryCounts::merge(const CategoryCounts &other)
{
    for (std::size_t i = 0; i < counts_.size(); ++i) {
        counts_[i] += other.counts_[i];
    }
    total_ += other.total_;
}

std::vector<MinuteBucket> aggregateByMinute(const std::vector<DetectionEvent> &events)
{
    std::vector<MinuteBucket> buckets(kMinuteBuckets);
    for (int i = 0; i < kMinuteBuckets; ++i) {
        buckets[static_cast<std::size_t>(i)].index = i;
    }

    for (const DetectionEvent &ev : events) {
        const qint64 minute = std::clamp<qint64>(ev.timeOffset / 60, 0, kMinuteBuckets - 1);
        buckets[static_cast<std::size_t>(minute)].counts.add(ev.size);
    }

    return buckets;
}

CategoryCounts sessionTotals(const std::vector<MinuteBucket> &buckets)
{
    CategoryCounts totals;
    for (const MinuteBucket &b : buckets) {
        totals.merge(b.counts);
    }
    return totals;
}

double throughputPerMinute(const CategoryCounts &totals, int minutes)
{
    const int mins = std::max(1, minutes);
    const double perMinute = static_cast<double>(totals.total()) / mins;
    return std::floor(perMinute * 10.0 + 0.5) / 10.0;
}

PeakWindow findPeakWindow(const std::vector<MinuteBucket> &buckets, int windowSize)
{
    PeakWindow best;
    best.endIndex = windowSize - 1;

    const int n = static_cast<int>(buckets.size());
    if (windowSize <= 0 || n < windowSize) {
        return best;
    }

    // Running sum over [start, start + windowSize)
    int sum = 0;
    for (int j = 0; j < windowSize; ++j) {
        sum += buckets[static_cast<std::size_t>(j)].total();
    }
    best.count = sum;

    for (int start = 1; start + windowSize <= n; ++start) {
        sum += buckets[static_cast<std::size_t>(start + windowSize - 1)].total();
        sum -= buckets[static_cast<std::size_t>(start - 1)].total();
        if (sum > best.count) {
            best.count = sum;
            best.startIndex = start;
        }
    }

    best.endIndex = best.startIndex + windowSize - 1;
    return best;
}

std::vector<int> projectSeries(const std::vector<MinuteBucket> &buckets,
                               std::optional<SizeCategory> category)
{
    std::vector<int> series;
    series.reserve(buckets.size());
    for (const MinuteBucket &b : buckets) {
        series.push_back(category.has_value() ? b.counts.count(*category) : b.total());
    }
    return series;
}

} // namespace cutline
