#pragma once

#include <array>
#include <optional>
#include <vector>

#include "cutline/common.hpp"
#include "cutline/event.hpp"

namespace cutline {

// Per-category tally that keeps `total` equal to the sum of its counts.
class CategoryCounts
{
public:
    void add(SizeCategory c);
    void merge(const CategoryCounts &other);

    int total() const { return total_; }
    int count(SizeCategory c) const { return counts_[static_cast<std::size_t>(categoryIndex(c))]; }

private:
    int total_ = 0;
    std::array<int, kCategoryCount> counts_{};
};

struct MinuteBucket
{
    int index = 0;
    CategoryCounts counts;

    int total() const { return counts.total(); }
};

struct PeakWindow
{
    int startIndex = 0;
    int endIndex = 0;   // inclusive
    int count = 0;
};

// Always kMinuteBuckets buckets; events past the last minute land in it.
std::vector<MinuteBucket> aggregateByMinute(const std::vector<DetectionEvent> &events);

// Elementwise sum of all buckets.
CategoryCounts sessionTotals(const std::vector<MinuteBucket> &buckets);

// Events per minute across the whole series, rounded to one decimal.
double throughputPerMinute(const CategoryCounts &totals, int minutes = kMinuteBuckets);

// Busiest run of `windowSize` consecutive buckets; the earliest wins a tie.
// With fewer buckets than the window, or no events at all, the result is the
// zero window starting at 0.
PeakWindow findPeakWindow(const std::vector<MinuteBucket> &buckets,
                          int windowSize = kPeakWindowMinutes);

// Plotted value per bucket: the total, or a single category's count.
std::vector<int> projectSeries(const std::vector<MinuteBucket> &buckets,
                               std::optional<SizeCategory> category);

} // namespace cutline
