#include "cutline/synthetic_events.hpp"

#include "cutline/common.hpp"

#include <algorithm>
#include <cmath>

namespace cutline {

namespace {

constexpr quint32 kFnvOffsetBasis = 2166136261u;
constexpr quint32 kFnvPrime = 16777619u;

// Indexed like allCategories(): Small, Medium, Large, XL.
constexpr double kCategoryWeights[kCategoryCount] = {0.22, 0.38, 0.31, 0.09};

constexpr double kConfidenceBase = 0.72;
constexpr double kConfidenceSpread = 0.27;

double roundTo3(double v)
{
    return std::floor(v * 1000.0 + 0.5) / 1000.0;
}

} // namespace

quint32 seedFromString(const QString &s)
{
    quint32 h = kFnvOffsetBasis;
    for (const QChar ch : s) {
        h ^= ch.unicode();
        h *= kFnvPrime;
    }
    return h;
}

QString syntheticSeedFor(const QString &sessionName)
{
    const QString name = sessionName.isEmpty() ? QStringLiteral("demo") : sessionName;
    return name + QStringLiteral(":events");
}

Mulberry32::Mulberry32(quint32 seed)
    : state_(seed)
{
}

double Mulberry32::next()
{
    state_ += 0x6D2B79F5u;
    quint32 x = state_;
    x = (x ^ (x >> 15)) * (x | 1u);
    x ^= x + (x ^ (x >> 7)) * (x | 61u);
    return static_cast<double>(x ^ (x >> 14)) / 4294967296.0;
}

SizeCategory sampleCategory(double draw)
{
    const auto &categories = allCategories();

    double acc = 0.0;
    for (int k = 0; k < kCategoryCount; ++k) {
        acc += kCategoryWeights[k];
        if (draw <= acc) {
            return categories[static_cast<std::size_t>(k)];
        }
    }

    // Weights may sum to slightly under 1.0
    return categories.back();
}

std::vector<DetectionEvent> generateSyntheticEvents(const QString &seedString)
{
    std::vector<DetectionEvent> out;
    out.reserve(kSyntheticEventCount);

    Mulberry32 rng(seedFromString(seedString));

    for (int i = 0; i < kSyntheticEventCount; ++i) {
        DetectionEvent ev;
        ev.id = eventIdForPosition(i + 1);
        ev.timeOffset = static_cast<qint64>(std::floor(
            (static_cast<double>(i) / kSyntheticEventCount) * kSessionDurationSecs));

        // Category draw first, confidence draw second.
        ev.size = sampleCategory(rng.next());

        const double confidence = std::clamp(
            kConfidenceBase + rng.next() * kConfidenceSpread, 0.0, 1.0);
        ev.confidence = roundTo3(confidence);

        ev.source = defaultSourceLabel();
        out.push_back(std::move(ev));
    }

    return out;
}

} // namespace cutline
