#pragma once

#include <QString>

#include <vector>

#include "cutline/event.hpp"

namespace cutline {

constexpr int kSyntheticEventCount = 220;

// 32-bit FNV-1a over the UTF-16 code units of `s`.
quint32 seedFromString(const QString &s);

// Seed string for a named session; an empty name means "demo".
QString syntheticSeedFor(const QString &sessionName);

// mulberry32: small deterministic generator producing doubles in [0, 1).
class Mulberry32
{
public:
    explicit Mulberry32(quint32 seed);

    double next();

private:
    quint32 state_;
};

// Pick from allCategories() by cumulative weight. `draw` is in [0, 1).
SizeCategory sampleCategory(double draw);

// Fallback event set used when no real feed is available. Same seed string,
// same events.
std::vector<DetectionEvent> generateSyntheticEvents(const QString &seedString);

} // namespace cutline
