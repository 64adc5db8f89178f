#pragma once

#include <QJsonObject>
#include <QString>

#include <array>
#include <optional>

namespace cutline {

enum class SizeCategory {
    Small,
    Medium,
    Large,
    XL
};

constexpr int kCategoryCount = 4;

struct DetectionEvent
{
    QString id;

    // Seconds since session start, never negative.
    qint64 timeOffset = 0;

    // Raw instant as supplied by the feed; parsed only by absolute range filtering.
    std::optional<QString> absoluteTimestamp;

    SizeCategory size = SizeCategory::Medium;
    double confidence = 0.0;
    QString source;
};

bool operator==(const DetectionEvent &a, const DetectionEvent &b);
bool operator!=(const DetectionEvent &a, const DetectionEvent &b);

// Declared order; also the order used for weighted sampling.
const std::array<SizeCategory, kCategoryCount> &allCategories();

inline int categoryIndex(SizeCategory c)
{
    return static_cast<int>(c);
}

// String conversions. Parsing is exact and case-sensitive.
QString categoryToString(SizeCategory c);
std::optional<SizeCategory> categoryFromString(const QString &s);

// JSON helpers
QJsonObject eventToJson(const DetectionEvent &ev);

} // namespace cutline
