#include "cutline/event.hpp"

#include "cutline/common.hpp"

#include <QJsonValue>

namespace cutline {

bool operator==(const DetectionEvent &a, const DetectionEvent &b)
{
    return a.id == b.id
        && a.timeOffset == b.timeOffset
        && a.absoluteTimestamp == b.absoluteTimestamp
        && a.size == b.size
        && a.confidence == b.confidence
        && a.source == b.source;
}

bool operator!=(const DetectionEvent &a, const DetectionEvent &b)
{
    return !(a == b);
}

const std::array<SizeCategory, kCategoryCount> &allCategories()
{
    static const std::array<SizeCategory, kCategoryCount> categories = {
        SizeCategory::Small,
        SizeCategory::Medium,
        SizeCategory::Large,
        SizeCategory::XL,
    };
    return categories;
}

QString categoryToString(SizeCategory c)
{
    switch (c) {
    case SizeCategory::Small:
        return QStringLiteral("Small");
    case SizeCategory::Medium:
        return QStringLiteral("Medium");
    case SizeCategory::Large:
        return QStringLiteral("Large");
    case SizeCategory::XL:
        return QStringLiteral("XL");
    }

    return QStringLiteral("Medium");
}

std::optional<SizeCategory> categoryFromString(const QString &s)
{
    if (s == QLatin1String("Small"))
        return SizeCategory::Small;
    if (s == QLatin1String("Medium"))
        return SizeCategory::Medium;
    if (s == QLatin1String("Large"))
        return SizeCategory::Large;
    if (s == QLatin1String("XL"))
        return SizeCategory::XL;

    return std::nullopt;
}

QJsonObject eventToJson(const DetectionEvent &ev)
{
    QJsonObject obj;

    obj.insert(QStringLiteral("id"), ev.id);

    // Offset both as clock string and raw seconds
    obj.insert(QStringLiteral("time"), formatHms(ev.timeOffset));
    obj.insert(QStringLiteral("time_offset"), static_cast<qint64>(ev.timeOffset));

    obj.insert(QStringLiteral("size"), categoryToString(ev.size));
    obj.insert(QStringLiteral("confidence"), ev.confidence);
    obj.insert(QStringLiteral("source"), ev.source);

    if (ev.absoluteTimestamp.has_value()) {
        obj.insert(QStringLiteral("timestamp"), *ev.absoluteTimestamp);
    }

    return obj;
}

} // namespace cutline
