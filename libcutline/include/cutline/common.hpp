#pragma once

#include <QDateTime>
#include <QString>

#include <optional>

namespace cutline {

// One session covers a fixed hour, bucketed per minute.
constexpr qint64 kSessionDurationSecs = 3600;
constexpr int kMinuteBuckets = 60;
constexpr int kPeakWindowMinutes = 10;

constexpr double kDefaultConfidence = 0.9;

QString defaultSourceLabel();

// "EVT-0007" for position 7 (1-based).
QString eventIdForPosition(int position);

// Zero-padded HH:MM:SS; negative input renders as 00:00:00.
QString formatHms(qint64 seconds);

// Inverse of formatHms. Anything that is not three finite numeric parts is 0;
// offsets beyond qint64 saturate at its maximum.
qint64 hmsToSeconds(const QString &hms);

// Chart label for a minute bucket: "00:07".
QString minuteLabel(int index);

// ISO-8601 with or without milliseconds / zone designator. A date without
// a time part means midnight UTC. Empty or malformed input yields nullopt.
std::optional<QDateTime> parseDateTime(const QString &s);

} // namespace cutline
