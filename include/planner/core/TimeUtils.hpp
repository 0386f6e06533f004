#pragma once

#include <optional>

#include <QString>
#include <QTime>

namespace planner {
namespace core {

constexpr int kMinutesPerHour = 60;
constexpr int kMinutesPerDay = 24 * kMinutesPerHour;

// Accepts "HH:MM" and "HH:MM:SS"; "24:00" maps to end of day. Seconds are truncated.
std::optional<int> parseTimeOfDay(const QString &value);

std::optional<int> parseDurationMinutes(const QString &value);

QString formatTimeOfDay(int minutes);
int minutesSinceMidnight(const QTime &time);

} // namespace core
} // namespace planner
