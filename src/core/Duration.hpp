#pragma once

#include <QString>
#include <chrono>
#include <optional>

namespace btt {

/// Parse a human-readable duration such as "5m 1s", "30s", "1h30m" or "250ms".
/// Units: ms, s/sec/secs/second/seconds, m/min/mins/minute/minutes,
/// h/hr/hrs/hour/hours, d/day/days. A bare integer is read as seconds.
/// Returns nullopt on any syntax error or an empty string.
std::optional<std::chrono::milliseconds> parseDuration(const QString& text);

/// Format a duration the way parseDuration() accepts it, largest unit first
/// ("5m 1s", "1m", "250ms"). Zero formats as "0s".
QString formatDuration(std::chrono::milliseconds duration);

} // namespace btt
