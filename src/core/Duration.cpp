#include "core/Duration.hpp"
#include <QRegularExpression>
#include <QStringList>
#include <limits>

namespace btt {

namespace {

struct Unit {
    const char* name;
    qint64 millis;
};

const Unit kUnits[] = {
    {"ms", 1},
    {"s", 1000}, {"sec", 1000}, {"secs", 1000}, {"second", 1000}, {"seconds", 1000},
    {"m", 60000}, {"min", 60000}, {"mins", 60000}, {"minute", 60000}, {"minutes", 60000},
    {"h", 3600000}, {"hr", 3600000}, {"hrs", 3600000}, {"hour", 3600000}, {"hours", 3600000},
    {"d", 86400000}, {"day", 86400000}, {"days", 86400000},
};

std::optional<qint64> unitMillis(const QString& name)
{
    for (const auto& unit : kUnits) {
        if (name == QLatin1String(unit.name))
            return unit.millis;
    }
    return std::nullopt;
}

constexpr qint64 kMaxMillis = std::numeric_limits<qint64>::max();

} // namespace

std::optional<std::chrono::milliseconds> parseDuration(const QString& text)
{
    const QString trimmed = text.trimmed();
    if (trimmed.isEmpty())
        return std::nullopt;

    bool isNumber = false;
    const qint64 bareSeconds = trimmed.toLongLong(&isNumber);
    if (isNumber) {
        if (bareSeconds < 0 || bareSeconds > kMaxMillis / 1000)
            return std::nullopt;
        return std::chrono::milliseconds(bareSeconds * 1000);
    }

    static const QRegularExpression component(QStringLiteral("\\s*(\\d+)\\s*([a-z]+)"));

    qint64 total = 0;
    qsizetype pos = 0;
    while (pos < trimmed.size()) {
        const auto match = component.match(trimmed, pos, QRegularExpression::NormalMatch,
                                           QRegularExpression::AnchorAtOffsetMatchOption);
        if (!match.hasMatch())
            return std::nullopt;

        bool ok = false;
        const qint64 value = match.captured(1).toLongLong(&ok);
        const auto millis = unitMillis(match.captured(2));
        if (!ok || !millis)
            return std::nullopt;

        if (value > (kMaxMillis - total) / *millis)
            return std::nullopt;
        total += value * *millis;
        pos = match.capturedEnd(0);
    }
    return std::chrono::milliseconds(total);
}

QString formatDuration(std::chrono::milliseconds duration)
{
    qint64 remaining = duration.count();
    if (remaining <= 0)
        return QStringLiteral("0s");

    struct Part { qint64 millis; const char* suffix; };
    static const Part parts[] = {
        {86400000, "d"}, {3600000, "h"}, {60000, "m"}, {1000, "s"}, {1, "ms"},
    };

    QStringList out;
    for (const auto& part : parts) {
        const qint64 count = remaining / part.millis;
        if (count > 0) {
            out << QString::number(count) + QLatin1String(part.suffix);
            remaining -= count * part.millis;
        }
    }
    return out.join(QLatin1Char(' '));
}

} // namespace btt
