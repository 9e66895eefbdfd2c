#include "timeblock/data/TimeWindow.hpp"

#include <QTime>

namespace timeblock {
namespace data {

namespace {

TimeRange makeRange(const char *start, const char *end)
{
    return TimeRange::fromStrings(QLatin1String(start), QLatin1String(end)).value_or(TimeRange{});
}

} // namespace

std::optional<TimeRange> TimeRange::fromStrings(const QString &start, const QString &end)
{
    const auto startMinute = parseClockTime(start);
    const auto endMinute = parseClockTime(end);
    if (!startMinute || !endMinute) {
        return std::nullopt;
    }
    return TimeRange{ *startMinute, *endMinute };
}

QVector<TimeRange> TimeWindow::rangesFor(int weekday) const
{
    return schedule.value(weekday);
}

bool TimeWindow::isActiveAt(const QDateTime &instant) const
{
    if (!instant.isValid()) {
        return false;
    }
    const int minute = minuteOfDay(instant);
    const auto ranges = rangesFor(weekdayOf(instant.date()));
    for (const auto &range : ranges) {
        if (!range.isEmpty() && range.contains(minute)) {
            return true;
        }
    }
    return false;
}

std::optional<int> parseClockTime(const QString &value)
{
    const QString trimmed = value.trimmed();
    const int colonIndex = trimmed.indexOf(':');
    if (colonIndex <= 0 || colonIndex == trimmed.size() - 1) {
        return std::nullopt;
    }
    bool hoursOk = false;
    bool minutesOk = false;
    const int hours = trimmed.left(colonIndex).toInt(&hoursOk);
    const int minutes = trimmed.mid(colonIndex + 1).toInt(&minutesOk);
    if (!hoursOk || !minutesOk || hours < 0 || minutes < 0 || minutes > 59) {
        return std::nullopt;
    }
    const int total = hours * 60 + minutes;
    if (total > kMinutesPerDay) {
        return std::nullopt;
    }
    return total;
}

QString formatClockTime(int minuteOfDay)
{
    return QStringLiteral("%1:%2")
        .arg(minuteOfDay / 60, 2, 10, QLatin1Char('0'))
        .arg(minuteOfDay % 60, 2, 10, QLatin1Char('0'));
}

int weekdayOf(const QDate &date)
{
    // QDate counts Monday = 1 ... Sunday = 7.
    return date.dayOfWeek() % 7;
}

int minuteOfDay(const QDateTime &instant)
{
    const QTime time = instant.time();
    return time.hour() * 60 + time.minute();
}

QDateTime atMinuteOfDay(const QDate &date, int minuteOfDay)
{
    if (minuteOfDay >= kMinutesPerDay) {
        return QDateTime(date.addDays(1), QTime(0, 0));
    }
    return QDateTime(date, QTime(minuteOfDay / 60, minuteOfDay % 60));
}

std::vector<TimeWindow> defaultTimeWindows()
{
    TimeWindow work;
    work.id = QStringLiteral("work");
    work.name = QStringLiteral("Work Hours");
    work.color = QStringLiteral("#3498db");
    work.priority = 10;
    for (int day = 1; day <= 5; ++day) {
        work.schedule.insert(day, { makeRange("09:00", "17:00") });
    }

    TimeWindow personal;
    personal.id = QStringLiteral("personal");
    personal.name = QStringLiteral("Personal Time");
    personal.color = QStringLiteral("#2ecc71");
    personal.priority = 5;
    personal.schedule.insert(0, { makeRange("05:00", "23:00") });
    for (int day = 1; day <= 5; ++day) {
        personal.schedule.insert(day, { makeRange("05:00", "09:00"), makeRange("17:00", "23:00") });
    }
    personal.schedule.insert(6, { makeRange("05:00", "23:00") });

    return { work, personal };
}

} // namespace data
} // namespace timeblock
