#pragma once

#include <QDate>
#include <QDateTime>
#include <QMap>
#include <QString>
#include <QVector>

#include <optional>
#include <vector>

namespace timeblock {
namespace data {

constexpr int kMinutesPerDay = 24 * 60;

struct TimeRange
{
    int startMinute = 0; // minutes since midnight
    int endMinute = 0;

    bool isEmpty() const { return endMinute <= startMinute; }
    bool contains(int minuteOfDay) const { return minuteOfDay >= startMinute && minuteOfDay < endMinute; }

    static std::optional<TimeRange> fromStrings(const QString &start, const QString &end);
};

struct TimeWindow
{
    QString id;
    QString name;
    QString color;
    QMap<int, QVector<TimeRange>> schedule; // weekday, 0 = Sunday
    int priority = 0;

    QVector<TimeRange> rangesFor(int weekday) const;
    bool isActiveAt(const QDateTime &instant) const;
};

// Parses "HH:MM" (24h). "24:00" is accepted as the end of a day.
std::optional<int> parseClockTime(const QString &value);
QString formatClockTime(int minuteOfDay);

int weekdayOf(const QDate &date);
int minuteOfDay(const QDateTime &instant);
QDateTime atMinuteOfDay(const QDate &date, int minuteOfDay);

std::vector<TimeWindow> defaultTimeWindows();

} // namespace data
} // namespace timeblock
