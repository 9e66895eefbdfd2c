#pragma once

#include <QDateTime>
#include <QString>

namespace timeblock {
namespace data {

struct TimeBlockInfo
{
    QString id;
    QString taskId;
    QDateTime start;
    QDateTime end;
    int duration = 0; // minutes, always end - start
    QString timeWindowId;
    bool isCompleted = false;

    // True if the block starts inside, ends inside or fully contains [rangeStart, rangeEnd).
    bool overlaps(const QDateTime &rangeStart, const QDateTime &rangeEnd) const
    {
        return (start >= rangeStart && start < rangeEnd)
            || (end > rangeStart && end <= rangeEnd)
            || (start <= rangeStart && end >= rangeEnd);
    }
};

} // namespace data
} // namespace timeblock
