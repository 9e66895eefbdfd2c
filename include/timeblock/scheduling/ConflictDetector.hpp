#pragma once

#include <QString>
#include <QStringList>

#include "timeblock/data/TimeBlock.hpp"

namespace timeblock {
namespace data {
class ScheduleCache;
}

namespace scheduling {

class ConflictDetector
{
public:
    explicit ConflictDetector(const data::ScheduleCache &cache);

    static bool blocksOverlap(const data::TimeBlockInfo &first, const data::TimeBlockInfo &second);

    // True as soon as one block of the task overlaps a block of another task.
    bool hasConflicts(const QString &taskId) const;

    // Every task id involved in at least one overlap, listed once.
    QStringList conflictingTaskIds() const;

private:
    const data::ScheduleCache &m_cache;
};

} // namespace scheduling
} // namespace timeblock
