#pragma once

#include <QString>

#include <vector>

#include "timeblock/data/TimeBlock.hpp"

namespace timeblock {
namespace scheduling {

enum class ScheduleStatus
{
    Success,
    InvalidInput,
    NoMatchingWindows,
    Overdue,
    PartiallyScheduled,
};

struct TaskScheduleResult
{
    ScheduleStatus status = ScheduleStatus::InvalidInput;
    bool success = false;
    QString message;
    std::vector<data::TimeBlockInfo> timeBlocks;
    bool overdue = false; // deadline passed or at risk
    int unscheduledMinutes = 0;
};

QString scheduleStatusToString(ScheduleStatus status);

} // namespace scheduling
} // namespace timeblock
