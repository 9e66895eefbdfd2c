#pragma once

#include <QDateTime>
#include <QString>

#include <vector>

#include "timeblock/data/Task.hpp"
#include "timeblock/data/TimeBlock.hpp"

namespace timeblock {
namespace scheduling {

struct TimeSlot
{
    QDateTime start;
    QDateTime end;
    int duration = 0; // minutes
    QString timeWindowId;
    double quality = 0.0; // 0-100, higher is better
};

struct SchedulingContext
{
    data::Task task;
    std::vector<TimeSlot> availableSlots;
    std::vector<data::TimeBlockInfo> existingBlocks;
    QDateTime deadlineDate;
    QDateTime currentDate;
    int minBlockSize = 30;
};

struct RuleResult
{
    std::vector<TimeSlot> selectedSlots;
    QString message;
    int remainingDuration = 0;
};

} // namespace scheduling
} // namespace timeblock
