#include "timeblock/scheduling/SchedulingRules.hpp"

#include <QtGlobal>

#include <algorithm>
#include <cmath>

namespace timeblock {
namespace scheduling {

namespace {

constexpr double kHoursPerWeek = 168.0;

int clampedPriority(const data::Task &task)
{
    return qBound(1, task.priority, 4);
}

double hoursUntil(const QDateTime &from, const QDateTime &to)
{
    return static_cast<double>(from.secsTo(to)) / 3600.0;
}

} // namespace

double linearUrgency(const data::Task &task, const QDateTime &now)
{
    if (!task.dueDate.isValid() || !task.estimatedDuration || *task.estimatedDuration <= 0) {
        return 0.0;
    }

    const double minutesRemaining = static_cast<double>(now.secsTo(task.dueDate)) / 60.0;
    if (minutesRemaining <= 0.0) {
        return 100.0;
    }

    const double durationRatio = *task.estimatedDuration / minutesRemaining;
    // Priority 1 weighs 3x, priority 4 weighs 1.5x.
    const double priorityFactor = 1.0 + (5 - clampedPriority(task)) * 0.5;
    return std::min(100.0, durationRatio * 100.0 * priorityFactor);
}

double logarithmicUrgency(const data::Task &task, const QDateTime &now)
{
    if (!task.dueDate.isValid()) {
        return 0.0;
    }

    const double hoursRemaining = std::max(0.0, hoursUntil(now, task.dueDate));
    if (hoursRemaining <= 0.0) {
        return 100.0;
    }

    double urgency = 100.0 - (std::log(hoursRemaining + 1.0) / std::log(kHoursPerWeek)) * 100.0;
    urgency += (5 - clampedPriority(task)) * 6.67;

    if (task.estimatedDuration && *task.estimatedDuration > 0) {
        const double timeRatio = (*task.estimatedDuration / 60.0) / hoursRemaining;
        if (timeRatio > 0.5) {
            urgency += std::min(15.0, timeRatio * 15.0);
        }

        if (task.splitUpBlock && *task.splitUpBlock > 0) {
            const auto blocksNeeded = static_cast<int>(
                std::ceil(static_cast<double>(*task.estimatedDuration) / *task.splitUpBlock));
            urgency += std::min(5, blocksNeeded);
        }
    }

    return qBound(0.0, std::round(urgency), 100.0);
}

UrgencyStrategy urgencyStrategy(UrgencyFormula formula)
{
    switch (formula) {
    case UrgencyFormula::Linear:
        return &linearUrgency;
    case UrgencyFormula::Logarithmic:
        break;
    }
    return &logarithmicUrgency;
}

bool isUrgent(const data::Task &task, const QDateTime &now)
{
    if (task.priority == 1) {
        return true;
    }
    if (task.urgency && *task.urgency > 80.0) {
        return true;
    }
    if (task.dueDate.isValid()) {
        const double hoursUntilDue = hoursUntil(now, task.dueDate);
        if (hoursUntilDue < 24.0) {
            return true;
        }
        if (task.estimatedDuration && *task.estimatedDuration > 0) {
            const double hoursNeeded = *task.estimatedDuration / 60.0;
            if (hoursUntilDue < hoursNeeded * 2.0) {
                return true;
            }
        }
    }
    return false;
}

bool isLongTask(const data::Task &task)
{
    return task.estimatedDuration && *task.estimatedDuration > 120;
}

double proximityScore(const QDateTime &slotStart, const QDateTime &deadline, const QDateTime &now)
{
    const qint64 totalSpan = now.msecsTo(deadline);
    const qint64 untilSlot = now.msecsTo(slotStart);

    if (untilSlot > totalSpan) {
        return 0.0;
    }
    if (totalSpan <= 0) {
        return 100.0;
    }

    const double percentageThrough = qBound(0.0, static_cast<double>(untilSlot) / totalSpan * 100.0, 100.0);
    return 100.0 - std::abs(percentageThrough - 75.0);
}

RuleResult applySchedulingRules(const SchedulingContext &context)
{
    std::vector<TimeSlot> sortedSlots = context.availableSlots;
    const auto &task = context.task;
    const QDateTime now = context.currentDate;

    if (isUrgent(task, now)) {
        std::stable_sort(sortedSlots.begin(), sortedSlots.end(),
                         [](const TimeSlot &a, const TimeSlot &b) { return a.start < b.start; });
    } else if (isLongTask(task)) {
        std::stable_sort(sortedSlots.begin(), sortedSlots.end(),
                         [](const TimeSlot &a, const TimeSlot &b) { return a.duration > b.duration; });
    } else {
        const QDateTime deadline = context.deadlineDate;
        auto score = [&](const TimeSlot &slot) {
            return slot.quality + proximityScore(slot.start, deadline, now);
        };
        std::stable_sort(sortedSlots.begin(), sortedSlots.end(),
                         [&](const TimeSlot &a, const TimeSlot &b) { return score(a) > score(b); });
    }

    if (!task.allowedTimeWindows.isEmpty()) {
        std::stable_partition(sortedSlots.begin(), sortedSlots.end(), [&task](const TimeSlot &slot) {
            return task.allowedTimeWindows.contains(slot.timeWindowId);
        });
    }

    RuleResult result;
    const int totalDuration = task.estimatedDuration.value_or(0);
    int remaining = totalDuration;

    for (const auto &slot : sortedSlots) {
        if (remaining <= 0) {
            break;
        }
        const int durationToUse = std::min(remaining, slot.duration);
        // The last piece of a task may be shorter than the minimum block size.
        if (durationToUse <= 0 || (durationToUse < context.minBlockSize && durationToUse != remaining)) {
            continue;
        }
        TimeSlot adjusted = slot;
        adjusted.end = slot.start.addSecs(static_cast<qint64>(durationToUse) * 60);
        adjusted.duration = durationToUse;
        result.selectedSlots.push_back(adjusted);
        remaining -= durationToUse;
    }

    result.remainingDuration = remaining;
    const auto blockCount = static_cast<int>(result.selectedSlots.size());
    if (result.selectedSlots.empty()) {
        result.message = QStringLiteral("No suitable time slots found.");
    } else if (remaining > 0) {
        result.message = QStringLiteral("Partially scheduled: %1 of %2 minutes scheduled across %3 time block(s).")
                             .arg(totalDuration - remaining)
                             .arg(totalDuration)
                             .arg(blockCount);
    } else {
        result.message = QStringLiteral("Fully scheduled: %1 minutes across %2 time block(s).")
                             .arg(totalDuration)
                             .arg(blockCount);
    }
    return result;
}

bool isTaskSchedulable(const data::Task &task)
{
    if (!task.dueDate.isValid() || !task.estimatedDuration || *task.estimatedDuration <= 0) {
        return false;
    }
    if (task.completed) {
        return false;
    }
    return task.autoSchedule.value_or(true);
}

int suggestedBlockSize(const data::Task &task, const QDateTime &now)
{
    if (task.splitUpBlock && *task.splitUpBlock > 0) {
        return *task.splitUpBlock;
    }

    const double urgency = task.urgency ? *task.urgency : logarithmicUrgency(task, now);
    const int duration = task.estimatedDuration.value_or(0);

    if (urgency > 80.0) {
        return std::min(30, duration);
    }
    if (duration > 240) {
        return 60;
    }
    if (duration > 120) {
        return 45;
    }
    return std::min(30, duration);
}

} // namespace scheduling
} // namespace timeblock
