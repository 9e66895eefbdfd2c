#include "timeblock/scheduling/Scheduler.hpp"

#include "timeblock/core/Logging.hpp"
#include "timeblock/data/TaskRepository.hpp"
#include "timeblock/scheduling/AvailabilityFinder.hpp"
#include "timeblock/scheduling/ConflictDetector.hpp"
#include "timeblock/scheduling/SchedulingRules.hpp"

#include <QTime>

#include <algorithm>

namespace timeblock {
namespace scheduling {

namespace {

const QString kManualWindowId = QStringLiteral("manual");

QDateTime ceilToMinute(const QDateTime &instant)
{
    const QDateTime local = instant.toLocalTime();
    const QTime time = local.time();
    if (time.second() == 0 && time.msec() == 0) {
        return local;
    }
    return QDateTime(local.date(), QTime(time.hour(), time.minute())).addSecs(60);
}

TaskScheduleResult failure(ScheduleStatus status, const QString &message, bool overdue, int unscheduledMinutes)
{
    TaskScheduleResult result;
    result.status = status;
    result.success = false;
    result.message = message;
    result.overdue = overdue;
    result.unscheduledMinutes = unscheduledMinutes;
    return result;
}

} // namespace

Scheduler::Scheduler(data::TaskRepository &tasks, std::vector<data::TimeWindow> windows, SchedulerOptions options)
    : m_tasks(tasks)
    , m_timeWindows(std::move(windows))
    , m_options(std::move(options))
{
    if (m_timeWindows.empty()) {
        m_timeWindows = data::defaultTimeWindows();
    }
}

Scheduler::~Scheduler() = default;

TaskScheduleResult Scheduler::scheduleTask(const data::Task &task)
{
    if (!task.dueDate.isValid()) {
        return failure(ScheduleStatus::InvalidInput, QStringLiteral("Task must have a due date"), false, 0);
    }
    if (!task.estimatedDuration || *task.estimatedDuration <= 0) {
        return failure(ScheduleStatus::InvalidInput,
                       QStringLiteral("Task must have a valid estimated duration"), false, 0);
    }

    const int totalMinutes = *task.estimatedDuration;
    const QDateTime currentTime = now();

    if (task.dueDate < currentTime) {
        qCInfo(core::lcScheduling) << "Task" << task.id << "is already overdue";
        return failure(ScheduleStatus::Overdue, QStringLiteral("Task is already overdue"), true, totalMinutes);
    }

    std::vector<data::TimeWindow> allowedWindows;
    if (task.allowedTimeWindows.isEmpty()) {
        allowedWindows = m_timeWindows;
    } else {
        for (const auto &window : m_timeWindows) {
            if (task.allowedTimeWindows.contains(window.id)) {
                allowedWindows.push_back(window);
            }
        }
    }
    if (allowedWindows.empty()) {
        qCWarning(core::lcScheduling) << "Task" << task.id << "has no usable time window, requested:"
                                      << task.allowedTimeWindows;
        return failure(ScheduleStatus::NoMatchingWindows,
                       QStringLiteral("No matching time windows found for task"), false, totalMinutes);
    }
    std::stable_sort(allowedWindows.begin(), allowedWindows.end(),
                     [](const data::TimeWindow &a, const data::TimeWindow &b) { return a.priority > b.priority; });

    rememberTask(task);

    QDateTime startTime = currentTime;
    if (task.creationDate.isValid() && task.creationDate > startTime) {
        startTime = task.creationDate;
    }
    startTime = ceilToMinute(startTime);

    const int minBlockSize = minimumBlockSize(task);
    const AvailabilityFinder finder(m_cache, m_tasks);
    auto slots = finder.findAvailableSlots(startTime, task.dueDate, minBlockSize, allowedWindows,
                                           task.timeDefense == data::TimeDefense::AlwaysBusy);
    const auto selected = selectSlots(task, std::move(slots), currentTime, minBlockSize);

    TaskScheduleResult result;
    int remainingMinutes = totalMinutes;
    for (const auto &slot : selected) {
        if (remainingMinutes <= 0) {
            break;
        }
        const int blockDuration = std::min(remainingMinutes, slot.duration);
        if (blockDuration <= 0) {
            continue;
        }

        data::TimeBlockInfo block;
        block.id = nextBlockId(task.id);
        block.taskId = task.id;
        block.start = slot.start;
        block.end = slot.start.addSecs(static_cast<qint64>(blockDuration) * 60);
        block.duration = blockDuration;
        block.timeWindowId = slot.timeWindowId;

        if (!m_cache.add(block)) {
            continue;
        }
        result.timeBlocks.push_back(block);
        remainingMinutes -= blockDuration;
    }

    const auto blockCount = static_cast<int>(result.timeBlocks.size());
    result.unscheduledMinutes = remainingMinutes;
    if (remainingMinutes <= 0) {
        result.status = ScheduleStatus::Success;
        result.success = true;
        result.message = QStringLiteral("Task scheduled into %1 time blocks").arg(blockCount);
    } else {
        result.status = ScheduleStatus::PartiallyScheduled;
        result.overdue = true;
        if (result.timeBlocks.empty()) {
            result.message = QStringLiteral("No available time slots found within task deadline");
        } else {
            result.message = QStringLiteral("Only %1 of %2 minutes could be scheduled")
                                 .arg(totalMinutes - remainingMinutes)
                                 .arg(totalMinutes);
        }
    }

    qCInfo(core::lcScheduling) << "Task" << task.id << scheduleStatusToString(result.status) << "-"
                               << result.message;
    return result;
}

RescheduleSummary Scheduler::rescheduleAll(const std::vector<data::Task> &tasks)
{
    std::vector<data::Task> schedulable;
    for (const auto &task : tasks) {
        if (isTaskSchedulable(task)) {
            schedulable.push_back(task);
        }
    }

    for (const auto &task : schedulable) {
        removeScheduledBlocks(task.id);
    }

    RescheduleSummary summary;
    for (const auto &task : schedulable) {
        const auto result = scheduleTask(task);
        if (result.success) {
            ++summary.succeeded;
        } else if (!result.timeBlocks.empty()) {
            ++summary.partial;
        } else {
            ++summary.failed;
        }
    }

    qCInfo(core::lcScheduling) << "Rescheduled tasks:" << summary.succeeded << "successful," << summary.partial
                               << "partial," << summary.failed << "failed";
    return summary;
}

double Scheduler::calculateTaskUrgency(const data::Task &task) const
{
    return urgencyStrategy(m_options.urgencyFormula)(task, now());
}

int Scheduler::minimumBlockSize(const data::Task &task) const
{
    if (task.splitUpBlock && *task.splitUpBlock > 0) {
        return *task.splitUpBlock;
    }
    return std::min(30, task.estimatedDuration.value_or(30));
}

bool Scheduler::hasConflicts(const QString &taskId) const
{
    return ConflictDetector(m_cache).hasConflicts(taskId);
}

std::vector<data::TimeBlockInfo> Scheduler::getBlocksInTimeframe(const QDateTime &start, const QDateTime &end) const
{
    return m_cache.blocksInRange(start, end);
}

std::vector<data::TimeBlockInfo> Scheduler::getBlocksForTask(const QString &taskId) const
{
    return m_cache.blocksForTask(taskId);
}

bool Scheduler::hasScheduledBlocks(const QString &taskId) const
{
    return m_cache.blockCountForTask(taskId) > 0;
}

const std::vector<data::TimeBlockInfo> &Scheduler::scheduledBlocks() const
{
    return m_cache.blocks();
}

void Scheduler::setScheduledBlocks(std::vector<data::TimeBlockInfo> blocks)
{
    m_cache.assign(std::move(blocks));
}

bool Scheduler::markBlockCompleted(const QString &blockId)
{
    return m_cache.markCompleted(blockId);
}

int Scheduler::removeScheduledBlocks(const QString &taskId)
{
    return m_cache.removeForTask(taskId);
}

std::optional<data::TimeBlockInfo> Scheduler::createTimeBlock(const data::Task &task,
                                                              const QDateTime &start,
                                                              const QDateTime &end)
{
    if (task.id.isEmpty() || !start.isValid() || !end.isValid()) {
        return std::nullopt;
    }
    const auto minutes = static_cast<int>(start.secsTo(end) / 60);
    if (minutes <= 0) {
        return std::nullopt;
    }

    rememberTask(task);

    data::TimeBlockInfo block;
    block.id = nextBlockId(task.id);
    block.taskId = task.id;
    block.start = start;
    block.end = start.addSecs(static_cast<qint64>(minutes) * 60);
    block.duration = minutes;
    block.timeWindowId = kManualWindowId;
    if (!m_cache.add(block)) {
        return std::nullopt;
    }
    return block;
}

bool Scheduler::updateTimeBlock(const QString &blockId, const QDateTime &start, const QDateTime &end)
{
    auto block = m_cache.findById(blockId);
    if (!block || !start.isValid() || !end.isValid()) {
        return false;
    }
    const auto minutes = static_cast<int>(start.secsTo(end) / 60);
    if (minutes <= 0) {
        return false;
    }
    block->start = start;
    block->end = start.addSecs(static_cast<qint64>(minutes) * 60);
    block->duration = minutes;
    return m_cache.update(*block);
}

bool Scheduler::deleteTimeBlock(const QString &blockId)
{
    return m_cache.remove(blockId);
}

std::vector<TimeSlot> Scheduler::availableTimeSlots(const QDate &date, int durationMinutes) const
{
    return AvailabilityFinder(m_cache, m_tasks).availableSlotsOnDay(date, durationMinutes, m_timeWindows);
}

const std::vector<data::TimeWindow> &Scheduler::timeWindows() const
{
    return m_timeWindows;
}

void Scheduler::setTimeWindows(std::vector<data::TimeWindow> windows)
{
    m_timeWindows = std::move(windows);
    if (m_timeWindows.empty()) {
        qCInfo(core::lcConfig) << "Empty time window list, using defaults";
        m_timeWindows = data::defaultTimeWindows();
    }
}

void Scheduler::addTimeWindow(const QString &name,
                              int startHour,
                              int endHour,
                              const QVector<int> &days,
                              const QString &color)
{
    data::TimeWindow window;
    window.id = name;
    window.name = name;
    window.color = color;
    window.priority = 10;
    const data::TimeRange range{ qBound(0, startHour, 24) * 60, qBound(0, endHour, 24) * 60 };
    for (const int day : days) {
        if (day < 0 || day > 6) {
            qCWarning(core::lcConfig) << "Ignoring invalid weekday" << day << "for time window" << name;
            continue;
        }
        window.schedule[day].append(range);
    }

    removeTimeWindow(name);
    m_timeWindows.push_back(std::move(window));
}

bool Scheduler::removeTimeWindow(const QString &id)
{
    const auto before = m_timeWindows.size();
    m_timeWindows.erase(std::remove_if(m_timeWindows.begin(), m_timeWindows.end(),
                                       [&id](const data::TimeWindow &window) { return window.id == id; }),
                        m_timeWindows.end());
    return m_timeWindows.size() != before;
}

const SchedulerOptions &Scheduler::options() const
{
    return m_options;
}

void Scheduler::setOptions(SchedulerOptions options)
{
    m_options = std::move(options);
}

const data::ScheduleCache &Scheduler::cache() const
{
    return m_cache;
}

QDateTime Scheduler::now() const
{
    if (m_options.clock) {
        return m_options.clock();
    }
    return QDateTime::currentDateTime();
}

QString Scheduler::nextBlockId(const QString &taskId) const
{
    int index = m_cache.blockCountForTask(taskId);
    QString id = QStringLiteral("%1-block-%2").arg(taskId).arg(index);
    while (m_cache.contains(id)) {
        id = QStringLiteral("%1-block-%2").arg(taskId).arg(++index);
    }
    return id;
}

void Scheduler::rememberTask(const data::Task &task)
{
    if (!m_tasks.updateTask(task)) {
        m_tasks.addTask(task);
    }
}

std::vector<TimeSlot> Scheduler::selectSlots(const data::Task &task,
                                             std::vector<TimeSlot> slots,
                                             const QDateTime &currentTime,
                                             int minBlockSize) const
{
    if (m_options.slotOrdering == SlotOrdering::Rules) {
        SchedulingContext context;
        context.task = task;
        context.availableSlots = std::move(slots);
        context.existingBlocks = m_cache.blocks();
        context.deadlineDate = task.dueDate;
        context.currentDate = currentTime;
        context.minBlockSize = minBlockSize;
        auto ruleResult = applySchedulingRules(context);
        qCDebug(core::lcScheduling) << ruleResult.message;
        return std::move(ruleResult.selectedSlots);
    }

    std::sort(slots.begin(), slots.end(), [](const TimeSlot &a, const TimeSlot &b) { return a.start < b.start; });
    return slots;
}

} // namespace scheduling
} // namespace timeblock
