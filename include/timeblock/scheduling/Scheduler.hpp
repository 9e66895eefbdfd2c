#pragma once

#include <QDate>
#include <QDateTime>
#include <QString>
#include <QVector>

#include <optional>
#include <vector>

#include "timeblock/data/ScheduleCache.hpp"
#include "timeblock/data/Task.hpp"
#include "timeblock/data/TimeWindow.hpp"
#include "timeblock/scheduling/ScheduleResult.hpp"
#include "timeblock/scheduling/SchedulerOptions.hpp"
#include "timeblock/scheduling/TimeSlot.hpp"

namespace timeblock {
namespace data {
class TaskRepository;
}

namespace scheduling {

struct RescheduleSummary
{
    int succeeded = 0;
    int partial = 0;
    int failed = 0;
};

// Owns the schedule cache and the time window configuration. Every block placement,
// removal and completion goes through this object. Not thread-safe.
class Scheduler
{
public:
    explicit Scheduler(data::TaskRepository &tasks,
                       std::vector<data::TimeWindow> windows = {},
                       SchedulerOptions options = {});
    ~Scheduler();

    TaskScheduleResult scheduleTask(const data::Task &task);
    RescheduleSummary rescheduleAll(const std::vector<data::Task> &tasks);

    double calculateTaskUrgency(const data::Task &task) const;
    int minimumBlockSize(const data::Task &task) const;
    bool hasConflicts(const QString &taskId) const;

    std::vector<data::TimeBlockInfo> getBlocksInTimeframe(const QDateTime &start, const QDateTime &end) const;
    std::vector<data::TimeBlockInfo> getBlocksForTask(const QString &taskId) const;
    bool hasScheduledBlocks(const QString &taskId) const;
    const std::vector<data::TimeBlockInfo> &scheduledBlocks() const;
    void setScheduledBlocks(std::vector<data::TimeBlockInfo> blocks);
    bool markBlockCompleted(const QString &blockId);
    int removeScheduledBlocks(const QString &taskId);

    std::optional<data::TimeBlockInfo> createTimeBlock(const data::Task &task,
                                                       const QDateTime &start,
                                                       const QDateTime &end);
    bool updateTimeBlock(const QString &blockId, const QDateTime &start, const QDateTime &end);
    bool deleteTimeBlock(const QString &blockId);
    std::vector<TimeSlot> availableTimeSlots(const QDate &date, int durationMinutes) const;

    const std::vector<data::TimeWindow> &timeWindows() const;
    // An empty list falls back to the default windows.
    void setTimeWindows(std::vector<data::TimeWindow> windows);
    void addTimeWindow(const QString &name, int startHour, int endHour, const QVector<int> &days, const QString &color);
    bool removeTimeWindow(const QString &id);

    const SchedulerOptions &options() const;
    void setOptions(SchedulerOptions options);
    const data::ScheduleCache &cache() const;

private:
    QDateTime now() const;
    QString nextBlockId(const QString &taskId) const;
    void rememberTask(const data::Task &task);
    std::vector<TimeSlot> selectSlots(const data::Task &task,
                                      std::vector<TimeSlot> slots,
                                      const QDateTime &currentTime,
                                      int minBlockSize) const;

    data::TaskRepository &m_tasks;
    data::ScheduleCache m_cache;
    std::vector<data::TimeWindow> m_timeWindows;
    SchedulerOptions m_options;
};

} // namespace scheduling
} // namespace timeblock
