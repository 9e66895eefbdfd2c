#pragma once

#include <QDate>
#include <QDateTime>

#include <optional>
#include <vector>

#include "timeblock/data/TimeBlock.hpp"
#include "timeblock/data/TimeWindow.hpp"
#include "timeblock/scheduling/TimeSlot.hpp"

namespace timeblock {
namespace data {
class ScheduleCache;
class TaskRepository;
}

namespace scheduling {

struct WindowOccurrence
{
    const data::TimeWindow *window = nullptr;
    QDateTime start;
    QDateTime end;
};

class AvailabilityFinder
{
public:
    // How many days past the current one the window search may look ahead.
    static constexpr int kMaxLookaheadDays = 7;

    AvailabilityFinder(const data::ScheduleCache &cache, const data::TaskRepository &tasks);

    // Free slots of at least minBlockSize minutes inside [startTime, endTime), in generation order.
    // With isFixedRequest, blocks of always-free tasks are treated as free time.
    std::vector<TimeSlot> findAvailableSlots(const QDateTime &startTime,
                                             const QDateTime &endTime,
                                             int minBlockSize,
                                             const std::vector<data::TimeWindow> &allowedWindows,
                                             bool isFixedRequest) const;

    // The window segment covering time, or the next one to start. Nothing when no window
    // has a range within kMaxLookaheadDays.
    std::optional<WindowOccurrence> findNextValidWindow(const QDateTime &time,
                                                        const std::vector<data::TimeWindow> &windows) const;

    // End of the window's range covering startTime in local time, the next midnight when none does.
    // Occurrences start from this end and are then cut where a higher priority window begins.
    QDateTime getWindowEndTime(const QDateTime &startTime, const data::TimeWindow &window) const;

    std::optional<data::TimeBlockInfo> findNextBusyBlock(const QDateTime &startTime,
                                                         const QDateTime &endTime,
                                                         bool isFixedRequest) const;

    std::vector<TimeSlot> availableSlotsOnDay(const QDate &date,
                                              int minDuration,
                                              const std::vector<data::TimeWindow> &windows) const;

private:
    std::optional<WindowOccurrence> occurrenceOnDay(const QDate &date,
                                                    int fromMinute,
                                                    const std::vector<data::TimeWindow> &windows) const;
    bool isDisplaceable(const data::TimeBlockInfo &block) const;

    const data::ScheduleCache &m_cache;
    const data::TaskRepository &m_tasks;
};

} // namespace scheduling
} // namespace timeblock
