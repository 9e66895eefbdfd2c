#include "timeblock/scheduling/AvailabilityFinder.hpp"

#include "timeblock/core/Logging.hpp"
#include "timeblock/data/ScheduleCache.hpp"
#include "timeblock/data/TaskRepository.hpp"

#include <QtGlobal>

#include <algorithm>

namespace timeblock {
namespace scheduling {

namespace {

double slotQuality(const data::TimeWindow &window, const std::vector<data::TimeWindow> &windows)
{
    int maxPriority = 0;
    for (const auto &candidate : windows) {
        maxPriority = std::max(maxPriority, candidate.priority);
    }
    if (maxPriority <= 0) {
        return 50.0;
    }
    return qBound(0.0, 100.0 * window.priority / maxPriority, 100.0);
}

TimeSlot makeSlot(const QDateTime &start, int minutes, const data::TimeWindow &window, double quality)
{
    TimeSlot slot;
    slot.start = start;
    slot.end = start.addSecs(static_cast<qint64>(minutes) * 60);
    slot.duration = minutes;
    slot.timeWindowId = window.id;
    slot.quality = quality;
    return slot;
}

int wholeMinutesBetween(const QDateTime &from, const QDateTime &to)
{
    return static_cast<int>(from.secsTo(to) / 60);
}

} // namespace

AvailabilityFinder::AvailabilityFinder(const data::ScheduleCache &cache, const data::TaskRepository &tasks)
    : m_cache(cache)
    , m_tasks(tasks)
{
}

std::vector<TimeSlot> AvailabilityFinder::findAvailableSlots(const QDateTime &startTime,
                                                             const QDateTime &endTime,
                                                             int minBlockSize,
                                                             const std::vector<data::TimeWindow> &allowedWindows,
                                                             bool isFixedRequest) const
{
    std::vector<TimeSlot> slots;
    if (!startTime.isValid() || !endTime.isValid() || startTime >= endTime || allowedWindows.empty()) {
        return slots;
    }
    const int minimum = std::max(1, minBlockSize);
    // Window ranges are wall-clock times, so the whole search runs in local time.
    const QDateTime localEnd = endTime.toLocalTime();

    QDateTime current = startTime.toLocalTime();
    while (current < localEnd) {
        const auto occurrence = findNextValidWindow(current, allowedWindows);
        if (!occurrence) {
            break;
        }
        if (occurrence->start >= localEnd) {
            break;
        }
        if (occurrence->end <= current) {
            current = data::atMinuteOfDay(current.date().addDays(1), 0);
            continue;
        }

        current = std::max(current, occurrence->start);
        const QDateTime windowEnd = std::min(occurrence->end, localEnd);
        const auto &window = *occurrence->window;

        const auto busyBlock = findNextBusyBlock(current, windowEnd, isFixedRequest);
        if (!busyBlock) {
            const int minutes = wholeMinutesBetween(current, windowEnd);
            if (minutes >= minimum) {
                slots.push_back(makeSlot(current, minutes, window, slotQuality(window, allowedWindows)));
            }
            current = windowEnd;
        } else {
            const int minutes = wholeMinutesBetween(current, busyBlock->start);
            if (minutes >= minimum) {
                slots.push_back(makeSlot(current, minutes, window, slotQuality(window, allowedWindows)));
            }
            current = busyBlock->end > current ? busyBlock->end.toLocalTime() : windowEnd;
        }
    }

    qCDebug(core::lcScheduling) << "Found" << slots.size() << "slots between" << startTime << "and" << endTime;
    return slots;
}

std::optional<WindowOccurrence> AvailabilityFinder::findNextValidWindow(
    const QDateTime &time, const std::vector<data::TimeWindow> &windows) const
{
    if (!time.isValid() || windows.empty()) {
        return std::nullopt;
    }
    const QDateTime localTime = time.toLocalTime();

    if (auto today = occurrenceOnDay(localTime.date(), data::minuteOfDay(localTime), windows)) {
        if (today->start < localTime) {
            today->start = localTime;
        }
        if (today->start < today->end) {
            return today;
        }
    }

    for (int dayOffset = 1; dayOffset <= kMaxLookaheadDays; ++dayOffset) {
        if (auto next = occurrenceOnDay(localTime.date().addDays(dayOffset), 0, windows)) {
            return next;
        }
    }

    qCWarning(core::lcScheduling) << "No time window found in the" << kMaxLookaheadDays << "days after" << localTime;
    return std::nullopt;
}

std::optional<WindowOccurrence> AvailabilityFinder::occurrenceOnDay(
    const QDate &date, int fromMinute, const std::vector<data::TimeWindow> &windows) const
{
    const int weekday = data::weekdayOf(date);

    const data::TimeWindow *bestWindow = nullptr;
    int bestStart = 0;

    for (const auto &window : windows) {
        const auto ranges = window.rangesFor(weekday);
        for (const auto &range : ranges) {
            if (range.isEmpty() || range.endMinute <= fromMinute) {
                continue;
            }
            const int candidateStart = std::max(fromMinute, range.startMinute);
            const bool earlier = !bestWindow || candidateStart < bestStart;
            const bool wins = bestWindow && candidateStart == bestStart && window.priority > bestWindow->priority;
            if (earlier || wins) {
                bestWindow = &window;
                bestStart = candidateStart;
            }
        }
    }

    if (!bestWindow) {
        return std::nullopt;
    }

    WindowOccurrence occurrence;
    occurrence.window = bestWindow;
    occurrence.start = data::atMinuteOfDay(date, bestStart);
    occurrence.end = getWindowEndTime(occurrence.start, *bestWindow);

    // A higher priority window taking over later in the segment ends it.
    for (const auto &window : windows) {
        if (window.priority <= bestWindow->priority) {
            continue;
        }
        const auto ranges = window.rangesFor(weekday);
        for (const auto &range : ranges) {
            if (range.isEmpty() || range.startMinute <= bestStart) {
                continue;
            }
            const QDateTime takeover = data::atMinuteOfDay(date, range.startMinute);
            if (takeover < occurrence.end) {
                occurrence.end = takeover;
            }
        }
    }
    return occurrence;
}

QDateTime AvailabilityFinder::getWindowEndTime(const QDateTime &startTime, const data::TimeWindow &window) const
{
    const QDateTime localStart = startTime.toLocalTime();
    const QDate date = localStart.date();
    const int minute = data::minuteOfDay(localStart);
    const auto ranges = window.rangesFor(data::weekdayOf(date));
    for (const auto &range : ranges) {
        if (!range.isEmpty() && range.contains(minute)) {
            return data::atMinuteOfDay(date, range.endMinute);
        }
    }
    return data::atMinuteOfDay(date, data::kMinutesPerDay);
}

std::optional<data::TimeBlockInfo> AvailabilityFinder::findNextBusyBlock(const QDateTime &startTime,
                                                                         const QDateTime &endTime,
                                                                         bool isFixedRequest) const
{
    const data::TimeBlockInfo *earliest = nullptr;
    for (const auto &block : m_cache.blocks()) {
        if (isFixedRequest && isDisplaceable(block)) {
            continue;
        }
        if (!block.overlaps(startTime, endTime)) {
            continue;
        }
        if (!earliest || block.start < earliest->start) {
            earliest = &block;
        }
    }
    if (!earliest) {
        return std::nullopt;
    }
    return *earliest;
}

std::vector<TimeSlot> AvailabilityFinder::availableSlotsOnDay(const QDate &date,
                                                              int minDuration,
                                                              const std::vector<data::TimeWindow> &windows) const
{
    std::vector<TimeSlot> result;
    const int weekday = data::weekdayOf(date);
    const int minimum = std::max(1, minDuration);

    for (const auto &window : windows) {
        const auto ranges = window.rangesFor(weekday);
        for (const auto &range : ranges) {
            if (range.isEmpty()) {
                continue;
            }
            const QDateTime rangeStart = data::atMinuteOfDay(date, range.startMinute);
            const QDateTime rangeEnd = data::atMinuteOfDay(date, range.endMinute);

            auto busy = m_cache.blocksInRange(rangeStart, rangeEnd);
            std::sort(busy.begin(), busy.end(), [](const data::TimeBlockInfo &a, const data::TimeBlockInfo &b) {
                return a.start < b.start;
            });

            QDateTime gapStart = rangeStart;
            auto addGap = [&](const QDateTime &gapEnd) {
                const int minutes = wholeMinutesBetween(gapStart, gapEnd);
                if (minutes >= minimum) {
                    result.push_back(makeSlot(gapStart, minutes, window, slotQuality(window, windows)));
                }
            };
            for (const auto &block : busy) {
                if (block.start > gapStart) {
                    addGap(block.start);
                }
                gapStart = std::max(gapStart, block.end);
            }
            if (gapStart < rangeEnd) {
                addGap(rangeEnd);
            }
        }
    }
    return result;
}

bool AvailabilityFinder::isDisplaceable(const data::TimeBlockInfo &block) const
{
    const auto task = m_tasks.findById(block.taskId);
    return task && task->timeDefense == data::TimeDefense::AlwaysFree;
}

} // namespace scheduling
} // namespace timeblock
