#include "timeblock/scheduling/ScheduleResult.hpp"

namespace timeblock {
namespace scheduling {

QString scheduleStatusToString(ScheduleStatus status)
{
    switch (status) {
    case ScheduleStatus::Success:
        return QStringLiteral("success");
    case ScheduleStatus::InvalidInput:
        return QStringLiteral("invalid-input");
    case ScheduleStatus::NoMatchingWindows:
        return QStringLiteral("no-matching-windows");
    case ScheduleStatus::Overdue:
        return QStringLiteral("overdue");
    case ScheduleStatus::PartiallyScheduled:
        return QStringLiteral("partially-scheduled");
    }
    return QString();
}

} // namespace scheduling
} // namespace timeblock
