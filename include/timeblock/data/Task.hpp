#pragma once

#include <QDateTime>
#include <QString>
#include <QStringList>
#include <QUuid>

#include <optional>

namespace timeblock {
namespace data {

enum class TimeDefense
{
    Unset,
    AlwaysBusy,
    AlwaysFree,
};

enum class ConflictBehavior
{
    Reschedule,
    Keep,
    Prompt,
};

struct Task
{
    QString id = QUuid::createUuid().toString(QUuid::WithoutBraces);
    QString title;
    QDateTime creationDate = QDateTime::currentDateTime();
    QDateTime dueDate; // invalid when the task has no deadline
    std::optional<int> estimatedDuration; // minutes
    int priority = 3; // 1 highest, 4 lowest
    std::optional<int> splitUpBlock; // minimum block size in minutes
    TimeDefense timeDefense = TimeDefense::Unset;
    QStringList allowedTimeWindows;
    std::optional<double> urgency;
    std::optional<bool> autoSchedule;
    bool completed = false;
    ConflictBehavior conflictBehavior = ConflictBehavior::Reschedule;
};

} // namespace data
} // namespace timeblock
