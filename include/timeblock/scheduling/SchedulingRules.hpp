#pragma once

#include <QDateTime>

#include <functional>

#include "timeblock/data/Task.hpp"
#include "timeblock/scheduling/SchedulerOptions.hpp"
#include "timeblock/scheduling/TimeSlot.hpp"

namespace timeblock {
namespace scheduling {

using UrgencyStrategy = std::function<double(const data::Task &task, const QDateTime &now)>;

// Share of the remaining time the task needs, scaled by priority. Capped at 100.
double linearUrgency(const data::Task &task, const QDateTime &now);

// Log-scaled deadline pressure plus priority, duration and split bonuses.
// A deadline one week out scores about 0 before the bonuses.
double logarithmicUrgency(const data::Task &task, const QDateTime &now);

UrgencyStrategy urgencyStrategy(UrgencyFormula formula);

bool isUrgent(const data::Task &task, const QDateTime &now);
bool isLongTask(const data::Task &task);

// Bell curve over the span from now to the deadline, peaking at 75 %.
double proximityScore(const QDateTime &slotStart, const QDateTime &deadline, const QDateTime &now);

RuleResult applySchedulingRules(const SchedulingContext &context);

bool isTaskSchedulable(const data::Task &task);
int suggestedBlockSize(const data::Task &task, const QDateTime &now);

} // namespace scheduling
} // namespace timeblock
