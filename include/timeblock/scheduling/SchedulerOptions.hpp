#pragma once

#include <QDateTime>
#include <QString>

#include <functional>
#include <optional>

namespace timeblock {
namespace scheduling {

enum class UrgencyFormula
{
    Logarithmic,
    Linear,
};

enum class SlotOrdering
{
    Chronological,
    Rules,
};

struct SchedulerOptions
{
    UrgencyFormula urgencyFormula = UrgencyFormula::Logarithmic;
    SlotOrdering slotOrdering = SlotOrdering::Chronological;
    // Source of "now"; the system clock when empty.
    std::function<QDateTime()> clock;
};

QString urgencyFormulaToString(UrgencyFormula formula);
std::optional<UrgencyFormula> urgencyFormulaFromString(const QString &value);
QString slotOrderingToString(SlotOrdering ordering);
std::optional<SlotOrdering> slotOrderingFromString(const QString &value);

} // namespace scheduling
} // namespace timeblock
