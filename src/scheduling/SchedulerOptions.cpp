#include "timeblock/scheduling/SchedulerOptions.hpp"

namespace timeblock {
namespace scheduling {

QString urgencyFormulaToString(UrgencyFormula formula)
{
    switch (formula) {
    case UrgencyFormula::Linear:
        return QStringLiteral("linear");
    case UrgencyFormula::Logarithmic:
        break;
    }
    return QStringLiteral("logarithmic");
}

std::optional<UrgencyFormula> urgencyFormulaFromString(const QString &value)
{
    const QString normalized = value.trimmed().toLower();
    if (normalized == QLatin1String("logarithmic")) {
        return UrgencyFormula::Logarithmic;
    }
    if (normalized == QLatin1String("linear")) {
        return UrgencyFormula::Linear;
    }
    return std::nullopt;
}

QString slotOrderingToString(SlotOrdering ordering)
{
    switch (ordering) {
    case SlotOrdering::Rules:
        return QStringLiteral("rules");
    case SlotOrdering::Chronological:
        break;
    }
    return QStringLiteral("chronological");
}

std::optional<SlotOrdering> slotOrderingFromString(const QString &value)
{
    const QString normalized = value.trimmed().toLower();
    if (normalized == QLatin1String("chronological")) {
        return SlotOrdering::Chronological;
    }
    if (normalized == QLatin1String("rules")) {
        return SlotOrdering::Rules;
    }
    return std::nullopt;
}

} // namespace scheduling
} // namespace timeblock
