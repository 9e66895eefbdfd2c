#include "timeblock/core/SchedulerSettings.hpp"

#include "timeblock/core/Logging.hpp"

#include <QSettings>
#include <QStringList>

namespace timeblock {
namespace core {

namespace {
const QString kWindowsGroup = QStringLiteral("timeWindows");
const QString kUrgencyFormulaKey = QStringLiteral("scheduler/urgencyFormula");
const QString kSlotOrderingKey = QStringLiteral("scheduler/slotOrdering");
} // namespace

SchedulerSettings::SchedulerSettings(QSettings &settings)
    : m_settings(settings)
{
}

std::vector<data::TimeWindow> SchedulerSettings::loadTimeWindows() const
{
    std::vector<data::TimeWindow> windows;
    const int count = m_settings.beginReadArray(kWindowsGroup);
    windows.reserve(static_cast<size_t>(count));
    for (int i = 0; i < count; ++i) {
        m_settings.setArrayIndex(i);
        data::TimeWindow window;
        window.id = m_settings.value(QStringLiteral("id")).toString().trimmed();
        if (window.id.isEmpty()) {
            qCWarning(lcConfig) << "Skipping time window" << i << "without id";
            continue;
        }
        window.name = m_settings.value(QStringLiteral("name"), window.id).toString();
        window.color = m_settings.value(QStringLiteral("color")).toString();
        window.priority = m_settings.value(QStringLiteral("priority"), 0).toInt();
        window.schedule = decodeSchedule(m_settings.value(QStringLiteral("schedule")).toString());
        windows.push_back(std::move(window));
    }
    m_settings.endArray();

    if (windows.empty()) {
        qCInfo(lcConfig) << "No time windows configured, using defaults";
        return data::defaultTimeWindows();
    }
    return windows;
}

void SchedulerSettings::saveTimeWindows(const std::vector<data::TimeWindow> &windows)
{
    m_settings.remove(kWindowsGroup);
    m_settings.beginWriteArray(kWindowsGroup, static_cast<int>(windows.size()));
    for (int i = 0; i < static_cast<int>(windows.size()); ++i) {
        const auto &window = windows[static_cast<size_t>(i)];
        m_settings.setArrayIndex(i);
        m_settings.setValue(QStringLiteral("id"), window.id);
        m_settings.setValue(QStringLiteral("name"), window.name);
        m_settings.setValue(QStringLiteral("color"), window.color);
        m_settings.setValue(QStringLiteral("priority"), window.priority);
        m_settings.setValue(QStringLiteral("schedule"), encodeSchedule(window.schedule));
    }
    m_settings.endArray();
}

scheduling::SchedulerOptions SchedulerSettings::loadSchedulerOptions() const
{
    scheduling::SchedulerOptions options;

    const QString formula = m_settings.value(kUrgencyFormulaKey).toString();
    if (!formula.isEmpty()) {
        if (const auto parsed = scheduling::urgencyFormulaFromString(formula)) {
            options.urgencyFormula = *parsed;
        } else {
            qCWarning(lcConfig) << "Unknown urgency formula" << formula;
        }
    }

    const QString ordering = m_settings.value(kSlotOrderingKey).toString();
    if (!ordering.isEmpty()) {
        if (const auto parsed = scheduling::slotOrderingFromString(ordering)) {
            options.slotOrdering = *parsed;
        } else {
            qCWarning(lcConfig) << "Unknown slot ordering" << ordering;
        }
    }
    return options;
}

void SchedulerSettings::saveSchedulerOptions(const scheduling::SchedulerOptions &options)
{
    m_settings.setValue(kUrgencyFormulaKey, scheduling::urgencyFormulaToString(options.urgencyFormula));
    m_settings.setValue(kSlotOrderingKey, scheduling::slotOrderingToString(options.slotOrdering));
}

QString SchedulerSettings::encodeSchedule(const QMap<int, QVector<data::TimeRange>> &schedule)
{
    QStringList days;
    for (auto it = schedule.constBegin(); it != schedule.constEnd(); ++it) {
        if (it.value().isEmpty()) {
            continue;
        }
        QStringList ranges;
        for (const auto &range : it.value()) {
            ranges << QStringLiteral("%1-%2").arg(data::formatClockTime(range.startMinute),
                                                  data::formatClockTime(range.endMinute));
        }
        days << QStringLiteral("%1=%2").arg(it.key()).arg(ranges.join(','));
    }
    return days.join(';');
}

QMap<int, QVector<data::TimeRange>> SchedulerSettings::decodeSchedule(const QString &value)
{
    QMap<int, QVector<data::TimeRange>> schedule;
    const QStringList days = value.split(';', Qt::SkipEmptyParts);
    for (const QString &entry : days) {
        const int equalsIndex = entry.indexOf('=');
        bool dayOk = false;
        const int day = equalsIndex > 0 ? entry.left(equalsIndex).trimmed().toInt(&dayOk) : -1;
        if (!dayOk || day < 0 || day > 6) {
            qCWarning(lcConfig) << "Skipping malformed schedule entry" << entry;
            continue;
        }

        const QStringList ranges = entry.mid(equalsIndex + 1).split(',', Qt::SkipEmptyParts);
        for (const QString &rangeText : ranges) {
            const QStringList bounds = rangeText.split('-');
            const auto range = bounds.size() == 2 ? data::TimeRange::fromStrings(bounds.at(0), bounds.at(1))
                                                  : std::nullopt;
            if (!range || range->isEmpty()) {
                qCWarning(lcConfig) << "Skipping invalid time range" << rangeText << "on day" << day;
                continue;
            }
            schedule[day].append(*range);
        }
    }
    return schedule;
}

} // namespace core
} // namespace timeblock
