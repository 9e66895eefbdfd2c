#pragma once

#include <QMap>
#include <QString>
#include <QVector>

#include <vector>

#include "timeblock/data/TimeWindow.hpp"
#include "timeblock/scheduling/SchedulerOptions.hpp"

class QSettings;

namespace timeblock {
namespace core {

// Reads and writes the time window list and scheduler options. A window's weekly
// schedule is stored as one string, e.g. "1=09:00-17:00;6=10:00-12:00,14:00-16:00".
class SchedulerSettings
{
public:
    explicit SchedulerSettings(QSettings &settings);

    // Falls back to the default work and personal windows when nothing usable is stored.
    std::vector<data::TimeWindow> loadTimeWindows() const;
    void saveTimeWindows(const std::vector<data::TimeWindow> &windows);

    scheduling::SchedulerOptions loadSchedulerOptions() const;
    void saveSchedulerOptions(const scheduling::SchedulerOptions &options);

    static QString encodeSchedule(const QMap<int, QVector<data::TimeRange>> &schedule);
    static QMap<int, QVector<data::TimeRange>> decodeSchedule(const QString &value);

private:
    QSettings &m_settings;
};

} // namespace core
} // namespace timeblock
