#pragma once

#include <QDateTime>

#include <memory>

class QSettings;

namespace timeblock {
namespace data {
class TaskRepository;
}

namespace scheduling {
class Scheduler;
}

namespace core {

class SchedulerSettings;

class AppContext
{
public:
    explicit AppContext(QSettings &settings);
    ~AppContext();

    data::TaskRepository &taskRepository();
    scheduling::Scheduler &scheduler();
    SchedulerSettings &settings();

    void seedDemoTasks(const QDateTime &now = QDateTime::currentDateTime());

private:
    std::unique_ptr<SchedulerSettings> m_settings;
    std::unique_ptr<data::TaskRepository> m_taskRepository;
    std::unique_ptr<scheduling::Scheduler> m_scheduler;
};

} // namespace core
} // namespace timeblock
