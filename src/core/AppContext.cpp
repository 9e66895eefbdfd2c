#include "timeblock/core/AppContext.hpp"

#include "timeblock/core/SchedulerSettings.hpp"
#include "timeblock/data/InMemoryTaskRepository.hpp"
#include "timeblock/scheduling/Scheduler.hpp"

#include <QObject>

namespace timeblock {
namespace core {

AppContext::AppContext(QSettings &settings)
    : m_settings(std::make_unique<SchedulerSettings>(settings))
    , m_taskRepository(std::make_unique<data::InMemoryTaskRepository>())
{
    m_scheduler = std::make_unique<scheduling::Scheduler>(*m_taskRepository,
                                                          m_settings->loadTimeWindows(),
                                                          m_settings->loadSchedulerOptions());
}

AppContext::~AppContext() = default;

data::TaskRepository &AppContext::taskRepository()
{
    return *m_taskRepository;
}

scheduling::Scheduler &AppContext::scheduler()
{
    return *m_scheduler;
}

SchedulerSettings &AppContext::settings()
{
    return *m_settings;
}

void AppContext::seedDemoTasks(const QDateTime &now)
{
    if (!m_taskRepository->fetchTasks().empty()) {
        return;
    }

    data::Task review;
    review.title = QObject::tr("Review scheduling rules");
    review.creationDate = now;
    review.dueDate = now.addDays(2);
    review.estimatedDuration = 90;
    review.priority = 3;
    review.allowedTimeWindows = QStringList{ QStringLiteral("work") };

    data::Task report;
    report.title = QObject::tr("Write quarterly report");
    report.creationDate = now;
    report.dueDate = now.addDays(5);
    report.estimatedDuration = 240;
    report.splitUpBlock = 60;
    report.priority = 2;

    data::Task groceries;
    groceries.title = QObject::tr("Groceries");
    groceries.creationDate = now;
    groceries.dueDate = now.addDays(1);
    groceries.estimatedDuration = 45;
    groceries.priority = 4;
    groceries.timeDefense = data::TimeDefense::AlwaysFree;
    groceries.allowedTimeWindows = QStringList{ QStringLiteral("personal") };

    m_taskRepository->addTask(std::move(review));
    m_taskRepository->addTask(std::move(report));
    m_taskRepository->addTask(std::move(groceries));
}

} // namespace core
} // namespace timeblock
