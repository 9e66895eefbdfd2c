#include <QCoreApplication>
#include <QSettings>
#include <QString>
#include <QTextStream>

#include <memory>

#include "version.h"

#include "timeblock/core/AppContext.hpp"
#include "timeblock/data/TaskRepository.hpp"
#include "timeblock/scheduling/Scheduler.hpp"

int main(int argc, char *argv[])
{
    QCoreApplication::setOrganizationName(QStringLiteral("Zellhoff"));
    QCoreApplication::setOrganizationDomain(QStringLiteral("zellhoff.at"));
    QCoreApplication::setApplicationName(QStringLiteral("TimeBlock"));

    QCoreApplication app(argc, argv);

    // An optional INI file replaces the per-user settings store.
    const QStringList arguments = app.arguments();
    auto settings = arguments.size() > 1
        ? std::make_unique<QSettings>(arguments.at(1), QSettings::IniFormat)
        : std::make_unique<QSettings>();

    timeblock::core::AppContext context(*settings);
    context.seedDemoTasks();

    auto &scheduler = context.scheduler();
    const auto tasks = context.taskRepository().fetchTasks();
    const auto summary = scheduler.rescheduleAll(tasks);

    QTextStream out(stdout);
    out << QObject::tr("TimeBlock %1").arg(QString::fromLatin1(kTimeBlockVersion)) << '\n';
    for (const auto &task : tasks) {
        out << QStringLiteral("%1 (P%2, urgency %3)")
                   .arg(task.title)
                   .arg(task.priority)
                   .arg(scheduler.calculateTaskUrgency(task), 0, 'f', 0)
            << '\n';
        for (const auto &block : scheduler.getBlocksForTask(task.id)) {
            out << QStringLiteral("  %1 - %2  %3 min  [%4]%5")
                       .arg(block.start.toString(QStringLiteral("ddd yyyy-MM-dd hh:mm")),
                            block.end.toString(QStringLiteral("hh:mm")))
                       .arg(block.duration)
                       .arg(block.timeWindowId)
                       .arg(scheduler.hasConflicts(task.id) ? QStringLiteral("  conflict") : QString())
                << '\n';
        }
    }
    out << QObject::tr("%1 scheduled, %2 partial, %3 failed")
               .arg(summary.succeeded)
               .arg(summary.partial)
               .arg(summary.failed)
        << '\n';

    return summary.failed == 0 ? 0 : 1;
}
