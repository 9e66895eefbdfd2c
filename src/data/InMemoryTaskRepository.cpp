#include "timeblock/data/InMemoryTaskRepository.hpp"

#include "timeblock/core/Logging.hpp"

#include <QUuid>

#include <algorithm>

namespace timeblock {
namespace data {

InMemoryTaskRepository::InMemoryTaskRepository() = default;
InMemoryTaskRepository::~InMemoryTaskRepository() = default;

std::vector<Task> InMemoryTaskRepository::fetchTasks() const
{
    std::vector<Task> tasks;
    tasks.reserve(static_cast<size_t>(m_items.size()));
    for (const auto &item : m_items) {
        tasks.push_back(item);
    }
    std::sort(tasks.begin(), tasks.end(), [](const Task &lhs, const Task &rhs) {
        if (lhs.priority != rhs.priority) {
            return lhs.priority < rhs.priority;
        }
        if (lhs.dueDate != rhs.dueDate) {
            // Tasks without a deadline go last.
            if (!lhs.dueDate.isValid() || !rhs.dueDate.isValid()) {
                return lhs.dueDate.isValid();
            }
            return lhs.dueDate < rhs.dueDate;
        }
        return lhs.title.toLower() < rhs.title.toLower();
    });
    return tasks;
}

std::optional<Task> InMemoryTaskRepository::findById(const QString &id) const
{
    const auto it = m_items.constFind(id);
    if (it == m_items.constEnd()) {
        return std::nullopt;
    }
    return it.value();
}

Task InMemoryTaskRepository::addTask(Task task)
{
    if (task.id.isEmpty()) {
        task.id = QUuid::createUuid().toString(QUuid::WithoutBraces);
    }
    if (m_items.contains(task.id)) {
        qCInfo(core::lcData) << "Replacing task" << task.id;
    }
    m_items.insert(task.id, task);
    return task;
}

bool InMemoryTaskRepository::updateTask(const Task &task)
{
    auto it = m_items.find(task.id);
    if (it == m_items.end()) {
        return false;
    }
    it.value() = task;
    return true;
}

bool InMemoryTaskRepository::removeTask(const QString &id)
{
    return m_items.remove(id) > 0;
}

} // namespace data
} // namespace timeblock
