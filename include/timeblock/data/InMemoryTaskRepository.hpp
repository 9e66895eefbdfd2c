#pragma once

#include <QHash>

#include "timeblock/data/TaskRepository.hpp"

namespace timeblock {
namespace data {

class InMemoryTaskRepository : public TaskRepository
{
public:
    InMemoryTaskRepository();
    ~InMemoryTaskRepository() override;

    std::vector<Task> fetchTasks() const override;
    std::optional<Task> findById(const QString &id) const override;
    Task addTask(Task task) override;
    bool updateTask(const Task &task) override;
    bool removeTask(const QString &id) override;

private:
    QHash<QString, Task> m_items;
};

} // namespace data
} // namespace timeblock
