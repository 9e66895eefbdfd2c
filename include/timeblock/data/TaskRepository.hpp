#pragma once

#include <optional>
#include <vector>

#include "timeblock/data/Task.hpp"

namespace timeblock {
namespace data {

class TaskRepository
{
public:
    virtual ~TaskRepository() = default;

    virtual std::vector<Task> fetchTasks() const = 0;
    virtual std::optional<Task> findById(const QString &id) const = 0;
    virtual Task addTask(Task task) = 0;
    virtual bool updateTask(const Task &task) = 0;
    virtual bool removeTask(const QString &id) = 0;
};

} // namespace data
} // namespace timeblock
