#pragma once

#include <QHash>
#include <QMultiHash>

#include <cstddef>
#include <optional>
#include <vector>

#include "timeblock/data/TimeBlock.hpp"

namespace timeblock {
namespace data {

// Ordered store of every placed block, indexed by block id and by task id.
// Blocks only leave the cache through explicit removal.
class ScheduleCache
{
public:
    ScheduleCache();
    ~ScheduleCache();

    const std::vector<TimeBlockInfo> &blocks() const;
    std::vector<TimeBlockInfo> blocksForTask(const QString &taskId) const;
    std::vector<TimeBlockInfo> blocksInRange(const QDateTime &start, const QDateTime &end) const;
    std::optional<TimeBlockInfo> findById(const QString &id) const;
    bool contains(const QString &id) const;
    int blockCountForTask(const QString &taskId) const;
    std::size_t size() const;

    bool add(TimeBlockInfo block);
    bool update(const TimeBlockInfo &block);
    bool markCompleted(const QString &id);
    bool remove(const QString &id);
    int removeForTask(const QString &taskId);
    void assign(std::vector<TimeBlockInfo> blocks);
    void clear();

private:
    static bool isValid(const TimeBlockInfo &block);
    void rebuildIndex();

    std::vector<TimeBlockInfo> m_blocks;
    QHash<QString, std::size_t> m_indexById;
    QMultiHash<QString, QString> m_blockIdsByTask;
};

} // namespace data
} // namespace timeblock
