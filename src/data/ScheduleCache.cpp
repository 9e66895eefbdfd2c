#include "timeblock/data/ScheduleCache.hpp"

#include "timeblock/core/Logging.hpp"

#include <algorithm>

namespace timeblock {
namespace data {

ScheduleCache::ScheduleCache() = default;
ScheduleCache::~ScheduleCache() = default;

const std::vector<TimeBlockInfo> &ScheduleCache::blocks() const
{
    return m_blocks;
}

std::vector<TimeBlockInfo> ScheduleCache::blocksForTask(const QString &taskId) const
{
    std::vector<std::size_t> indices;
    const auto ids = m_blockIdsByTask.values(taskId);
    indices.reserve(static_cast<size_t>(ids.size()));
    for (const auto &id : ids) {
        indices.push_back(m_indexById.value(id));
    }
    std::sort(indices.begin(), indices.end());

    std::vector<TimeBlockInfo> result;
    result.reserve(indices.size());
    for (const auto index : indices) {
        result.push_back(m_blocks[index]);
    }
    return result;
}

std::vector<TimeBlockInfo> ScheduleCache::blocksInRange(const QDateTime &start, const QDateTime &end) const
{
    std::vector<TimeBlockInfo> result;
    if (!start.isValid() || !end.isValid()) {
        return result;
    }
    for (const auto &block : m_blocks) {
        if (block.overlaps(start, end)) {
            result.push_back(block);
        }
    }
    return result;
}

std::optional<TimeBlockInfo> ScheduleCache::findById(const QString &id) const
{
    const auto it = m_indexById.constFind(id);
    if (it == m_indexById.constEnd()) {
        return std::nullopt;
    }
    return m_blocks[it.value()];
}

bool ScheduleCache::contains(const QString &id) const
{
    return m_indexById.contains(id);
}

int ScheduleCache::blockCountForTask(const QString &taskId) const
{
    return m_blockIdsByTask.count(taskId);
}

std::size_t ScheduleCache::size() const
{
    return m_blocks.size();
}

bool ScheduleCache::add(TimeBlockInfo block)
{
    if (!isValid(block)) {
        qCWarning(core::lcData) << "Rejecting malformed time block" << block.id;
        return false;
    }
    if (m_indexById.contains(block.id)) {
        qCWarning(core::lcData) << "Time block id already in use:" << block.id;
        return false;
    }
    m_indexById.insert(block.id, m_blocks.size());
    m_blockIdsByTask.insert(block.taskId, block.id);
    m_blocks.push_back(std::move(block));
    return true;
}

bool ScheduleCache::update(const TimeBlockInfo &block)
{
    const auto it = m_indexById.constFind(block.id);
    if (it == m_indexById.constEnd() || !isValid(block)) {
        return false;
    }
    auto &stored = m_blocks[it.value()];
    if (stored.taskId != block.taskId) {
        m_blockIdsByTask.remove(stored.taskId, stored.id);
        m_blockIdsByTask.insert(block.taskId, block.id);
    }
    stored = block;
    return true;
}

bool ScheduleCache::markCompleted(const QString &id)
{
    const auto it = m_indexById.constFind(id);
    if (it == m_indexById.constEnd()) {
        return false;
    }
    m_blocks[it.value()].isCompleted = true;
    return true;
}

bool ScheduleCache::remove(const QString &id)
{
    const auto it = m_indexById.constFind(id);
    if (it == m_indexById.constEnd()) {
        return false;
    }
    m_blocks.erase(m_blocks.begin() + static_cast<long>(it.value()));
    rebuildIndex();
    return true;
}

int ScheduleCache::removeForTask(const QString &taskId)
{
    const auto before = m_blocks.size();
    m_blocks.erase(std::remove_if(m_blocks.begin(), m_blocks.end(),
                                  [&taskId](const TimeBlockInfo &block) { return block.taskId == taskId; }),
                   m_blocks.end());
    const auto removed = static_cast<int>(before - m_blocks.size());
    if (removed > 0) {
        rebuildIndex();
    }
    return removed;
}

void ScheduleCache::assign(std::vector<TimeBlockInfo> blocks)
{
    clear();
    m_blocks.reserve(blocks.size());
    for (auto &block : blocks) {
        add(std::move(block));
    }
}

void ScheduleCache::clear()
{
    m_blocks.clear();
    m_indexById.clear();
    m_blockIdsByTask.clear();
}

bool ScheduleCache::isValid(const TimeBlockInfo &block)
{
    return !block.id.isEmpty() && block.start.isValid() && block.end.isValid() && block.start < block.end
        && block.duration > 0;
}

void ScheduleCache::rebuildIndex()
{
    m_indexById.clear();
    m_blockIdsByTask.clear();
    for (std::size_t i = 0; i < m_blocks.size(); ++i) {
        m_indexById.insert(m_blocks[i].id, i);
        m_blockIdsByTask.insert(m_blocks[i].taskId, m_blocks[i].id);
    }
}

} // namespace data
} // namespace timeblock
