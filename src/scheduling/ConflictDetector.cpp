#include "timeblock/scheduling/ConflictDetector.hpp"

#include "timeblock/data/ScheduleCache.hpp"

namespace timeblock {
namespace scheduling {

ConflictDetector::ConflictDetector(const data::ScheduleCache &cache)
    : m_cache(cache)
{
}

bool ConflictDetector::blocksOverlap(const data::TimeBlockInfo &first, const data::TimeBlockInfo &second)
{
    return (first.start >= second.start && first.start < second.end)
        || (first.end > second.start && first.end <= second.end)
        || (first.start <= second.start && first.end >= second.end);
}

bool ConflictDetector::hasConflicts(const QString &taskId) const
{
    const auto taskBlocks = m_cache.blocksForTask(taskId);
    if (taskBlocks.empty()) {
        return false;
    }
    for (const auto &block : taskBlocks) {
        for (const auto &other : m_cache.blocks()) {
            if (other.taskId == taskId) {
                continue;
            }
            if (blocksOverlap(block, other)) {
                return true;
            }
        }
    }
    return false;
}

QStringList ConflictDetector::conflictingTaskIds() const
{
    QStringList result;
    const auto &blocks = m_cache.blocks();
    for (std::size_t i = 0; i < blocks.size(); ++i) {
        for (std::size_t j = i + 1; j < blocks.size(); ++j) {
            if (blocks[i].taskId == blocks[j].taskId || !blocksOverlap(blocks[i], blocks[j])) {
                continue;
            }
            if (!result.contains(blocks[i].taskId)) {
                result << blocks[i].taskId;
            }
            if (!result.contains(blocks[j].taskId)) {
                result << blocks[j].taskId;
            }
        }
    }
    return result;
}

} // namespace scheduling
} // namespace timeblock
