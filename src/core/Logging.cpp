#include "timeblock/core/Logging.hpp"

namespace timeblock {
namespace core {

Q_LOGGING_CATEGORY(lcScheduling, "timeblock.scheduling", QtInfoMsg)
Q_LOGGING_CATEGORY(lcData, "timeblock.data", QtInfoMsg)
Q_LOGGING_CATEGORY(lcConfig, "timeblock.config", QtInfoMsg)

} // namespace core
} // namespace timeblock
