#pragma once

#include <QLoggingCategory>

namespace timeblock {
namespace core {

Q_DECLARE_LOGGING_CATEGORY(lcScheduling)
Q_DECLARE_LOGGING_CATEGORY(lcData)
Q_DECLARE_LOGGING_CATEGORY(lcConfig)

} // namespace core
} // namespace timeblock
