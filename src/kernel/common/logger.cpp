/**
 * @file logger.cpp
 * @brief Config-driven logger initialization
 */

#include "kernel/common/logger.h"
#include "kernel/common/config_manager.h"

namespace kernel::common {

void Logger::initializeFromConfig(const std::string& loggerName) {
    const auto& config = ConfigManager::getInstance();
    initialize(loggerName,
               config.getString(ConfigManager::LOG_LEVEL, "info"),
               config.getBool(ConfigManager::LOG_TO_FILE, false),
               config.getString(ConfigManager::LOG_FILE));
}

} // namespace kernel::common
