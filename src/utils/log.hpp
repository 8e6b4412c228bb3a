//
// Named spdlog loggers sharing one stderr sink
//

#ifndef OPLOGSYNC_UTILS_LOG_HPP
#define OPLOGSYNC_UTILS_LOG_HPP

#include <memory>
#include <string>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

using LoggerPtr = std::shared_ptr<spdlog::logger>;

/**
 * returns the logger registered under `name`, creating it on first use.
 */
LoggerPtr createLogger(const std::string &name);

/**
 * changes the level of the shared sink and of every logger created so far.
 */
void setLogLevel(spdlog::level::level_enum level);

#endif //OPLOGSYNC_UTILS_LOG_HPP
