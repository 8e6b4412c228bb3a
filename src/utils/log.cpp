//
// Named spdlog loggers sharing one stderr sink
//

#include "log.hpp"

#include <map>
#include <mutex>

namespace {
    auto initLoggerSink() {
        auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        sink->set_level(spdlog::level::info);

        return sink;
    }

    std::mutex &loggerMutex() {
        static std::mutex mutex;
        return mutex;
    }

    std::shared_ptr<spdlog::sinks::stderr_color_sink_mt> &loggerSink() {
        static auto sink = initLoggerSink();
        return sink;
    }

    std::map<std::string, LoggerPtr> &loggerMap() {
        static std::map<std::string, LoggerPtr> loggers;
        return loggers;
    }
}

LoggerPtr createLogger(const std::string &name) {
    std::scoped_lock lock(loggerMutex());
    auto &loggers = loggerMap();

    auto it = loggers.find(name);
    if (it == loggers.end()) {
        auto logger = std::make_shared<spdlog::logger>(name, loggerSink());

        logger->set_level(loggerSink()->level());
        it = loggers.emplace(name, std::move(logger)).first;
    }

    return it->second;
}

void setLogLevel(spdlog::level::level_enum level) {
    std::scoped_lock lock(loggerMutex());
    loggerSink()->set_level(level);

    for (auto &pair: loggerMap()) {
        pair.second->set_level(level);
    }
}
