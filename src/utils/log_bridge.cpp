#include "utils/log_bridge.hpp"

namespace davhost::utils {
LogBridge::LogBridge(Sink sink, LogLevel minLevel, LogFormat format)
{
    auto &logger = Logger::getInstance();
    previousSettings_ = logger.getSettings();

    // Консольный и файловый вывод остаются такими, какими их настроил хост
    auto settings = previousSettings_;
    settings.enabled = true;
    settings.minLevel = minLevel;
    settings.format = format;
    settings.includeCaller = false;
    logger.applySettings(settings);

    hookId_ = logger.addHook(
        [sink = std::move(sink)](LogLevel, const std::string &record) { sink(record); });

    LOG_DEBUG << "Мост логирования установлен (минимальный уровень: "
              << Logger::levelToString(minLevel) << ")";
}

LogBridge::~LogBridge()
{
    auto &logger = Logger::getInstance();
    logger.flush();
    logger.removeHook(hookId_);
    logger.applySettings(previousSettings_);
}
} // namespace davhost::utils
