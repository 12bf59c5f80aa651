#pragma once

#include <functional>
#include <string>

#include "utils/logger.hpp"

namespace davhost::utils {
/**
 * @class LogBridge
 * @brief Перенаправляет записи процессного логгера во внешний приемник
 *
 * На время жизни объекта логгер переконфигурируется (уровень, формат, без места вызова),
 * а каждая выведенная запись передается приемнику. При разрушении буферы сбрасываются,
 * удаляется только собственный подписчик и восстанавливаются прежние настройки логгера.
 */
class LogBridge {
public:
    using Sink = std::function<void(const std::string &record)>;

    /**
     * @brief Устанавливает мост
     * @param sink Приемник сериализованных записей
     * @param minLevel Минимальный уровень пересылаемых записей
     * @param format Формат сериализации записей
     */
    LogBridge(Sink sink, LogLevel minLevel, LogFormat format);

    /**
     * @brief Сбрасывает буферы и снимает мост
     */
    ~LogBridge();

    LogBridge(const LogBridge &) = delete;
    LogBridge &operator=(const LogBridge &) = delete;
    LogBridge(LogBridge &&) = delete;
    LogBridge &operator=(LogBridge &&) = delete;

private:
    LoggerSettings previousSettings_; // Настройки логгера до установки моста
    Logger::HookId hookId_; // Идентификатор собственного подписчика
};
} // namespace davhost::utils
