#pragma once

#include <string>

namespace davhost {
/**
 * @enum EventCode
 * @brief Категория сообщения, передаваемого хосту через Callback::onMessage()
 *
 * Отрицательные коды соответствуют сбоям, положительные - информационным событиям.
 */
enum class EventCode : int {
    START_FAILED = -0x1, // Запуск не удался или обслуживание прервано ошибкой транспорта
    STOP_FAILED = -0x2, // Ошибка при освобождении ресурсов во время остановки
    ALREADY_RUNNING = 0x01, // Повторный запуск при работающем экземпляре
    MESSAGE = 0x10, // Запись лога
    REQUEST = 0x20, // Диагностика завершенного запроса
};

/**
 * @class Callback
 * @brief Интерфейс уведомлений, реализуемый хост-приложением
 *
 * Объект заимствуется контроллером на время жизни экземпляра сервиса и может вызываться
 * одновременно из нескольких потоков.
 */
class Callback {
public:
    virtual ~Callback() = default;

    /**
     * @brief Сервис запущен
     * @param address Порт (для TCP) или путь к сокету (для Unix Domain Socket)
     */
    virtual void onStart(const std::string &address) = 0;

    /**
     * @brief Сервис остановлен по запросу
     */
    virtual void onStop() = 0;

    /**
     * @brief Произвольное событие
     * @param code Категория события
     * @param message Текст события
     */
    virtual void onMessage(EventCode code, const std::string &message) = 0;
};
} // namespace davhost
