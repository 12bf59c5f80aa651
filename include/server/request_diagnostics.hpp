#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

#include "config/config.hpp"
#include "http/request_handler.hpp"

namespace davhost::server {
/**
 * @struct RequestDiagnostic
 * @brief Сведения о завершенном запросе, передаваемые хосту
 */
struct RequestDiagnostic {
    std::string method;
    std::string path; // Путь без строки запроса, с декодированными %XX
    int64_t contentLength = 0; // -1, если длина тела неизвестна (chunked)
    bool close = false; // Соединение не будет переиспользовано
    int64_t expectedEntityLength = 0; // Заголовок X-Expected-Entity-Length
    std::string error; // Текст ошибки обработчика или пустая строка

    /**
     * @brief Построение записи по запросу
     * @param request Обработанный запрос
     * @param error Ошибка обработчика
     */
    static RequestDiagnostic fromRequest(const http::Request &request,
                                         const std::optional<std::string> &error);

    /**
     * @brief Компактный JSON с ключами close, content_length, error, method, path,
     * x_expected_entity_length
     */
    std::string toJson() const;
};

/**
 * @brief Разбор целого числа со знаком; некорректное значение дает 0
 */
int64_t parseInt64OrZero(std::string_view value);

/**
 * @brief Декодирование %XX в пути запроса
 * @param target Цель запроса: путь или абсолютный URI, возможно со строкой запроса
 * @return Путь без схемы, authority и строки запроса; при некорректной
 * последовательности - путь как есть
 */
std::string decodeRequestPath(std::string_view target);

/**
 * @brief Подключение моста диагностики ко всем вариантам обработчиков конфигурации
 * @param config Конфигурация с обработчиками
 * @param sink Приемник сериализованных записей
 */
void attachRequestDiagnostics(const config::Config &config,
                              std::function<void(const std::string &payload)> sink);
} // namespace davhost::server
