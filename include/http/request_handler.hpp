#pragma once

#include <functional>
#include <optional>
#include <string>

#include <boost/beast/http.hpp>

namespace davhost::http {
using Request = boost::beast::http::request<boost::beast::http::string_body>;
using Response = boost::beast::http::response<boost::beast::http::string_body>;

/**
 * @brief Хук, вызываемый обработчиком после завершения каждого запроса
 * @param request Обработанный запрос
 * @param error Текст ошибки обработки или std::nullopt
 */
using RequestLogger
    = std::function<void(const Request &request, const std::optional<std::string> &error)>;

/**
 * @class RequestHandler
 * @brief Обработчик протокола, предоставляемый внешним кодом
 *
 * Сервер не разбирает семантику запросов: он лишь передает разобранный HTTP-запрос
 * обработчику и отправляет клиенту полученный ответ. Обработчик обязан вызывать
 * установленный RequestLogger по завершении каждого запроса.
 */
class RequestHandler {
public:
    virtual ~RequestHandler() = default;

    /**
     * @brief Обработка запроса
     * @param request Запрос
     * @return Ответ
     */
    virtual Response handle(const Request &request) = 0;

    /**
     * @brief Установка хука логирования запросов (заменяет предыдущий)
     * @param logger Хук
     */
    virtual void setLogger(RequestLogger logger) = 0;
};
} // namespace davhost::http
