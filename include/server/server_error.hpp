#pragma once

#include <type_traits>

#include <boost/system/error_code.hpp>

namespace davhost::server {
/**
 * @enum ServerError
 * @brief Коды завершения цикла обслуживания, не являющиеся ошибками транспорта
 */
enum class ServerError {
    SERVER_CLOSED = 1, // Сервер закрыт по запросу
    SERVE_ABORTED, // Цикл обслуживания прерван исключением
};

/**
 * @brief Категория ошибок "davhost.server"
 */
const boost::system::error_category &serverErrorCategory();

boost::system::error_code make_error_code(ServerError error);
} // namespace davhost::server

namespace boost::system {
template <> struct is_error_code_enum<davhost::server::ServerError> : std::true_type {
};
} // namespace boost::system
