#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "http/request_handler.hpp"

namespace davhost::server {
/**
 * @class ConnectionBase
 * @brief Общий интерфейс соединений для учета на стороне сервера
 */
class ConnectionBase {
public:
    virtual ~ConnectionBase() = default;

    /**
     * @brief Начать обработку соединения
     */
    virtual void start() = 0;

    /**
     * @brief Принудительно закрыть соединение (из любого потока)
     */
    virtual void close() = 0;
};

/**
 * @class Connection
 * @brief Класс, обрабатывающий одно HTTP/1.1 соединение с клиентом
 *
 * Читает запросы, передает их обработчику протокола и отправляет ответы, пока клиент
 * поддерживает соединение. Stream - сокет TCP или Unix Domain Socket, либо TLS-поток
 * поверх них. Исполнитель сокета - strand соединения, все обработчики выполняются в нем.
 *
 * Запрос с телом больше bodyLimit получает ответ 413, после чего соединение закрывается.
 */
template <typename Stream>
class Connection : public ConnectionBase, public std::enable_shared_from_this<Connection<Stream>> {
public:
    using SharedConnection = std::shared_ptr<Connection>;

    /**
     * @brief Создает новое соединение
     * @param handler Обработчик протокола (должен пережить соединение)
     * @param bodyLimit Предельный размер тела запроса
     * @param args Аргументы конструктора потока
     * @return Указатель на новое соединение
     */
    template <typename... Args>
    static SharedConnection create(http::RequestHandler &handler, std::uint64_t bodyLimit,
                                   Args &&...args)
    {
        return SharedConnection(new Connection(handler, bodyLimit, std::forward<Args>(args)...));
    }

    void start() override;

    void close() override;

private:
    using RequestParser = boost::beast::http::request_parser<boost::beast::http::string_body>;

    http::RequestHandler &handler_; // Обработчик протокола
    std::uint64_t bodyLimit_; // Предельный размер тела запроса
    Stream stream_; // Поток соединения
    boost::beast::flat_buffer buffer_; // Буфер чтения
    std::optional<RequestParser> parser_; // Парсер текущего запроса
    bool closed_; // Соединение закрыто
    std::atomic<bool> closing_; // Запрошено закрытие извне

    template <typename... Args>
    explicit Connection(http::RequestHandler &handler, std::uint64_t bodyLimit, Args &&...args)
        : handler_(handler)
        , bodyLimit_(bodyLimit)
        , stream_(std::forward<Args>(args)...)
        , closed_(false)
        , closing_(false)
    {
    }

    /**
     * @brief TLS рукопожатие (если нужно) и чтение первого запроса
     */
    void run();

    /**
     * @brief Асинхронное чтение очередного запроса
     */
    void read();

    /**
     * @brief Обработка прочитанного запроса
     * @param ec Код ошибки чтения
     */
    void onRead(const boost::system::error_code &ec);

    /**
     * @brief Асинхронная отправка ответа
     * @param response Ответ
     */
    void write(http::Response &&response);

    /**
     * @brief Ответ 413 на запрос со слишком большим телом
     */
    void rejectOversizedBody();

    /**
     * @brief Корректное завершение соединения (TLS close_notify для защищенного потока)
     */
    void shutdown();

    /**
     * @brief Закрытие сокета (в strand соединения)
     */
    void closeStream();
};

using TcpSocket = boost::asio::ip::tcp::socket;
using LocalSocket = boost::asio::local::stream_protocol::socket;
using TlsTcpStream = boost::asio::ssl::stream<TcpSocket>;
using TlsLocalStream = boost::asio::ssl::stream<LocalSocket>;

extern template class Connection<TcpSocket>;
extern template class Connection<LocalSocket>;
extern template class Connection<TlsTcpStream>;
extern template class Connection<TlsLocalStream>;
} // namespace davhost::server
