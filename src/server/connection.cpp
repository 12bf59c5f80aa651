#include "server/connection.hpp"

#include <type_traits>

#include "utils/logger.hpp"

namespace {
template <typename T> struct IsTlsStream : std::false_type {
};

template <typename T> struct IsTlsStream<boost::asio::ssl::stream<T>> : std::true_type {
};

// Ошибки, которые означают обычное закрытие соединения клиентом
bool isDisconnect(const boost::system::error_code &ec)
{
    return ec == boost::beast::http::error::end_of_stream || ec == boost::asio::error::eof
        || ec == boost::asio::error::connection_reset
        || ec == boost::asio::error::operation_aborted;
}
} // namespace

namespace davhost::server {
namespace beast_http = boost::beast::http;

template <typename Stream> void Connection<Stream>::start()
{
    // Все операции с потоком выполняются в strand соединения
    boost::asio::dispatch(stream_.get_executor(),
                          [self = this->shared_from_this()]() { self->run(); });
}

template <typename Stream> void Connection<Stream>::run()
{
    LOG_DEBUG << "Новое соединение установлено";

    if constexpr (IsTlsStream<Stream>::value) {
        stream_.async_handshake(boost::asio::ssl::stream_base::server,
                                [this, self = this->shared_from_this()](
                                    const boost::system::error_code &ec) {
                                    if (ec) {
                                        if (ec != boost::asio::error::operation_aborted) {
                                            LOG_WARNING << "Ошибка TLS рукопожатия: "
                                                        << ec.message();
                                        }
                                        closeStream();
                                        return;
                                    }
                                    read();
                                });
    }
    else {
        read();
    }
}

template <typename Stream> void Connection<Stream>::close()
{
    closing_ = true;
    boost::asio::post(stream_.get_executor(),
                      [self = this->shared_from_this()]() { self->closeStream(); });
}

template <typename Stream> void Connection<Stream>::closeStream()
{
    if (closed_) {
        return;
    }
    closed_ = true;

    boost::system::error_code ec;
    boost::beast::get_lowest_layer(stream_).close(ec);
    if (ec) {
        LOG_DEBUG << "Ошибка при закрытии соединения: " << ec.message();
    }
}

template <typename Stream> void Connection<Stream>::read()
{
    if (closed_) {
        return;
    }

    // Новый парсер на каждый запрос
    parser_.emplace();
    parser_->body_limit(bodyLimit_);

    beast_http::async_read(stream_, buffer_, *parser_,
                           [this, self = this->shared_from_this()](
                               const boost::system::error_code &ec, std::size_t) { onRead(ec); });
}

template <typename Stream> void Connection<Stream>::onRead(const boost::system::error_code &ec)
{
    if (ec == beast_http::error::body_limit) {
        rejectOversizedBody();
        return;
    }
    if (ec) {
        if (!isDisconnect(ec)) {
            LOG_WARNING << "Ошибка при чтении запроса: " << ec.message();
        }
        if (ec == beast_http::error::end_of_stream) {
            shutdown();
        }
        else {
            closeStream();
        }
        return;
    }

    auto request = parser_->release();
    parser_.reset();

    http::Response response;
    try {
        response = handler_.handle(request);
    }
    catch (const std::exception &e) {
        LOG_ERROR << "Исключение в обработчике запроса: " << e.what();
        response = http::Response(beast_http::status::internal_server_error, request.version());
        response.set(beast_http::field::content_type, "text/plain; charset=utf-8");
        response.body() = "Internal Server Error";
    }

    // Сервер закрыт, пока обработчик был занят запросом: ответ не отправляется
    if (closing_) {
        closeStream();
        return;
    }

    const auto handlerKeepAlive = response.keep_alive();
    response.version(request.version());
    response.keep_alive(request.keep_alive() && handlerKeepAlive);
    response.prepare_payload();

    write(std::move(response));
}

template <typename Stream> void Connection<Stream>::write(http::Response &&response)
{
    // Ответ должен жить до завершения асинхронной записи
    auto message = std::make_shared<http::Response>(std::move(response));
    beast_http::async_write(stream_, *message,
                            [this, self = this->shared_from_this(),
                             message](const boost::system::error_code &ec, std::size_t) {
                                if (ec) {
                                    if (!isDisconnect(ec)) {
                                        LOG_WARNING << "Ошибка при записи ответа: "
                                                    << ec.message();
                                    }
                                    closeStream();
                                    return;
                                }
                                if (message->need_eof()) {
                                    shutdown();
                                    return;
                                }
                                read();
                            });
}

template <typename Stream> void Connection<Stream>::rejectOversizedBody()
{
    const auto &header = parser_->get();
    LOG_WARNING << "Тело запроса " << header.method_string() << " " << header.target()
                << " превышает предел в " << bodyLimit_ << " байт";

    http::Response response(beast_http::status::payload_too_large, header.version());
    response.set(beast_http::field::content_type, "text/plain; charset=utf-8");
    response.body() = "Payload Too Large";
    // Непрочитанный остаток тела не позволяет продолжить соединение
    response.keep_alive(false);
    response.prepare_payload();
    parser_.reset();

    write(std::move(response));
}

template <typename Stream> void Connection<Stream>::shutdown()
{
    if (closed_) {
        return;
    }

    if constexpr (IsTlsStream<Stream>::value) {
        stream_.async_shutdown(
            [this, self = this->shared_from_this()](const boost::system::error_code &) {
                closeStream();
            });
    }
    else {
        boost::system::error_code ec;
        stream_.shutdown(Stream::shutdown_send, ec);
        closeStream();
    }
}

template class Connection<TcpSocket>;
template class Connection<LocalSocket>;
template class Connection<TlsTcpStream>;
template class Connection<TlsLocalStream>;
} // namespace davhost::server
