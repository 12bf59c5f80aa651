#include "server/http_server.hpp"

#include <algorithm>
#include <stdexcept>
#include <system_error>

#include "server/server_error.hpp"
#include "utils/logger.hpp"

namespace {
// Ошибки приема, после которых имеет смысл повторить попытку
bool isTemporaryAcceptError(const boost::system::error_code &ec)
{
    return ec == boost::asio::error::connection_aborted || ec == boost::asio::error::no_descriptors
        || ec == boost::asio::error::no_buffer_space || ec == boost::asio::error::no_memory
        || ec == boost::system::errc::too_many_files_open_in_system;
}
} // namespace

namespace davhost::server {
HttpServer::HttpServer(boost::asio::io_context &ioCtx, Listener &listener,
                       std::shared_ptr<http::RequestHandler> handler)
    : ioCtx_(ioCtx)
    , listener_(listener)
    , handler_(std::move(handler))
    , bodyLimit_(TransportOptions::DEFAULT_BODY_LIMIT)
    , strand_(boost::asio::make_strand(ioCtx))
    , retryTimer_(strand_)
    , retryDelay_(0)
    , finished_(false)
    , closeRequested_(false)
    , finishSignaled_(false)
{
    if (handler_ == nullptr) {
        throw std::invalid_argument("HttpServer requires a request handler");
    }
}

HttpServer::~HttpServer()
{
    // Цикл не завершился штатно (serve() не вызывался или прерван): пул останавливается
    if (!finishSignaled_) {
        workGuard_.reset();
        ioCtx_.stop();
    }
    joinWorkers();
}

boost::system::error_code HttpServer::serve(const TransportOptions &options)
{
    if (options.tls) {
        const auto ec = setupTls(options);
        if (ec) {
            return ec;
        }
    }
    bodyLimit_ = options.bodyLimit;

    const auto workerCount = options.workers != 0
        ? options.workers
        : std::max(MIN_WORKER_COUNT, std::thread::hardware_concurrency());

    LOG_INFO << "Запуск цикла обслуживания на " << listener_.boundAddress()
             << (options.tls ? " (TLS)" : "") << ", потоков: " << workerCount;

    auto finished = finishedPromise_.get_future();
    workGuard_.emplace(ioCtx_.get_executor());
    boost::asio::post(strand_, [this]() { accept(); });

    try {
        for (unsigned i = 0; i < workerCount; i++) {
            workers_.emplace_back([this]() { runWorker(); });
        }
    }
    catch (const std::system_error &e) {
        LOG_ERROR << "Не удалось запустить поток обслуживания: " << e.what();
        if (workers_.empty()) {
            workGuard_.reset();
            ioCtx_.stop();
            boost::system::error_code closeEc;
            listener_.close(closeEc);
            return make_error_code(ServerError::SERVE_ABORTED);
        }
        boost::asio::post(strand_,
                          [this]() { finish(make_error_code(ServerError::SERVE_ABORTED)); });
    }

    const auto result = finished.get();
    LOG_INFO << "Цикл обслуживания завершен: " << result.message();
    return result;
}

void HttpServer::close(CloseHandler onFailure)
{
    if (closeRequested_.exchange(true)) {
        return;
    }

    boost::asio::post(strand_,
                      [this, onFailure = std::move(onFailure)]() { doClose(onFailure); });
}

bool HttpServer::closeRequested() const
{
    return closeRequested_;
}

boost::system::error_code HttpServer::setupTls(const TransportOptions &options)
{
    sslCtx_ = std::make_unique<boost::asio::ssl::context>(boost::asio::ssl::context::tls_server);
    sslCtx_->set_options(boost::asio::ssl::context::default_workarounds
                         | boost::asio::ssl::context::no_sslv2
                         | boost::asio::ssl::context::no_sslv3);

    boost::system::error_code ec;
    sslCtx_->use_certificate_chain_file(options.cert, ec);
    if (ec) {
        LOG_ERROR << "Не удалось загрузить сертификат " << options.cert << ": " << ec.message();
        return ec;
    }

    sslCtx_->use_private_key_file(options.key, boost::asio::ssl::context::pem, ec);
    if (ec) {
        LOG_ERROR << "Не удалось загрузить ключ " << options.key << ": " << ec.message();
        return ec;
    }
    return ec;
}

void HttpServer::runWorker()
{
    for (;;) {
        try {
            ioCtx_.run();
            return;
        }
        catch (const boost::system::system_error &e) {
            LOG_ERROR << "Ошибка в цикле обслуживания: " << e.what();
            const auto ec = e.code();
            boost::asio::post(strand_, [this, ec]() { finish(ec); });
        }
        catch (const std::exception &e) {
            LOG_ERROR << "Исключение в цикле обслуживания: " << e.what();
            boost::asio::post(strand_,
                              [this]() { finish(make_error_code(ServerError::SERVE_ABORTED)); });
        }
    }
}

void HttpServer::accept()
{
    if (finished_ || closeRequested_) {
        return;
    }

    if (auto *tcp = listener_.tcpAcceptor(); tcp != nullptr) {
        acceptOn(*tcp);
    }
    else if (auto *local = listener_.localAcceptor(); local != nullptr) {
        acceptOn(*local);
    }
    else {
        finish(boost::asio::error::bad_descriptor);
    }
}

template <typename Acceptor> void HttpServer::acceptOn(Acceptor &acceptor)
{
    using Socket = typename Acceptor::protocol_type::socket;
    // Каждое соединение получает собственный strand
    using StrandSocket = typename Socket::template rebind_executor<Strand>::other;

    acceptor.async_accept(
        boost::asio::make_strand(ioCtx_),
        boost::asio::bind_executor(strand_, [this](const boost::system::error_code &ec,
                                                   StrandSocket socket) {
            if (ec) {
                onAcceptError(ec);
                return;
            }
            if (finished_) {
                boost::system::error_code closeEc;
                socket.close(closeEc);
                return;
            }

            retryDelay_ = std::chrono::milliseconds(0);
            startConnection(Socket(std::move(socket)));
            accept();
        }));
}

template <typename Socket> void HttpServer::startConnection(Socket socket)
{
    // Отбрасываем уже завершенные соединения
    connections_.erase(std::remove_if(connections_.begin(), connections_.end(),
                                      [](const auto &connection) { return connection.expired(); }),
                       connections_.end());

    std::shared_ptr<ConnectionBase> connection;
    if (sslCtx_ != nullptr) {
        connection = Connection<boost::asio::ssl::stream<Socket>>::create(
            *handler_, bodyLimit_, std::move(socket), *sslCtx_);
    }
    else {
        connection = Connection<Socket>::create(*handler_, bodyLimit_, std::move(socket));
    }

    connections_.push_back(connection);
    connection->start();
}

void HttpServer::onAcceptError(const boost::system::error_code &ec)
{
    // Закрытие слушателя по close() завершает цикл в doClose()
    if (closeRequested_ || finished_) {
        return;
    }

    if (isTemporaryAcceptError(ec)) {
        retryDelay_ = retryDelay_.count() == 0 ? MIN_ACCEPT_RETRY_DELAY
                                               : std::min(retryDelay_ * 2, MAX_ACCEPT_RETRY_DELAY);
        LOG_WARNING << "Временная ошибка приема соединения: " << ec.message() << ", повтор через "
                    << retryDelay_.count() << " мс";

        retryTimer_.expires_after(retryDelay_);
        retryTimer_.async_wait([this](const boost::system::error_code &timerEc) {
            if (timerEc) {
                return;
            }
            accept();
        });
        return;
    }

    LOG_ERROR << "Ошибка при приеме соединения: " << ec.message();
    finish(ec);
}

void HttpServer::doClose(const CloseHandler &onFailure)
{
    if (finished_) {
        return;
    }

    LOG_INFO << "Закрываем сервер...";

    boost::system::error_code ec;
    listener_.close(ec);
    if (ec) {
        LOG_ERROR << "Ошибка при закрытии слушателя: " << ec.message();
        if (onFailure) {
            onFailure(ec);
        }
    }

    finish(make_error_code(ServerError::SERVER_CLOSED));
}

void HttpServer::finish(const boost::system::error_code &ec)
{
    if (finished_) {
        return;
    }
    finished_ = true;

    retryTimer_.cancel();

    boost::system::error_code closeEc;
    listener_.close(closeEc);
    if (closeEc) {
        LOG_WARNING << "Ошибка при закрытии слушателя: " << closeEc.message();
    }

    closeConnections();

    // Пул завершится, когда отработают уже начатые обработчики
    workGuard_.reset();
    finishSignaled_ = true;
    finishedPromise_.set_value(ec);
}

void HttpServer::closeConnections()
{
    for (const auto &weak : connections_) {
        if (auto connection = weak.lock(); connection != nullptr) {
            connection->close();
        }
    }
    connections_.clear();
}

void HttpServer::joinWorkers()
{
    for (auto &worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();
}
} // namespace davhost::server
