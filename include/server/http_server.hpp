#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/system/error_code.hpp>

#include "http/request_handler.hpp"
#include "server/address_resolver.hpp"
#include "server/connection.hpp"

namespace davhost::server {
/**
 * @struct TransportOptions
 * @brief Параметры транспорта цикла обслуживания
 */
struct TransportOptions {
    /**
     * @brief Предельный размер тела запроса по умолчанию (64 МБ)
     */
    static constexpr std::uint64_t DEFAULT_BODY_LIMIT = 64ull * 1024 * 1024;

    bool tls = false; // Обслуживать по TLS
    std::string cert = "cert.pem"; // Путь к цепочке сертификатов (PEM)
    std::string key = "key.pem"; // Путь к закрытому ключу (PEM)
    std::uint64_t bodyLimit = DEFAULT_BODY_LIMIT; // Предельный размер тела запроса
    unsigned workers = 0; // Число потоков io_context, 0 - по числу ядер (не меньше 4)
};

/**
 * @class HttpServer
 * @brief Цикл обслуживания HTTP поверх связанного слушателя
 *
 * serve() блокирует вызывающий поток до закрытия сервера или фатальной ошибки приема.
 * Соединения обслуживаются пулом потоков io_context: каждое соединение работает в своем
 * strand, состояние приема и закрытия сервера - в strand сервера. close() потокобезопасен
 * и не ждет обработчиков, занятых запросами.
 *
 * После возврата из serve() потоки пула дорабатывают начатые запросы; деструктор
 * дожидается их завершения.
 */
class HttpServer {
public:
    using CloseHandler = std::function<void(const boost::system::error_code &ec)>;

    /**
     * @brief Минимальная и максимальная задержка повтора при временной ошибке приема
     */
    static constexpr std::chrono::milliseconds MIN_ACCEPT_RETRY_DELAY{5};
    static constexpr std::chrono::milliseconds MAX_ACCEPT_RETRY_DELAY{1000};

    /**
     * @brief Минимальное число потоков пула при автоматическом выборе
     */
    static constexpr unsigned MIN_WORKER_COUNT = 4;

    /**
     * @param ioCtx ASIO контекст, к которому привязан слушатель
     * @param listener Слушатель (должен пережить сервер)
     * @param handler Обработчик протокола
     */
    HttpServer(boost::asio::io_context &ioCtx, Listener &listener,
               std::shared_ptr<http::RequestHandler> handler);

    /**
     * @brief Дожидается завершения потоков пула
     */
    ~HttpServer();

    HttpServer(const HttpServer &) = delete;
    HttpServer &operator=(const HttpServer &) = delete;

    /**
     * @brief Цикл обслуживания (блокирующий вызов)
     * @param options Параметры транспорта
     * @return ServerError::SERVER_CLOSED после close() либо ошибка, прервавшая цикл
     */
    boost::system::error_code serve(const TransportOptions &options);

    /**
     * @brief Закрытие сервера: слушатель и все соединения закрываются немедленно
     *
     * Повторный вызов ничего не делает. Закрытие выполняется асинхронно в strand
     * сервера, ошибка закрытия слушателя передается в onFailure.
     *
     * @param onFailure Обработчик ошибки закрытия
     */
    void close(CloseHandler onFailure = {});

    /**
     * @brief Был ли запрошен close()
     */
    bool closeRequested() const;

private:
    using Strand = boost::asio::strand<boost::asio::io_context::executor_type>;
    using WorkGuard = boost::asio::executor_work_guard<boost::asio::io_context::executor_type>;

    boost::asio::io_context &ioCtx_; // ASIO контекст
    Listener &listener_; // Слушатель
    std::shared_ptr<http::RequestHandler> handler_; // Обработчик протокола
    std::unique_ptr<boost::asio::ssl::context> sslCtx_; // Контекст TLS, если включен
    std::uint64_t bodyLimit_; // Предельный размер тела запроса
    Strand strand_; // Strand состояния приема и закрытия
    boost::asio::steady_timer retryTimer_; // Таймер повтора приема
    std::optional<WorkGuard> workGuard_; // Удерживает пул до завершения цикла
    std::vector<std::thread> workers_; // Потоки пула
    std::promise<boost::system::error_code> finishedPromise_; // Результат цикла

    // Доступны только в strand_
    std::chrono::milliseconds retryDelay_; // Текущая задержка повтора
    bool finished_; // Цикл обслуживания завершен
    std::vector<std::weak_ptr<ConnectionBase>> connections_; // Открытые соединения

    std::atomic<bool> closeRequested_; // Флаг запрошенного закрытия
    std::atomic<bool> finishSignaled_; // Результат передан в serve()

    /**
     * @brief Подготовка контекста TLS
     * @return Код ошибки загрузки сертификата или ключа
     */
    boost::system::error_code setupTls(const TransportOptions &options);

    /**
     * @brief Тело потока пула
     */
    void runWorker();

    /**
     * @brief Принятие нового соединения (в strand_)
     */
    void accept();

    template <typename Acceptor> void acceptOn(Acceptor &acceptor);

    template <typename Socket> void startConnection(Socket socket);

    /**
     * @brief Обработка ошибки приема: повтор с задержкой для временных ошибок
     */
    void onAcceptError(const boost::system::error_code &ec);

    /**
     * @brief Выполняется в strand_ по запросу close()
     */
    void doClose(const CloseHandler &onFailure);

    /**
     * @brief Завершение цикла обслуживания с результатом ec (в strand_)
     *
     * Закрывает слушатель и соединения, отпускает пул и передает результат в serve().
     */
    void finish(const boost::system::error_code &ec);

    void closeConnections();

    void joinWorkers();
};
} // namespace davhost::server
