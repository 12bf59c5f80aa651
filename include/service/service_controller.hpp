#pragma once

#include <future>
#include <memory>
#include <mutex>
#include <thread>

#include <boost/asio.hpp>

#include "config/config.hpp"
#include "server/address_resolver.hpp"
#include "server/http_server.hpp"
#include "service/callback.hpp"
#include "utils/log_bridge.hpp"

namespace davhost {
namespace tests {
class ServiceControllerTestAccess;
} // namespace tests

/**
 * @class ServiceController
 * @brief Управление жизненным циклом единственного экземпляра файлового сервиса
 *
 * start() и stop() вызываются из потоков хост-приложения и не блокируются на сетевых
 * операциях. Обслуживание выполняется в отдельном потоке; о его завершении хост узнает
 * через Callback::onStop() или Callback::onMessage(EventCode::START_FAILED, ...).
 */
class ServiceController {
public:
    ServiceController();

    /**
     * @brief Останавливает работающий экземпляр и дожидается завершения потока обслуживания
     */
    ~ServiceController();

    ServiceController(const ServiceController &) = delete;
    ServiceController &operator=(const ServiceController &) = delete;

    /**
     * @brief Запуск сервиса
     * @param source Источник конфигурации
     * @param callback Получатель уведомлений (должен пережить экземпляр сервиса)
     * @throw config::ConfigError при некорректной конфигурации
     */
    void start(config::ConfigSource &source, Callback &callback);

    /**
     * @brief Запрос остановки сервиса. Без работающего экземпляра ничего не делает
     */
    void stop();

    /**
     * @brief Занят ли слот экземпляра
     */
    bool isRunning() const;

private:
    friend class tests::ServiceControllerTestAccess;

    /**
     * @enum SlotState
     * @brief Состояние слота экземпляра
     */
    enum class SlotState {
        EMPTY, // Экземпляра нет
        STARTING, // Идет запуск, слот зарезервирован
        RUNNING, // Экземпляр обслуживает запросы
        RELEASING, // Поток обслуживания освобождает ресурсы экземпляра
    };

    /**
     * @struct Instance
     * @brief Работающий экземпляр сервиса и все его ресурсы
     */
    struct Instance {
        explicit Instance(Callback &cb)
            : callback(cb)
        {
        }

        Callback &callback; // Получатель уведомлений (заимствуется)
        std::shared_ptr<config::Config> config; // Конфигурация, владеет обработчиками
        server::TransportOptions options; // Параметры транспорта
        std::unique_ptr<utils::LogBridge> logBridge; // Мост логирования
        boost::asio::io_context ioCtx; // ASIO контекст пула обслуживания
        std::unique_ptr<server::Listener> listener; // Слушатель
        std::unique_ptr<server::HttpServer> server; // Сервер
    };

    mutable std::mutex mutex_; // Защищает слот и поток обслуживания
    SlotState state_; // Состояние слота
    std::shared_ptr<Instance> instance_; // Текущий экземпляр
    std::thread serveThread_; // Поток обслуживания
    std::thread retiredThread_; // Поток, из которого сервис был перезапущен в onStop()

    /**
     * @brief Подготовка экземпляра: конфигурация, мосты, слушатель, сервер
     * @return Экземпляр или nullptr, если о неудаче уже сообщено хосту
     */
    std::shared_ptr<Instance> createInstance(config::ConfigSource &source, Callback &callback);

    /**
     * @brief Тело потока обслуживания
     * @param instance Экземпляр
     * @param gate Сигнал о том, что onStart() уже вызван
     */
    void serve(std::shared_ptr<Instance> instance, std::future<void> gate);

    /**
     * @brief Освобождение зарезервированного слота после неудачного запуска
     */
    void releaseSlot();

    /**
     * @brief Ожидание завершения предыдущего потока обслуживания
     *
     * Поток, вызвавший перезапуск из onStop(), не может дождаться сам себя: он
     * сохраняется в retiredThread_ и дожидается следующим запуском или деструктором.
     * Вызывается без захваченного mutex_.
     */
    void reapThread(std::thread thread);
};
} // namespace davhost
