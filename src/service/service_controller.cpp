#include "service/service_controller.hpp"

#include <chrono>
#include <system_error>

#include "server/request_diagnostics.hpp"
#include "server/server_error.hpp"
#include "utils/logger.hpp"

namespace {
constexpr char ALREADY_RUNNING_MESSAGE[] = "Already running.";

// Параметры прослушивания и транспорта по умолчанию
constexpr char DEFAULT_ADDRESS[] = "0.0.0.0";
constexpr char DEFAULT_PORT[] = "0";
constexpr char DEFAULT_CERT[] = "cert.pem";
constexpr char DEFAULT_KEY[] = "key.pem";
} // namespace

namespace davhost {
ServiceController::ServiceController()
    : state_(SlotState::EMPTY)
{
}

ServiceController::~ServiceController()
{
    // Перезапуск из onStop() может породить новый поток, пока ждем предыдущий
    for (;;) {
        stop();

        std::thread serving;
        std::thread retired;
        bool idle = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            serving = std::move(serveThread_);
            retired = std::move(retiredThread_);
            idle = state_ == SlotState::EMPTY;
        }
        if (!serving.joinable() && !retired.joinable()) {
            if (idle) {
                break;
            }
            // Запуск из другого потока еще не опубликовал свой поток обслуживания
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
            continue;
        }
        for (auto *thread : { &retired, &serving }) {
            if (!thread->joinable()) {
                continue;
            }
            if (thread->get_id() == std::this_thread::get_id()) {
                thread->detach();
            }
            else {
                thread->join();
            }
        }
    }
}

void ServiceController::start(config::ConfigSource &source, Callback &callback)
{
    bool reserved = false;
    std::thread previous;
    std::thread retired;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == SlotState::EMPTY) {
            state_ = SlotState::STARTING;
            previous = std::move(serveThread_);
            retired = std::move(retiredThread_);
            reserved = true;
        }
    }
    if (!reserved) {
        callback.onMessage(EventCode::ALREADY_RUNNING, ALREADY_RUNNING_MESSAGE);
        return;
    }
    reapThread(std::move(retired));
    reapThread(std::move(previous));

    std::shared_ptr<Instance> instance;
    try {
        instance = createInstance(source, callback);
    }
    catch (const config::ConfigError &e) {
        LOG_ERROR << "Некорректная конфигурация: " << e.what();
        releaseSlot();
        throw;
    }
    catch (const std::exception &e) {
        LOG_ERROR << "Ошибка при запуске сервиса: " << e.what();
        releaseSlot();
        callback.onMessage(EventCode::START_FAILED, e.what());
        return;
    }
    if (instance == nullptr) {
        releaseSlot();
        return;
    }

    const auto boundAddress = instance->listener->boundAddress();

    // Поток обслуживания ждет, пока хост не получит onStart()
    std::promise<void> gate;
    std::thread thread;
    try {
        thread = std::thread(&ServiceController::serve, this, instance, gate.get_future());
    }
    catch (const std::system_error &e) {
        LOG_ERROR << "Не удалось создать поток обслуживания: " << e.what();
        instance.reset();
        releaseSlot();
        callback.onMessage(EventCode::START_FAILED, e.what());
        return;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        instance_ = instance;
        state_ = SlotState::RUNNING;
        serveThread_ = std::move(thread);
    }
    instance.reset();

    callback.onStart(boundAddress);
    gate.set_value();
}

void ServiceController::stop()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != SlotState::RUNNING || instance_ == nullptr) {
            return;
        }

        // Экземпляр жив, пока работает пул, в котором будет вызван обработчик
        auto &callback = instance_->callback;
        instance_->server->close([&callback](const boost::system::error_code &ec) {
            callback.onMessage(EventCode::STOP_FAILED, ec.message());
        });
    }
    LOG_INFO << "Запрошена остановка сервиса";
}

bool ServiceController::isRunning() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return state_ != SlotState::EMPTY;
}

std::shared_ptr<ServiceController::Instance>
ServiceController::createInstance(config::ConfigSource &source, Callback &callback)
{
    auto instance = std::make_shared<Instance>(callback);

    instance->config = source.load();
    if (instance->config == nullptr || instance->config->handler == nullptr) {
        LOG_ERROR << "Конфигурация не содержит обработчика запросов";
        callback.onMessage(EventCode::START_FAILED, "no request handler configured");
        return nullptr;
    }
    const auto &cfg = *instance->config;

    const auto format = utils::parseLogFormat(cfg.logFormat);
    if (!format.has_value()) {
        throw config::ConfigError("unknown log_format: " + cfg.logFormat);
    }

    auto &options = instance->options;
    options.tls = config::getOptionBool(source, "tls", false);
    options.cert = config::getOption(source, "cert", DEFAULT_CERT);
    options.key = config::getOption(source, "key", DEFAULT_KEY);
    options.bodyLimit = config::getOptionUInt(source, "body_limit",
                                              server::TransportOptions::DEFAULT_BODY_LIMIT);
    if (options.bodyLimit == 0) {
        throw config::ConfigError("body_limit must be positive");
    }
    options.workers = static_cast<unsigned>(config::getOptionUInt(source, "workers", 0));

    server::attachRequestDiagnostics(cfg, [&callback](const std::string &payload) {
        callback.onMessage(EventCode::REQUEST, payload);
    });

    instance->logBridge = std::make_unique<utils::LogBridge>(
        [&callback](const std::string &record) { callback.onMessage(EventCode::MESSAGE, record); },
        cfg.debug ? utils::LogLevel::DEBUG : utils::LogLevel::INFO, *format);

    const auto address
        = server::resolveListenAddress(config::getOption(source, "address", DEFAULT_ADDRESS),
                                       config::getOption(source, "port", DEFAULT_PORT));

    boost::system::error_code ec;
    instance->listener = server::Listener::bind(instance->ioCtx, address, ec);
    if (instance->listener == nullptr) {
        LOG_ERROR << "Не удалось начать прослушивание " << address.address << ": "
                  << ec.message();
        callback.onMessage(EventCode::START_FAILED, ec.message());
        return nullptr;
    }

    instance->server = std::make_unique<server::HttpServer>(instance->ioCtx, *instance->listener,
                                                            cfg.handler);
    return instance;
}

void ServiceController::serve(std::shared_ptr<Instance> instance, std::future<void> gate)
{
    gate.wait();

    const auto ec = instance->server->serve(instance->options);
    auto &callback = instance->callback;

    bool owned = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (instance_ == instance) {
            owned = true;
            instance_.reset();
            state_ = SlotState::RELEASING;
        }
    }

    // Слушатель уже закрыт сервером; мост логирования снимается до освобождения слота
    instance->logBridge.reset();
    if (owned) {
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = SlotState::EMPTY;
    }

    if (ec == server::ServerError::SERVER_CLOSED) {
        callback.onStop();
    }
    else {
        callback.onMessage(EventCode::START_FAILED, ec.message());
    }

    // Дожидается потоков пула, которые еще дорабатывают начатые запросы
    instance.reset();
}

void ServiceController::releaseSlot()
{
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = SlotState::EMPTY;
}

void ServiceController::reapThread(std::thread thread)
{
    if (!thread.joinable()) {
        return;
    }

    // Повторный запуск из обработчика onStop() выполняется в самом потоке обслуживания
    if (thread.get_id() == std::this_thread::get_id()) {
        std::lock_guard<std::mutex> lock(mutex_);
        retiredThread_ = std::move(thread);
        return;
    }
    thread.join();
}
} // namespace davhost
