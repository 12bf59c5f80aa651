#include "testing_utils.hpp"

#include <algorithm>
#include <cstdlib>
#include <limits>
#include <random>
#include <unordered_set>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <gtest/gtest.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/rsa.h>
#include <openssl/x509.h>

#include "utils/logger.hpp"

namespace {
// Мьютекс для безопасного доступа к контейнеру из нескольких потоков
static std::mutex randomIdsMutex;
// Базовая часть наименования временных директорий
static const char tmpDirBase[] = "davhost_test_";

namespace beast_http = boost::beast::http;

// Отправка запросов по уже установленному соединению
template <typename Stream>
std::vector<davhost::tests::HttpResult> exchange(Stream &stream,
                                                 std::vector<davhost::http::Request> requests)
{
    std::vector<davhost::tests::HttpResult> results;
    boost::beast::flat_buffer buffer;
    for (auto &request : requests) {
        request.prepare_payload();
        beast_http::write(stream, request);

        beast_http::response_parser<beast_http::string_body> parser;
        parser.body_limit(std::numeric_limits<std::uint64_t>::max());
        beast_http::read(stream, buffer, parser);

        auto response = parser.release();
        davhost::tests::HttpResult result;
        result.status = response.result_int();
        result.body = std::move(response.body());
        result.keepAlive = response.keep_alive();
        results.push_back(std::move(result));
    }
    return results;
}

// Закрытие клиентского сокета, ошибки не важны
template <typename Socket> void closeSocket(Socket &socket)
{
    boost::system::error_code ec;
    socket.shutdown(Socket::shutdown_both, ec);
    socket.close(ec);
}
} // namespace

namespace davhost::tests {
std::string generateRandomId(size_t length)
{
    static std::unordered_set<std::string> randomIds;

    // Для каждого потока создаем свой экземпляр генератора
    thread_local std::mt19937 rng(std::random_device{}());
    static const char characters[]
        = "0123456789abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ";
    // `-2`, так как убираем `\0` из массива + обеспечиваем индексацию от нулевого символа
    std::uniform_int_distribution<size_t> dist(0, sizeof(characters) - 2);

    // Блокируем мьютекс для защиты контейнера со сгенерированными ID
    std::lock_guard<std::mutex> guard(randomIdsMutex);

    bool idUnique = false;
    std::string result;
    result.reserve(length);
    constexpr uint16_t maxAttempts = 10000;
    uint16_t attempts = 0;
    do {
        result.clear();
        for (size_t i = 0; i < length; i++) {
            result += characters[dist(rng)];
        }
        // Проверяем, был ли сгенерирован такой ID в рамках текущей сессии тестирования
        idUnique = randomIds.find(result) == randomIds.end();
        attempts++;
    } while (!idUnique && attempts < maxAttempts);
    EXPECT_TRUE(idUnique);

    randomIds.insert(result);
    return result;
}

std::string generateLargeString(size_t size)
{
    std::string result(size, 'X');
    for (size_t i = 0; i < size; i += 1024) {
        size_t pos = i % 26;
        result[i] = static_cast<char>('A' + pos);
    }
    return result;
}

std::filesystem::path createTmpDirectory(std::string_view suffix)
{
    // Путь к Unix Domain Socket ограничен ~108 байтами, поэтому имя короткое
    const auto systemTmpDir = std::filesystem::temp_directory_path();
    std::filesystem::path tmpDir;
    do {
        tmpDir = systemTmpDir / (tmpDirBase + std::string(suffix.substr(0, 16)) + "_"
                                 + generateRandomId(8));
    } while (std::filesystem::exists(tmpDir));

    // Создаем директорию и проверяем результат
    std::error_code ec;
    bool created = std::filesystem::create_directories(tmpDir, ec);
    EXPECT_TRUE(created);
    EXPECT_FALSE(ec);

    EXPECT_TRUE(std::filesystem::exists(tmpDir));
    EXPECT_TRUE(std::filesystem::is_directory(tmpDir));

    return tmpDir;
}

void removeTmpDirectory(const std::filesystem::path &tmpDir)
{
    if (!std::filesystem::exists(tmpDir)) {
        // Директория уже удалена или не была создана
        return;
    }

    // Проверяем, что это действительно временная тестовая директория
    const auto dirName = tmpDir.filename().string();
    EXPECT_TRUE(dirName.find(tmpDirBase) == 0);

    std::error_code ec;
    bool removed = std::filesystem::remove_all(tmpDir, ec) > 0;

    // Если возникла ошибка при удалении, логируем ее, но не прерываем тест
    if (ec) {
        LOG_WARNING << "Ошибка при удалении тестовой директории: " << tmpDir.string()
                    << ", код ошибки: " << ec.value() << ", сообщение: " << ec.message();
    }
    else if (!removed) {
        LOG_WARNING << "Директория не была удалена: " << tmpDir.string();
    }
}

ScopedEnv::ScopedEnv(std::string name, const std::string &value)
    : name_(std::move(name))
{
    const char *previous = std::getenv(name_.c_str());
    if (previous != nullptr) {
        previous_ = previous;
    }
    ::setenv(name_.c_str(), value.c_str(), 1);
}

ScopedEnv::~ScopedEnv()
{
    if (previous_.has_value()) {
        ::setenv(name_.c_str(), previous_->c_str(), 1);
    }
    else {
        ::unsetenv(name_.c_str());
    }
}

void RecordingCallback::onStart(const std::string &address)
{
    record({CallbackEvent::Kind::START, EventCode::MESSAGE, address});
}

void RecordingCallback::onStop()
{
    record({CallbackEvent::Kind::STOP, EventCode::MESSAGE, {}});
}

void RecordingCallback::onMessage(EventCode code, const std::string &message)
{
    record({CallbackEvent::Kind::MESSAGE, code, message});
}

void RecordingCallback::setHook(Hook hook)
{
    std::lock_guard<std::mutex> lock(mutex_);
    hook_ = std::move(hook);
}

std::vector<CallbackEvent> RecordingCallback::events() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return events_;
}

std::vector<CallbackEvent> RecordingCallback::lifecycleEvents() const
{
    std::vector<CallbackEvent> result;
    for (auto &event : events()) {
        if (event.kind == CallbackEvent::Kind::MESSAGE && event.code == EventCode::MESSAGE) {
            continue;
        }
        result.push_back(std::move(event));
    }
    return result;
}

std::vector<std::string> RecordingCallback::messages(EventCode code) const
{
    std::vector<std::string> result;
    for (auto &event : events()) {
        if (event.kind == CallbackEvent::Kind::MESSAGE && event.code == code) {
            result.push_back(std::move(event.payload));
        }
    }
    return result;
}

size_t RecordingCallback::startCount() const
{
    const auto all = events();
    return std::count_if(all.begin(), all.end(), [](const CallbackEvent &event) {
        return event.kind == CallbackEvent::Kind::START;
    });
}

size_t RecordingCallback::stopCount() const
{
    const auto all = events();
    return std::count_if(all.begin(), all.end(), [](const CallbackEvent &event) {
        return event.kind == CallbackEvent::Kind::STOP;
    });
}

bool RecordingCallback::waitFor(
    const std::function<bool(const std::vector<CallbackEvent> &)> &predicate,
    std::chrono::milliseconds timeout) const
{
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [&]() { return predicate(events_); });
}

bool RecordingCallback::waitForStart(size_t count) const
{
    return waitFor([count](const std::vector<CallbackEvent> &events) {
        return static_cast<size_t>(std::count_if(events.begin(), events.end(), [](const auto &e) {
                   return e.kind == CallbackEvent::Kind::START;
               }))
            >= count;
    });
}

bool RecordingCallback::waitForStop(size_t count) const
{
    return waitFor([count](const std::vector<CallbackEvent> &events) {
        return static_cast<size_t>(std::count_if(events.begin(), events.end(), [](const auto &e) {
                   return e.kind == CallbackEvent::Kind::STOP;
               }))
            >= count;
    });
}

bool RecordingCallback::waitForCode(EventCode code, size_t count) const
{
    return waitFor([code, count](const std::vector<CallbackEvent> &events) {
        return static_cast<size_t>(
                   std::count_if(events.begin(), events.end(), [code](const auto &e) {
                       return e.kind == CallbackEvent::Kind::MESSAGE && e.code == code;
                   }))
            >= count;
    });
}

std::string RecordingCallback::startAddress() const
{
    for (const auto &event : events()) {
        if (event.kind == CallbackEvent::Kind::START) {
            return event.payload;
        }
    }
    return {};
}

void RecordingCallback::record(CallbackEvent event)
{
    Hook hook;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.push_back(event);
        hook = hook_;
    }
    cv_.notify_all();

    // Хук выполняется без блокировки: он может обращаться к контроллеру
    if (hook) {
        hook(event);
    }
}

FakeRequestHandler::FakeRequestHandler(std::string name)
    : name_(std::move(name))
{
}

http::Response FakeRequestHandler::handle(const http::Request &request)
{
    http::Response response(beast_http::status::ok, request.version());
    response.set(beast_http::field::content_type, "text/plain");

    std::optional<std::string> error;
    if (std::string(request.target()) == "/fail") {
        response.result(beast_http::status::internal_server_error);
        response.body() = "failure";
        error = "injected failure";
    }
    else if (request.method() == beast_http::verb::put) {
        response.result(beast_http::status::created);
        response.body() = request.body();
    }
    else {
        response.body() = std::string(request.method_string()) + " "
            + std::string(request.target());
    }

    http::RequestLogger logger;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        handled_++;
        logger = logger_;
    }
    if (logger) {
        logger(request, error);
    }
    return response;
}

void FakeRequestHandler::setLogger(http::RequestLogger logger)
{
    std::lock_guard<std::mutex> lock(mutex_);
    logger_ = std::move(logger);
}

const std::string &FakeRequestHandler::name() const
{
    return name_;
}

bool FakeRequestHandler::hasLogger() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<bool>(logger_);
}

size_t FakeRequestHandler::handledCount() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return handled_;
}

http::Response BlockingRequestHandler::handle(const http::Request &request)
{
    if (std::string(request.target()) == "/slow") {
        std::unique_lock<std::mutex> lock(mutex_);
        blocked_++;
        cv_.notify_all();
        cv_.wait_for(lock, EVENT_TIMEOUT, [this]() { return released_; });
        blocked_--;
    }

    http::Response response(beast_http::status::ok, request.version());
    response.set(beast_http::field::content_type, "text/plain");
    response.body() = std::string(request.target());
    return response;
}

bool BlockingRequestHandler::waitUntilBlocked(std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this]() { return blocked_ > 0; });
}

bool BlockingRequestHandler::isBlocked() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return blocked_ > 0;
}

void BlockingRequestHandler::release()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        released_ = true;
    }
    cv_.notify_all();
}

std::shared_ptr<http::RequestHandler> FakeHandlerFactory::createDefault(const config::Config &)
{
    createdFor_.emplace_back();
    if (nullDefault_) {
        return nullptr;
    }
    return std::make_shared<FakeRequestHandler>();
}

std::shared_ptr<http::RequestHandler> FakeHandlerFactory::createForUser(const config::Config &,
                                                                        const config::User &user)
{
    if (userFailure_.has_value()) {
        const auto message = *userFailure_;
        userFailure_.reset();
        throw std::runtime_error(message);
    }
    createdFor_.push_back(user.username);
    return std::make_shared<FakeRequestHandler>(user.username);
}

void FakeHandlerFactory::failOnUser(std::string message)
{
    userFailure_ = std::move(message);
}

void FakeHandlerFactory::returnNullDefault()
{
    nullDefault_ = true;
}

std::vector<std::string> FakeHandlerFactory::createdFor() const
{
    return createdFor_;
}

StaticConfigSource::StaticConfigSource()
    : config_(std::make_shared<config::Config>())
    , defaultHandler_(std::make_shared<FakeRequestHandler>())
{
    config_->handler = defaultHandler_;
}

std::shared_ptr<config::Config> StaticConfigSource::load()
{
    if (loadFailure_) {
        loadFailure_();
    }
    return config_;
}

std::optional<std::string> StaticConfigSource::getString(const std::string &key) const
{
    const auto it = strings_.find(key);
    if (it == strings_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<bool> StaticConfigSource::getBool(const std::string &key) const
{
    const auto it = bools_.find(key);
    if (it == bools_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void StaticConfigSource::set(const std::string &key, const std::string &value)
{
    strings_[key] = value;
}

void StaticConfigSource::setBool(const std::string &key, bool value)
{
    bools_[key] = value;
}

config::Config &StaticConfigSource::config()
{
    return *config_;
}

std::shared_ptr<FakeRequestHandler> StaticConfigSource::defaultHandler() const
{
    return defaultHandler_;
}

std::shared_ptr<FakeRequestHandler> StaticConfigSource::addUser(const std::string &username)
{
    auto handler = std::make_shared<FakeRequestHandler>(username);
    config::User user;
    user.username = username;
    user.handler = handler;
    config_->users[username] = std::move(user);
    return handler;
}

void StaticConfigSource::failLoad(std::function<void()> thrower)
{
    loadFailure_ = std::move(thrower);
}

http::Request makeRequest(beast_http::verb method, const std::string &target,
                          const std::string &body)
{
    http::Request request(method, target, 11);
    request.set(beast_http::field::host, "localhost");
    request.body() = body;
    request.prepare_payload();
    return request;
}

HttpResult sendTcpRequest(uint16_t port, http::Request request)
{
    std::vector<http::Request> requests;
    requests.push_back(std::move(request));
    return sendTcpRequests(port, std::move(requests)).front();
}

HttpResult sendRawTcpRequest(uint16_t port, const std::string &rawRequest)
{
    boost::asio::io_context ioCtx;
    boost::asio::ip::tcp::socket socket(ioCtx);
    socket.connect(
        boost::asio::ip::tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), port));
    boost::asio::write(socket, boost::asio::buffer(rawRequest));

    boost::beast::flat_buffer buffer;
    http::Response response;
    beast_http::read(socket, buffer, response);
    closeSocket(socket);

    HttpResult result;
    result.status = response.result_int();
    result.body = std::move(response.body());
    result.keepAlive = response.keep_alive();
    return result;
}

HttpResult sendLocalRequest(const std::string &socketPath, http::Request request)
{
    boost::asio::io_context ioCtx;
    boost::asio::local::stream_protocol::socket socket(ioCtx);
    socket.connect(boost::asio::local::stream_protocol::endpoint(socketPath));

    std::vector<http::Request> requests;
    requests.push_back(std::move(request));
    auto results = exchange(socket, std::move(requests));
    closeSocket(socket);
    return results.front();
}

std::vector<HttpResult> sendTcpRequests(uint16_t port, std::vector<http::Request> requests)
{
    boost::asio::io_context ioCtx;
    boost::asio::ip::tcp::socket socket(ioCtx);
    socket.connect(
        boost::asio::ip::tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), port));
    auto results = exchange(socket, std::move(requests));
    closeSocket(socket);
    return results;
}

HttpResult sendTlsRequest(uint16_t port, http::Request request)
{
    boost::asio::io_context ioCtx;
    boost::asio::ssl::context sslCtx(boost::asio::ssl::context::tls_client);
    sslCtx.set_verify_mode(boost::asio::ssl::verify_none);

    boost::asio::ssl::stream<boost::asio::ip::tcp::socket> stream(ioCtx, sslCtx);
    stream.next_layer().connect(
        boost::asio::ip::tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), port));
    stream.handshake(boost::asio::ssl::stream_base::client);

    std::vector<http::Request> requests;
    requests.push_back(std::move(request));
    auto results = exchange(stream, std::move(requests));

    // Без close_notify: сервер воспринимает обрыв как конец соединения
    closeSocket(stream.next_layer());
    return results.front();
}

void writeSelfSignedCertificate(const std::filesystem::path &certPath,
                                const std::filesystem::path &keyPath)
{
    std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)> key(EVP_RSA_gen(2048), &EVP_PKEY_free);
    if (key == nullptr) {
        throw std::runtime_error("Не удалось сгенерировать ключ RSA");
    }

    std::unique_ptr<X509, decltype(&X509_free)> cert(X509_new(), &X509_free);
    if (cert == nullptr) {
        throw std::runtime_error("Не удалось создать сертификат");
    }
    X509_set_version(cert.get(), 2);
    ASN1_INTEGER_set(X509_get_serialNumber(cert.get()), 1);
    X509_gmtime_adj(X509_getm_notBefore(cert.get()), 0);
    X509_gmtime_adj(X509_getm_notAfter(cert.get()), 24 * 60 * 60);
    X509_set_pubkey(cert.get(), key.get());

    auto *name = X509_get_subject_name(cert.get());
    X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_ASC,
                               reinterpret_cast<const unsigned char *>("localhost"), -1, -1, 0);
    X509_set_issuer_name(cert.get(), name);
    if (X509_sign(cert.get(), key.get(), EVP_sha256()) == 0) {
        throw std::runtime_error("Не удалось подписать сертификат");
    }

    std::unique_ptr<BIO, decltype(&BIO_free)> certBio(BIO_new_file(certPath.c_str(), "w"),
                                                      &BIO_free);
    std::unique_ptr<BIO, decltype(&BIO_free)> keyBio(BIO_new_file(keyPath.c_str(), "w"),
                                                     &BIO_free);
    if (certBio == nullptr || keyBio == nullptr
        || PEM_write_bio_X509(certBio.get(), cert.get()) == 0
        || PEM_write_bio_PrivateKey(keyBio.get(), key.get(), nullptr, nullptr, 0, nullptr,
                                    nullptr)
               == 0) {
        throw std::runtime_error("Не удалось записать сертификат или ключ");
    }
}
} // namespace davhost::tests
