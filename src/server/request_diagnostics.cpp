#include "server/request_diagnostics.hpp"

#include <charconv>
#include <memory>

#include <nlohmann/json.hpp>

#include "utils/logger.hpp"

namespace {
constexpr char EXPECTED_ENTITY_LENGTH_HEADER[] = "X-Expected-Entity-Length";

// Значение шестнадцатеричной цифры или -1
int hexValue(char c)
{
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

std::string_view toStdView(boost::beast::string_view value)
{
    return std::string_view(value.data(), value.size());
}
} // namespace

namespace davhost::server {
namespace beast_http = boost::beast::http;

RequestDiagnostic RequestDiagnostic::fromRequest(const http::Request &request,
                                                 const std::optional<std::string> &error)
{
    RequestDiagnostic diagnostic;
    diagnostic.method = std::string(toStdView(request.method_string()));
    diagnostic.path = decodeRequestPath(toStdView(request.target()));

    // Content-Length как заявлен клиентом; для chunked длина неизвестна
    const auto contentLength = request.find(beast_http::field::content_length);
    if (contentLength != request.end()) {
        diagnostic.contentLength = parseInt64OrZero(toStdView(contentLength->value()));
    }
    else if (request.chunked()) {
        diagnostic.contentLength = -1;
    }

    diagnostic.close = !request.keep_alive();

    const auto expected = request.find(EXPECTED_ENTITY_LENGTH_HEADER);
    if (expected != request.end()) {
        diagnostic.expectedEntityLength = parseInt64OrZero(toStdView(expected->value()));
    }

    if (error.has_value()) {
        diagnostic.error = *error;
    }
    return diagnostic;
}

std::string RequestDiagnostic::toJson() const
{
    // Объект nlohmann::json упорядочивает ключи по алфавиту
    nlohmann::json jsonData;
    jsonData["method"] = method;
    jsonData["path"] = path;
    jsonData["content_length"] = contentLength;
    jsonData["close"] = close;
    jsonData["x_expected_entity_length"] = expectedEntityLength;
    jsonData["error"] = error;
    return jsonData.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

int64_t parseInt64OrZero(std::string_view value)
{
    if (value.empty()) {
        return 0;
    }

    // from_chars не принимает явный знак "+"
    if (value.front() == '+') {
        value.remove_prefix(1);
        if (value.empty() || value.front() == '-') {
            return 0;
        }
    }

    int64_t result = 0;
    const auto *begin = value.data();
    const auto *end = value.data() + value.size();
    const auto [ptr, ec] = std::from_chars(begin, end, result);
    if (ec != std::errc() || ptr != end) {
        return 0;
    }
    return result;
}

std::string decodeRequestPath(std::string_view target)
{
    const auto query = target.find('?');
    if (query != std::string_view::npos) {
        target = target.substr(0, query);
    }

    // Абсолютная форма (http://host/path): схема и authority отбрасываются
    if (!target.empty() && target.front() != '/') {
        const auto scheme = target.find("://");
        if (scheme != std::string_view::npos) {
            const auto pathStart = target.find('/', scheme + 3);
            target = pathStart == std::string_view::npos ? std::string_view()
                                                         : target.substr(pathStart);
        }
    }

    std::string decoded;
    decoded.reserve(target.size());
    for (size_t i = 0; i < target.size(); i++) {
        if (target[i] != '%') {
            decoded += target[i];
            continue;
        }
        if (i + 2 >= target.size()) {
            return std::string(target);
        }
        const auto hi = hexValue(target[i + 1]);
        const auto lo = hexValue(target[i + 2]);
        if (hi < 0 || lo < 0) {
            return std::string(target);
        }
        decoded += static_cast<char>((hi << 4) | lo);
        i += 2;
    }
    return decoded;
}

void attachRequestDiagnostics(const config::Config &config,
                              std::function<void(const std::string &payload)> sink)
{
    // Один общий приемник для всех вариантов обработчиков
    auto sharedSink = std::make_shared<std::function<void(const std::string &)>>(std::move(sink));
    const auto logger = [sharedSink](const http::Request &request,
                                     const std::optional<std::string> &error) {
        const auto diagnostic = RequestDiagnostic::fromRequest(request, error);
        (*sharedSink)(diagnostic.toJson());
    };

    size_t attached = 0;
    for (const auto &handler : config.handlers()) {
        handler->setLogger(logger);
        attached++;
    }
    LOG_DEBUG << "Мост диагностики запросов подключен к обработчикам: " << attached;
}
} // namespace davhost::server
