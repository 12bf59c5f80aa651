#include "config/json_config_source.hpp"

#include <cctype>
#include <cstdlib>

#include "utils/file_utils.hpp"
#include "utils/logger.hpp"

namespace {
using json = nlohmann::json;

// Скалярное значение JSON в строковом представлении
std::optional<std::string> jsonToString(const json &value)
{
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_boolean()) {
        return value.get<bool>() ? "true" : "false";
    }
    if (value.is_number()) {
        return value.dump();
    }
    return std::nullopt;
}

// Скалярное значение JSON в логическом представлении
std::optional<bool> jsonToBool(const json &value)
{
    if (value.is_boolean()) {
        return value.get<bool>();
    }
    if (value.is_string()) {
        // Нераспознанная строка трактуется как false
        return davhost::config::parseBool(value.get<std::string>()).value_or(false);
    }
    if (value.is_number()) {
        return value.get<double>() != 0.0;
    }
    return std::nullopt;
}
} // namespace

namespace davhost::config {
JsonConfigSource::JsonConfigSource(std::filesystem::path configFile, HandlerFactory &factory,
                                   std::string envPrefix)
    : configFile_(std::move(configFile))
    , factory_(factory)
    , envPrefix_(std::move(envPrefix))
    , document_(json::object())
{
}

std::shared_ptr<Config> JsonConfigSource::load()
{
    readDocument();

    auto config = std::make_shared<Config>();
    config->debug = getOptionBool(*this, "debug", false);
    config->logFormat = getOption(*this, "log_format", "console");
    config->auth = getOptionBool(*this, "auth", true);
    config->prefix = getOption(*this, "prefix", "/");
    config->defaults.scope = getOption(*this, "scope", ".");
    config->defaults.modify = getOptionBool(*this, "modify", true);

    parseUsers(*config);
    if (!config->users.empty() && !config->auth) {
        LOG_WARNING << "Users will be ignored due to auth=false";
    }

    // Обработчики строятся после того, как конфигурация полностью заполнена
    config->handler = factory_.createDefault(*config);
    if (config->handler == nullptr) {
        throw std::runtime_error("Фабрика не создала обработчик по умолчанию");
    }
    for (auto &[username, user] : config->users) {
        user.handler = factory_.createForUser(*config, user);
        if (user.handler == nullptr) {
            throw std::runtime_error("Фабрика не создала обработчик для пользователя " + username);
        }
    }

    LOG_DEBUG << "Конфигурация загружена: " << configFile_.string()
              << ", пользователей: " << config->users.size();
    return config;
}

std::optional<std::string> JsonConfigSource::getString(const std::string &key) const
{
    auto env = getEnv(key);
    if (env.has_value()) {
        return env;
    }

    const auto it = document_.find(key);
    if (it == document_.end()) {
        return std::nullopt;
    }
    return jsonToString(*it);
}

std::optional<bool> JsonConfigSource::getBool(const std::string &key) const
{
    const auto env = getEnv(key);
    if (env.has_value()) {
        return parseBool(*env).value_or(false);
    }

    const auto it = document_.find(key);
    if (it == document_.end()) {
        return std::nullopt;
    }
    return jsonToBool(*it);
}

void JsonConfigSource::readDocument()
{
    document_ = json::object();

    if (!utils::isFileReadable(configFile_)) {
        LOG_WARNING << "Файл конфигурации не найден, используются значения по умолчанию: "
                    << configFile_.string();
        return;
    }

    std::string content;
    if (!utils::safeFileRead(configFile_, content)) {
        LOG_WARNING << "Не удалось прочитать файл конфигурации, используются значения по "
                       "умолчанию: "
                    << configFile_.string();
        return;
    }

    try {
        auto parsed = json::parse(content);
        if (!parsed.is_object()) {
            throw ConfigError("Файл конфигурации должен содержать JSON-объект: "
                              + configFile_.string());
        }
        document_ = std::move(parsed);
    }
    catch (const json::exception &e) {
        LOG_CRITICAL << "Ошибка при разборе файла конфигурации " << configFile_.string() << ": "
                     << e.what();
        throw ConfigError("Ошибка при разборе файла конфигурации " + configFile_.string() + ": "
                          + e.what());
    }
}

std::optional<std::string> JsonConfigSource::getEnv(const std::string &key) const
{
    std::string name = envPrefix_.empty() ? std::string() : envPrefix_ + "_";
    for (const auto c : key) {
        name += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }

    const char *value = std::getenv(name.c_str());
    if (value == nullptr) {
        return std::nullopt;
    }
    return std::string(value);
}

void JsonConfigSource::parseUsers(Config &config) const
{
    const auto it = document_.find("users");
    if (it == document_.end() || it->is_null()) {
        return;
    }
    if (!it->is_array()) {
        throw ConfigError("Параметр users должен быть массивом");
    }

    for (const auto &entry : *it) {
        if (!entry.is_object()) {
            throw ConfigError("Элемент users должен быть объектом");
        }

        const auto username = entry.find("username");
        if (username == entry.end() || !username->is_string()) {
            throw ConfigError("user needs an username");
        }

        User user;
        user.username = username->get<std::string>();
        user.settings = config.defaults;

        const auto password = entry.find("password");
        if (password != entry.end()) {
            user.password = jsonToString(*password).value_or("");
        }

        const auto scope = entry.find("scope");
        if (scope != entry.end()) {
            user.settings.scope = jsonToString(*scope).value_or(config.defaults.scope);
        }

        const auto modify = entry.find("modify");
        if (modify != entry.end()) {
            user.settings.modify = jsonToBool(*modify).value_or(config.defaults.modify);
        }

        LOG_DEBUG << "Пользователь из конфигурации: " << user.username;
        config.users[user.username] = std::move(user);
    }
}
} // namespace davhost::config
