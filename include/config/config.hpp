#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "http/request_handler.hpp"

namespace davhost::config {
/**
 * @class ConfigError
 * @brief Некорректная конфигурация, при которой сервис не может быть запущен
 */
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @struct UserSettings
 * @brief Параметры, из которых внешняя фабрика строит обработчик протокола
 */
struct UserSettings {
    std::string scope = "."; // Корневая директория
    bool modify = true; // Разрешены ли изменяющие запросы
};

/**
 * @struct User
 * @brief Пользователь со своим обработчиком протокола
 */
struct User {
    std::string username;
    std::string password;
    UserSettings settings;
    std::shared_ptr<http::RequestHandler> handler;
};

/**
 * @struct Config
 * @brief Загруженная конфигурация сервиса
 *
 * Сервер передает все запросы обработчику handler; маршрутизация по пользователям
 * (если она нужна) - ответственность этого обработчика.
 */
struct Config {
    bool debug = false;
    std::string logFormat = "console";
    bool auth = true;
    std::string prefix = "/";
    UserSettings defaults;
    std::shared_ptr<http::RequestHandler> handler; // Обработчик по умолчанию
    std::map<std::string, User> users; // Пользователи по имени

    /**
     * @brief Все варианты обработчиков: по умолчанию и пользовательские
     * @return Список ненулевых обработчиков
     */
    std::vector<std::shared_ptr<http::RequestHandler>> handlers() const;
};

/**
 * @class HandlerFactory
 * @brief Внешняя фабрика обработчиков протокола
 */
class HandlerFactory {
public:
    virtual ~HandlerFactory() = default;

    /**
     * @brief Создание обработчика по умолчанию
     * @param config Конфигурация (пользователи уже заполнены, обработчики еще нет)
     */
    virtual std::shared_ptr<http::RequestHandler> createDefault(const Config &config) = 0;

    /**
     * @brief Создание обработчика для пользователя
     * @param config Конфигурация
     * @param user Пользователь
     */
    virtual std::shared_ptr<http::RequestHandler> createForUser(const Config &config,
                                                                const User &user)
        = 0;
};

/**
 * @class ConfigSource
 * @brief Источник конфигурации сервиса
 */
class ConfigSource {
public:
    virtual ~ConfigSource() = default;

    /**
     * @brief Загрузка конфигурации и построение обработчиков
     * @return Конфигурация
     * @throw ConfigError при некорректной конфигурации
     */
    virtual std::shared_ptr<Config> load() = 0;

    /**
     * @brief Значение строкового параметра
     * @param key Имя параметра
     * @return Значение или std::nullopt, если параметр не задан
     */
    virtual std::optional<std::string> getString(const std::string &key) const = 0;

    /**
     * @brief Значение логического параметра
     * @param key Имя параметра
     * @return Значение или std::nullopt, если параметр не задан
     */
    virtual std::optional<bool> getBool(const std::string &key) const = 0;
};

/**
 * @brief Строковый параметр со значением по умолчанию
 */
std::string getOption(const ConfigSource &source, const std::string &key,
                      const std::string &defValue);

/**
 * @brief Логический параметр со значением по умолчанию
 */
bool getOptionBool(const ConfigSource &source, const std::string &key, bool defValue);

/**
 * @brief Целочисленный параметр без знака со значением по умолчанию
 * @throw ConfigError если значение не является десятичным числом без знака
 */
std::uint64_t getOptionUInt(const ConfigSource &source, const std::string &key,
                            std::uint64_t defValue);

/**
 * @brief Разбор логического значения: "1", "t", "T", "TRUE", "true", "True" и
 * "0", "f", "F", "FALSE", "false", "False"
 * @param value Строка
 * @return Значение или std::nullopt для любой другой строки
 */
std::optional<bool> parseBool(std::string_view value);
} // namespace davhost::config
