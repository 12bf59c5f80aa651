#pragma once

#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

#include "config/config.hpp"

namespace davhost::config {
/**
 * @class JsonConfigSource
 * @brief Конфигурация из JSON-файла с переопределением через переменные окружения
 *
 * Значение параметра `key` ищется сначала в переменной окружения `<ПРЕФИКС>_KEY`,
 * затем в файле конфигурации. Отсутствующий файл не является ошибкой - используются
 * значения по умолчанию. Файл читается при вызове load(); до этого доступны только
 * переменные окружения.
 */
class JsonConfigSource : public ConfigSource {
public:
    /**
     * @brief Конструктор
     * @param configFile Путь к файлу конфигурации
     * @param factory Фабрика обработчиков протокола (должна пережить источник)
     * @param envPrefix Префикс переменных окружения
     */
    JsonConfigSource(std::filesystem::path configFile, HandlerFactory &factory,
                     std::string envPrefix = "WD");

    std::shared_ptr<Config> load() override;

    std::optional<std::string> getString(const std::string &key) const override;

    std::optional<bool> getBool(const std::string &key) const override;

private:
    const std::filesystem::path configFile_; // Путь к файлу конфигурации
    HandlerFactory &factory_; // Фабрика обработчиков
    const std::string envPrefix_; // Префикс переменных окружения
    nlohmann::json document_; // Содержимое файла конфигурации

    /**
     * @brief Чтение и разбор файла конфигурации
     * @throw ConfigError если файл не является корректным JSON-объектом
     */
    void readDocument();

    /**
     * @brief Значение переменной окружения для параметра
     */
    std::optional<std::string> getEnv(const std::string &key) const;

    /**
     * @brief Разбор списка пользователей
     */
    void parseUsers(Config &config) const;
};
} // namespace davhost::config
