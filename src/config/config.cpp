#include "config/config.hpp"

#include <charconv>

namespace davhost::config {
std::vector<std::shared_ptr<http::RequestHandler>> Config::handlers() const
{
    std::vector<std::shared_ptr<http::RequestHandler>> result;
    result.reserve(users.size() + 1);
    if (handler != nullptr) {
        result.push_back(handler);
    }
    for (const auto &[username, user] : users) {
        if (user.handler != nullptr) {
            result.push_back(user.handler);
        }
    }
    return result;
}

std::string getOption(const ConfigSource &source, const std::string &key,
                      const std::string &defValue)
{
    // Значение из окружения или файла конфигурации имеет приоритет
    auto value = source.getString(key);
    if (value.has_value()) {
        return std::move(*value);
    }
    return defValue;
}

bool getOptionBool(const ConfigSource &source, const std::string &key, bool defValue)
{
    const auto value = source.getBool(key);
    if (value.has_value()) {
        return *value;
    }
    return defValue;
}

std::uint64_t getOptionUInt(const ConfigSource &source, const std::string &key,
                            std::uint64_t defValue)
{
    const auto value = source.getString(key);
    if (!value.has_value()) {
        return defValue;
    }

    std::uint64_t result = 0;
    const auto *end = value->data() + value->size();
    const auto [ptr, ec] = std::from_chars(value->data(), end, result);
    if (value->empty() || ec != std::errc() || ptr != end) {
        throw ConfigError("invalid " + key + ": " + *value);
    }
    return result;
}

std::optional<bool> parseBool(std::string_view value)
{
    if (value == "1" || value == "t" || value == "T" || value == "TRUE" || value == "true"
        || value == "True") {
        return true;
    }
    if (value == "0" || value == "f" || value == "F" || value == "FALSE" || value == "false"
        || value == "False") {
        return false;
    }
    return std::nullopt;
}
} // namespace davhost::config
