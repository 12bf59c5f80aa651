#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace davhost::utils {
/**
 * @enum LogLevel
 * @brief Уровни логирования, определяющие важность сообщения
 */
enum class LogLevel {
    TRACE, // Детальная трассировка для отладки
    DEBUG, // Отладочные сообщения
    INFO, // Информационные сообщения
    WARNING, // Предупреждения, не являющиеся ошибками
    ERROR, // Ошибки, не прерывающие работу программы
    CRITICAL // Критические ошибки, прерывающие работу программы
};

/**
 * @enum LogFormat
 * @brief Формат сериализации записи лога
 */
enum class LogFormat {
    CONSOLE, // [ВРЕМЯ] [УРОВЕНЬ] Сообщение
    JSON, // {"level":...,"msg":...,"ts":...}
};

/**
 * @brief Разбор названия формата лога ("console" или "json")
 * @param name Название формата
 * @return Формат или std::nullopt, если название неизвестно
 */
std::optional<LogFormat> parseLogFormat(std::string_view name);

/**
 * @brief Подписчик на записи лога
 *
 * Получает уровень записи и запись, уже сериализованную в текущем формате.
 */
using LogHook = std::function<void(LogLevel level, const std::string &record)>;

/**
 * @struct LoggerSettings
 * @brief Снимок настроек логгера, позволяющий временно переконфигурировать его и вернуть
 * прежнее состояние
 */
struct LoggerSettings {
    bool enabled = false;
    bool consoleOutput = false;
    bool colorOutput = false;
    bool includeCaller = true;
    std::optional<std::filesystem::path> logFile;
    LogLevel minLevel = LogLevel::INFO;
    LogFormat format = LogFormat::CONSOLE;
};

/**
 * @class Logger
 * @brief Управляет логированием сообщений с различными уровнями важности
 *
 * Logger является синглтоном и обеспечивает потокобезопасное логирование.
 * По умолчанию логирование отключено и должно быть явно включено пользователем.
 * Помимо консоли и файла, записи доставляются зарегистрированным подписчикам (хукам).
 */
class Logger {
public:
    using HookId = std::uint64_t;

    /**
     * @brief Получение единственного экземпляра логгера
     * @return Ссылка на экземпляр логгера
     */
    static Logger &getInstance();

    /**
     * @brief Включает логирование
     * @param logToConsole Включить вывод в консоль
     * @param logFile Путь к файлу для логирования (опционально)
     * @param minLevel Минимальный уровень сообщений для логирования
     * @param useColors Использовать цветной вывод в консоли (если поддерживается)
     */
    void enable(bool logToConsole = true,
                std::optional<std::filesystem::path> logFile = std::nullopt,
                LogLevel minLevel = LogLevel::INFO, bool useColors = true);

    /**
     * @brief Отключает логирование
     */
    void disable();

    /**
     * @brief Проверяет, включено ли логирование
     * @return true, если логирование включено
     */
    bool isEnabled() const;

    /**
     * @brief Установка минимального уровня логирования
     * @param level Минимальный уровень сообщений
     */
    void setMinLogLevel(LogLevel level);

    /**
     * @brief Получение текущего минимального уровня логирования
     * @return Текущий минимальный уровень
     */
    LogLevel getMinLogLevel() const;

    /**
     * @brief Установка формата сериализации записей
     */
    void setFormat(LogFormat format);

    LogFormat getFormat() const;

    /**
     * @brief Включение или отключение указания места вызова (файл:строка) в записи
     */
    void setIncludeCaller(bool includeCaller);

    /**
     * @brief Текущие настройки логгера
     */
    LoggerSettings getSettings() const;

    /**
     * @brief Применяет ранее сохраненные настройки
     * @param settings Снимок настроек
     */
    void applySettings(const LoggerSettings &settings);

    /**
     * @brief Регистрирует подписчика на записи лога
     * @param hook Подписчик
     * @return Идентификатор для последующего удаления
     */
    HookId addHook(LogHook hook);

    /**
     * @brief Удаляет подписчика. Неизвестный идентификатор игнорируется
     * @param id Идентификатор, полученный от addHook()
     */
    void removeHook(HookId id);

    /**
     * @brief Сбрасывает буферизованный вывод в консоль и файл
     */
    void flush();

    /**
     * @brief Логирование сообщения с указанным уровнем
     * @param level Уровень сообщения
     * @param message Текст сообщения
     * @param file Имя файла, из которого вызвана функция логирования
     * @param line Номер строки, из которой вызвана функция логирования
     */
    void log(LogLevel level, const std::string &message, const std::string_view file = {},
             int line = 0);

    /**
     * @brief Преобразует уровень логирования в строку
     * @param level Уровень логирования
     * @return Текстовое представление уровня
     */
    static std::string levelToString(LogLevel level);

private:
    // Запрещаем создание экземпляров класса напрямую
    Logger();
    ~Logger();
    Logger(const Logger &) = delete;
    Logger &operator=(const Logger &) = delete;
    Logger(Logger &&) = delete;
    Logger &operator=(Logger &&) = delete;

    struct HookEntry {
        HookId id;
        std::shared_ptr<const LogHook> hook;
    };

    // Состояние логгера
    std::atomic<bool> enabled_; // Включено ли логирование
    bool consoleOutput_; // Вывод в консоль
    bool colorOutput_; // Использовать цветной вывод
    bool includeCaller_; // Добавлять файл:строку в запись
    std::optional<std::filesystem::path> logFilePath_; // Путь к файлу лога
    std::ofstream logFile_; // Открытый файл лога
    std::atomic<LogLevel> minimumLevel_; // Минимальный уровень логирования
    LogFormat format_; // Формат записей
    std::vector<HookEntry> hooks_; // Подписчики
    HookId nextHookId_; // Следующий идентификатор подписчика
    mutable std::mutex logMutex_; // Мьютекс для потокобезопасности

    /**
     * @brief Форматирует сообщение для вывода в лог
     * @param level Уровень сообщения
     * @param message Текст сообщения
     * @param file Имя файла
     * @param line Номер строки
     * @return Отформатированное сообщение
     */
    std::string formatLogMessage(LogLevel level, const std::string &message,
                                 const std::string_view file, int line) const;

    /**
     * @brief Открывает файл лога (вызывается под мьютексом)
     */
    void openLogFile();

    /**
     * @brief Записывает сообщение в файл лога
     * @param formattedMessage Отформатированное сообщение
     * @return true, если запись выполнена успешно
     */
    bool writeToFile(const std::string &formattedMessage);

    /**
     * @brief Выводит сообщение в консоль
     * @param formattedMessage Отформатированное сообщение
     * @param level Уровень сообщения (для цветового выделения)
     */
    void writeToConsole(const std::string &formattedMessage, LogLevel level);

    /**
     * @brief Проверяет, поддерживает ли консоль ANSI цвета
     * @return true, если консоль поддерживает ANSI цвета
     */
    bool isColorSupportedByTerminal() const;
};

/**
 * @brief Вспомогательный класс для логирования с использованием потокового синтаксиса
 */
class LogStream {
public:
    /**
     * @brief Создает поток логирования для указанного уровня
     * @param level Уровень логирования
     * @param file Имя файла, из которого произведен вызов
     * @param line Номер строки
     */
    LogStream(LogLevel level, const std::string_view file, int line);

    /**
     * @brief Деструктор, который отправляет собранное сообщение в логгер
     */
    ~LogStream();

    /**
     * @brief Оператор перенаправления для потокового формирования сообщения
     * @param val Значение для добавления в сообщение
     * @return Ссылка на текущий поток
     */
    template <typename T> LogStream &operator<<(const T &val)
    {
        if (Logger::getInstance().isEnabled() && level_ >= Logger::getInstance().getMinLogLevel()) {
            stream_ << val;
        }
        return *this;
    }

private:
    LogLevel level_; // Уровень логирования
    std::ostringstream stream_; // Поток для формирования сообщения
    std::string_view file_; // Имя файла
    int line_; // Номер строки
};

} // namespace davhost::utils

// Макросы для условного логирования
#define LOG_TRACE_ENABLED                                                                          \
    (davhost::utils::Logger::getInstance().isEnabled()                                             \
     && davhost::utils::Logger::getInstance().getMinLogLevel() <= davhost::utils::LogLevel::TRACE)
#define LOG_DEBUG_ENABLED                                                                          \
    (davhost::utils::Logger::getInstance().isEnabled()                                             \
     && davhost::utils::Logger::getInstance().getMinLogLevel() <= davhost::utils::LogLevel::DEBUG)
#define LOG_INFO_ENABLED                                                                           \
    (davhost::utils::Logger::getInstance().isEnabled()                                             \
     && davhost::utils::Logger::getInstance().getMinLogLevel() <= davhost::utils::LogLevel::INFO)
#define LOG_WARNING_ENABLED                                                                        \
    (davhost::utils::Logger::getInstance().isEnabled()                                             \
     && davhost::utils::Logger::getInstance().getMinLogLevel()                                     \
            <= davhost::utils::LogLevel::WARNING)
#define LOG_ERROR_ENABLED                                                                          \
    (davhost::utils::Logger::getInstance().isEnabled()                                             \
     && davhost::utils::Logger::getInstance().getMinLogLevel() <= davhost::utils::LogLevel::ERROR)
#define LOG_CRITICAL_ENABLED                                                                       \
    (davhost::utils::Logger::getInstance().isEnabled()                                             \
     && davhost::utils::Logger::getInstance().getMinLogLevel()                                     \
            <= davhost::utils::LogLevel::CRITICAL)

// Макросы для удобного логирования с автоматическим указанием файла и строки
#define LOG_TRACE                                                                                  \
    if (LOG_TRACE_ENABLED)                                                                         \
    davhost::utils::LogStream(davhost::utils::LogLevel::TRACE, __FILE__, __LINE__)
#define LOG_DEBUG                                                                                  \
    if (LOG_DEBUG_ENABLED)                                                                         \
    davhost::utils::LogStream(davhost::utils::LogLevel::DEBUG, __FILE__, __LINE__)
#define LOG_INFO                                                                                   \
    if (LOG_INFO_ENABLED)                                                                          \
    davhost::utils::LogStream(davhost::utils::LogLevel::INFO, __FILE__, __LINE__)
#define LOG_WARNING                                                                                \
    if (LOG_WARNING_ENABLED)                                                                       \
    davhost::utils::LogStream(davhost::utils::LogLevel::WARNING, __FILE__, __LINE__)
#define LOG_ERROR                                                                                  \
    if (LOG_ERROR_ENABLED)                                                                         \
    davhost::utils::LogStream(davhost::utils::LogLevel::ERROR, __FILE__, __LINE__)
#define LOG_CRITICAL                                                                               \
    if (LOG_CRITICAL_ENABLED)                                                                      \
    davhost::utils::LogStream(davhost::utils::LogLevel::CRITICAL, __FILE__, __LINE__)
