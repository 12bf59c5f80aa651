#include "logger.hpp"

#include <cctype>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

#if defined(DAVHOST_PLATFORM_WINDOWS)
#include <windows.h>
#endif

#include <nlohmann/json.hpp>

#include "utils/compiler.hpp"

namespace {
/**
 * @brief Получение текущего времени в формате ISO8601 для лога
 * @return Строка с текущим временем в формате "YYYY-MM-DDTHH:MM:SS.mmm+ZZZZ"
 */
std::string getCurrentTimeFormatted()
{
    // Получаем текущее время из системных часов
    const auto now = std::chrono::system_clock::now();
    // now -> time_t для использования localtime
    const auto time_t_now = std::chrono::system_clock::to_time_t(now);
    // Получаем миллисекунды текущей секунды
    const auto ms
        = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm localTime{};
#if defined(DAVHOST_PLATFORM_WINDOWS)
    localtime_s(&localTime, &time_t_now);
#else
    localtime_r(&time_t_now, &localTime);
#endif

    std::ostringstream oss;
    oss << std::put_time(&localTime, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0')
        << std::setw(3) << ms.count() << std::put_time(&localTime, "%z");
    return oss.str();
}

/**
 * @brief Извлекает имя файла из полного пути
 * @param fullPath Полный путь к файлу
 * @return Только имя файла без пути
 */
std::string extractFileName(const std::string_view fullPath)
{
    auto pos = fullPath.find_last_of("/\\");
    if (pos != std::string_view::npos) {
        return std::string(fullPath.substr(pos + 1));
    }
    return std::string(fullPath);
}

// Название уровня в нижнем регистре для JSON-записей
std::string levelToJsonName(davhost::utils::LogLevel level)
{
    auto name = davhost::utils::Logger::levelToString(level);
    for (auto &c : name) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return name;
}
} // namespace

/**
 * ANSI коды цветов для консольного вывода
 * Используются для визуального выделения сообщений разного уровня
 */
namespace ConsoleColor {
constexpr const char *RESET = "\033[0m"; // Сброс всех атрибутов
constexpr const char *RED = "\033[31m"; // Красный (для ошибок)
constexpr const char *GREEN = "\033[32m"; // Зеленый (для информации)
constexpr const char *YELLOW = "\033[33m"; // Желтый (для предупреждений)
constexpr const char *BLUE = "\033[34m"; // Синий (для отладки)
constexpr const char *MAGENTA = "\033[35m"; // Пурпурный (для критических ошибок)
constexpr const char *CYAN = "\033[36m"; // Голубой (для трассировки)
} // namespace ConsoleColor

namespace davhost::utils {
std::optional<LogFormat> parseLogFormat(std::string_view name)
{
    if (name == "console") {
        return LogFormat::CONSOLE;
    }
    if (name == "json") {
        return LogFormat::JSON;
    }
    return std::nullopt;
}

Logger &Logger::getInstance()
{
    // Реализация синглтона Logger
    static Logger instance;
    return instance;
}

Logger::Logger()
    : enabled_(false)
    , consoleOutput_(false)
    , colorOutput_(false)
    , includeCaller_(true)
    , logFilePath_(std::nullopt)
    , minimumLevel_(LogLevel::INFO)
    , format_(LogFormat::CONSOLE)
    , nextHookId_(1)
{
}

Logger::~Logger()
{
    flush();
}

void Logger::enable(bool logToConsole, std::optional<std::filesystem::path> logFile,
                    LogLevel minLevel, bool useColors)
{
    std::ostringstream configMsg;
    bool needColorWarning = false;

    {
        std::lock_guard<std::mutex> lock(logMutex_);

        enabled_ = true;
        consoleOutput_ = logToConsole;
        logFilePath_ = std::move(logFile);
        minimumLevel_ = minLevel;

        // Устанавливаем использование цветов, если это запрошено и поддерживается
        colorOutput_ = false;
        if (useColors) {
            const auto isColorSupported = isColorSupportedByTerminal();
            needColorWarning = logToConsole && !isColorSupported;
            colorOutput_ = isColorSupported;
        }

        openLogFile();

        // Формируем сообщение с конфигурацией логгера
        configMsg << "Логирование включено (минимальный уровень: " << levelToString(minLevel)
                  << ", вывод в консоль: " << (consoleOutput_ ? "да" : "нет")
                  << ", цветной вывод: " << (colorOutput_ ? "да" : "нет") << ")";
    }

    if (needColorWarning) {
        log(LogLevel::WARNING,
            "Включена поддержка цветного вывода, однако текущая консоль не поддерживает ANSI цвета",
            __FILE__, __LINE__);
    }
    log(LogLevel::DEBUG, configMsg.str(), __FILE__, __LINE__);
}

void Logger::disable()
{
    log(LogLevel::DEBUG, "Логирование отключено", __FILE__, __LINE__);

    std::lock_guard<std::mutex> lock(logMutex_);
    enabled_ = false;
    if (logFile_.is_open()) {
        logFile_.flush();
        logFile_.close();
    }
}

bool Logger::isEnabled() const
{
    return enabled_;
}

void Logger::setMinLogLevel(LogLevel level)
{
    minimumLevel_ = level;

    if (enabled_) {
        std::ostringstream oss;
        oss << "Минимальный уровень логирования установлен на " << levelToString(level);
        log(LogLevel::DEBUG, oss.str(), __FILE__, __LINE__);
    }
}

LogLevel Logger::getMinLogLevel() const
{
    return minimumLevel_;
}

void Logger::setFormat(LogFormat format)
{
    std::lock_guard<std::mutex> lock(logMutex_);
    format_ = format;
}

LogFormat Logger::getFormat() const
{
    std::lock_guard<std::mutex> lock(logMutex_);
    return format_;
}

void Logger::setIncludeCaller(bool includeCaller)
{
    std::lock_guard<std::mutex> lock(logMutex_);
    includeCaller_ = includeCaller;
}

LoggerSettings Logger::getSettings() const
{
    std::lock_guard<std::mutex> lock(logMutex_);

    LoggerSettings settings;
    settings.enabled = enabled_;
    settings.consoleOutput = consoleOutput_;
    settings.colorOutput = colorOutput_;
    settings.includeCaller = includeCaller_;
    settings.logFile = logFilePath_;
    settings.minLevel = minimumLevel_;
    settings.format = format_;
    return settings;
}

void Logger::applySettings(const LoggerSettings &settings)
{
    std::lock_guard<std::mutex> lock(logMutex_);

    consoleOutput_ = settings.consoleOutput;
    colorOutput_ = settings.colorOutput;
    includeCaller_ = settings.includeCaller;
    minimumLevel_ = settings.minLevel;
    format_ = settings.format;

    if (logFilePath_ != settings.logFile || (settings.logFile && !logFile_.is_open())) {
        logFilePath_ = settings.logFile;
        openLogFile();
    }

    enabled_ = settings.enabled;
}

Logger::HookId Logger::addHook(LogHook hook)
{
    std::lock_guard<std::mutex> lock(logMutex_);
    const auto id = nextHookId_++;
    hooks_.push_back({ id, std::make_shared<const LogHook>(std::move(hook)) });
    return id;
}

void Logger::removeHook(HookId id)
{
    std::lock_guard<std::mutex> lock(logMutex_);
    for (auto it = hooks_.begin(); it != hooks_.end(); ++it) {
        if (it->id == id) {
            hooks_.erase(it);
            return;
        }
    }
}

void Logger::flush()
{
    std::lock_guard<std::mutex> lock(logMutex_);
    std::cerr.flush();
    if (logFile_.is_open()) {
        logFile_.flush();
    }
}

void Logger::log(LogLevel level, const std::string &message, const std::string_view file, int line)
{
    // Проверяем, включено ли логирование и подходит ли уровень сообщения
    if (!enabled_ || level < minimumLevel_) {
        return;
    }

    std::string formattedMessage;
    std::vector<std::shared_ptr<const LogHook>> hooks;
    {
        std::lock_guard<std::mutex> lock(logMutex_);

        // Форматируем сообщение
        formattedMessage = formatLogMessage(level, message, file, line);

        // Выводим в консоль, если необходимо
        if (consoleOutput_) {
            writeToConsole(formattedMessage, level);
        }

        // Записываем в файл, если указан путь
        if (logFilePath_.has_value()) {
            writeToFile(formattedMessage);
        }

        hooks.reserve(hooks_.size());
        for (const auto &entry : hooks_) {
            hooks.push_back(entry.hook);
        }
    }

    // Подписчики вызываются вне мьютекса: они вправе сами писать в лог
    for (const auto &hook : hooks) {
        (*hook)(level, formattedMessage);
    }
}

std::string Logger::levelToString(LogLevel level)
{
    switch (level) {
    case LogLevel::TRACE:
        return "TRACE";
    case LogLevel::DEBUG:
        return "DEBUG";
    case LogLevel::INFO:
        return "INFO";
    case LogLevel::WARNING:
        return "WARNING";
    case LogLevel::ERROR:
        return "ERROR";
    case LogLevel::CRITICAL:
        return "CRITICAL";
    default:
        UNREACHABLE("Unsupported LogLevel");
    }
}

std::string Logger::formatLogMessage(LogLevel level, const std::string &message,
                                     const std::string_view file, int line) const
{
    const auto timestamp = getCurrentTimeFormatted();

    if (format_ == LogFormat::JSON) {
        nlohmann::json record;
        record["level"] = levelToJsonName(level);
        record["ts"] = timestamp;
        if (includeCaller_ && !file.empty()) {
            record["caller"] = extractFileName(file) + ":" + std::to_string(line);
        }
        record["msg"] = message;
        // Невалидный UTF-8 заменяется, а не приводит к исключению
        return record.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    }

    std::ostringstream oss;

    // Формат: [ВРЕМЯ] [УРОВЕНЬ] [ФАЙЛ:СТРОКА] Сообщение
    oss << "[" << timestamp << "] "
        << "[" << levelToString(level) << "] ";

    if (includeCaller_ && !file.empty()) {
        oss << "[" << extractFileName(file) << ":" << line << "] ";
    }

    oss << message;

    return oss.str();
}

void Logger::openLogFile()
{
    if (logFile_.is_open()) {
        logFile_.flush();
        logFile_.close();
    }
    if (!logFilePath_.has_value()) {
        return;
    }

    // Создаем директорию для лог-файла, если она не существует
    const auto dir = logFilePath_->parent_path();
    if (!dir.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
    }

    logFile_.open(*logFilePath_, std::ios::out | std::ios::app);
    if (logFile_) {
        logFile_ << "--- DAVHOST логирование начато в " << getCurrentTimeFormatted() << " ---\n";
    }
}

bool Logger::writeToFile(const std::string &formattedMessage)
{
    if (!logFile_.is_open()) {
        std::cerr << "DAVHOST: Не удалось открыть файл для записи: " << logFilePath_->string()
                  << std::endl;
        return false;
    }

    // Запись буферизуется до flush()
    logFile_ << formattedMessage << '\n';
    return static_cast<bool>(logFile_);
}

void Logger::writeToConsole(const std::string &formattedMessage, LogLevel level)
{
    // Префикс для консольного вывода
    const std::string prefix = "DAVHOST: ";

    // Используем цветовой вывод в зависимости от уровня логирования и настроек
    if (colorOutput_) {
        const char *colorCode = ConsoleColor::RESET;

        switch (level) {
        case LogLevel::TRACE:
            colorCode = ConsoleColor::CYAN;
            break;
        case LogLevel::DEBUG:
            colorCode = ConsoleColor::BLUE;
            break;
        case LogLevel::INFO:
            colorCode = ConsoleColor::GREEN;
            break;
        case LogLevel::WARNING:
            colorCode = ConsoleColor::YELLOW;
            break;
        case LogLevel::ERROR:
            colorCode = ConsoleColor::RED;
            break;
        case LogLevel::CRITICAL:
            colorCode = ConsoleColor::MAGENTA;
            break;
        default:
            UNREACHABLE("Unsupported LogLevel");
        }

        // Выводим сообщение с цветом
        std::cerr << colorCode << prefix << formattedMessage << ConsoleColor::RESET << std::endl;
    }
    else {
        // Выводим сообщение без цвета
        std::cerr << prefix << formattedMessage << std::endl;
    }
}

bool Logger::isColorSupportedByTerminal() const
{
#if defined(DAVHOST_PLATFORM_UNIX)
    // В Unix-подобных системах проверяем переменную окружения TERM
    const char *term = std::getenv("TERM");
    if (term == nullptr) {
        return false;
    }

    // Проверяем стандартные терминалы, поддерживающие цвет
    return std::string(term) != "dumb" && std::string(term) != "unknown";
#elif defined(DAVHOST_PLATFORM_WINDOWS)
    // В Windows проверяем наличие поддержки ANSI через GetConsoleMode
    HANDLE hOut = GetStdHandle(STD_OUTPUT_HANDLE);
    if (hOut == INVALID_HANDLE_VALUE) {
        return false;
    }

    DWORD dwMode = 0;
    if (!GetConsoleMode(hOut, &dwMode)) {
        return false;
    }

    // Флаг ENABLE_VIRTUAL_TERMINAL_PROCESSING указывает на поддержку ANSI цветов
    return (dwMode & ENABLE_VIRTUAL_TERMINAL_PROCESSING) != 0;
#else
    return false;
#endif
}

LogStream::LogStream(LogLevel level, const std::string_view file, int line)
    : level_(level)
    , file_(file)
    , line_(line)
{
}

LogStream::~LogStream()
{
    // Отправляем собранное сообщение в логгер при уничтожении объекта
    // Это позволяет использовать потоковый синтаксис для логирования
    Logger::getInstance().log(level_, stream_.str(), file_, line_);
}

} // namespace davhost::utils
