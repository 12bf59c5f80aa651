#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "testing_utils.hpp"
#include "utils/log_bridge.hpp"
#include "utils/logger.hpp"

namespace davhost::tests {
using utils::LogFormat;
using utils::Logger;
using utils::LogLevel;

class LoggerTest : public ::testing::Test {
protected:
    utils::LoggerSettings savedSettings;
    std::vector<Logger::HookId> hookIds;
    std::mutex recordsMutex;
    std::vector<std::string> records;

    void SetUp() override
    {
        savedSettings = Logger::getInstance().getSettings();

        // Тихий логгер: только подписчики
        utils::LoggerSettings settings;
        settings.enabled = true;
        settings.consoleOutput = false;
        settings.includeCaller = false;
        settings.minLevel = LogLevel::INFO;
        settings.format = LogFormat::CONSOLE;
        Logger::getInstance().applySettings(settings);
    }

    void TearDown() override
    {
        for (const auto id : hookIds) {
            Logger::getInstance().removeHook(id);
        }
        Logger::getInstance().applySettings(savedSettings);
    }

    void addRecordingHook()
    {
        hookIds.push_back(Logger::getInstance().addHook([this](LogLevel, const std::string &record) {
            std::lock_guard<std::mutex> lock(recordsMutex);
            records.push_back(record);
        }));
    }

    std::vector<std::string> recorded()
    {
        std::lock_guard<std::mutex> lock(recordsMutex);
        return records;
    }
};

// Разбор названия формата
TEST_F(LoggerTest, ParseLogFormat)
{
    EXPECT_EQ(utils::parseLogFormat("console"), LogFormat::CONSOLE);
    EXPECT_EQ(utils::parseLogFormat("json"), LogFormat::JSON);
    EXPECT_FALSE(utils::parseLogFormat("JSON").has_value());
    EXPECT_FALSE(utils::parseLogFormat("xml").has_value());
    EXPECT_FALSE(utils::parseLogFormat("").has_value());
}

// Подписчик получает запись в консольном формате
TEST_F(LoggerTest, HookReceivesConsoleRecord)
{
    addRecordingHook();
    LOG_INFO << "сервис " << 42;

    const auto all = recorded();
    ASSERT_EQ(all.size(), 1u);
    EXPECT_EQ(all[0].front(), '[');
    EXPECT_NE(all[0].find("] [INFO] сервис 42"), std::string::npos);
    // Место вызова отключено
    EXPECT_EQ(all[0].find("test_logger.cpp"), std::string::npos);
}

// Место вызова добавляется в запись, если включено
TEST_F(LoggerTest, ConsoleRecordWithCaller)
{
    Logger::getInstance().setIncludeCaller(true);
    addRecordingHook();
    LOG_WARNING << "с местом вызова";

    const auto all = recorded();
    ASSERT_EQ(all.size(), 1u);
    EXPECT_NE(all[0].find("[WARNING] [test_logger.cpp:"), std::string::npos);
}

// Записи ниже минимального уровня отбрасываются
TEST_F(LoggerTest, LevelFilter)
{
    addRecordingHook();
    LOG_TRACE << "trace";
    LOG_DEBUG << "debug";
    LOG_INFO << "info";
    LOG_ERROR << "error";

    const auto all = recorded();
    ASSERT_EQ(all.size(), 2u);
    EXPECT_NE(all[0].find("info"), std::string::npos);
    EXPECT_NE(all[1].find("[ERROR]"), std::string::npos);

    Logger::getInstance().setMinLogLevel(LogLevel::TRACE);
    const auto before = recorded().size();
    LOG_TRACE << "trace";
    EXPECT_EQ(recorded().size(), before + 1);
}

// Включение логгера с явными параметрами
TEST_F(LoggerTest, EnableConfiguresOutputs)
{
    Logger::getInstance().disable();
    EXPECT_FALSE(Logger::getInstance().isEnabled());

    Logger::getInstance().enable(false, std::nullopt, LogLevel::WARNING, false);
    EXPECT_TRUE(Logger::getInstance().isEnabled());
    EXPECT_EQ(Logger::getInstance().getMinLogLevel(), LogLevel::WARNING);

    const auto settings = Logger::getInstance().getSettings();
    EXPECT_FALSE(settings.consoleOutput);
    EXPECT_FALSE(settings.colorOutput);
    EXPECT_FALSE(settings.logFile.has_value());

    addRecordingHook();
    LOG_INFO << "ниже порога";
    LOG_WARNING << "предупреждение";
    ASSERT_EQ(recorded().size(), 1u);
    EXPECT_NE(recorded()[0].find("предупреждение"), std::string::npos);
}

// Отключенный логгер не вызывает подписчиков
TEST_F(LoggerTest, DisabledLoggerSkipsHooks)
{
    addRecordingHook();
    Logger::getInstance().disable();
    LOG_CRITICAL << "не должно дойти";
    EXPECT_TRUE(recorded().empty());
}

// JSON-формат: уровень в нижнем регистре, время и сообщение
TEST_F(LoggerTest, JsonRecord)
{
    Logger::getInstance().setFormat(LogFormat::JSON);
    addRecordingHook();
    LOG_WARNING << "диск \"почти\" заполнен";

    const auto all = recorded();
    ASSERT_EQ(all.size(), 1u);

    const auto record = nlohmann::json::parse(all[0]);
    EXPECT_EQ(record["level"], "warning");
    EXPECT_EQ(record["msg"], "диск \"почти\" заполнен");
    EXPECT_TRUE(record["ts"].is_string());
    EXPECT_FALSE(record.contains("caller"));
    // Компактная запись в одну строку
    EXPECT_EQ(all[0].find('\n'), std::string::npos);
}

// JSON-формат с местом вызова
TEST_F(LoggerTest, JsonRecordWithCaller)
{
    Logger::getInstance().setFormat(LogFormat::JSON);
    Logger::getInstance().setIncludeCaller(true);
    addRecordingHook();
    LOG_INFO << "caller";

    const auto record = nlohmann::json::parse(recorded().at(0));
    ASSERT_TRUE(record.contains("caller"));
    EXPECT_EQ(record["caller"].get<std::string>().rfind("test_logger.cpp:", 0), 0u);
}

// Удаляется только указанный подписчик
TEST_F(LoggerTest, RemoveHookKeepsOthers)
{
    size_t firstCalls = 0;
    size_t secondCalls = 0;
    const auto first = Logger::getInstance().addHook(
        [&firstCalls](LogLevel, const std::string &) { firstCalls++; });
    const auto second = Logger::getInstance().addHook(
        [&secondCalls](LogLevel, const std::string &) { secondCalls++; });
    hookIds.push_back(second);

    LOG_INFO << "оба";
    Logger::getInstance().removeHook(first);
    LOG_INFO << "только второй";

    EXPECT_EQ(firstCalls, 1u);
    EXPECT_EQ(secondCalls, 2u);
}

// Подписчик может сам писать в лог без взаимной блокировки
TEST_F(LoggerTest, HookMayLogRecursively)
{
    addRecordingHook();
    hookIds.push_back(Logger::getInstance().addHook([](LogLevel level, const std::string &) {
        if (level == LogLevel::ERROR) {
            LOG_INFO << "ответ на ошибку";
        }
    }));

    LOG_ERROR << "ошибка";

    const auto all = recorded();
    ASSERT_EQ(all.size(), 2u);
    EXPECT_NE(all[0].find("ошибка"), std::string::npos);
    EXPECT_NE(all[1].find("ответ на ошибку"), std::string::npos);
}

// Снимок и восстановление настроек
TEST_F(LoggerTest, ApplySettingsRoundTrip)
{
    auto settings = Logger::getInstance().getSettings();
    EXPECT_TRUE(settings.enabled);
    EXPECT_EQ(settings.minLevel, LogLevel::INFO);

    settings.minLevel = LogLevel::ERROR;
    settings.format = LogFormat::JSON;
    Logger::getInstance().applySettings(settings);

    EXPECT_EQ(Logger::getInstance().getMinLogLevel(), LogLevel::ERROR);
    EXPECT_EQ(Logger::getInstance().getFormat(), LogFormat::JSON);
}

// Запись в файл доступна после flush()
TEST_F(LoggerTest, FileOutputAfterFlush)
{
    const auto testDir = createTmpDirectory("Logger");
    const auto logPath = testDir / "logs" / "davhost.log";

    auto settings = Logger::getInstance().getSettings();
    settings.logFile = logPath;
    Logger::getInstance().applySettings(settings);

    LOG_INFO << "запись в файл";
    Logger::getInstance().flush();

    std::ifstream file(logPath);
    std::stringstream content;
    content << file.rdbuf();
    EXPECT_NE(content.str().find("запись в файл"), std::string::npos);

    settings.logFile.reset();
    Logger::getInstance().applySettings(settings);
    removeTmpDirectory(testDir);
}

// Мост пересылает записи в приемник в заданном формате
TEST_F(LoggerTest, LogBridgeForwardsRecords)
{
    std::vector<std::string> forwarded;
    {
        utils::LogBridge bridge(
            [&forwarded](const std::string &record) { forwarded.push_back(record); },
            LogLevel::INFO, LogFormat::JSON);

        LOG_DEBUG << "отфильтровано";
        LOG_INFO << "переслано";
    }

    ASSERT_EQ(forwarded.size(), 1u);
    const auto record = nlohmann::json::parse(forwarded[0]);
    EXPECT_EQ(record["msg"], "переслано");
    EXPECT_EQ(record["level"], "info");
    EXPECT_FALSE(record.contains("caller"));
}

// Уровень DEBUG пропускает отладочные записи
TEST_F(LoggerTest, LogBridgeDebugLevel)
{
    std::vector<std::string> forwarded;
    {
        utils::LogBridge bridge(
            [&forwarded](const std::string &record) { forwarded.push_back(record); },
            LogLevel::DEBUG, LogFormat::CONSOLE);
        LOG_DEBUG << "отладка";
    }

    bool found = false;
    for (const auto &record : forwarded) {
        if (record.find("[DEBUG] отладка") != std::string::npos) {
            found = true;
        }
    }
    EXPECT_TRUE(found);
}

// После разрушения моста настройки восстановлены, чужие подписчики сохранены
TEST_F(LoggerTest, LogBridgeRestoresSettings)
{
    Logger::getInstance().setIncludeCaller(true);
    addRecordingHook();
    const auto before = Logger::getInstance().getSettings();

    size_t bridged = 0;
    {
        utils::LogBridge bridge([&bridged](const std::string &) { bridged++; }, LogLevel::TRACE,
                                LogFormat::JSON);
        EXPECT_EQ(Logger::getInstance().getFormat(), LogFormat::JSON);
        EXPECT_EQ(Logger::getInstance().getMinLogLevel(), LogLevel::TRACE);
        EXPECT_FALSE(Logger::getInstance().getSettings().includeCaller);
    }
    const auto bridgedWhileInstalled = bridged;

    const auto after = Logger::getInstance().getSettings();
    EXPECT_EQ(after.enabled, before.enabled);
    EXPECT_EQ(after.minLevel, before.minLevel);
    EXPECT_EQ(after.format, before.format);
    EXPECT_EQ(after.includeCaller, before.includeCaller);

    records.clear();
    LOG_INFO << "после моста";
    EXPECT_EQ(bridged, bridgedWhileInstalled);
    EXPECT_EQ(recorded().size(), 1u);
}

// Мост включает отключенный логгер и выключает его обратно
TEST_F(LoggerTest, LogBridgeEnablesDisabledLogger)
{
    auto settings = Logger::getInstance().getSettings();
    settings.enabled = false;
    Logger::getInstance().applySettings(settings);

    size_t bridged = 0;
    {
        utils::LogBridge bridge([&bridged](const std::string &) { bridged++; }, LogLevel::INFO,
                                LogFormat::CONSOLE);
        EXPECT_TRUE(Logger::getInstance().isEnabled());
        LOG_INFO << "через мост";
    }
    EXPECT_EQ(bridged, 1u);
    EXPECT_FALSE(Logger::getInstance().isEnabled());
}
} // namespace davhost::tests
