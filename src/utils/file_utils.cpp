#include "utils/file_utils.hpp"

#include <fstream>
#include <system_error>

#include "utils/logger.hpp"

namespace {
// Проверка существовании директории по указанному пути
bool isExistingDirectory(const std::filesystem::path &path)
{
    std::error_code ec;
    return std::filesystem::is_directory(path, ec) && !ec;
}
} // namespace

namespace davhost::utils {
bool safeFileRead(const std::filesystem::path &filePath, std::string &data)
{
    LOG_DEBUG << "Безопасное чтение файла: " << filePath.string();

    if (isExistingDirectory(filePath)) {
        LOG_ERROR << "Ошибка при безопасном чтении: " << filePath.string()
                  << " - это директория, а не файл";
        return false;
    }

    if (!isFileReadable(filePath)) {
        LOG_ERROR << "Файл не доступен для чтения: " << filePath.string();
        return false;
    }

    std::ifstream inFile(filePath, std::ios::binary | std::ios::ate);
    if (!inFile) {
        LOG_ERROR << "Не удалось открыть файл для чтения: " << filePath.string();
        return false;
    }

    // Определяем размер файла и выделяем буфер
    const auto fileSize = inFile.tellg();
    if (fileSize < 0) {
        LOG_ERROR << "Ошибка при определении размера файла: " << filePath.string();
        return false;
    }

    LOG_DEBUG << "Чтение файла размером " << fileSize << " байт: " << filePath.string();
    data.resize(static_cast<size_t>(fileSize));
    if (fileSize == 0) {
        return true;
    }

    // Перемещаемся в начало файла и читаем содержимое
    inFile.seekg(0);
    inFile.read(&data[0], fileSize);

    const auto readSize = inFile.gcount();
    if (static_cast<size_t>(readSize) != static_cast<size_t>(fileSize)) {
        LOG_ERROR << "Ошибка при чтении: " << filePath.string() << ", прочитано " << readSize
                  << " байт из " << fileSize << " ожидаемых";
        return false;
    }

    LOG_DEBUG << "Успешно прочитано " << readSize << " байт: " << filePath.string();
    return true;
}

bool isFileReadable(const std::filesystem::path &filePath)
{
    LOG_DEBUG << "Проверка файла на чтение: " << filePath.string();

    // Проверка существования файла
    std::error_code ec;
    if (!std::filesystem::exists(filePath, ec)) {
        if (ec) {
            LOG_ERROR << "Ошибка при проверке существования файла: " << filePath.string()
                      << ", код ошибки: " << ec.value() << ", сообщение: " << ec.message();
        }
        else {
            LOG_DEBUG << "Файл не существует: " << filePath.string();
        }
        return false;
    }

    if (isExistingDirectory(filePath)) {
        LOG_DEBUG << "По указанному пути находится директория, а не файл: " << filePath.string();
        return false;
    }

    // Пытаемся открыть файл для чтения, чтобы убедиться в доступности
    std::ifstream testFile(filePath);
    const auto readable = testFile.good();
    if (readable) {
        LOG_DEBUG << "Файл доступен для чтения: " << filePath.string();
    }
    else {
        LOG_DEBUG << "Файл существует, но недоступен для чтения: " << filePath.string();
    }
    return readable;
}

bool removeFileIfExists(const std::filesystem::path &filePath, std::error_code &ec)
{
    ec.clear();
    const auto removed = std::filesystem::remove(filePath, ec);
    if (ec) {
        LOG_ERROR << "Ошибка при удалении файла: " << filePath.string()
                  << ", код ошибки: " << ec.value() << ", сообщение: " << ec.message();
        return false;
    }
    if (removed) {
        LOG_DEBUG << "Удален файл: " << filePath.string();
    }
    return removed;
}
} // namespace davhost::utils
