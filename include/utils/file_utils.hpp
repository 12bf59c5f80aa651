#pragma once

#include <string>
#include <filesystem>
#include <system_error>

namespace davhost::utils {
/**
 * @brief Безопасно считывает все содержимое файла
 * @param filePath Путь к файлу для чтения
 * @param[out] data Буфер для сохранения прочитанных данных
 * @return true, если чтение выполнено успешно
 */
bool safeFileRead(const std::filesystem::path &filePath, std::string &data);

/**
 * @brief Проверяет, существует ли файл и доступен ли для чтения
 * @param filePath Путь к проверяемому файлу
 * @return true, если файл существует и доступен для чтения
 */
bool isFileReadable(const std::filesystem::path &filePath);

/**
 * @brief Удаляет файл, если он существует
 * @param filePath Путь к файлу
 * @param[out] ec Код ошибки удаления
 * @return true, если файл был удален
 */
bool removeFileIfExists(const std::filesystem::path &filePath, std::error_code &ec);
} // namespace davhost::utils
