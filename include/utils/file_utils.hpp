#pragma once

#include <filesystem>
#include <string>

namespace squid::utils {
/**
 * @brief Проверяет, существует ли файл и доступен ли для чтения
 * @param filePath Путь к проверяемому файлу
 * @return true, если файл существует и доступен для чтения
 */
bool isFileReadable(const std::filesystem::path &filePath);

/**
 * @brief Безопасно считывает все содержимое файла
 * @param filePath Путь к файлу для чтения
 * @param[out] data Буфер для сохранения прочитанных данных
 * @return true, если чтение выполнено успешно
 */
bool safeFileRead(const std::filesystem::path &filePath, std::string &data);

/**
 * @brief Удаляет пробельные символы в начале и в конце строки
 * @param input Исходная строка
 * @return Строка без незначащих пробелов
 */
std::string trim(const std::string &input);
} // namespace squid::utils
