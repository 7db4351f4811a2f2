#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "utils/logger.hpp"

namespace squid::cli {
/**
 * @struct Options
 * @brief Разобранные опции командной строки
 */
struct Options {
    bool help = false; // Показать справку и завершиться
    bool serverMode = false; // Запуск в серверном режиме
    std::optional<std::string> machineId; // Явный идентификатор машины
    std::optional<std::string> socketPath; // Путь к Unix-сокету сервера
    size_t count = 1; // Количество идентификаторов в однократном режиме
    size_t workers = 1; // Количество рабочих потоков сервера
    utils::LogLevel logLevel = utils::LogLevel::WARNING;
    std::optional<std::filesystem::path> logFile;
};

/**
 * @brief Вывод справки
 * @param out Поток вывода
 * @param executable Имя исполняемого файла
 */
void printHelp(std::ostream &out, const std::string &executable);

/**
 * @brief Получение значения опции из аргументов командной строки
 *
 * Поддерживаются форматы `--option=value` и `--option value`. Найденная опция удаляется из
 * списка аргументов.
 *
 * @param option Имя опции
 * @param args Аргументы командной строки
 * @return Значение опции или std::nullopt, если опция не указана
 */
std::optional<std::string> getOptionValue(const std::string &option,
                                          std::vector<std::string> &args);

// Проверка наличия флага (найденный флаг удаляется из списка аргументов)
bool hasFlag(const std::string &flag, std::vector<std::string> &args);

// Проверка оставшихся аргументов: если они остались, то это ошибка
bool checkLastArgs(const std::vector<std::string> &args);

/**
 * @brief Разбор положительного целого значения опции
 * @param option Имя опции (для сообщения об ошибке)
 * @param value Значение, допускаются только десятичные цифры
 * @return Число больше нуля или std::nullopt
 */
std::optional<size_t> parsePositive(const std::string &option, const std::string &value);

/**
 * @brief Разбор аргументов командной строки
 * @param args Аргументы без имени исполняемого файла
 * @return Опции или std::nullopt, если аргументы некорректны (причина пишется в лог)
 */
std::optional<Options> parseOptions(std::vector<std::string> args);
} // namespace squid::cli
