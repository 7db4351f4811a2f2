#pragma once

#include <atomic>
#include <filesystem>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

namespace squid::utils {
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
 * @brief Разбор текстового представления уровня логирования
 * @param name Наименование уровня в нижнем регистре (например, "warning")
 * @return Уровень логирования или std::nullopt, если наименование неизвестно
 */
std::optional<LogLevel> parseLogLevel(std::string_view name);

/**
 * @class Logger
 * @brief Управляет логированием сообщений с различными уровнями важности
 *
 * Logger является синглтоном и обеспечивает потокобезопасное логирование.
 * По умолчанию логирование отключено: библиотека ничего не пишет, пока приложение
 * явно не включит логгер.
 */
class Logger {
public:
    /**
     * @brief Получение единственного экземпляра логгера
     * @return Ссылка на экземпляр логгера
     */
    static Logger &getInstance();

    /**
     * @brief Включает логирование
     * @param logToConsole Включить вывод в консоль (stderr)
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

    bool isEnabled() const;

    void setMinLogLevel(LogLevel level);

    LogLevel getMinLogLevel() const;

    /**
     * @brief Проверяет, будет ли записано сообщение указанного уровня
     * @param level Уровень сообщения
     * @return true, если логирование включено и уровень не ниже минимального
     */
    bool shouldLog(LogLevel level) const;

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
     * @brief Сообщает о неустранимой ошибке и аварийно завершает процесс
     *
     * Сообщение пишется в лог с уровнем CRITICAL. Если логгер отключен или не пишет в консоль,
     * сообщение дополнительно выводится в stderr, чтобы причина завершения не потерялась.
     */
    [[noreturn]] void fatal(const std::string &message, const std::string_view file, int line);

private:
    Logger();
    ~Logger() = default;
    Logger(const Logger &) = delete;
    Logger &operator=(const Logger &) = delete;
    Logger(Logger &&) = delete;
    Logger &operator=(Logger &&) = delete;

    std::atomic<bool> enabled_; // Включено ли логирование
    std::atomic<bool> consoleOutput_; // Вывод в консоль
    bool colorOutput_; // Использовать цветной вывод
    std::optional<std::filesystem::path> logFilePath_; // Путь к файлу лога
    std::atomic<LogLevel> minimumLevel_; // Минимальный уровень логирования
    mutable std::mutex logMutex_; // Мьютекс для потокобезопасности

    static std::string levelToString(LogLevel level);

    std::string formatLogMessage(LogLevel level, const std::string &message,
                                 const std::string_view file, int line) const;

    /**
     * @brief Записывает сообщение в файл лога
     * @param formattedMessage Отформатированное сообщение
     * @return true, если запись выполнена успешно
     */
    bool writeToFile(const std::string &formattedMessage);

    void writeToConsole(const std::string &formattedMessage, LogLevel level);

    /**
     * @brief Проверяет, поддерживает ли консоль ANSI цвета
     * @return true, если консоль поддерживает ANSI цвета
     */
    static bool isColorSupportedByTerminal();
};

/**
 * @brief Вспомогательный класс для логирования с использованием потокового синтаксиса
 */
class LogStream {
public:
    LogStream(LogLevel level, const std::string_view file, int line);

    /**
     * @brief Деструктор, который отправляет собранное сообщение в логгер
     */
    ~LogStream();

    template <typename T> LogStream &operator<<(const T &val)
    {
        stream_ << val;
        return *this;
    }

private:
    LogLevel level_; // Уровень логирования
    std::ostringstream stream_; // Поток для формирования сообщения
    std::string_view file_; // Имя файла
    int line_; // Номер строки
};

} // namespace squid::utils

// Макросы для удобного логирования с автоматическим указанием файла и строки.
// Аргументы оператора << не вычисляются, если сообщение не будет записано.
#define SQUID_LOG(level)                                                                           \
    if (squid::utils::Logger::getInstance().shouldLog(level))                                      \
    squid::utils::LogStream(level, __FILE__, __LINE__)

#define LOG_TRACE SQUID_LOG(squid::utils::LogLevel::TRACE)
#define LOG_DEBUG SQUID_LOG(squid::utils::LogLevel::DEBUG)
#define LOG_INFO SQUID_LOG(squid::utils::LogLevel::INFO)
#define LOG_WARNING SQUID_LOG(squid::utils::LogLevel::WARNING)
#define LOG_ERROR SQUID_LOG(squid::utils::LogLevel::ERROR)
#define LOG_CRITICAL SQUID_LOG(squid::utils::LogLevel::CRITICAL)
