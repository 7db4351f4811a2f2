#include "utils/logger.hpp"

#include <chrono>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>

namespace {
/**
 * @brief Получение текущего времени в формате для лога
 * @return Строка с текущим временем в формате "YYYY-MM-DD HH:MM:SS.mmm"
 */
std::string getCurrentTimeFormatted()
{
    const auto now = std::chrono::system_clock::now();
    const auto timeNow = std::chrono::system_clock::to_time_t(now);
    // Миллисекунды текущей секунды
    const auto ms
        = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    // localtime_r, так как логгер вызывается из нескольких потоков
    std::tm localTime {};
#if defined(SQUID_PLATFORM_UNIX)
    localtime_r(&timeNow, &localTime);
#else
    localTime = *std::localtime(&timeNow);
#endif

    std::ostringstream oss;
    oss << std::put_time(&localTime, "%Y-%m-%d %H:%M:%S") << '.' << std::setfill('0')
        << std::setw(3) << ms.count();
    return oss.str();
}

// Имя файла без пути
std::string extractFileName(const std::string_view fullPath)
{
    const auto pos = fullPath.find_last_of("/\\");
    if (pos != std::string_view::npos) {
        return std::string(fullPath.substr(pos + 1));
    }
    return std::string(fullPath);
}

// Префикс всех сообщений, выводимых в консоль
constexpr char CONSOLE_PREFIX[] = "SQUID: ";
} // namespace

/**
 * ANSI коды цветов для консольного вывода
 */
namespace ConsoleColor {
constexpr const char *RESET = "\033[0m";
constexpr const char *RED = "\033[31m";
constexpr const char *GREEN = "\033[32m";
constexpr const char *YELLOW = "\033[33m";
constexpr const char *BLUE = "\033[34m";
constexpr const char *MAGENTA = "\033[35m";
constexpr const char *CYAN = "\033[36m";
} // namespace ConsoleColor

namespace squid::utils {
std::optional<LogLevel> parseLogLevel(std::string_view name)
{
    if (name == "trace")
        return LogLevel::TRACE;
    if (name == "debug")
        return LogLevel::DEBUG;
    if (name == "info")
        return LogLevel::INFO;
    if (name == "warning")
        return LogLevel::WARNING;
    if (name == "error")
        return LogLevel::ERROR;
    if (name == "critical")
        return LogLevel::CRITICAL;
    return std::nullopt;
}

Logger &Logger::getInstance()
{
    static Logger instance;
    return instance;
}

Logger::Logger()
    : enabled_(false)
    , consoleOutput_(false)
    , colorOutput_(false)
    , logFilePath_(std::nullopt)
    , minimumLevel_(LogLevel::INFO)
{
}

void Logger::enable(bool logToConsole, std::optional<std::filesystem::path> logFile,
                    LogLevel minLevel, bool useColors)
{
    bool needColorWarning = false;
    std::ostringstream configMsg;

    {
        std::lock_guard<std::mutex> lock(logMutex_);

        consoleOutput_ = logToConsole;
        logFilePath_ = std::move(logFile);
        minimumLevel_ = minLevel;

        const auto isColorSupported = isColorSupportedByTerminal();
        needColorWarning = useColors && !isColorSupported;
        colorOutput_ = useColors && isColorSupported;

        if (logFilePath_.has_value()) {
            // Создаем директорию для лог-файла, если она не существует
            const auto dir = logFilePath_->parent_path();
            std::error_code ec;
            if (!dir.empty()) {
                std::filesystem::create_directories(dir, ec);
            }
            if (ec) {
                std::cerr << CONSOLE_PREFIX << "Не удалось создать директорию для лога: "
                          << dir.string() << ", сообщение: " << ec.message() << std::endl;
            }

            std::ofstream file(*logFilePath_, std::ios::out | std::ios::app);
            if (file) {
                file << "--- SQUID логирование начато в " << getCurrentTimeFormatted() << " ---"
                     << std::endl;
            }
        }

        configMsg << "Логирование включено (минимальный уровень: " << levelToString(minLevel)
                  << ", вывод в консоль: " << (consoleOutput_ ? "да" : "нет")
                  << ", цветной вывод: " << (colorOutput_ ? "да" : "нет") << ")";

        enabled_ = true;
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
}

bool Logger::isEnabled() const
{
    return enabled_;
}

void Logger::setMinLogLevel(LogLevel level)
{
    minimumLevel_ = level;
}

LogLevel Logger::getMinLogLevel() const
{
    return minimumLevel_;
}

bool Logger::shouldLog(LogLevel level) const
{
    return enabled_.load() && level >= minimumLevel_.load();
}

void Logger::log(LogLevel level, const std::string &message, const std::string_view file, int line)
{
    if (!shouldLog(level)) {
        return;
    }

    std::lock_guard<std::mutex> lock(logMutex_);

    const auto formattedMessage = formatLogMessage(level, message, file, line);

    if (consoleOutput_) {
        writeToConsole(formattedMessage, level);
    }

    if (logFilePath_.has_value()) {
        writeToFile(formattedMessage);
    }
}

void Logger::fatal(const std::string &message, const std::string_view file, int line)
{
    const auto reachesConsole = shouldLog(LogLevel::CRITICAL) && consoleOutput_;
    log(LogLevel::CRITICAL, message, file, line);

    if (!reachesConsole) {
        std::lock_guard<std::mutex> lock(logMutex_);
        std::cerr << CONSOLE_PREFIX << formatLogMessage(LogLevel::CRITICAL, message, file, line)
                  << std::endl;
    }
    std::abort();
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
    }
    return "UNKNOWN";
}

std::string Logger::formatLogMessage(LogLevel level, const std::string &message,
                                     const std::string_view file, int line) const
{
    // Формат: [ВРЕМЯ] [УРОВЕНЬ] [ФАЙЛ:СТРОКА] Сообщение
    std::ostringstream oss;
    oss << "[" << getCurrentTimeFormatted() << "] "
        << "[" << levelToString(level) << "] ";

    if (!file.empty()) {
        oss << "[" << extractFileName(file) << ":" << line << "] ";
    }

    oss << message;
    return oss.str();
}

bool Logger::writeToFile(const std::string &formattedMessage)
{
    if (!logFilePath_.has_value()) {
        return false;
    }

    std::ofstream file(*logFilePath_, std::ios::out | std::ios::app);
    if (!file) {
        std::cerr << CONSOLE_PREFIX << "Не удалось открыть файл для записи: " << *logFilePath_
                  << std::endl;
        return false;
    }

    file << formattedMessage << std::endl;
    return true;
}

void Logger::writeToConsole(const std::string &formattedMessage, LogLevel level)
{
    if (!colorOutput_) {
        std::cerr << CONSOLE_PREFIX << formattedMessage << std::endl;
        return;
    }

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
    }

    std::cerr << colorCode << CONSOLE_PREFIX << formattedMessage << ConsoleColor::RESET
              << std::endl;
}

bool Logger::isColorSupportedByTerminal()
{
    // Проверяем переменную окружения TERM
    const char *term = std::getenv("TERM");
    if (term == nullptr) {
        return false;
    }
    return std::string(term) != "dumb" && std::string(term) != "unknown";
}

LogStream::LogStream(LogLevel level, const std::string_view file, int line)
    : level_(level)
    , file_(file)
    , line_(line)
{
}

LogStream::~LogStream()
{
    Logger::getInstance().log(level_, stream_.str(), file_, line_);
}

} // namespace squid::utils
