#include "cli/options.hpp"

#include <algorithm>
#include <cctype>
#include <exception>

namespace squid::cli {
void printHelp(std::ostream &out, const std::string &executable)
{
    out << "Использование:\n"
        << "  " << executable << " [ОПЦИИ]\n\n"

        << "Описание:\n"
        << "  Генератор сортируемых уникальных идентификаторов вида\n"
        << "  <ИДЕНТИФИКАТОР_МАШИНЫ>-<МИЛЛИСЕКУНДЫ>-<СЧЕТЧИК>.\n\n"

        << "Общие опции:\n"
        << "  --machine-id=ID        Идентификатор машины (по умолчанию читается из\n"
        << "                         /etc/machine-id или /var/lib/dbus/machine-id)\n"
        << "  --log-level=УРОВЕНЬ    trace, debug, info, warning, error, critical\n"
        << "                         (по умолчанию: warning)\n"
        << "  --log-file=ПУТЬ        Дополнительно писать лог в файл\n"
        << "  --help                 Показать справку\n\n"

        << "=== Однократная генерация ===\n"
        << "  Запуск: " << executable << " [--count=ЧИСЛО] [ОПЦИИ]\n"
        << "  Выводит ЧИСЛО идентификаторов (по умолчанию: 1), по одному в строке.\n\n"

        << "=== Серверный режим ===\n"
        << "  Запуск: " << executable << " --server [ОПЦИИ]\n"
        << "  Доступные опции:\n"
        << "    --socket=ПУТЬ        Путь к Unix-сокету (по умолчанию: /TMP/squid.sock).\n"
        << "                         Сокет не должен существовать.\n"
        << "    --workers=ЧИСЛО      Количество рабочих потоков (по умолчанию: 1)\n";
}

std::optional<std::string> getOptionValue(const std::string &option,
                                          std::vector<std::string> &args)
{
    for (size_t i = 0; i < args.size(); ++i) {
        const auto &arg = args[i];
        // Проверка формата `--option=value`
        const auto pos = arg.find('=');
        if (pos != std::string::npos && arg.substr(0, pos) == option) {
            const std::string value = arg.substr(pos + 1);
            args.erase(args.begin() + i);
            return value;
        }
        // Проверка формата `--option value`
        if (arg == option && i + 1 < args.size()) {
            const std::string value = args[i + 1];
            args.erase(args.begin() + i, args.begin() + i + 2);
            return value;
        }
    }
    return std::nullopt;
}

bool hasFlag(const std::string &flag, std::vector<std::string> &args)
{
    auto it = std::find(args.begin(), args.end(), flag);
    if (it != args.end()) {
        args.erase(it);
        return true;
    }
    return false;
}

bool checkLastArgs(const std::vector<std::string> &args)
{
    if (args.empty()) {
        return true;
    }

    LOG_ERROR << "Ошибка: неизвестные аргументы:";
    for (const auto &arg : args) {
        LOG_ERROR << "\t" << arg;
    }
    return false;
}

std::optional<size_t> parsePositive(const std::string &option, const std::string &value)
{
    // std::stoull пропускает пробелы и принимает знак, поэтому допускаем только цифры
    const auto isDigits
        = !value.empty() && std::all_of(value.begin(), value.end(), [](char c) {
              return std::isdigit(static_cast<unsigned char>(c)) != 0;
          });

    if (isDigits) {
        try {
            const auto parsed = std::stoull(value);
            if (parsed > 0) {
                return static_cast<size_t>(parsed);
            }
        }
        catch (const std::exception &e) {
            LOG_DEBUG << "Ошибка разбора " << option << ": " << e.what();
        }
    }
    LOG_ERROR << "Ошибка: некорректное значение для " << option << ": " << value;
    return std::nullopt;
}

std::optional<Options> parseOptions(std::vector<std::string> args)
{
    Options options;
    if (hasFlag("--help", args)) {
        options.help = true;
        return options;
    }

    const auto logLevelOption = getOptionValue("--log-level", args);
    if (logLevelOption.has_value()) {
        const auto parsedLevel = utils::parseLogLevel(*logLevelOption);
        if (!parsedLevel.has_value()) {
            LOG_ERROR << "Ошибка: неизвестный уровень логирования: " << *logLevelOption;
            return std::nullopt;
        }
        options.logLevel = *parsedLevel;
    }

    const auto logFileOption = getOptionValue("--log-file", args);
    if (logFileOption.has_value()) {
        options.logFile = std::filesystem::path(*logFileOption);
    }

    options.serverMode = hasFlag("--server", args);
    options.machineId = getOptionValue("--machine-id", args);
    options.socketPath = getOptionValue("--socket", args);

    const auto countOption = getOptionValue("--count", args);
    if (countOption.has_value()) {
        const auto parsed = parsePositive("--count", *countOption);
        if (!parsed.has_value()) {
            return std::nullopt;
        }
        options.count = *parsed;
    }

    const auto workersOption = getOptionValue("--workers", args);
    if (workersOption.has_value()) {
        const auto parsed = parsePositive("--workers", *workersOption);
        if (!parsed.has_value()) {
            return std::nullopt;
        }
        options.workers = *parsed;
    }

    if (!checkLastArgs(args)) {
        return std::nullopt;
    }
    return options;
}
} // namespace squid::cli
