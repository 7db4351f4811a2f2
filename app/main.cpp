#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "cli/options.hpp"
#include "generator/squid_generator.hpp"
#include "generator/synchronized_generator.hpp"
#include "server/server.hpp"
#include "utils/logger.hpp"

int main(int argc, char *argv[])
{
    const std::string executable = (argc > 0) ? argv[0] : "squid";
    std::vector<std::string> args(argv + 1, argv + argc);

    // Ошибки разбора аргументов выводятся в консоль с уровнем по умолчанию
    auto &logger = squid::utils::Logger::getInstance();
    logger.enable(true, std::nullopt, squid::utils::LogLevel::WARNING, true);

    const auto options = squid::cli::parseOptions(std::move(args));
    if (!options.has_value()) {
        squid::cli::printHelp(std::cout, executable);
        return 1;
    }
    if (options->help) {
        squid::cli::printHelp(std::cout, executable);
        return 0;
    }

    logger.enable(true, options->logFile, options->logLevel, true);

    if (options->serverMode) {
        // Генератор разделяется между рабочими потоками сервера
        squid::SynchronizedIdGenerator generator(
            std::make_unique<squid::SquidGenerator>(options->machineId));
        return squid::server::Server::startServer(generator, options->socketPath,
                                                  options->workers);
    }

    squid::SquidGenerator generator(options->machineId);
    for (size_t i = 0; i < options->count; i++) {
        std::cout << generator.generate() << '\n';
    }
    std::cout.flush();
    return 0;
}
