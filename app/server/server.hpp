#pragma once

#include <atomic>
#include <boost/asio.hpp>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include "generator/id_generator.hpp"
#include "server/request_handler.hpp"

namespace squid::server {
/**
 * @class Server
 * @brief Локальный сервер, выдающий идентификаторы через Unix Domain Socket
 */
class Server {
public:
    /**
     * @brief Инициализация и запуск сервера (блокирующий вызов до SIGINT/SIGTERM)
     * @param generator Потокобезопасный генератор идентификаторов
     * @param socketPath Путь к сокету (по умолчанию <tmp>/squid.sock)
     * @param workers Количество рабочих потоков
     * @return Код завершения
     */
    static int startServer(IdGenerator &generator, std::optional<std::string> socketPath,
                           size_t workers);

private:
    RequestHandler handler_; // Обработчик запросов
    std::filesystem::path socketPath_; // Путь к сокету
    size_t workers_; // Количество рабочих потоков
    std::unique_ptr<boost::asio::io_context> ioCtx_; // ASIO контекст
    std::unique_ptr<boost::asio::local::stream_protocol::acceptor> acceptor_; // Ассептор соединений
    std::unique_ptr<boost::asio::signal_set> signalSet_; // Обработчик сигналов завершения
    std::atomic<bool> running_; // Флаг работы сервера

    Server(IdGenerator &generator, std::optional<std::string> socketPath, size_t workers);

    ~Server();

    /**
     * @brief Запуск сервера
     * @return Код завершения
     */
    int start();

    /**
     * @brief Остановка сервера
     */
    void stop();

    /**
     * @brief Принятие нового соединения
     */
    void accept();
};
} // namespace squid::server
