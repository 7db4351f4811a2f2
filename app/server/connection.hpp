#pragma once

#include <boost/asio.hpp>
#include <memory>
#include <queue>
#include <vector>

#include "server/protocol.hpp"
#include "server/request_handler.hpp"

namespace squid::server {
/**
 * @class Connection
 * @brief Класс, обрабатывающий одно соединение с клиентом
 *
 * Все обработчики соединения выполняются в его strand, поэтому состояние соединения не
 * требует отдельной синхронизации при нескольких рабочих потоках.
 */
class Connection : public std::enable_shared_from_this<Connection> {
public:
    using SharedConnection = std::shared_ptr<Connection>;
    using Socket = boost::asio::local::stream_protocol::socket;

    /**
     * @brief Создает новое соединение
     * @param ioCtx ASIO контекст
     * @param handler Обработчик запросов
     * @return Указатель на новое соединение
     */
    static SharedConnection create(boost::asio::io_context &ioCtx, const RequestHandler &handler);

    Socket &socket();

    /**
     * @brief Начать обработку соединения
     */
    void start();

private:
    const RequestHandler &handler_; // Обработчик запросов
    Socket socket_; // Сокет
    std::vector<uint8_t> readBuffer_; // Буфер с непрочитанными фреймами
    std::vector<uint8_t> chunk_; // Буфер для очередной операции чтения
    std::queue<std::shared_ptr<std::vector<uint8_t>>> writeQueue_; // Очередь буферов для записи
    bool writeInProgress_; // Выполняется ли в данный момент операция записи

    Connection(boost::asio::io_context &ioCtx, const RequestHandler &handler);

    /**
     * @brief Асинхронное чтение данных
     */
    void read();

    /**
     * @brief Обработка всех полных сообщений в буфере
     * @return false, если очередной фрейм превышает допустимый размер
     */
    bool processMessages();

    /**
     * @brief Постановка ответа в очередь на отправку
     * @param response Ответ для отправки
     */
    void write(const Response &response);

    /**
     * @brief Асинхронная запись сообщения из очереди
     */
    void doWrite();
};
} // namespace squid::server
