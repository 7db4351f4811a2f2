#include "server/connection.hpp"

#include "utils/logger.hpp"

namespace squid::server {
// Размер буфера одной операции чтения
constexpr size_t READ_CHUNK_SIZE = 1024;

Connection::SharedConnection Connection::create(boost::asio::io_context &ioCtx,
                                                const RequestHandler &handler)
{
    return SharedConnection(new Connection(ioCtx, handler));
}

Connection::Connection(boost::asio::io_context &ioCtx, const RequestHandler &handler)
    : handler_(handler)
    , socket_(boost::asio::make_strand(ioCtx))
    , chunk_(READ_CHUNK_SIZE)
    , writeInProgress_(false)
{
    readBuffer_.reserve(FRAME_HEADER_SIZE + MAX_MESSAGE_SIZE);
}

Connection::Socket &Connection::socket()
{
    return socket_;
}

void Connection::start()
{
    LOG_DEBUG << "Новое соединение установлено";
    read();
}

void Connection::read()
{
    socket_.async_read_some(
        boost::asio::buffer(chunk_),
        [this, self = shared_from_this()](boost::system::error_code ec, std::size_t length) {
            if (ec) {
                if (ec == boost::asio::error::eof) {
                    LOG_DEBUG << "Клиент закрыл соединение";
                }
                else if (ec != boost::asio::error::operation_aborted) {
                    LOG_ERROR << "Ошибка при чтении: " << ec.message();
                }
                return; // Не продолжаем цикл чтения при ошибке
            }

            readBuffer_.insert(readBuffer_.end(), chunk_.begin(), chunk_.begin() + length);

            if (!processMessages()) {
                // Продолжение фрейма невозможно отделить от следующего, соединение закрывается
                // после отправки уже поставленных в очередь ответов
                readBuffer_.clear();
                return;
            }
            read();
        });
}

bool Connection::processMessages()
{
    while (true) {
        const auto declaredLength = ProtocolFrame::peekLength(readBuffer_);
        if (declaredLength.has_value() && *declaredLength > MAX_MESSAGE_SIZE) {
            LOG_ERROR << "Размер сообщения превышает допустимый: " << *declaredLength << " > "
                      << MAX_MESSAGE_SIZE;
            return false;
        }

        const auto jsonMessage = ProtocolFrame::extractMessage(readBuffer_);
        if (!jsonMessage.has_value()) {
            return true; // Нет полных сообщений
        }
        LOG_TRACE << "Извлечено сообщение: " << *jsonMessage;

        write(handler_.handleMessage(*jsonMessage));
    }
}

void Connection::write(const Response &response)
{
    writeQueue_.push(
        std::make_shared<std::vector<uint8_t>>(ProtocolFrame::wrapMessage(response.toJson())));

    // Если запись уже идет, текущая операция запустит следующую при завершении
    if (writeInProgress_) {
        return;
    }
    doWrite();
}

void Connection::doWrite()
{
    if (writeQueue_.empty()) {
        writeInProgress_ = false;
        return;
    }
    writeInProgress_ = true;
    auto buffer = writeQueue_.front();
    writeQueue_.pop();

    boost::asio::async_write(
        socket_, boost::asio::buffer(*buffer),
        [this, self = shared_from_this(), buffer](boost::system::error_code ec, std::size_t) {
            if (ec) {
                if (ec != boost::asio::error::operation_aborted) {
                    LOG_ERROR << "Ошибка при записи: " << ec.message();
                }
                writeInProgress_ = false;
                return;
            }
            doWrite();
        });
}
} // namespace squid::server
