#include "server/server.hpp"

#include <boost/system/error_code.hpp>
#include <csignal>
#include <system_error>
#include <thread>
#include <vector>

#include "server/connection.hpp"
#include "utils/logger.hpp"

namespace {
std::filesystem::path getSocketPath(std::optional<std::string> socketPath)
{
    if (socketPath.has_value()) {
        return std::filesystem::path(std::move(*socketPath));
    }
    return std::filesystem::temp_directory_path() / "squid.sock";
}
} // namespace

namespace squid::server {
Server::Server(IdGenerator &generator, std::optional<std::string> socketPath, size_t workers)
    : handler_(generator)
    , socketPath_(getSocketPath(std::move(socketPath)))
    , workers_(workers > 0 ? workers : 1)
    , running_(false)
{
}

Server::~Server()
{
    stop();
    acceptor_.reset();
    signalSet_.reset();
    ioCtx_.reset();
}

int Server::startServer(IdGenerator &generator, std::optional<std::string> socketPath,
                        size_t workers)
{
    Server server(generator, std::move(socketPath), workers);
    return server.start();
}

int Server::start()
{
    try {
        // Сокет не должен существовать: возможно, запущен другой экземпляр сервера
        std::error_code ec;
        if (std::filesystem::exists(socketPath_, ec)) {
            LOG_ERROR << "Сокет существует: " << socketPath_.string()
                      << ", удалите его вручную и перезапустите программу";
            return 1;
        }

        const auto socketDir = socketPath_.parent_path();
        if (!socketDir.empty()) {
            std::filesystem::create_directories(socketDir, ec);
            if (ec) {
                LOG_ERROR << "Не удалось создать директорию для сокета: " << socketDir.string()
                          << ", сообщение: " << ec.message();
                return 1;
            }
        }

        ioCtx_ = std::make_unique<boost::asio::io_context>(static_cast<int>(workers_));
        acceptor_ = std::make_unique<boost::asio::local::stream_protocol::acceptor>(
            *ioCtx_, boost::asio::local::stream_protocol::endpoint(socketPath_.string()));

        running_ = true;
        accept();

        // Корректное завершение по сигналам
        signalSet_ = std::make_unique<boost::asio::signal_set>(*ioCtx_, SIGINT, SIGTERM);
        signalSet_->async_wait([this](const boost::system::error_code &ec, int sig) {
            if (!ec) {
                LOG_INFO << "Получен сигнал " << sig;
                stop();
            }
        });

        LOG_INFO << "Запуск сервера на сокете " << socketPath_.string()
                 << ", рабочих потоков: " << workers_;

        // Дополнительные рабочие потоки, основной поток тоже обслуживает контекст
        std::vector<std::thread> threads;
        threads.reserve(workers_ - 1);
        for (size_t i = 1; i < workers_; i++) {
            threads.emplace_back([this]() { ioCtx_->run(); });
        }
        ioCtx_->run();
        for (auto &thread : threads) {
            thread.join();
        }

        LOG_INFO << "Сервер завершил работу";
        return 0;
    }
    catch (const std::exception &e) {
        LOG_ERROR << "Ошибка при запуске сервера: " << e.what();
        stop();
        return 1;
    }
}

void Server::stop()
{
    if (!running_.exchange(false)) {
        return;
    }

    LOG_INFO << "Останавливаем сервер...";

    if (signalSet_ != nullptr) {
        boost::system::error_code ec;
        signalSet_->cancel(ec);
        if (ec) {
            LOG_ERROR << "Ошибка при отмене регистрации сигналов: " << ec.message();
        }
    }

    if (acceptor_ != nullptr) {
        boost::system::error_code ec;
        acceptor_->close(ec);
        if (ec) {
            LOG_ERROR << "Ошибка при закрытии аксептора: " << ec.message();
        }
    }

    if (ioCtx_ != nullptr) {
        ioCtx_->stop();
    }

    std::error_code ec;
    std::filesystem::remove(socketPath_, ec);
    if (ec) {
        LOG_ERROR << "Ошибка при удалении сокета: " << socketPath_.string()
                  << ", код ошибки: " << ec.value() << ", сообщение: " << ec.message();
    }
}

void Server::accept()
{
    if (acceptor_ == nullptr || ioCtx_ == nullptr) {
        return;
    }

    auto newConnection = Connection::create(*ioCtx_, handler_);
    acceptor_->async_accept(newConnection->socket(),
                            [this, newConnection](const boost::system::error_code &ec) {
                                if (!ec) {
                                    newConnection->start();
                                }
                                else if (ec != boost::asio::error::operation_aborted) {
                                    LOG_ERROR << "Ошибка при приеме соединения: " << ec.message();
                                }
                                // Продолжаем принимать соединения, если сервер работает
                                if (running_) {
                                    accept();
                                }
                            });
}
} // namespace squid::server
