#include "server/request_handler.hpp"

#include <exception>

#include "utils/logger.hpp"

namespace squid::server {
RequestHandler::RequestHandler(IdGenerator &generator)
    : generator_(generator)
{
}

Response RequestHandler::handle(const Request &request) const
{
    Response response;
    response.requestId = request.requestId;
    response.success = true;

    try {
        switch (request.command) {
        case CommandType::GENERATE: {
            const auto count = request.count.value_or(1);
            if (count < 1 || count > MAX_IDS_PER_REQUEST) {
                response.success = false;
                response.error = "Count out of range [1, " + std::to_string(MAX_IDS_PER_REQUEST)
                    + "]";
                break;
            }

            response.ids.reserve(static_cast<size_t>(count));
            for (int64_t i = 0; i < count; i++) {
                response.ids.push_back(generator_.generate());
            }
            LOG_TRACE << "Запрос " << request.requestId << ": выдано идентификаторов: " << count;
            break;
        }
        case CommandType::PING: {
            break;
        }
        case CommandType::UNKNOWN:
        default: {
            response.success = false;
            response.error = "Unknown command";
            break;
        }
        }
    }
    catch (const std::exception &e) {
        response.success = false;
        response.ids.clear();
        response.error = std::string("Exception: ") + e.what();
        LOG_ERROR << "Исключение при обработке запроса: " << e.what();
    }

    return response;
}

Response RequestHandler::handleMessage(const std::string &jsonMessage) const
{
    const auto request = Request::fromJson(jsonMessage);
    if (request.has_value()) {
        return handle(*request);
    }

    LOG_ERROR << "Некорректный формат запроса: " << jsonMessage;
    Response errorResponse;
    errorResponse.requestId = "error";
    errorResponse.success = false;
    errorResponse.error = "Invalid request format";
    return errorResponse;
}
} // namespace squid::server
