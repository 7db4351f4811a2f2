#include "server/protocol.hpp"

#include <algorithm>
#include <nlohmann/json.hpp>

#include "utils/logger.hpp"

namespace squid::server {
using json = nlohmann::json;

std::optional<Request> Request::fromJson(const std::string &jsonStr)
{
    try {
        const auto jsonData = json::parse(jsonStr);

        // Проверка обязательных полей
        if (!jsonData.is_object() || !jsonData.contains("request_id")
            || !jsonData.contains("command")) {
            LOG_ERROR << "JSON не содержит обязательных полей";
            return std::nullopt;
        }

        Request req;
        req.requestId = jsonData.at("request_id").get<std::string>();
        req.command = stringToCommand(jsonData.at("command").get<std::string>());

        // Параметры необязательны
        if (jsonData.contains("params")) {
            const auto &params = jsonData.at("params");
            if (!params.is_object()) {
                LOG_ERROR << "Поле params должно быть объектом";
                return std::nullopt;
            }
            if (params.contains("count")) {
                req.count = params.at("count").get<int64_t>();
            }
        }

        return req;
    }
    catch (const json::exception &e) {
        LOG_ERROR << "Ошибка при разборе JSON: " << e.what();
        return std::nullopt;
    }
}

CommandType Request::stringToCommand(const std::string &cmdStr)
{
    if (cmdStr == "generate")
        return CommandType::GENERATE;
    if (cmdStr == "ping")
        return CommandType::PING;
    return CommandType::UNKNOWN;
}

std::string Response::toJson() const
{
    json jsonData;
    jsonData["request_id"] = requestId;
    jsonData["success"] = success;
    jsonData["params"] = json::object({ { "ids", ids } });

    if (error.has_value()) {
        jsonData["error"] = *error;
    }

    return jsonData.dump();
}

std::vector<uint8_t> ProtocolFrame::wrapMessage(const std::string &jsonMessage)
{
    const auto lengthBytes = encodeLength(static_cast<uint32_t>(jsonMessage.size()));

    std::vector<uint8_t> frame(lengthBytes.size() + jsonMessage.size());
    std::copy(lengthBytes.begin(), lengthBytes.end(), frame.begin());
    std::copy(jsonMessage.begin(), jsonMessage.end(), frame.begin() + lengthBytes.size());

    return frame;
}

std::optional<std::string> ProtocolFrame::extractMessage(std::vector<uint8_t> &buffer)
{
    if (buffer.size() < FRAME_HEADER_SIZE) {
        return std::nullopt;
    }

    const auto messageLength = decodeLength(buffer.data());
    if (buffer.size() < FRAME_HEADER_SIZE + messageLength) {
        return std::nullopt;
    }

    std::string message(buffer.begin() + FRAME_HEADER_SIZE,
                        buffer.begin() + FRAME_HEADER_SIZE + messageLength);
    buffer.erase(buffer.begin(), buffer.begin() + FRAME_HEADER_SIZE + messageLength);

    return message;
}

std::optional<uint32_t> ProtocolFrame::peekLength(const std::vector<uint8_t> &buffer)
{
    if (buffer.size() < FRAME_HEADER_SIZE) {
        return std::nullopt;
    }
    return decodeLength(buffer.data());
}

// !! Для кодирования/декодирования используем формат little-endian

uint32_t ProtocolFrame::decodeLength(const uint8_t *headerBytes)
{
    constexpr size_t BITS_PER_BYTE = 8;
    uint32_t length = 0;
    for (size_t i = 0; i < FRAME_HEADER_SIZE; ++i) {
        length |= static_cast<uint32_t>(headerBytes[i]) << (i * BITS_PER_BYTE);
    }
    return length;
}

std::vector<uint8_t> ProtocolFrame::encodeLength(uint32_t length)
{
    constexpr size_t BITS_PER_BYTE = 8;
    std::vector<uint8_t> bytes(FRAME_HEADER_SIZE);
    for (size_t i = 0; i < FRAME_HEADER_SIZE; i++) {
        bytes[i] = (length >> (i * BITS_PER_BYTE)) & 0xFF;
    }
    return bytes;
}
} // namespace squid::server
