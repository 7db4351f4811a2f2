#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace squid::server {
// Максимальное количество идентификаторов в одном ответе
constexpr int64_t MAX_IDS_PER_REQUEST = 1000;
// Размер заголовка фрейма (длина сообщения)
constexpr size_t FRAME_HEADER_SIZE = sizeof(uint32_t);
// Максимальная длина JSON-сообщения в одном фрейме (16 КБ)
constexpr uint32_t MAX_MESSAGE_SIZE = 16384;

/**
 * @enum CommandType
 * @brief Типы команд сервера
 */
enum class CommandType { GENERATE, PING, UNKNOWN };

/**
 * @struct Request
 * @brief Запрос клиента
 */
struct Request {
    std::string requestId;
    CommandType command = CommandType::UNKNOWN;
    std::optional<int64_t> count; // Количество идентификаторов для GENERATE

    /**
     * @brief Десериализация запроса из JSON
     * @param jsonStr JSON-строка
     * @return Request или std::nullopt при ошибке
     */
    static std::optional<Request> fromJson(const std::string &jsonStr);

    /**
     * @brief Конвертация строкового представления команды в CommandType
     * @param cmdStr Строковое представление команды
     * @return Соответствующий CommandType
     */
    static CommandType stringToCommand(const std::string &cmdStr);
};

/**
 * @struct Response
 * @brief Ответ сервера
 */
struct Response {
    std::string requestId;
    bool success = false;
    std::vector<std::string> ids;
    std::optional<std::string> error;

    /**
     * @brief Сериализация ответа в JSON
     * @return JSON-строка
     */
    std::string toJson() const;
};

/**
 * @brief Класс для работы с форматом сообщений по протоколу
 *
 * Формат: [4 байта длины сообщения, little-endian][JSON-сообщение]
 */
class ProtocolFrame {
public:
    /**
     * @brief Обертывание JSON-сообщения в фрейм протокола
     * @param jsonMessage Сообщение в формате JSON
     * @return Байты фрейма протокола
     */
    static std::vector<uint8_t> wrapMessage(const std::string &jsonMessage);

    /**
     * @brief Извлечение JSON-сообщения из частичного буфера
     *
     * Извлеченный фрейм удаляется из начала буфера.
     *
     * @param buffer Буфер с данными
     * @return std::nullopt, если сообщение неполное, или JSON-сообщение
     */
    static std::optional<std::string> extractMessage(std::vector<uint8_t> &buffer);

    /**
     * @brief Длина сообщения, объявленная в заголовке первого фрейма буфера
     * @param buffer Буфер с данными
     * @return std::nullopt, если заголовок еще не получен целиком
     */
    static std::optional<uint32_t> peekLength(const std::vector<uint8_t> &buffer);

    static uint32_t decodeLength(const uint8_t *headerBytes);

    static std::vector<uint8_t> encodeLength(uint32_t length);
};
} // namespace squid::server
