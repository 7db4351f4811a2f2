#pragma once

#include <string>

#include "generator/id_generator.hpp"
#include "server/protocol.hpp"

namespace squid::server {
/**
 * @class RequestHandler
 * @brief Выполняет запросы клиентов над генератором идентификаторов
 *
 * Генератор должен быть потокобезопасным, если обработчик вызывается из нескольких потоков.
 */
class RequestHandler {
public:
    explicit RequestHandler(IdGenerator &generator);

    /**
     * @brief Обработка запроса
     * @param request Запрос
     * @return Ответ (ошибки запроса возвращаются в поле error, исключения не выбрасываются)
     */
    Response handle(const Request &request) const;

    /**
     * @brief Обработка сообщения, извлеченного из фрейма
     *
     * Если сообщение не удается разобрать как запрос, возвращается ответ с request_id "error".
     *
     * @param jsonMessage JSON-сообщение
     * @return Ответ
     */
    Response handleMessage(const std::string &jsonMessage) const;

private:
    IdGenerator &generator_; // Генератор идентификаторов
};
} // namespace squid::server
