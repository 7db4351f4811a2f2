#pragma once

#include <string>

namespace squid {
/**
 * @class IdGenerator
 * @brief Интерфейс генератора идентификаторов
 *
 * Вызывающий код (CLI, сервер) зависит только от этого интерфейса, поэтому следующие версии
 * схемы идентификаторов подключаются без изменения мест вызова.
 */
class IdGenerator {
public:
    virtual ~IdGenerator() = default;

    /**
     * @brief Генерирует следующий идентификатор
     * @return Строка с новым идентификатором
     */
    virtual std::string generate() = 0;
};
} // namespace squid
