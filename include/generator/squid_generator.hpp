#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "generator/clock.hpp"
#include "generator/id_generator.hpp"
#include "identity/machine_id_provider.hpp"

namespace squid {
/**
 * @class SquidGenerator
 * @brief Генерирует сортируемые уникальные идентификаторы (версия 0)
 *
 * Формат идентификатора: [MACHINE-ID]-[TIMESTAMP]-[COUNTER]
 *  - [MACHINE-ID]: идентификатор машины, без экранирования дефисов
 *  - [TIMESTAMP]: миллисекунды с начала эпохи Unix, десятичное число без дополнения
 *  - [COUNTER]: счетчик вызовов в пределах одной миллисекунды, дополняется нулями минимум до
 *    4 цифр (значения от 10000 занимают больше 4 символов)
 *
 * Идентификаторы одного экземпляра упорядочены лексикографически, пока ширина временной метки
 * не меняется, а счетчик не превышает 9999 в пределах одной миллисекунды.
 *
 * Класс не синхронизирован: экземпляр либо используется из одного потока, либо оборачивается в
 * SynchronizedIdGenerator.
 *
 * @warning Идентификатор машины попадает в каждый идентификатор в открытом виде. Не используйте
 * эту версию там, где важна приватность устройства.
 */
class SquidGenerator : public IdGenerator {
public:
    /**
     * @brief Создание генератора с системными часами
     * @param machineId Идентификатор машины; если не указан, читается из системы, а при ошибке
     * заменяется на FALLBACK_MACHINE_ID
     */
    explicit SquidGenerator(std::optional<std::string> machineId = std::nullopt);

    /**
     * @brief Создание генератора с внешними зависимостями
     * @param machineId Идентификатор машины (принимается как есть, без проверок)
     * @param provider Источник идентификатора, используется только если machineId не указан
     * @param clock Источник времени (nullptr означает системные часы)
     */
    SquidGenerator(std::optional<std::string> machineId, const MachineIdProvider &provider,
                   std::shared_ptr<Clock> clock);

    /**
     * @brief Генерирует новый идентификатор
     *
     * Если системные часы показывают время раньше эпохи Unix, процесс аварийно завершается:
     * такую временную метку нельзя представить без нарушения порядка идентификаторов.
     *
     * @return Строка с новым идентификатором
     */
    std::string generate() override;

    const std::string &machineId() const;

    // Временная метка последнего выданного идентификатора (0, если идентификаторов еще не было)
    uint64_t lastTimestamp() const;

    // Значение счетчика последнего выданного идентификатора
    uint64_t counter() const;

private:
    std::string machineId_; // Идентификатор машины
    std::shared_ptr<Clock> clock_; // Источник времени
    uint64_t lastTimestamp_; // Временная метка последнего идентификатора, мс
    uint64_t counter_; // Счетчик в пределах одной миллисекунды
};
} // namespace squid
