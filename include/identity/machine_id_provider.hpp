#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace squid {
// Идентификатор, который используется, если определить идентификатор машины не удалось
inline constexpr char FALLBACK_MACHINE_ID[] = "00000000-0000-0000-0000-000000000000";

/**
 * @class MachineIdProvider
 * @brief Источник идентификатора машины
 *
 * Используется генератором только при создании, если идентификатор не передан явно.
 */
class MachineIdProvider {
public:
    virtual ~MachineIdProvider() = default;

    /**
     * @brief Определение идентификатора машины
     * @return Идентификатор или std::nullopt, если определить его не удалось (причина пишется в
     * лог)
     */
    virtual std::optional<std::string> resolve() const = 0;
};

/**
 * @class SystemMachineIdProvider
 * @brief Читает идентификатор машины из системных файлов
 *
 * Перебирает файлы-кандидаты по порядку и возвращает содержимое первого читаемого непустого
 * файла без пробелов и переводов строк по краям.
 */
class SystemMachineIdProvider : public MachineIdProvider {
public:
    /**
     * @brief Провайдер со стандартными путями: /etc/machine-id, /var/lib/dbus/machine-id
     */
    SystemMachineIdProvider();

    /**
     * @brief Провайдер с явным списком файлов-кандидатов
     * @param candidates Пути к файлам в порядке приоритета
     */
    explicit SystemMachineIdProvider(std::vector<std::filesystem::path> candidates);

    std::optional<std::string> resolve() const override;

private:
    std::vector<std::filesystem::path> candidates_; // Файлы-кандидаты в порядке приоритета
};
} // namespace squid
