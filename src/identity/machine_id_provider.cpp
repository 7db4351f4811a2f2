#include "identity/machine_id_provider.hpp"

#include "utils/file_utils.hpp"
#include "utils/logger.hpp"

namespace {
// Стандартные расположения идентификатора машины в Linux (systemd и D-Bus)
const std::vector<std::filesystem::path> &defaultCandidates()
{
    static const std::vector<std::filesystem::path> candidates
        = { "/etc/machine-id", "/var/lib/dbus/machine-id" };
    return candidates;
}
} // namespace

namespace squid {
SystemMachineIdProvider::SystemMachineIdProvider()
    : candidates_(defaultCandidates())
{
}

SystemMachineIdProvider::SystemMachineIdProvider(std::vector<std::filesystem::path> candidates)
    : candidates_(std::move(candidates))
{
}

std::optional<std::string> SystemMachineIdProvider::resolve() const
{
    for (const auto &candidate : candidates_) {
        std::string content;
        if (!utils::safeFileRead(candidate, content)) {
            LOG_DEBUG << "Идентификатор машины недоступен в файле: " << candidate.string();
            continue;
        }

        auto machineId = utils::trim(content);
        if (machineId.empty()) {
            LOG_DEBUG << "Файл идентификатора машины пуст: " << candidate.string();
            continue;
        }

        LOG_DEBUG << "Идентификатор машины прочитан из файла: " << candidate.string();
        return machineId;
    }

    LOG_WARNING << "Не удалось определить идентификатор машины, проверено файлов: "
                << candidates_.size();
    return std::nullopt;
}
} // namespace squid
