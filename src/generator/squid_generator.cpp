#include "generator/squid_generator.hpp"

#include <iomanip>
#include <sstream>

#include "utils/compiler.hpp"
#include "utils/logger.hpp"

namespace {
// Минимальная ширина поля счетчика
constexpr int COUNTER_WIDTH = 4;

std::string resolveMachineId(std::optional<std::string> machineId,
                             const squid::MachineIdProvider &provider)
{
    if (machineId.has_value()) {
        return std::move(*machineId);
    }

    auto resolved = provider.resolve();
    if (resolved.has_value()) {
        return std::move(*resolved);
    }

    LOG_WARNING << "Используется идентификатор машины по умолчанию: "
                << squid::FALLBACK_MACHINE_ID;
    return squid::FALLBACK_MACHINE_ID;
}
} // namespace

namespace squid {
SquidGenerator::SquidGenerator(std::optional<std::string> machineId)
    : SquidGenerator(std::move(machineId), SystemMachineIdProvider(), nullptr)
{
}

SquidGenerator::SquidGenerator(std::optional<std::string> machineId,
                               const MachineIdProvider &provider, std::shared_ptr<Clock> clock)
    : machineId_(resolveMachineId(std::move(machineId), provider))
    , clock_(clock != nullptr ? std::move(clock) : std::make_shared<SystemClock>())
    , lastTimestamp_(0)
    , counter_(0)
{
    LOG_DEBUG << "Создан генератор идентификаторов для машины " << machineId_;
}

std::string SquidGenerator::generate()
{
    // Время читается до изменения состояния: при аварийном завершении состояние не меняется
    const auto sinceEpoch = clock_->sinceEpoch().count();
    if (sinceEpoch < 0) {
        FATAL_ERROR("Системные часы показывают время раньше эпохи Unix: " << sinceEpoch << " мс");
    }
    const auto timestamp = static_cast<uint64_t>(sinceEpoch);

    if (timestamp == lastTimestamp_) {
        counter_++;
    }
    else {
        counter_ = 0;
        lastTimestamp_ = timestamp;
    }

    std::ostringstream ss;
    ss << machineId_ << '-' << timestamp << '-' << std::setfill('0') << std::setw(COUNTER_WIDTH)
       << counter_;
    return ss.str();
}

const std::string &SquidGenerator::machineId() const
{
    return machineId_;
}

uint64_t SquidGenerator::lastTimestamp() const
{
    return lastTimestamp_;
}

uint64_t SquidGenerator::counter() const
{
    return counter_;
}
} // namespace squid
