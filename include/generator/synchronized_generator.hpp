#pragma once

#include <memory>
#include <mutex>

#include "generator/id_generator.hpp"

namespace squid {
/**
 * @class SynchronizedIdGenerator
 * @brief Потокобезопасная обертка над генератором идентификаторов
 *
 * Владеет генератором и сериализует вызовы generate() собственным мьютексом: один мьютекс на
 * один экземпляр генератора.
 */
class SynchronizedIdGenerator : public IdGenerator {
public:
    /**
     * @brief Конструктор
     * @param generator Оборачиваемый генератор
     * @throws std::invalid_argument если generator == nullptr
     */
    explicit SynchronizedIdGenerator(std::unique_ptr<IdGenerator> generator);

    std::string generate() override;

private:
    std::unique_ptr<IdGenerator> generator_; // Оборачиваемый генератор
    std::mutex mutex_; // Мьютекс для сериализации вызовов
};
} // namespace squid
