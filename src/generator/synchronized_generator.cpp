#include "generator/synchronized_generator.hpp"

#include <stdexcept>

namespace squid {
SynchronizedIdGenerator::SynchronizedIdGenerator(std::unique_ptr<IdGenerator> generator)
    : generator_(std::move(generator))
{
    if (generator_ == nullptr) {
        throw std::invalid_argument("SynchronizedIdGenerator requires a generator");
    }
}

std::string SynchronizedIdGenerator::generate()
{
    std::lock_guard<std::mutex> lock(mutex_);
    return generator_->generate();
}
} // namespace squid
