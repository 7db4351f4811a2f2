#include "generator/clock.hpp"

namespace squid {
std::chrono::milliseconds SystemClock::sinceEpoch()
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch());
}
} // namespace squid
