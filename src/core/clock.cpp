#include "gidkit/core/clock.hpp"

#include <chrono>

namespace gidkit::core {
    UnixMillis system_clock_ms(void* ctx) noexcept {
        (void)ctx;
        const auto now = std::chrono::system_clock::now().time_since_epoch();
        return static_cast<UnixMillis>(std::chrono::duration_cast<std::chrono::milliseconds>(now).count());
    }
} // namespace gidkit::core
