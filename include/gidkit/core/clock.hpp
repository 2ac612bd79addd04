#pragma once

#include <type_traits>

#include "gidkit/core/types.hpp"

namespace gidkit::core {

    using ClockFn = UnixMillis (*)(void* ctx) noexcept;

    // A wall-clock source. ctx is passed back to fn untouched and must
    // outlive every reader of the clock.
    struct Clock {
        ClockFn fn{nullptr};
        void* ctx{nullptr};
    };

    [[nodiscard]] UnixMillis system_clock_ms(void* ctx) noexcept;

    [[nodiscard]] constexpr Clock system_clock() noexcept {
        return Clock{&system_clock_ms, nullptr};
    }

    [[nodiscard]] constexpr bool clock_valid(const Clock& c) noexcept {
        return c.fn != nullptr;
    }

    [[nodiscard]] inline UnixMillis clock_now(const Clock& c) noexcept {
        return c.fn(c.ctx);
    }

    static_assert(std::is_trivially_copyable_v<Clock>);
    static_assert(std::is_standard_layout_v<Clock>);

} // namespace gidkit::core
