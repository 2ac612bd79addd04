#pragma once

#include <type_traits>

#include "gidkit/core/types.hpp"

namespace gidkit::codec {
    using u8 = gidkit::core::u8;
    using u32 = gidkit::core::u32;

    struct BufferView {
        const u8* data{nullptr};
        u32 len{0};
    };

    [[nodiscard]] constexpr bool buffer_ok(BufferView b) noexcept {
        return (b.len == 0) || (b.data != nullptr);
    }

    static_assert(std::is_trivially_copyable_v<BufferView>);
    static_assert(std::is_standard_layout_v<BufferView>);
} // namespace gidkit::codec
