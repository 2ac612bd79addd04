#pragma once

#include <cstdint>
#include <cstddef>
#include <type_traits>

namespace gidkit::core {

    using u8 = std::uint8_t;
    using u16 = std::uint16_t;
    using u32 = std::uint32_t;
    using u64 = std::uint64_t;

    using i64 = std::int64_t;

    // Unix microseconds; the unit of every created_at column.
    using Timestamp = i64;

    // Unix milliseconds, as read from a Clock.
    using UnixMillis = i64;

    enum class FieldType : u8 {
        Text = 0,
        I64 = 1,
        U64 = 2,
    };

    [[nodiscard]] constexpr bool field_type_valid(u8 v) noexcept {
        return v <= static_cast<u8>(FieldType::U64);
    }

} // namespace gidkit::core
