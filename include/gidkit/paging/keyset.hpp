#pragma once

#include <string_view>
#include <type_traits>

#include "gidkit/codec/record.hpp"
#include "gidkit/core/errors.hpp"
#include "gidkit/core/types.hpp"
#include "gidkit/paging/cursor.hpp"

namespace gidkit::paging {
    using u64 = gidkit::core::u64;

    // Position in a (created_at DESC, id DESC) ordering. id breaks ties
    // between rows created in the same microsecond.
    struct KeysetCursor {
        gidkit::core::Timestamp created_at{0};
        u64 id{0};

        friend constexpr bool operator==(KeysetCursor, KeysetCursor) noexcept = default;
    };

    inline constexpr std::string_view kKeysetCreatedAtField = "created_at";
    inline constexpr std::string_view kKeysetIdField = "id";

    // True when a comes strictly after b in a descending listing, i.e. a row
    // keyed a belongs to the page that follows cursor b.
    [[nodiscard]] constexpr bool keyset_before(KeysetCursor a, KeysetCursor b) noexcept {
        if (a.created_at != b.created_at) {
            return a.created_at < b.created_at;
        }
        return a.id < b.id;
    }

    gidkit::core::Status cursor_write(const KeysetCursor& c, gidkit::codec::Record* rec) noexcept;
    gidkit::core::Status cursor_read(const gidkit::codec::Record& rec, KeysetCursor* out) noexcept;

    // Both fields must be set.
    gidkit::core::Status keyset_cursor_validate(const KeysetCursor& c) noexcept;

    [[nodiscard]] constexpr CursorCodec<KeysetCursor> keyset_cursor_codec() noexcept {
        return CursorCodec<KeysetCursor>{&keyset_cursor_validate};
    }

    static_assert(std::is_trivially_copyable_v<KeysetCursor>);
    static_assert(std::is_standard_layout_v<KeysetCursor>);
} // namespace gidkit::paging
