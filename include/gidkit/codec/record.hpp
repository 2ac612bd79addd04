#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "gidkit/codec/buffer.hpp"
#include "gidkit/core/errors.hpp"
#include "gidkit/core/types.hpp"

namespace gidkit::codec {
    using u8 = gidkit::core::u8;
    using u16 = gidkit::core::u16;
    using u32 = gidkit::core::u32;
    using u64 = gidkit::core::u64;
    using i64 = gidkit::core::i64;

    // Wire layout (big-endian):
    //   u8 version | u8 field_count | field*
    //   field = u8 name_len | name | u8 FieldType | value
    //   value = I64/U64: 8 bytes; Text: u16 len | bytes
    inline constexpr u8 kRecordVersion = 1;
    inline constexpr u32 kRecordMaxFields = 16;
    inline constexpr u32 kRecordMaxNameBytes = 255;
    inline constexpr u32 kRecordMaxTextBytes = 0xffffu;

    struct RecordField {
        std::string name;
        gidkit::core::FieldType type{gidkit::core::FieldType::Text};
        u64 num{0};
        std::string text;
    };

    // Fields keep insertion order, so encoding is deterministic.
    struct Record {
        std::vector<RecordField> fields;
    };

    gidkit::core::Status record_put_i64(Record* rec, std::string_view name, i64 v) noexcept;
    gidkit::core::Status record_put_u64(Record* rec, std::string_view name, u64 v) noexcept;
    gidkit::core::Status record_put_text(Record* rec, std::string_view name, std::string_view v) noexcept;

    // (Codec, NotFound) when the name is absent, (Codec, Invalid) when the
    // field holds another type.
    gidkit::core::Status record_get_i64(const Record& rec, std::string_view name, i64* out) noexcept;
    gidkit::core::Status record_get_u64(const Record& rec, std::string_view name, u64* out) noexcept;
    gidkit::core::Status record_get_text(const Record& rec, std::string_view name, std::string* out) noexcept;

    gidkit::core::Status record_encode(const Record& rec, std::vector<u8>* out) noexcept;
    gidkit::core::Status record_parse(BufferView in, Record* out) noexcept;

} // namespace gidkit::codec
