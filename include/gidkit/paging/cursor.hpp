#pragma once

#include <new>
#include <string>
#include <string_view>
#include <vector>

#include "gidkit/codec/base64.hpp"
#include "gidkit/codec/record.hpp"
#include "gidkit/core/errors.hpp"

namespace gidkit::paging {
    using u8 = gidkit::core::u8;
    using u32 = gidkit::core::u32;

    // Opaque pagination token codec.
    //
    // A Payload is default-constructible and describes itself through two free
    // functions found by argument-dependent lookup:
    //
    //   gidkit::core::Status cursor_write(const Payload&, gidkit::codec::Record*) noexcept;
    //   gidkit::core::Status cursor_read(const gidkit::codec::Record&, Payload*) noexcept;
    //
    // Token = unpadded base64url(record_encode(cursor_write(payload))).
    template <typename Payload>
    class CursorCodec {
    public:
        using Validator = gidkit::core::Status (*)(const Payload&) noexcept;

        constexpr CursorCodec() noexcept = default;
        explicit constexpr CursorCodec(Validator validate) noexcept : validate_(validate) {}

        gidkit::core::Status encode(const Payload& payload, std::string* out) const noexcept {
            if (out == nullptr) {
                return invalid_argument();
            }
            out->clear();

            gidkit::codec::Record rec{};
            gidkit::core::Status s = cursor_write(payload, &rec);
            if (!gidkit::core::is_ok(s)) {
                return s;
            }

            std::vector<u8> bytes;
            s = gidkit::codec::record_encode(rec, &bytes);
            if (!gidkit::core::is_ok(s)) {
                return s;
            }

            const gidkit::codec::BufferView view{bytes.data(), static_cast<u32>(bytes.size())};
            return gidkit::codec::base64url_encode(view, out);
        }

        // Empty token: *out = Payload{}, *found = false, Ok. Any undecodable,
        // malformed or rejected token: (Cursor, InvalidCursor), *found = false.
        gidkit::core::Status decode(std::string_view token, Payload* out, bool* found) const noexcept {
            if (out == nullptr || found == nullptr) {
                return invalid_argument();
            }
            *found = false;

            if (token.empty()) {
                *out = Payload{};
                return gidkit::core::ok_status();
            }

            std::vector<u8> bytes;
            gidkit::core::Status s = gidkit::codec::base64url_decode(token, &bytes);
            if (!gidkit::core::is_ok(s)) {
                return s.code == gidkit::core::StatusCode::InvalidEncoding ? invalid_cursor() : s;
            }

            gidkit::codec::Record rec{};
            s = gidkit::codec::record_parse(
                gidkit::codec::BufferView{bytes.data(), static_cast<u32>(bytes.size())}, &rec);
            if (!gidkit::core::is_ok(s)) {
                return s.code == gidkit::core::StatusCode::OutOfMemory ? s : invalid_cursor();
            }

            Payload payload{};
            s = cursor_read(rec, &payload);
            if (!gidkit::core::is_ok(s)) {
                return s.code == gidkit::core::StatusCode::OutOfMemory ? s : invalid_cursor();
            }

            if (validate_ != nullptr && !gidkit::core::is_ok(validate_(payload))) {
                return invalid_cursor();
            }

            *out = payload;
            *found = true;
            return gidkit::core::ok_status();
        }

        [[nodiscard]] constexpr bool has_validator() const noexcept { return validate_ != nullptr; }

    private:
        static constexpr gidkit::core::Status invalid_argument() noexcept {
            return gidkit::core::make_status(gidkit::core::StatusDomain::Cursor, gidkit::core::StatusCode::Invalid);
        }

        static constexpr gidkit::core::Status invalid_cursor() noexcept {
            return gidkit::core::make_status(gidkit::core::StatusDomain::Cursor, gidkit::core::StatusCode::InvalidCursor);
        }

        Validator validate_{nullptr};
    };

} // namespace gidkit::paging
