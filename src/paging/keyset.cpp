#include "gidkit/paging/keyset.hpp"

namespace gidkit::paging {
    gidkit::core::Status cursor_write(const KeysetCursor& c, gidkit::codec::Record* rec) noexcept {
        if (rec == nullptr) {
            return gidkit::core::make_status(gidkit::core::StatusDomain::Cursor, gidkit::core::StatusCode::Invalid);
        }
        const gidkit::core::Status s = gidkit::codec::record_put_i64(rec, kKeysetCreatedAtField, c.created_at);
        if (!gidkit::core::is_ok(s)) {
            return s;
        }
        return gidkit::codec::record_put_u64(rec, kKeysetIdField, c.id);
    }

    gidkit::core::Status cursor_read(const gidkit::codec::Record& rec, KeysetCursor* out) noexcept {
        if (out == nullptr) {
            return gidkit::core::make_status(gidkit::core::StatusDomain::Cursor, gidkit::core::StatusCode::Invalid);
        }
        KeysetCursor c{};
        gidkit::core::Status s = gidkit::codec::record_get_i64(rec, kKeysetCreatedAtField, &c.created_at);
        if (!gidkit::core::is_ok(s)) {
            return s;
        }
        s = gidkit::codec::record_get_u64(rec, kKeysetIdField, &c.id);
        if (!gidkit::core::is_ok(s)) {
            return s;
        }
        *out = c;
        return gidkit::core::ok_status();
    }

    gidkit::core::Status keyset_cursor_validate(const KeysetCursor& c) noexcept {
        if (c.created_at == 0 || c.id == 0) {
            return gidkit::core::make_status(gidkit::core::StatusDomain::Cursor, gidkit::core::StatusCode::Invalid);
        }
        return gidkit::core::ok_status();
    }
} // namespace gidkit::paging
