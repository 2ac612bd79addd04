#include "gidkit/codec/record.hpp"

#include <cstddef>
#include <new>
#include <utility>

namespace gidkit::codec {
    using gidkit::core::FieldType;
    using gidkit::core::Status;
    using gidkit::core::StatusCode;
    using gidkit::core::StatusDomain;

    namespace {
        [[nodiscard]] Status invalid() noexcept {
            return gidkit::core::make_status(StatusDomain::Codec, StatusCode::Invalid);
        }

        void put_u16_be(std::vector<u8>* out, u16 v) {
            out->push_back(static_cast<u8>((v >> 8) & 0xffu));
            out->push_back(static_cast<u8>((v >> 0) & 0xffu));
        }

        void put_u64_be(std::vector<u8>* out, u64 v) {
            for (int shift = 56; shift >= 0; shift -= 8) {
                out->push_back(static_cast<u8>((v >> shift) & 0xffu));
            }
        }

        u16 get_u16_be(const u8* p) noexcept {
            return static_cast<u16>((static_cast<u16>(p[0]) << 8) | static_cast<u16>(p[1]));
        }

        u64 get_u64_be(const u8* p) noexcept {
            return (static_cast<u64>(p[0]) << 56) |
                   (static_cast<u64>(p[1]) << 48) |
                   (static_cast<u64>(p[2]) << 40) |
                   (static_cast<u64>(p[3]) << 32) |
                   (static_cast<u64>(p[4]) << 24) |
                   (static_cast<u64>(p[5]) << 16) |
                   (static_cast<u64>(p[6]) << 8) |
                   (static_cast<u64>(p[7]) << 0);
        }

        [[nodiscard]] const RecordField* find_field(const Record& rec, std::string_view name) noexcept {
            for (const RecordField& f : rec.fields) {
                if (f.name == name) {
                    return &f;
                }
            }
            return nullptr;
        }

        [[nodiscard]] Status check_new_field(const Record* rec, std::string_view name) noexcept {
            if (rec == nullptr || name.empty() || name.size() > kRecordMaxNameBytes) {
                return invalid();
            }
            if (rec->fields.size() >= kRecordMaxFields) {
                return invalid();
            }
            if (find_field(*rec, name) != nullptr) {
                return invalid();
            }
            return gidkit::core::ok_status();
        }

        [[nodiscard]] Status push_field(Record* rec, RecordField&& f) noexcept {
            try {
                rec->fields.push_back(std::move(f));
            } catch (const std::bad_alloc&) {
                return gidkit::core::make_status(StatusDomain::Codec, StatusCode::OutOfMemory);
            }
            return gidkit::core::ok_status();
        }

        [[nodiscard]] Status lookup(const Record& rec, std::string_view name, FieldType type,
            const RecordField** out) noexcept {
            const RecordField* f = find_field(rec, name);
            if (f == nullptr) {
                return gidkit::core::make_status(StatusDomain::Codec, StatusCode::NotFound);
            }
            if (f->type != type) {
                return invalid();
            }
            *out = f;
            return gidkit::core::ok_status();
        }

        struct ByteReader {
            const u8* p{nullptr};
            u32 left{0};

            [[nodiscard]] bool has(u32 n) const noexcept { return left >= n; }
            void skip(u32 n) noexcept {
                p += n;
                left -= n;
            }
        };
    } // namespace

    Status record_put_i64(Record* rec, std::string_view name, i64 v) noexcept {
        const Status s = check_new_field(rec, name);
        if (!gidkit::core::is_ok(s)) {
            return s;
        }
        try {
            RecordField f{};
            f.name.assign(name);
            f.type = FieldType::I64;
            f.num = static_cast<u64>(v);
            return push_field(rec, std::move(f));
        } catch (const std::bad_alloc&) {
            return gidkit::core::make_status(StatusDomain::Codec, StatusCode::OutOfMemory);
        }
    }

    Status record_put_u64(Record* rec, std::string_view name, u64 v) noexcept {
        const Status s = check_new_field(rec, name);
        if (!gidkit::core::is_ok(s)) {
            return s;
        }
        try {
            RecordField f{};
            f.name.assign(name);
            f.type = FieldType::U64;
            f.num = v;
            return push_field(rec, std::move(f));
        } catch (const std::bad_alloc&) {
            return gidkit::core::make_status(StatusDomain::Codec, StatusCode::OutOfMemory);
        }
    }

    Status record_put_text(Record* rec, std::string_view name, std::string_view v) noexcept {
        const Status s = check_new_field(rec, name);
        if (!gidkit::core::is_ok(s)) {
            return s;
        }
        if (v.size() > kRecordMaxTextBytes) {
            return invalid();
        }
        try {
            RecordField f{};
            f.name.assign(name);
            f.type = FieldType::Text;
            f.text.assign(v);
            return push_field(rec, std::move(f));
        } catch (const std::bad_alloc&) {
            return gidkit::core::make_status(StatusDomain::Codec, StatusCode::OutOfMemory);
        }
    }

    Status record_get_i64(const Record& rec, std::string_view name, i64* out) noexcept {
        if (out == nullptr) {
            return invalid();
        }
        const RecordField* f = nullptr;
        const Status s = lookup(rec, name, FieldType::I64, &f);
        if (!gidkit::core::is_ok(s)) {
            return s;
        }
        *out = static_cast<i64>(f->num);
        return gidkit::core::ok_status();
    }

    Status record_get_u64(const Record& rec, std::string_view name, u64* out) noexcept {
        if (out == nullptr) {
            return invalid();
        }
        const RecordField* f = nullptr;
        const Status s = lookup(rec, name, FieldType::U64, &f);
        if (!gidkit::core::is_ok(s)) {
            return s;
        }
        *out = f->num;
        return gidkit::core::ok_status();
    }

    Status record_get_text(const Record& rec, std::string_view name, std::string* out) noexcept {
        if (out == nullptr) {
            return invalid();
        }
        const RecordField* f = nullptr;
        const Status s = lookup(rec, name, FieldType::Text, &f);
        if (!gidkit::core::is_ok(s)) {
            return s;
        }
        try {
            *out = f->text;
        } catch (const std::bad_alloc&) {
            return gidkit::core::make_status(StatusDomain::Codec, StatusCode::OutOfMemory);
        }
        return gidkit::core::ok_status();
    }

    Status record_encode(const Record& rec, std::vector<u8>* out) noexcept {
        if (out == nullptr || rec.fields.size() > kRecordMaxFields) {
            return invalid();
        }
        out->clear();
        try {
            out->push_back(kRecordVersion);
            out->push_back(static_cast<u8>(rec.fields.size()));
            for (const RecordField& f : rec.fields) {
                if (f.name.empty() || f.name.size() > kRecordMaxNameBytes) {
                    out->clear();
                    return invalid();
                }
                out->push_back(static_cast<u8>(f.name.size()));
                out->insert(out->end(), f.name.begin(), f.name.end());
                out->push_back(static_cast<u8>(f.type));
                switch (f.type) {
                case FieldType::I64:
                case FieldType::U64:
                    put_u64_be(out, f.num);
                    break;
                case FieldType::Text:
                    if (f.text.size() > kRecordMaxTextBytes) {
                        out->clear();
                        return invalid();
                    }
                    put_u16_be(out, static_cast<u16>(f.text.size()));
                    out->insert(out->end(), f.text.begin(), f.text.end());
                    break;
                }
            }
        } catch (const std::bad_alloc&) {
            out->clear();
            return gidkit::core::make_status(StatusDomain::Codec, StatusCode::OutOfMemory);
        }
        return gidkit::core::ok_status();
    }

    Status record_parse(BufferView in, Record* out) noexcept {
        if (out == nullptr || !buffer_ok(in)) {
            return invalid();
        }

        ByteReader c{in.data, in.len};
        if (!c.has(2)) {
            return invalid();
        }
        const u8 version = c.p[0];
        const u8 count = c.p[1];
        c.skip(2);
        if (version != kRecordVersion || count > kRecordMaxFields) {
            return invalid();
        }

        Record rec{};
        try {
            rec.fields.reserve(count);
            for (u32 i = 0; i < count; ++i) {
                if (!c.has(1)) return invalid();
                const u8 name_len = c.p[0];
                c.skip(1);
                if (name_len == 0 || !c.has(name_len + 1u)) return invalid();

                RecordField f{};
                f.name.assign(reinterpret_cast<const char*>(c.p), name_len);
                c.skip(name_len);
                if (find_field(rec, f.name) != nullptr) return invalid();

                const u8 type_u8 = c.p[0];
                c.skip(1);
                if (!gidkit::core::field_type_valid(type_u8)) return invalid();
                f.type = static_cast<FieldType>(type_u8);

                if (f.type == FieldType::Text) {
                    if (!c.has(2)) return invalid();
                    const u16 len = get_u16_be(c.p);
                    c.skip(2);
                    if (!c.has(len)) return invalid();
                    f.text.assign(reinterpret_cast<const char*>(c.p), len);
                    c.skip(len);
                } else {
                    if (!c.has(8)) return invalid();
                    f.num = get_u64_be(c.p);
                    c.skip(8);
                }
                rec.fields.push_back(std::move(f));
            }
        } catch (const std::bad_alloc&) {
            return gidkit::core::make_status(StatusDomain::Codec, StatusCode::OutOfMemory);
        }

        if (c.left != 0) {
            return invalid();
        }
        *out = std::move(rec);
        return gidkit::core::ok_status();
    }
} // namespace gidkit::codec
