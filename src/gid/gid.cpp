#include "gidkit/gid/gid.hpp"

#include <charconv>
#include <new>
#include <vector>

#include "gidkit/codec/base64.hpp"

namespace gidkit::gid {
    using gidkit::core::Status;
    using gidkit::core::StatusCode;
    using gidkit::core::StatusDomain;

    namespace {
        [[nodiscard]] Status gid_error(StatusCode code) noexcept {
            return gidkit::core::make_status(StatusDomain::Gid, code);
        }

        [[nodiscard]] bool parse_u64(std::string_view s, u64* out) noexcept {
            if (s.empty()) {
                return false;
            }
            const char* begin = s.data();
            const char* end = s.data() + s.size();
            u64 v{};
            auto r = std::from_chars(begin, end, v, 10);
            if (r.ec != std::errc() || r.ptr != end) {
                return false;
            }
            *out = v;
            return true;
        }
    } // namespace

    std::string gid_to_string(Gid g) {
        char digits[20];
        auto r = std::to_chars(digits, digits + sizeof(digits), g.id, 10);

        const std::string_view type = entity_type_name(g.type);
        std::string out;
        out.reserve(kGidPrefix.size() + type.size() + 1 + static_cast<size_t>(r.ptr - digits));
        out.append(kGidPrefix);
        out.append(type);
        out.push_back('/');
        out.append(digits, r.ptr);
        return out;
    }

    Status gid_to_compact(Gid g, std::string* out) noexcept {
        if (out == nullptr) {
            return gid_error(StatusCode::Invalid);
        }
        try {
            const std::string canonical = gid_to_string(g);
            const gidkit::codec::BufferView view{
                reinterpret_cast<const gidkit::codec::u8*>(canonical.data()),
                static_cast<gidkit::codec::u32>(canonical.size())};
            return gidkit::codec::base64url_encode(view, out);
        } catch (const std::bad_alloc&) {
            return gid_error(StatusCode::OutOfMemory);
        }
    }

    Status gid_parse(std::string_view text, Gid* out) noexcept {
        if (out == nullptr) {
            return gid_error(StatusCode::Invalid);
        }
        if (text.substr(0, kGidPrefix.size()) != kGidPrefix) {
            return gid_error(StatusCode::MissingPrefix);
        }

        const std::string_view body = text.substr(kGidPrefix.size());
        const size_t slash = body.find('/');
        if (slash == std::string_view::npos) {
            return gid_error(StatusCode::MalformedBody);
        }
        const std::string_view type_part = body.substr(0, slash);
        const std::string_view id_part = body.substr(slash + 1);
        if (type_part.empty() || id_part.empty() || id_part.find('/') != std::string_view::npos) {
            return gid_error(StatusCode::MalformedBody);
        }

        EntityType type{EntityType::None};
        if (!entity_type_parse(type_part, &type)) {
            return gid_error(StatusCode::UnknownEntityType);
        }

        u64 id{0};
        if (!parse_u64(id_part, &id)) {
            return gid_error(StatusCode::InvalidId);
        }

        *out = Gid{type, id};
        return gidkit::core::ok_status();
    }

    Status gid_parse_compact(std::string_view text, Gid* out) noexcept {
        if (out == nullptr) {
            return gid_error(StatusCode::Invalid);
        }

        std::vector<gidkit::codec::u8> raw;
        const Status s = gidkit::codec::base64url_decode(text, &raw);
        if (s.code == StatusCode::InvalidEncoding) {
            return gid_error(StatusCode::InvalidEncoding);
        }
        if (!gidkit::core::is_ok(s)) {
            return s;
        }

        const std::string_view decoded(reinterpret_cast<const char*>(raw.data()), raw.size());
        return gid_parse(decoded, out);
    }
} // namespace gidkit::gid
