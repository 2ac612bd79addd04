#include "gidkit/paging/page.hpp"

#include <charconv>
#include <cstring>
#include <new>

namespace gidkit::paging {
    namespace {
        [[nodiscard]] bool parse_positive(const char* s, gidkit::core::u64* out) noexcept {
            const char* end = s + std::strlen(s);
            gidkit::core::u64 v{};
            auto r = std::from_chars(s, end, v, 10);
            if (r.ec == std::errc::result_out_of_range && r.ptr == end) {
                // Huge but well-formed: clamp later.
                *out = ~gidkit::core::u64{0};
                return true;
            }
            if (r.ec != std::errc() || r.ptr != end || v == 0) {
                return false;
            }
            *out = v;
            return true;
        }

        void append_escaped(std::string* out, const std::string& s) {
            for (char c : s) {
                if (c == '"' || c == '\\') {
                    out->push_back('\\');
                }
                out->push_back(c);
            }
        }
    } // namespace

    gidkit::core::Status page_params_parse(const char* limit,
        const char* cursor,
        u32 default_limit,
        u32 max_limit,
        PageParams* out) noexcept {
        if (out == nullptr || default_limit == 0 || max_limit < default_limit) {
            return gidkit::core::make_status(gidkit::core::StatusDomain::Paging, gidkit::core::StatusCode::Invalid);
        }

        u32 v = default_limit;
        if (limit != nullptr && *limit != '\0') {
            gidkit::core::u64 parsed{0};
            if (!parse_positive(limit, &parsed)) {
                return gidkit::core::make_status(gidkit::core::StatusDomain::Paging, gidkit::core::StatusCode::InvalidLimit);
            }
            v = parsed > max_limit ? max_limit : static_cast<u32>(parsed);
        }

        try {
            out->cursor.assign(cursor != nullptr ? cursor : "");
        } catch (const std::bad_alloc&) {
            return gidkit::core::make_status(gidkit::core::StatusDomain::Paging, gidkit::core::StatusCode::OutOfMemory);
        }
        out->limit = v;
        return gidkit::core::ok_status();
    }

    std::string page_info_to_json(const PageInfo& info) {
        std::string out;
        out.reserve(64 + info.next_cursor.size());
        out.append("{\"limit\":");
        out.append(std::to_string(info.limit));
        out.append(",\"has_more\":");
        out.append(info.has_more ? "true" : "false");
        if (info.has_more && !info.next_cursor.empty()) {
            out.append(",\"next_cursor\":\"");
            append_escaped(&out, info.next_cursor);
            out.push_back('"');
        }
        out.push_back('}');
        return out;
    }
} // namespace gidkit::paging
