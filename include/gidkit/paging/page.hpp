#pragma once

#include <limits>
#include <string>
#include <utility>
#include <vector>

#include "gidkit/core/errors.hpp"
#include "gidkit/core/types.hpp"
#include "gidkit/paging/cursor.hpp"
#include "gidkit/paging/keyset.hpp"

namespace gidkit::paging {
    using u32 = gidkit::core::u32;

    inline constexpr u32 kDefaultPageLimit = 50;
    inline constexpr u32 kMaxPageLimit = 100;

    struct PageParams {
        u32 limit{kDefaultPageLimit};
        std::string cursor; // opaque, empty for the first page
    };

    // limit: nullptr or "" selects default_limit; anything that is not a
    // positive base-10 integer is (Paging, InvalidLimit); values above
    // max_limit are clamped. cursor may be nullptr.
    gidkit::core::Status page_params_parse(const char* limit,
        const char* cursor,
        u32 default_limit,
        u32 max_limit,
        PageParams* out) noexcept;

    struct PageInfo {
        u32 limit{0};
        bool has_more{false};
        std::string next_cursor; // empty unless has_more
    };

    template <typename Row>
    struct Page {
        std::vector<Row> data;
        PageInfo page;
    };

    // {"limit":N,"has_more":B,"next_cursor":"..."}; next_cursor is left out
    // when there is no next page.
    [[nodiscard]] std::string page_info_to_json(const PageInfo& info);

    // Keyset pagination over (created_at DESC, id DESC).
    //
    // fetch(const KeysetCursor* bound, u32 want, std::vector<Row>* rows) must
    // return at most `want` rows in descending key order, restricted to keys
    // strictly below *bound when bound is not null. paginate asks for
    // limit + 1 rows and uses the extra row only to learn whether another
    // page exists.
    //
    // key_of(const Row&) -> KeysetCursor gives the sort key of a row.
    //
    // (Paging, Invalid) for a null out, a zero limit, or a limit with no room
    // for the extra row.
    template <typename Row, typename Fetch, typename KeyOf>
    gidkit::core::Status paginate(const CursorCodec<KeysetCursor>& codec,
        const PageParams& params,
        Fetch&& fetch,
        KeyOf&& key_of,
        Page<Row>* out) {
        // limit + 1 must stay representable for the look-ahead row.
        if (out == nullptr || params.limit == 0 || params.limit == std::numeric_limits<u32>::max()) {
            return gidkit::core::make_status(gidkit::core::StatusDomain::Paging, gidkit::core::StatusCode::Invalid);
        }

        KeysetCursor bound{};
        bool has_bound = false;
        gidkit::core::Status s = codec.decode(params.cursor, &bound, &has_bound);
        if (!gidkit::core::is_ok(s)) {
            return s;
        }

        std::vector<Row> rows;
        s = fetch(has_bound ? &bound : nullptr, params.limit + 1u, &rows);
        if (!gidkit::core::is_ok(s)) {
            return s;
        }

        const bool has_more = rows.size() > params.limit;
        if (has_more) {
            rows.resize(params.limit);
        }

        PageInfo info{};
        info.limit = params.limit;
        info.has_more = has_more;
        if (has_more) {
            s = codec.encode(key_of(rows.back()), &info.next_cursor);
            if (!gidkit::core::is_ok(s)) {
                return s;
            }
        }

        out->data = std::move(rows);
        out->page = std::move(info);
        return gidkit::core::ok_status();
    }

} // namespace gidkit::paging
