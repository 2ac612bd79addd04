#pragma once

#include <string>
#include <string_view>
#include <type_traits>

#include "gidkit/core/errors.hpp"
#include "gidkit/core/types.hpp"
#include "gidkit/gid/entity_type.hpp"

namespace gidkit::gid {
    using u64 = gidkit::core::u64;

    inline constexpr std::string_view kGidScheme = "gid";
    inline constexpr std::string_view kGidNamespace = "mystoreos";
    inline constexpr std::string_view kGidPrefix = "gid://mystoreos/";

    // kGidPrefix is "<scheme>://<namespace>/".
    static_assert(kGidPrefix.substr(0, kGidScheme.size()) == kGidScheme);
    static_assert(kGidPrefix.substr(kGidScheme.size(), 3) == "://");
    static_assert(kGidPrefix.substr(kGidScheme.size() + 3, kGidNamespace.size()) == kGidNamespace);
    static_assert(kGidPrefix.size() == kGidScheme.size() + 3 + kGidNamespace.size() + 1);
    static_assert(kGidPrefix.back() == '/');

    struct Gid {
        EntityType type{EntityType::None};
        u64 id{0};

        friend constexpr bool operator==(Gid, Gid) noexcept = default;
    };

    // The zero value stands for "no identifier".
    [[nodiscard]] constexpr bool gid_is_zero(Gid g) noexcept {
        return g.type == EntityType::None && g.id == 0;
    }

    [[nodiscard]] constexpr Gid make_gid(EntityType type, u64 id) noexcept { return Gid{type, id}; }

    [[nodiscard]] constexpr Gid product_gid(u64 id) noexcept { return make_gid(EntityType::Product, id); }
    [[nodiscard]] constexpr Gid product_variant_gid(u64 id) noexcept { return make_gid(EntityType::ProductVariant, id); }
    [[nodiscard]] constexpr Gid store_gid(u64 id) noexcept { return make_gid(EntityType::Store, id); }
    [[nodiscard]] constexpr Gid tenant_gid(u64 id) noexcept { return make_gid(EntityType::Tenant, id); }
    [[nodiscard]] constexpr Gid user_gid(u64 id) noexcept { return make_gid(EntityType::User, id); }
    [[nodiscard]] constexpr Gid role_gid(u64 id) noexcept { return make_gid(EntityType::Role, id); }
    [[nodiscard]] constexpr Gid permission_gid(u64 id) noexcept { return make_gid(EntityType::Permission, id); }
    [[nodiscard]] constexpr Gid custom_domain_gid(u64 id) noexcept { return make_gid(EntityType::CustomDomain, id); }

    // gid://mystoreos/<EntityType>/<decimal id>
    [[nodiscard]] std::string gid_to_string(Gid g);

    // Unpadded base64url of gid_to_string(g).
    gidkit::core::Status gid_to_compact(Gid g, std::string* out) noexcept;

    // Errors, all in StatusDomain::Gid:
    //   MissingPrefix      text does not start with kGidPrefix
    //   MalformedBody      remainder is not exactly "<type>/<id>", both non-empty
    //   UnknownEntityType  <type> is not in the allow-list
    //   InvalidId          <id> is not a base-10 u64
    gidkit::core::Status gid_parse(std::string_view text, Gid* out) noexcept;

    // (Gid, InvalidEncoding) when text is not unpadded base64url, otherwise
    // whatever gid_parse reports for the decoded text.
    gidkit::core::Status gid_parse_compact(std::string_view text, Gid* out) noexcept;

    static_assert(std::is_trivially_copyable_v<Gid>);
    static_assert(std::is_standard_layout_v<Gid>);
} // namespace gidkit::gid
