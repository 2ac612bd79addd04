#pragma once

#include <array>
#include <string_view>

#include "gidkit/core/types.hpp"

namespace gidkit::gid {
    using u8 = gidkit::core::u8;

    // Closed set of things a GID can name. None is the zero value and never
    // appears in text.
    enum class EntityType : u8 {
        None = 0,
        Product = 1,
        ProductVariant = 2,
        Store = 3,
        Tenant = 4,
        User = 5,
        Role = 6,
        Permission = 7,
        CustomDomain = 8,
    };

    inline constexpr std::array<EntityType, 8> kEntityTypes = {{
        EntityType::Product,
        EntityType::ProductVariant,
        EntityType::Store,
        EntityType::Tenant,
        EntityType::User,
        EntityType::Role,
        EntityType::Permission,
        EntityType::CustomDomain,
    }};

    [[nodiscard]] constexpr bool entity_type_valid(EntityType t) noexcept {
        switch (t) {
        case EntityType::Product:
        case EntityType::ProductVariant:
        case EntityType::Store:
        case EntityType::Tenant:
        case EntityType::User:
        case EntityType::Role:
        case EntityType::Permission:
        case EntityType::CustomDomain:
            return true;
        case EntityType::None:
            return false;
        }
        return false;
    }

    // Empty for None and for values outside the enumeration.
    [[nodiscard]] std::string_view entity_type_name(EntityType t) noexcept;

    // Exact, case-sensitive match against the allow-list.
    [[nodiscard]] bool entity_type_parse(std::string_view name, EntityType* out) noexcept;

} // namespace gidkit::gid
