#include "gidkit/gid/entity_type.hpp"

namespace gidkit::gid {
    std::string_view entity_type_name(EntityType t) noexcept {
        switch (t) {
            case EntityType::Product: return "Product";
            case EntityType::ProductVariant: return "ProductVariant";
            case EntityType::Store: return "Store";
            case EntityType::Tenant: return "Tenant";
            case EntityType::User: return "User";
            case EntityType::Role: return "Role";
            case EntityType::Permission: return "Permission";
            case EntityType::CustomDomain: return "CustomDomain";
            case EntityType::None: return {};
        }
        return {};
    }

    bool entity_type_parse(std::string_view name, EntityType* out) noexcept {
        if (out == nullptr || name.empty()) {
            return false;
        }
        for (EntityType t : kEntityTypes) {
            if (entity_type_name(t) == name) {
                *out = t;
                return true;
            }
        }
        return false;
    }
} // namespace gidkit::gid
