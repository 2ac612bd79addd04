#include <limits>
#include <string>

#include <gtest/gtest.h>

#include "gidkit/core/errors.hpp"
#include "gidkit/gid/entity_type.hpp"
#include "gidkit/gid/gid.hpp"

using namespace gidkit::gid;
using gidkit::core::Status;
using gidkit::core::StatusCode;
using gidkit::core::StatusDomain;

namespace {

Status parse(std::string_view text, Gid* out) {
    return gid_parse(text, out);
}

StatusCode parse_code(std::string_view text) {
    Gid g{};
    return gid_parse(text, &g).code;
}

std::string compact(Gid g) {
    std::string out;
    const Status s = gid_to_compact(g, &out);
    EXPECT_EQ(s.code, StatusCode::Ok);
    return out;
}

constexpr u64 kSampleIds[] = {0, 1, 123456789, std::numeric_limits<u64>::max()};

} // namespace

//=============================================================================
// Entity types
//=============================================================================

TEST(EntityType, NamesRoundTrip) {
    for (EntityType t : kEntityTypes) {
        EXPECT_TRUE(entity_type_valid(t));
        const std::string_view name = entity_type_name(t);
        ASSERT_FALSE(name.empty());

        EntityType parsed{EntityType::None};
        EXPECT_TRUE(entity_type_parse(name, &parsed)) << name;
        EXPECT_EQ(parsed, t);
    }
}

TEST(EntityType, NoneAndOutOfRangeHaveNoName) {
    EXPECT_FALSE(entity_type_valid(EntityType::None));
    EXPECT_TRUE(entity_type_name(EntityType::None).empty());
    EXPECT_TRUE(entity_type_name(static_cast<EntityType>(200)).empty());
    EXPECT_FALSE(entity_type_valid(static_cast<EntityType>(200)));
}

TEST(EntityType, ParseIsExactAndCaseSensitive) {
    EntityType t{EntityType::None};
    EXPECT_FALSE(entity_type_parse("product", &t));
    EXPECT_FALSE(entity_type_parse("PRODUCT", &t));
    EXPECT_FALSE(entity_type_parse("Product ", &t));
    EXPECT_FALSE(entity_type_parse("Order", &t));
    EXPECT_FALSE(entity_type_parse("", &t));
    EXPECT_FALSE(entity_type_parse("Product", nullptr));
    EXPECT_EQ(t, EntityType::None);
}

//=============================================================================
// Canonical form
//=============================================================================

TEST(Gid, CanonicalString) {
    EXPECT_EQ(gid_to_string(product_gid(123456789)), "gid://mystoreos/Product/123456789");
    EXPECT_EQ(gid_to_string(product_variant_gid(7)), "gid://mystoreos/ProductVariant/7");
    EXPECT_EQ(gid_to_string(custom_domain_gid(0)), "gid://mystoreos/CustomDomain/0");
    EXPECT_EQ(gid_to_string(user_gid(std::numeric_limits<u64>::max())),
        "gid://mystoreos/User/18446744073709551615");
}

TEST(Gid, CanonicalStringCarriesSchemeAndNamespace) {
    const std::string text = gid_to_string(tenant_gid(3));
    const std::string expected_prefix =
        std::string(kGidScheme) + "://" + std::string(kGidNamespace) + "/";
    EXPECT_EQ(text.rfind(expected_prefix, 0), 0u) << text;
    EXPECT_EQ(expected_prefix, kGidPrefix);

    Gid g{};
    const std::string foreign = "gid://" + std::string(kGidNamespace) + "x/Tenant/3";
    EXPECT_EQ(gid_parse(foreign, &g).code, StatusCode::MissingPrefix);
}

TEST(Gid, TypedHelpersSetType) {
    EXPECT_EQ(product_gid(1).type, EntityType::Product);
    EXPECT_EQ(product_variant_gid(1).type, EntityType::ProductVariant);
    EXPECT_EQ(store_gid(1).type, EntityType::Store);
    EXPECT_EQ(tenant_gid(1).type, EntityType::Tenant);
    EXPECT_EQ(user_gid(1).type, EntityType::User);
    EXPECT_EQ(role_gid(1).type, EntityType::Role);
    EXPECT_EQ(permission_gid(1).type, EntityType::Permission);
    EXPECT_EQ(custom_domain_gid(1).type, EntityType::CustomDomain);
    EXPECT_EQ(store_gid(99).id, 99u);
}

TEST(Gid, ZeroValue) {
    EXPECT_TRUE(gid_is_zero(Gid{}));
    EXPECT_FALSE(gid_is_zero(product_gid(0)));
    EXPECT_FALSE(gid_is_zero(Gid{EntityType::None, 5}));
}

TEST(Gid, CanonicalRoundTripAllTypes) {
    for (EntityType t : kEntityTypes) {
        for (u64 id : kSampleIds) {
            const Gid g = make_gid(t, id);
            const std::string text = gid_to_string(g);
            EXPECT_EQ(text.find(' '), std::string::npos);

            Gid back{};
            const Status s = parse(text, &back);
            ASSERT_EQ(s.code, StatusCode::Ok) << text;
            EXPECT_EQ(back, g) << text;
        }
    }
}

TEST(Gid, ParseExample) {
    Gid g{};
    ASSERT_EQ(parse("gid://mystoreos/Product/123456789", &g).code, StatusCode::Ok);
    EXPECT_EQ(g.type, EntityType::Product);
    EXPECT_EQ(g.id, 123456789u);
}

//=============================================================================
// Parse errors
//=============================================================================

TEST(Gid, RejectsMissingPrefix) {
    Gid g{};
    const Status s = parse("Product/1", &g);
    EXPECT_EQ(s.code, StatusCode::MissingPrefix);
    EXPECT_EQ(s.domain, StatusDomain::Gid);

    EXPECT_EQ(parse_code(""), StatusCode::MissingPrefix);
    EXPECT_EQ(parse_code("gid://otherapp/Product/1"), StatusCode::MissingPrefix);
    EXPECT_EQ(parse_code("GID://mystoreos/Product/1"), StatusCode::MissingPrefix);
    EXPECT_EQ(parse_code("gid://mystoreos"), StatusCode::MissingPrefix);
}

TEST(Gid, RejectsMalformedBody) {
    EXPECT_EQ(parse_code("gid://mystoreos/"), StatusCode::MalformedBody);
    EXPECT_EQ(parse_code("gid://mystoreos/Product"), StatusCode::MalformedBody);
    EXPECT_EQ(parse_code("gid://mystoreos/Product/"), StatusCode::MalformedBody);
    EXPECT_EQ(parse_code("gid://mystoreos//1"), StatusCode::MalformedBody);
    EXPECT_EQ(parse_code("gid://mystoreos/Product/1/2"), StatusCode::MalformedBody);
    EXPECT_EQ(parse_code("gid://mystoreos/Product/1/"), StatusCode::MalformedBody);
}

TEST(Gid, RejectsUnknownEntityType) {
    Gid g{};
    const Status s = parse("gid://mystoreos/Order/1", &g);
    EXPECT_EQ(s.code, StatusCode::UnknownEntityType);
    EXPECT_EQ(s.domain, StatusDomain::Gid);

    EXPECT_EQ(parse_code("gid://mystoreos/Invalid/123"), StatusCode::UnknownEntityType);
    EXPECT_EQ(parse_code("gid://mystoreos/product/1"), StatusCode::UnknownEntityType);
    EXPECT_EQ(parse_code("gid://mystoreos/None/1"), StatusCode::UnknownEntityType);
}

TEST(Gid, RejectsInvalidId) {
    EXPECT_EQ(parse_code("gid://mystoreos/Product/abc"), StatusCode::InvalidId);
    EXPECT_EQ(parse_code("gid://mystoreos/Product/-1"), StatusCode::InvalidId);
    EXPECT_EQ(parse_code("gid://mystoreos/Product/+1"), StatusCode::InvalidId);
    EXPECT_EQ(parse_code("gid://mystoreos/Product/12x"), StatusCode::InvalidId);
    EXPECT_EQ(parse_code("gid://mystoreos/Product/ 1"), StatusCode::InvalidId);
    EXPECT_EQ(parse_code("gid://mystoreos/Product/18446744073709551616"), StatusCode::InvalidId);
}

TEST(Gid, TypeIsCheckedBeforeId) {
    EXPECT_EQ(parse_code("gid://mystoreos/Order/abc"), StatusCode::UnknownEntityType);
}

TEST(Gid, FailedParseLeavesOutputUntouched) {
    Gid g = store_gid(77);
    EXPECT_NE(parse("gid://mystoreos/Store/x", &g).code, StatusCode::Ok);
    EXPECT_EQ(g, store_gid(77));
    EXPECT_EQ(gid_parse("gid://mystoreos/Store/1", nullptr).code, StatusCode::Invalid);
}

//=============================================================================
// Compact form
//=============================================================================

TEST(Gid, CompactRoundTripAllTypes) {
    for (EntityType t : kEntityTypes) {
        for (u64 id : kSampleIds) {
            const Gid g = make_gid(t, id);
            const std::string token = compact(g);
            EXPECT_FALSE(token.empty());
            EXPECT_EQ(token.find_first_of("=+/"), std::string::npos) << token;

            Gid back{};
            const Status s = gid_parse_compact(token, &back);
            ASSERT_EQ(s.code, StatusCode::Ok) << token;
            EXPECT_EQ(back, g);
        }
    }
}

TEST(Gid, CompactOfKnownValue) {
    // base64url("gid://mystoreos/Product/1")
    EXPECT_EQ(compact(product_gid(1)), "Z2lkOi8vbXlzdG9yZW9zL1Byb2R1Y3QvMQ");
}

TEST(Gid, CompactRejectsGarbage) {
    Gid g{};
    Status s = gid_parse_compact("not base64!", &g);
    EXPECT_EQ(s.code, StatusCode::InvalidEncoding);
    EXPECT_EQ(s.domain, StatusDomain::Gid);

    s = gid_parse_compact("Zm9vY", &g);
    EXPECT_EQ(s.code, StatusCode::InvalidEncoding);
    EXPECT_EQ(s.domain, StatusDomain::Gid);
}

TEST(Gid, CompactHasOneSpelling) {
    Gid g{};
    ASSERT_EQ(gid_parse_compact("Z2lkOi8vbXlzdG9yZW9zL1Byb2R1Y3QvMQ", &g).code, StatusCode::Ok);
    EXPECT_EQ(g, product_gid(1));

    // Same bytes with a stray bit past the final byte.
    const Status s = gid_parse_compact("Z2lkOi8vbXlzdG9yZW9zL1Byb2R1Y3QvMR", &g);
    EXPECT_EQ(s.code, StatusCode::InvalidEncoding);
    EXPECT_EQ(s.domain, StatusDomain::Gid);
}

TEST(Gid, CompactOfNonGidTextReportsParseError) {
    Gid g{};
    // base64url("hello")
    EXPECT_EQ(gid_parse_compact("aGVsbG8", &g).code, StatusCode::MissingPrefix);
    EXPECT_EQ(gid_parse_compact("", &g).code, StatusCode::MissingPrefix);
}

TEST(Gid, CompactRejectsNullOutput) {
    EXPECT_EQ(gid_to_compact(product_gid(1), nullptr).code, StatusCode::Invalid);
    EXPECT_EQ(gid_parse_compact("aGVsbG8", nullptr).code, StatusCode::Invalid);
}
