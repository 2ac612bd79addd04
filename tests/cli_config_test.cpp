#include <limits>

#include <gtest/gtest.h>

#include "gidkit/cli/config.hpp"
#include "gidkit/cli/options.hpp"
#include "gidkit/ids/snowflake.hpp"

using namespace gidkit::cli;
using gidkit::core::Status;
using gidkit::core::StatusCode;
using gidkit::core::StatusDomain;

namespace {

// Parses argv against the global option table into buf.
ParsedOptions parse_globals(const char* const* argv, u32 argc, ParsedOption* buf, u32 cap) {
    ParsedOptions out{buf, 0, cap};
    u32 consumed = 0;
    const Status s = parse_options({argv, argc}, kGlobalOptions.data(),
        static_cast<u32>(kGlobalOptions.size()), &out, &consumed);
    EXPECT_EQ(s.code, StatusCode::Ok);
    return out;
}

} // namespace

//=============================================================================
// Source selection
//=============================================================================

TEST(CliConfig, DefaultsToTagZero) {
    ParsedOption buf[4]{};
    const ParsedOptions globals = parse_globals(nullptr, 0, buf, 4);

    CliConfig cfg{};
    ASSERT_EQ(resolve_cli_config(globals, nullptr, &cfg).code, StatusCode::Ok);
    EXPECT_EQ(cfg.machine_tag, 0u);
    EXPECT_EQ(cfg.source, MachineTagSource::Default);

    ASSERT_EQ(resolve_cli_config(globals, "", &cfg).code, StatusCode::Ok);
    EXPECT_EQ(cfg.source, MachineTagSource::Default);
}

TEST(CliConfig, EnvironmentUsedWithoutOption) {
    ParsedOption buf[4]{};
    const ParsedOptions globals = parse_globals(nullptr, 0, buf, 4);

    CliConfig cfg{};
    ASSERT_EQ(resolve_cli_config(globals, "42", &cfg).code, StatusCode::Ok);
    EXPECT_EQ(cfg.machine_tag, 42u);
    EXPECT_EQ(cfg.source, MachineTagSource::Environment);
}

TEST(CliConfig, OptionBeatsEnvironment) {
    const char* argv[] = {"--machine", "7", "generate"};
    ParsedOption buf[4]{};
    const ParsedOptions globals = parse_globals(argv, 3, buf, 4);

    CliConfig cfg{};
    ASSERT_EQ(resolve_cli_config(globals, "42", &cfg).code, StatusCode::Ok);
    EXPECT_EQ(cfg.machine_tag, 7u);
    EXPECT_EQ(cfg.source, MachineTagSource::Option);

    // An unusable environment value does not matter when the option is given.
    ASSERT_EQ(resolve_cli_config(globals, "not-a-number", &cfg).code, StatusCode::Ok);
    EXPECT_EQ(cfg.machine_tag, 7u);
}

TEST(CliConfig, RejectsNonNumericEnvironment) {
    ParsedOption buf[4]{};
    const ParsedOptions globals = parse_globals(nullptr, 0, buf, 4);

    const char* bad[] = {"abc", "-1", "12x", " 3", "18446744073709551616"};
    for (const char* env : bad) {
        CliConfig cfg{};
        const Status s = resolve_cli_config(globals, env, &cfg);
        EXPECT_EQ(s.code, StatusCode::Invalid) << env;
        EXPECT_EQ(s.domain, StatusDomain::Cli) << env;
    }
    EXPECT_EQ(resolve_cli_config(globals, "1", nullptr).code, StatusCode::Invalid);
}

//=============================================================================
// Machine tag range
//=============================================================================

TEST(CliConfig, MachineTagWithinRange) {
    u32 tag = 99;
    CliConfig cfg{};
    cfg.machine_tag = gidkit::ids::kMaxMachineTag;
    ASSERT_EQ(cli_machine_tag(cfg, &tag).code, StatusCode::Ok);
    EXPECT_EQ(tag, gidkit::ids::kMaxMachineTag);

    cfg.machine_tag = 0;
    ASSERT_EQ(cli_machine_tag(cfg, &tag).code, StatusCode::Ok);
    EXPECT_EQ(tag, 0u);
}

TEST(CliConfig, OutOfRangeTagKeepsValueAsGiven) {
    const char* argv[] = {"-m", "5000"};
    ParsedOption buf[4]{};
    const ParsedOptions globals = parse_globals(argv, 2, buf, 4);

    CliConfig cfg{};
    ASSERT_EQ(resolve_cli_config(globals, nullptr, &cfg).code, StatusCode::Ok);
    EXPECT_EQ(cfg.machine_tag, 5000u);

    u32 tag = 99;
    const Status s = cli_machine_tag(cfg, &tag);
    EXPECT_EQ(s.code, StatusCode::InvalidMachineTag);
    EXPECT_EQ(s.domain, StatusDomain::Ids);
    EXPECT_EQ(s.aux, 5000u);
    EXPECT_EQ(tag, 99u);
    EXPECT_EQ(cfg.machine_tag, 5000u);
}

TEST(CliConfig, HugeTagSaturatesAux) {
    CliConfig cfg{};
    cfg.machine_tag = u64{1} << 40;

    u32 tag = 0;
    const Status s = cli_machine_tag(cfg, &tag);
    EXPECT_EQ(s.code, StatusCode::InvalidMachineTag);
    EXPECT_EQ(s.aux, std::numeric_limits<u32>::max());
    EXPECT_EQ(cfg.machine_tag, u64{1} << 40);
}
