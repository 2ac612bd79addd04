#pragma once

#include <array>
#include <type_traits>

#include "gidkit/cli/options.hpp"
#include "gidkit/core/errors.hpp"

namespace gidkit::cli {
    inline constexpr const char* kMachineTagEnv = "GIDKIT_MACHINE_TAG";

    inline constexpr std::array<OptionSpec, 1> kGlobalOptions = {{
        {OptionId::Machine, OptionType::U64, "machine", 'm'},
    }};

    enum class MachineTagSource : u8 {
        Default = 0,
        Option = 1,
        Environment = 2,
    };

    struct CliConfig {
        u64 machine_tag{0}; // as given, range is checked by cli_machine_tag
        MachineTagSource source{MachineTagSource::Default};
    };

    // --machine beats the environment value; neither gives tag 0. env may be
    // nullptr or empty. (Cli, Invalid) when env is not a base-10 u64.
    gidkit::core::Status resolve_cli_config(const ParsedOptions& globals, const char* env, CliConfig* out) noexcept;

    // (Ids, InvalidMachineTag) above ids::kMaxMachineTag, with the tag in aux
    // saturated to u32. cfg.machine_tag keeps the full value for reporting.
    gidkit::core::Status cli_machine_tag(const CliConfig& cfg, u32* out) noexcept;

    static_assert(std::is_trivially_copyable_v<CliConfig>);
} // namespace gidkit::cli
