#include "gidkit/cli/config.hpp"

#include <limits>

#include "gidkit/ids/snowflake.hpp"

namespace gidkit::cli {
    gidkit::core::Status resolve_cli_config(const ParsedOptions& globals, const char* env, CliConfig* out) noexcept {
        if (out == nullptr) {
            return gidkit::core::make_status(gidkit::core::StatusDomain::Cli, gidkit::core::StatusCode::Invalid);
        }
        *out = CliConfig{};

        if (const ParsedOption* opt = find_option(globals, OptionId::Machine)) {
            out->machine_tag = opt->value.u64v;
            out->source = MachineTagSource::Option;
            return gidkit::core::ok_status();
        }
        if (env != nullptr && *env != '\0') {
            if (!parse_u64_text(env, &out->machine_tag)) {
                out->machine_tag = 0;
                return gidkit::core::make_status(gidkit::core::StatusDomain::Cli, gidkit::core::StatusCode::Invalid);
            }
            out->source = MachineTagSource::Environment;
        }
        return gidkit::core::ok_status();
    }

    gidkit::core::Status cli_machine_tag(const CliConfig& cfg, u32* out) noexcept {
        if (out == nullptr) {
            return gidkit::core::make_status(gidkit::core::StatusDomain::Cli, gidkit::core::StatusCode::Invalid);
        }
        if (cfg.machine_tag > gidkit::ids::kMaxMachineTag) {
            constexpr u64 kAuxMax = std::numeric_limits<u32>::max();
            const u32 aux = cfg.machine_tag > kAuxMax ? std::numeric_limits<u32>::max() : static_cast<u32>(cfg.machine_tag);
            return gidkit::core::make_status(gidkit::core::StatusDomain::Ids, gidkit::core::StatusCode::InvalidMachineTag, aux);
        }
        *out = static_cast<u32>(cfg.machine_tag);
        return gidkit::core::ok_status();
    }
} // namespace gidkit::cli
