#include "gidkit/cli/commands.hpp"

#include <cstring>

namespace gidkit::cli {
    gidkit::core::Status parse_command(const CliArgs& args,
        const CommandSpec* specs,
        u32 spec_count,
        CommandInvocation* out,
        u32* consumed) noexcept {
        const gidkit::core::Status invalid =
            gidkit::core::make_status(gidkit::core::StatusDomain::Cli, gidkit::core::StatusCode::Invalid);
        if (out == nullptr || consumed == nullptr) {
            return invalid;
        }
        *consumed = 0;
        *out = CommandInvocation{};

        if (args.argc == 0 || args.argv == nullptr || args.argv[0] == nullptr) {
            return invalid;
        }
        if (spec_count > 0 && specs == nullptr) {
            return invalid;
        }

        const char* cmd = args.argv[0];
        if (cmd[0] == '\0' || cmd[0] == '-') {
            return invalid;
        }

        for (u32 i = 0; i < spec_count; ++i) {
            if (specs[i].name != nullptr && std::strcmp(specs[i].name, cmd) == 0) {
                out->id = specs[i].id;
                out->spec = &specs[i];
                out->args.argv = args.argv + 1;
                out->args.argc = args.argc - 1;
                *consumed = 1;
                return gidkit::core::ok_status();
            }
        }
        return gidkit::core::make_status(gidkit::core::StatusDomain::Cli, gidkit::core::StatusCode::NotFound);
    }

    gidkit::core::Status parse_command_options(const CommandInvocation& inv,
        ParsedOptions* out,
        CliArgs* rest) noexcept {
        if (inv.spec == nullptr || out == nullptr || rest == nullptr) {
            return gidkit::core::make_status(gidkit::core::StatusDomain::Cli, gidkit::core::StatusCode::Invalid);
        }
        u32 consumed = 0;
        const gidkit::core::Status s =
            parse_options(inv.args, inv.spec->options, inv.spec->option_count, out, &consumed);
        if (!gidkit::core::is_ok(s)) {
            return s;
        }
        rest->argv = inv.args.argv + consumed;
        rest->argc = inv.args.argc - consumed;
        return gidkit::core::ok_status();
    }
} // namespace gidkit::cli
