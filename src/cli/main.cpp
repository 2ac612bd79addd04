#include <cstdlib>
#include <cstdio>
#include <memory>
#include <string>
#include <string_view>

#include "gidkit/cli/commands.hpp"
#include "gidkit/cli/config.hpp"
#include "gidkit/cli/options.hpp"
#include "gidkit/core/errors.hpp"
#include "gidkit/gid/gid.hpp"
#include "gidkit/ids/snowflake.hpp"
#include "gidkit/paging/keyset.hpp"

namespace {

// ========================================================================
// Configuration
// ========================================================================

constexpr gidkit::core::u32 kMaxOptions = 16;
constexpr gidkit::core::u64 kMaxGenerateCount = 1000000;

// ========================================================================
// Error Handling
// ========================================================================

void print_error(const char* msg) {
    fprintf(stderr, "error: %s\n", msg);
}

void print_status_error(const char* context, gidkit::core::Status s) {
    fprintf(stderr,
            "error: %s failed (code=%s/%u, domain=%s/%u, aux=%u)\n",
            context,
            gidkit::core::status_code_name(s.code),
            static_cast<unsigned>(s.code),
            gidkit::core::status_domain_name(s.domain),
            static_cast<unsigned>(s.domain),
            s.aux);
}

bool load_config(const gidkit::cli::ParsedOptions& globals, gidkit::cli::CliConfig* cfg) {
    const char* env = std::getenv(gidkit::cli::kMachineTagEnv);
    const gidkit::core::Status s = gidkit::cli::resolve_cli_config(globals, env, cfg);
    if (!gidkit::core::is_ok(s)) {
        fprintf(stderr, "error: %s is not a number: %s\n", gidkit::cli::kMachineTagEnv, env);
        return false;
    }
    if (cfg->source == gidkit::cli::MachineTagSource::Environment) {
        fprintf(stderr, "info: machine tag %llu from %s\n",
                static_cast<unsigned long long>(cfg->machine_tag), gidkit::cli::kMachineTagEnv);
    }
    return true;
}

bool parse_invocation_options(const gidkit::cli::CommandInvocation& inv,
                              gidkit::cli::ParsedOptions* out,
                              gidkit::cli::CliArgs* rest) {
    const gidkit::core::Status s = gidkit::cli::parse_command_options(inv, out, rest);
    if (!gidkit::core::is_ok(s)) {
        fprintf(stderr, "error: %s: bad or unknown option (try 'help')\n", inv.spec->name);
        return false;
    }
    return true;
}

// ========================================================================
// Command Handlers
// ========================================================================

void handle_help() {
    printf("usage: gidkit [-m|--machine <0-1023>] <command> [options]\n");
    printf("\n");
    printf("Commands:\n");
    for (const gidkit::cli::CommandSpec& cmd : gidkit::cli::kCommands) {
        printf("  %-40s %s\n", cmd.usage, cmd.summary);
    }
    printf("\n");
    printf("The machine tag can also be set with %s.\n", gidkit::cli::kMachineTagEnv);
}

int handle_generate(const gidkit::cli::CliConfig& cfg, const gidkit::cli::CommandInvocation& inv) {
    gidkit::cli::ParsedOption buf[kMaxOptions]{};
    gidkit::cli::ParsedOptions opts{buf, 0, kMaxOptions};
    gidkit::cli::CliArgs rest{};
    if (!parse_invocation_options(inv, &opts, &rest)) {
        return EXIT_FAILURE;
    }
    if (rest.argc != 0) {
        print_error("generate: unexpected argument");
        return EXIT_FAILURE;
    }

    const gidkit::core::u64 count = gidkit::cli::option_u64_or(opts, gidkit::cli::OptionId::Count, 1);
    if (count == 0 || count > kMaxGenerateCount) {
        print_error("generate: --count must be between 1 and 1000000");
        return EXIT_FAILURE;
    }

    gidkit::ids::IdGeneratorConfig gen_cfg{};
    gidkit::core::Status s = gidkit::cli::cli_machine_tag(cfg, &gen_cfg.machine_tag);
    if (!gidkit::core::is_ok(s)) {
        fprintf(stderr, "error: machine tag %llu is out of range (0-%u)\n",
                static_cast<unsigned long long>(cfg.machine_tag), gidkit::ids::kMaxMachineTag);
        return EXIT_FAILURE;
    }

    std::unique_ptr<gidkit::ids::IdGenerator> gen;
    s = gidkit::ids::IdGenerator::create(gen_cfg, &gen);
    if (!gidkit::core::is_ok(s)) {
        print_status_error("generator initialization", s);
        return EXIT_FAILURE;
    }

    for (gidkit::core::u64 i = 0; i < count; ++i) {
        printf("%llu\n", static_cast<unsigned long long>(gen->generate()));
    }
    return EXIT_SUCCESS;
}

int handle_inspect(const gidkit::cli::CliArgs& args) {
    gidkit::core::u64 id = 0;
    if (args.argc != 1 || !gidkit::cli::parse_u64_text(args.argv[0], &id)) {
        print_error("inspect: expected one decimal id");
        return EXIT_FAILURE;
    }
    printf("id=%llu\n", static_cast<unsigned long long>(id));
    printf("unix_ms=%lld\n", static_cast<long long>(gidkit::ids::snowflake_unix_ms(id)));
    printf("machine_tag=%u\n", gidkit::ids::snowflake_machine_tag(id));
    printf("sequence=%u\n", gidkit::ids::snowflake_sequence(id));
    return EXIT_SUCCESS;
}

int handle_gid_format(const gidkit::cli::CommandInvocation& inv) {
    gidkit::cli::ParsedOption buf[kMaxOptions]{};
    gidkit::cli::ParsedOptions opts{buf, 0, kMaxOptions};
    gidkit::cli::CliArgs rest{};
    if (!parse_invocation_options(inv, &opts, &rest)) {
        return EXIT_FAILURE;
    }

    const char* type_name = gidkit::cli::option_str_or(opts, gidkit::cli::OptionId::Type, nullptr);
    const auto* id_opt = gidkit::cli::find_option(opts, gidkit::cli::OptionId::Id);
    if (type_name == nullptr || id_opt == nullptr || rest.argc != 0) {
        print_error("gid-format: --type and --id are required");
        return EXIT_FAILURE;
    }

    gidkit::gid::EntityType type{};
    if (!gidkit::gid::entity_type_parse(type_name, &type)) {
        fprintf(stderr, "error: gid-format: unknown entity type %s\n", type_name);
        return EXIT_FAILURE;
    }

    const gidkit::gid::Gid g = gidkit::gid::make_gid(type, id_opt->value.u64v);
    if (gidkit::cli::option_flag(opts, gidkit::cli::OptionId::Compact)) {
        std::string compact;
        const gidkit::core::Status s = gidkit::gid::gid_to_compact(g, &compact);
        if (!gidkit::core::is_ok(s)) {
            print_status_error("gid-format: compact encoding", s);
            return EXIT_FAILURE;
        }
        printf("%s\n", compact.c_str());
    } else {
        printf("%s\n", gidkit::gid::gid_to_string(g).c_str());
    }
    return EXIT_SUCCESS;
}

int handle_gid_parse(const gidkit::cli::CliArgs& args) {
    if (args.argc != 1) {
        print_error("gid-parse: expected one GID");
        return EXIT_FAILURE;
    }

    gidkit::gid::Gid g{};
    gidkit::core::Status s = gidkit::gid::gid_parse(args.argv[0], &g);
    if (s.code == gidkit::core::StatusCode::MissingPrefix) {
        // Not canonical text; try the compact form.
        s = gidkit::gid::gid_parse_compact(args.argv[0], &g);
    }
    if (!gidkit::core::is_ok(s)) {
        print_status_error("gid-parse", s);
        return EXIT_FAILURE;
    }

    const std::string_view name = gidkit::gid::entity_type_name(g.type);
    printf("type=%.*s\n", static_cast<int>(name.size()), name.data());
    printf("id=%llu\n", static_cast<unsigned long long>(g.id));
    return EXIT_SUCCESS;
}

int handle_cursor_encode(const gidkit::cli::CommandInvocation& inv) {
    gidkit::cli::ParsedOption buf[kMaxOptions]{};
    gidkit::cli::ParsedOptions opts{buf, 0, kMaxOptions};
    gidkit::cli::CliArgs rest{};
    if (!parse_invocation_options(inv, &opts, &rest)) {
        return EXIT_FAILURE;
    }

    const auto* at_opt = gidkit::cli::find_option(opts, gidkit::cli::OptionId::CreatedAt);
    const auto* id_opt = gidkit::cli::find_option(opts, gidkit::cli::OptionId::Id);
    if (at_opt == nullptr || id_opt == nullptr || rest.argc != 0) {
        print_error("cursor-encode: --created-at and --id are required");
        return EXIT_FAILURE;
    }

    const gidkit::paging::KeysetCursor c{at_opt->value.i64v, id_opt->value.u64v};
    gidkit::core::Status s = gidkit::paging::keyset_cursor_validate(c);
    if (!gidkit::core::is_ok(s)) {
        print_error("cursor-encode: --created-at and --id must be non-zero");
        return EXIT_FAILURE;
    }

    std::string token;
    s = gidkit::paging::keyset_cursor_codec().encode(c, &token);
    if (!gidkit::core::is_ok(s)) {
        print_status_error("cursor-encode", s);
        return EXIT_FAILURE;
    }
    printf("%s\n", token.c_str());
    return EXIT_SUCCESS;
}

int handle_cursor_decode(const gidkit::cli::CliArgs& args) {
    if (args.argc > 1) {
        print_error("cursor-decode: expected at most one token");
        return EXIT_FAILURE;
    }

    gidkit::paging::KeysetCursor c{};
    bool found = false;
    const gidkit::core::Status s =
        gidkit::paging::keyset_cursor_codec().decode(args.argc == 1 ? args.argv[0] : "", &c, &found);
    if (!gidkit::core::is_ok(s)) {
        print_status_error("cursor-decode", s);
        return EXIT_FAILURE;
    }
    if (!found) {
        printf("no cursor (first page)\n");
        return EXIT_SUCCESS;
    }
    printf("created_at=%lld\n", static_cast<long long>(c.created_at));
    printf("id=%llu\n", static_cast<unsigned long long>(c.id));
    return EXIT_SUCCESS;
}

} // namespace

int main(int argc, char** argv) {
    const gidkit::cli::CliArgs all{argv + 1, argc > 0 ? static_cast<gidkit::core::u32>(argc - 1) : 0u};

    gidkit::cli::ParsedOption buf[kMaxOptions]{};
    gidkit::cli::ParsedOptions globals{buf, 0, kMaxOptions};
    gidkit::core::u32 consumed = 0;
    gidkit::core::Status s = gidkit::cli::parse_options(all,
        gidkit::cli::kGlobalOptions.data(),
        static_cast<gidkit::core::u32>(gidkit::cli::kGlobalOptions.size()),
        &globals,
        &consumed);
    if (!gidkit::core::is_ok(s)) {
        print_status_error("global options", s);
        return EXIT_FAILURE;
    }
    const gidkit::cli::CliArgs rest{all.argv + consumed, all.argc - consumed};

    gidkit::cli::CliConfig cfg{};
    if (!load_config(globals, &cfg)) {
        return EXIT_FAILURE;
    }

    if (rest.argc == 0) {
        handle_help();
        return EXIT_FAILURE;
    }

    gidkit::cli::CommandInvocation inv{};
    s = gidkit::cli::parse_command(rest,
        gidkit::cli::kCommands.data(),
        static_cast<gidkit::core::u32>(gidkit::cli::kCommands.size()),
        &inv,
        &consumed);
    if (!gidkit::core::is_ok(s)) {
        fprintf(stderr, "error: unknown command %s (try 'help')\n", rest.argv[0]);
        return EXIT_FAILURE;
    }

    switch (inv.id) {
        case gidkit::cli::CommandId::Help:
            handle_help();
            return EXIT_SUCCESS;
        case gidkit::cli::CommandId::Generate:
            return handle_generate(cfg, inv);
        case gidkit::cli::CommandId::Inspect:
            return handle_inspect(inv.args);
        case gidkit::cli::CommandId::GidFormat:
            return handle_gid_format(inv);
        case gidkit::cli::CommandId::GidParse:
            return handle_gid_parse(inv.args);
        case gidkit::cli::CommandId::CursorEncode:
            return handle_cursor_encode(inv);
        case gidkit::cli::CommandId::CursorDecode:
            return handle_cursor_decode(inv.args);
        case gidkit::cli::CommandId::None:
            break;
    }
    handle_help();
    return EXIT_FAILURE;
}
