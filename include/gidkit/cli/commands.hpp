#pragma once

#include <array>
#include <type_traits>

#include "gidkit/cli/options.hpp"
#include "gidkit/core/errors.hpp"

namespace gidkit::cli {
    using u32 = gidkit::core::u32;

    enum class CommandId : u32 {
        None = 0,
        Help = 1,
        Generate = 2,
        Inspect = 3,
        GidFormat = 4,
        GidParse = 5,
        CursorEncode = 6,
        CursorDecode = 7,
    };

    // A command and the options it accepts after its name. usage and summary
    // feed the help text.
    struct CommandSpec {
        CommandId id{CommandId::None};
        const char* name{nullptr};
        const OptionSpec* options{nullptr};
        u32 option_count{0};
        const char* usage{nullptr};
        const char* summary{nullptr};
    };

    struct CommandInvocation {
        CommandId id{CommandId::None};
        const CommandSpec* spec{nullptr};
        CliArgs args{};
    };

    inline constexpr std::array<OptionSpec, 1> kGenerateOptions = {{
        {OptionId::Count, OptionType::U64, "count", 'n'},
    }};

    inline constexpr std::array<OptionSpec, 3> kGidFormatOptions = {{
        {OptionId::Type, OptionType::String, "type", 't'},
        {OptionId::Id, OptionType::U64, "id", 'i'},
        {OptionId::Compact, OptionType::Flag, "compact", 'c'},
    }};

    inline constexpr std::array<OptionSpec, 2> kCursorEncodeOptions = {{
        {OptionId::CreatedAt, OptionType::I64, "created-at", 'a'},
        {OptionId::Id, OptionType::U64, "id", 'i'},
    }};

    inline constexpr std::array<CommandSpec, 7> kCommands = {{
        {CommandId::Generate, "generate", kGenerateOptions.data(), static_cast<u32>(kGenerateOptions.size()),
            "generate [--count N]", "Mint N ids (default 1)"},
        {CommandId::Inspect, "inspect", nullptr, 0,
            "inspect <id>", "Show timestamp, machine tag and sequence"},
        {CommandId::GidFormat, "gid-format", kGidFormatOptions.data(), static_cast<u32>(kGidFormatOptions.size()),
            "gid-format --type T --id N [--compact]", "Print the GID for (T, N)"},
        {CommandId::GidParse, "gid-parse", nullptr, 0,
            "gid-parse <gid>", "Parse canonical or compact GID text"},
        {CommandId::CursorEncode, "cursor-encode", kCursorEncodeOptions.data(), static_cast<u32>(kCursorEncodeOptions.size()),
            "cursor-encode --created-at T --id N", "Build a pagination cursor"},
        {CommandId::CursorDecode, "cursor-decode", nullptr, 0,
            "cursor-decode [<token>]", "Show the contents of a cursor"},
        {CommandId::Help, "help", nullptr, 0,
            "help", "Show this help"},
    }};

    // argv[0] names the command; the rest is handed back in out->args.
    // Unknown name: (Cli, NotFound). Missing, empty or option-like argv[0]:
    // (Cli, Invalid).
    gidkit::core::Status parse_command(const CliArgs& args,
        const CommandSpec* specs,
        u32 spec_count,
        CommandInvocation* out,
        u32* consumed) noexcept;

    // Parses the invocation's own options against spec->options. *rest gets
    // the positional arguments left after them.
    gidkit::core::Status parse_command_options(const CommandInvocation& inv,
        ParsedOptions* out,
        CliArgs* rest) noexcept;

    static_assert(std::is_trivially_copyable_v<CommandSpec>);
    static_assert(std::is_trivially_copyable_v<CommandInvocation>);
    static_assert(std::is_standard_layout_v<CommandSpec>);
    static_assert(std::is_standard_layout_v<CommandInvocation>);

} // namespace gidkit::cli
