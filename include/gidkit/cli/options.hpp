#pragma once

#include <type_traits>

#include "gidkit/core/errors.hpp"
#include "gidkit/core/types.hpp"

namespace gidkit::cli {
    using u8 = gidkit::core::u8;
    using u32 = gidkit::core::u32;
    using u64 = gidkit::core::u64;
    using i64 = gidkit::core::i64;

    struct CliArgs {
        const char* const* argv{nullptr};
        u32 argc{0};
    };

    enum class OptionType : u8 {
        Flag = 0,
        String = 1,
        I64 = 2,
        U64 = 3,
    };

    enum class OptionId : u32 {
        None = 0,
        Machine = 1,
        Count = 2,
        Type = 3,
        Id = 4,
        Compact = 5,
        CreatedAt = 6,
    };

    struct OptionSpec {
        OptionId id{OptionId::None};
        OptionType type{OptionType::Flag};
        const char* long_name{nullptr};
        char short_name{'\0'};
    };

    union OptionValue {
        const char* str;
        i64 i64v;
        u64 u64v;
        u8 boolv;
    };

    struct ParsedOption {
        OptionId id{OptionId::None};
        OptionType type{OptionType::Flag};
        OptionValue value{};
    };

    struct ParsedOptions {
        ParsedOption* data{nullptr};
        u32 len{0};
        u32 cap{0};
    };

    // Consumes leading options from args and stops at the first positional
    // token or after "--". *consumed is the number of argv entries used.
    // Any unknown option, missing value or unparsable number is
    // (Cli, Invalid).
    gidkit::core::Status parse_options(const CliArgs& args,
        const OptionSpec* specs,
        u32 spec_count,
        ParsedOptions* out,
        u32* consumed) noexcept;

    // Last occurrence wins; nullptr when the option was not given.
    [[nodiscard]] const ParsedOption* find_option(const ParsedOptions& opts, OptionId id) noexcept;

    // Typed lookups over find_option. A present option of the wrong type
    // counts as absent.
    [[nodiscard]] u64 option_u64_or(const ParsedOptions& opts, OptionId id, u64 fallback) noexcept;
    [[nodiscard]] const char* option_str_or(const ParsedOptions& opts, OptionId id, const char* fallback) noexcept;
    [[nodiscard]] bool option_flag(const ParsedOptions& opts, OptionId id) noexcept;

    // Plain base-10 digits only: no sign, no whitespace, no overflow.
    [[nodiscard]] bool parse_u64_text(const char* s, u64* out) noexcept;

    static_assert(std::is_trivially_copyable_v<CliArgs>);
    static_assert(std::is_trivially_copyable_v<OptionSpec>);
    static_assert(std::is_trivially_copyable_v<ParsedOption>);
    static_assert(std::is_trivially_copyable_v<ParsedOptions>);
    static_assert(std::is_standard_layout_v<CliArgs>);
    static_assert(std::is_standard_layout_v<OptionSpec>);
    static_assert(std::is_standard_layout_v<ParsedOption>);
    static_assert(std::is_standard_layout_v<ParsedOptions>);

} // namespace gidkit::cli
