#include "gidkit/cli/options.hpp"

#include <charconv>
#include <cstring>

namespace gidkit::cli {
    namespace {
        [[nodiscard]] gidkit::core::Status cli_invalid() noexcept {
            return gidkit::core::make_status(gidkit::core::StatusDomain::Cli, gidkit::core::StatusCode::Invalid);
        }

        [[nodiscard]] const OptionSpec* find_long(const OptionSpec* specs, u32 spec_count,
            const char* name, size_t name_len) noexcept {
            for (u32 i = 0; i < spec_count; ++i) {
                const OptionSpec& s = specs[i];
                if (s.long_name != nullptr && std::strlen(s.long_name) == name_len &&
                    std::strncmp(s.long_name, name, name_len) == 0) {
                    return &s;
                }
            }
            return nullptr;
        }

        [[nodiscard]] const OptionSpec* find_short(const OptionSpec* specs, u32 spec_count, char c) noexcept {
            if (c == '\0') {
                return nullptr;
            }
            for (u32 i = 0; i < spec_count; ++i) {
                if (specs[i].short_name == c) {
                    return &specs[i];
                }
            }
            return nullptr;
        }

        template <typename T>
        [[nodiscard]] bool parse_int(const char* s, T* out) noexcept {
            const char* end = s + std::strlen(s);
            if (s == end) {
                return false;
            }
            T v{};
            auto r = std::from_chars(s, end, v, 10);
            if (r.ec != std::errc() || r.ptr != end) {
                return false;
            }
            *out = v;
            return true;
        }

        [[nodiscard]] bool assign_value(const OptionSpec& spec, const char* value, ParsedOption* opt) noexcept {
            switch (spec.type) {
            case OptionType::String:
                opt->value.str = value;
                return true;
            case OptionType::I64:
                return parse_int(value, &opt->value.i64v);
            case OptionType::U64:
                return parse_int(value, &opt->value.u64v);
            case OptionType::Flag:
                return false;
            }
            return false;
        }

        [[nodiscard]] gidkit::core::Status push_option(ParsedOptions* out, const ParsedOption& opt) noexcept {
            if (out->cap == 0 || out->data == nullptr || out->len >= out->cap) {
                return cli_invalid();
            }
            out->data[out->len++] = opt;
            return gidkit::core::ok_status();
        }
    } // namespace

    gidkit::core::Status parse_options(const CliArgs& args,
        const OptionSpec* specs,
        u32 spec_count,
        ParsedOptions* out,
        u32* consumed) noexcept {
        if (out == nullptr || consumed == nullptr) {
            return cli_invalid();
        }
        *consumed = 0;
        out->len = 0;

        if (args.argc > 0 && args.argv == nullptr) {
            return cli_invalid();
        }
        if (spec_count > 0 && specs == nullptr) {
            return cli_invalid();
        }

        u32 i = 0;
        while (i < args.argc) {
            const char* tok = args.argv[i];
            if (tok == nullptr || tok[0] != '-' || tok[1] == '\0') {
                break;
            }
            if (std::strcmp(tok, "--") == 0) {
                ++i;
                break;
            }

            const OptionSpec* spec = nullptr;
            const char* inline_value = nullptr;
            if (tok[1] == '-') {
                // --name or --name=value
                const char* name = tok + 2;
                const char* eq = std::strchr(name, '=');
                const size_t name_len = eq != nullptr ? static_cast<size_t>(eq - name) : std::strlen(name);
                if (name_len == 0) {
                    return cli_invalid();
                }
                spec = find_long(specs, spec_count, name, name_len);
                if (eq != nullptr) {
                    inline_value = eq + 1;
                }
            } else {
                // -x or -xVALUE
                spec = find_short(specs, spec_count, tok[1]);
                if (tok[2] != '\0') {
                    inline_value = tok + 2;
                }
            }
            if (spec == nullptr) {
                return cli_invalid();
            }

            ParsedOption opt{};
            opt.id = spec->id;
            opt.type = spec->type;

            if (spec->type == OptionType::Flag) {
                if (inline_value != nullptr) {
                    return cli_invalid();
                }
                opt.value.boolv = 1;
                ++i;
            } else {
                const char* value = inline_value;
                if (value == nullptr) {
                    if (i + 1 >= args.argc || args.argv[i + 1] == nullptr) {
                        return cli_invalid();
                    }
                    value = args.argv[i + 1];
                    i += 2;
                } else {
                    ++i;
                }
                if (!assign_value(*spec, value, &opt)) {
                    return cli_invalid();
                }
            }

            const gidkit::core::Status s = push_option(out, opt);
            if (!gidkit::core::is_ok(s)) {
                return s;
            }
        }

        *consumed = i;
        return gidkit::core::ok_status();
    }

    const ParsedOption* find_option(const ParsedOptions& opts, OptionId id) noexcept {
        const ParsedOption* found = nullptr;
        for (u32 i = 0; i < opts.len; ++i) {
            if (opts.data[i].id == id) {
                found = &opts.data[i];
            }
        }
        return found;
    }

    u64 option_u64_or(const ParsedOptions& opts, OptionId id, u64 fallback) noexcept {
        const ParsedOption* opt = find_option(opts, id);
        if (opt == nullptr || opt->type != OptionType::U64) {
            return fallback;
        }
        return opt->value.u64v;
    }

    const char* option_str_or(const ParsedOptions& opts, OptionId id, const char* fallback) noexcept {
        const ParsedOption* opt = find_option(opts, id);
        if (opt == nullptr || opt->type != OptionType::String) {
            return fallback;
        }
        return opt->value.str;
    }

    bool option_flag(const ParsedOptions& opts, OptionId id) noexcept {
        const ParsedOption* opt = find_option(opts, id);
        return opt != nullptr && opt->type == OptionType::Flag && opt->value.boolv != 0;
    }

    bool parse_u64_text(const char* s, u64* out) noexcept {
        if (s == nullptr || out == nullptr) {
            return false;
        }
        return parse_int(s, out);
    }
} // namespace gidkit::cli
