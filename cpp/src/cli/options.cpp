#include "waypoint/cli/options.hpp"

#include <charconv>
#include <cstring>

namespace waypoint::cli {
    using waypoint::core::Status;
    using waypoint::core::StatusCode;
    using waypoint::core::StatusDomain;

    namespace {
        [[nodiscard]] Status cli_error(StatusCode code, u32 aux = 0) noexcept {
            return waypoint::core::make_status(StatusDomain::Cli, code, aux);
        }

        [[nodiscard]] const OptionSpec* find_long(const OptionSpec* specs, u32 spec_count,
                                                  const char* name, std::size_t name_len) noexcept {
            for (u32 i = 0; i < spec_count; ++i) {
                const char* candidate = specs[i].long_name;
                if (candidate != nullptr && std::strlen(candidate) == name_len
                    && std::strncmp(candidate, name, name_len) == 0) {
                    return &specs[i];
                }
            }
            return nullptr;
        }

        [[nodiscard]] const OptionSpec* find_short(const OptionSpec* specs, u32 spec_count, char c) noexcept {
            for (u32 i = 0; i < spec_count; ++i) {
                if (c != '\0' && specs[i].short_name == c) {
                    return &specs[i];
                }
            }
            return nullptr;
        }

        [[nodiscard]] bool parse_i64(const char* s, i64* out) noexcept {
            const char* end = s + std::strlen(s);
            i64 v{};
            auto r = std::from_chars(s, end, v, 10);
            if (s == end || r.ec != std::errc() || r.ptr != end) {
                return false;
            }
            *out = v;
            return true;
        }

        // Fills opt.value from `value` according to the spec type.
        [[nodiscard]] bool decode_value(const OptionSpec& spec, const char* value, ParsedOption* opt) noexcept {
            switch (spec.type) {
                case OptionType::String:
                    opt->value.str = value;
                    return true;
                case OptionType::I64:
                    return parse_i64(value, &opt->value.i64v);
                case OptionType::Flag:
                    break;
            }
            return false;
        }

        [[nodiscard]] Status push_option(ParsedOptions* out, const ParsedOption& opt) noexcept {
            if (out->data == nullptr || out->len >= out->cap) {
                return cli_error(StatusCode::Unavailable);
            }
            out->data[out->len++] = opt;
            return waypoint::core::ok_status();
        }
    } // namespace

    Status parse_options(const CliArgs& args,
        const OptionSpec* specs,
        u32 spec_count,
        ParsedOptions* out,
        u32* consumed) noexcept {
        if (out == nullptr || consumed == nullptr) {
            return cli_error(StatusCode::Invalid);
        }
        *consumed = 0;
        out->len = 0;

        if ((args.argc > 0 && args.argv == nullptr) || (spec_count > 0 && specs == nullptr)) {
            return cli_error(StatusCode::Invalid);
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

            const u32 at = i;
            const OptionSpec* spec = nullptr;
            const char* inline_value = nullptr;

            if (tok[1] == '-') {
                const char* name = tok + 2;
                const char* eq = std::strchr(name, '=');
                const std::size_t name_len = eq ? static_cast<std::size_t>(eq - name) : std::strlen(name);
                if (name_len == 0) {
                    return cli_error(StatusCode::Invalid, at);
                }
                spec = find_long(specs, spec_count, name, name_len);
                inline_value = eq ? eq + 1 : nullptr;
            } else {
                spec = find_short(specs, spec_count, tok[1]);
                inline_value = tok[2] != '\0' ? tok + 2 : nullptr;
            }
            if (spec == nullptr) {
                return cli_error(StatusCode::Invalid, at);
            }

            ParsedOption opt{};
            opt.id = spec->id;
            opt.type = spec->type;

            if (spec->type == OptionType::Flag) {
                if (inline_value != nullptr) {
                    return cli_error(StatusCode::Invalid, at);
                }
                opt.value.boolv = 1;
                ++i;
            } else {
                const char* value = inline_value;
                if (value == nullptr) {
                    if (i + 1 >= args.argc || args.argv[i + 1] == nullptr) {
                        return cli_error(StatusCode::Invalid, at);
                    }
                    value = args.argv[i + 1];
                    i += 2;
                } else {
                    ++i;
                }
                if (!decode_value(*spec, value, &opt)) {
                    return cli_error(StatusCode::Invalid, at);
                }
            }

            const Status s = push_option(out, opt);
            if (!waypoint::core::is_ok(s)) {
                return s;
            }
        }

        *consumed = i;
        return waypoint::core::ok_status();
    }

    const ParsedOption* find_option(const ParsedOptions& opts, OptionId id) noexcept {
        for (u32 i = opts.len; i > 0; --i) {
            if (opts.data[i - 1].id == id) {
                return &opts.data[i - 1];
            }
        }
        return nullptr;
    }

    bool option_flag(const ParsedOptions& opts, OptionId id) noexcept {
        const ParsedOption* opt = find_option(opts, id);
        return opt != nullptr && opt->type == OptionType::Flag && opt->value.boolv != 0;
    }

    const char* option_str(const ParsedOptions& opts, OptionId id, const char* fallback) noexcept {
        const ParsedOption* opt = find_option(opts, id);
        return (opt != nullptr && opt->type == OptionType::String) ? opt->value.str : fallback;
    }

    i64 option_i64(const ParsedOptions& opts, OptionId id, i64 fallback) noexcept {
        const ParsedOption* opt = find_option(opts, id);
        return (opt != nullptr && opt->type == OptionType::I64) ? opt->value.i64v : fallback;
    }
} // namespace waypoint::cli
