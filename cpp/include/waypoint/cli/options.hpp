#pragma once

#include <type_traits>

#include "waypoint/core/errors.hpp"
#include "waypoint/core/types.hpp"

namespace waypoint::cli {
    using u8 = waypoint::core::u8;
    using u32 = waypoint::core::u32;
    using i64 = waypoint::core::i64;

    struct CliArgs {
        const char* const* argv{nullptr};
        u32 argc{0};
    };

    enum class OptionType : u8 {
        Flag = 0,
        String = 1,
        I64 = 2,
    };

    enum class OptionId : u32 {
        None = 0,
        Home = 1,
        Concurrency = 2,
        Verify = 3,
        Session = 4,
        StateFile = 5,
        FromStep = 6,
        Experiment = 7,
        Output = 8,
        Type = 9,
        Tag = 10,
        Limit = 11,
        NoCache = 12,
        Producer = 13,
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
        u8 boolv;
    };

    struct ParsedOption {
        OptionId id{OptionId::None};
        OptionType type{OptionType::Flag};
        OptionValue value{};
    };

    // Caller-owned storage; parse_options never allocates.
    struct ParsedOptions {
        ParsedOption* data{nullptr};
        u32 len{0};
        u32 cap{0};
    };

    // Consumes leading options (--name, --name=value, --name value, -x,
    // -xvalue, -x value) up to the first operand or "--".
    // {Invalid, Cli} with aux = argv position of the offending token;
    // {Unavailable, Cli} when `out` is full.
    [[nodiscard]] waypoint::core::Status parse_options(const CliArgs& args,
        const OptionSpec* specs,
        u32 spec_count,
        ParsedOptions* out,
        u32* consumed) noexcept;

    // Last occurrence wins; nullptr if absent.
    [[nodiscard]] const ParsedOption* find_option(const ParsedOptions& opts, OptionId id) noexcept;

    [[nodiscard]] bool option_flag(const ParsedOptions& opts, OptionId id) noexcept;
    [[nodiscard]] const char* option_str(const ParsedOptions& opts, OptionId id, const char* fallback = nullptr) noexcept;
    [[nodiscard]] i64 option_i64(const ParsedOptions& opts, OptionId id, i64 fallback) noexcept;

    static_assert(std::is_trivially_copyable_v<CliArgs>);
    static_assert(std::is_trivially_copyable_v<OptionSpec>);
    static_assert(std::is_trivially_copyable_v<ParsedOption>);
    static_assert(std::is_trivially_copyable_v<ParsedOptions>);
    static_assert(std::is_standard_layout_v<CliArgs>);
    static_assert(std::is_standard_layout_v<OptionSpec>);

} // namespace waypoint::cli
