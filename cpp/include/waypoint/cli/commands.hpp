#pragma once

#include <type_traits>

#include "waypoint/cli/options.hpp"
#include "waypoint/core/errors.hpp"

namespace waypoint::cli {
    using u32 = waypoint::core::u32;

    enum class CommandId : u32 {
        None = 0,
        Help = 1,
        Run = 2,
        Resume = 3,
        Analyze = 4,
        Put = 5,
        Get = 6,
        Verify = 7,
        List = 8,
        Manifest = 9,
    };

    struct CommandSpec {
        CommandId id{CommandId::None};
        const char* name{nullptr};
        const char* alias{nullptr};
    };

    struct CommandInvocation {
        CommandId id{CommandId::None};
        CliArgs args{};  // tokens after the command name
    };

    // Matches args.argv[0] against name or alias.
    // {NotFound, Cli} for an unknown command, {Invalid, Cli} for no command.
    [[nodiscard]] waypoint::core::Status parse_command(const CliArgs& args,
        const CommandSpec* specs,
        u32 spec_count,
        CommandInvocation* out,
        u32* consumed) noexcept;

    static_assert(std::is_trivially_copyable_v<CommandSpec>);
    static_assert(std::is_trivially_copyable_v<CommandInvocation>);
    static_assert(std::is_standard_layout_v<CommandSpec>);
    static_assert(std::is_standard_layout_v<CommandInvocation>);

} // namespace waypoint::cli
