#include "waypoint/cli/commands.hpp"

#include <cstring>

namespace waypoint::cli {
    using waypoint::core::Status;
    using waypoint::core::StatusCode;
    using waypoint::core::StatusDomain;

    namespace {
        [[nodiscard]] bool matches(const CommandSpec& spec, const char* word) noexcept {
            return (spec.name != nullptr && std::strcmp(spec.name, word) == 0)
                || (spec.alias != nullptr && std::strcmp(spec.alias, word) == 0);
        }
    } // namespace

    Status parse_command(const CliArgs& args,
        const CommandSpec* specs,
        u32 spec_count,
        CommandInvocation* out,
        u32* consumed) noexcept {
        if (out == nullptr || consumed == nullptr) {
            return waypoint::core::make_status(StatusDomain::Cli, StatusCode::Invalid);
        }
        *consumed = 0;
        *out = CommandInvocation{};

        if (args.argc == 0 || args.argv == nullptr || args.argv[0] == nullptr) {
            return waypoint::core::make_status(StatusDomain::Cli, StatusCode::Invalid);
        }
        if (spec_count > 0 && specs == nullptr) {
            return waypoint::core::make_status(StatusDomain::Cli, StatusCode::Invalid);
        }

        const char* word = args.argv[0];
        if (word[0] == '-') {
            return waypoint::core::make_status(StatusDomain::Cli, StatusCode::Invalid);
        }

        for (u32 i = 0; i < spec_count; ++i) {
            if (matches(specs[i], word)) {
                out->id = specs[i].id;
                out->args = CliArgs{args.argv + 1, args.argc - 1};
                *consumed = 1;
                return waypoint::core::ok_status();
            }
        }
        return waypoint::core::make_status(StatusDomain::Cli, StatusCode::NotFound);
    }
} // namespace waypoint::cli
