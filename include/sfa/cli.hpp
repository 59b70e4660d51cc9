#pragma once

#include "agent.hpp"
#include "config.hpp"

#include <optional>
#include <string>

namespace sfa::cli {

    /*
     * Fills `cfg` and the declared option values from the command line.
     *
     * Returns an exit code when the process should stop right away: --help, --version,
     * --describe, parse errors and invalid values. Required declared options are only enforced
     * for single execution; in --mcp mode they arrive as tool arguments instead.
     */
    std::optional<int> parse_cli(
            const agent_definition& definition, int argc, char** argv, startup_config& cfg, tool_arguments& options);

    // JSON metadata printed by --describe.
    std::string describe(const agent_definition& definition);

    // Priority: --context-file > --context > piped stdin > empty. Throws usage_error for unreadable files.
    std::string read_input(const startup_config& cfg);

}  // namespace sfa::cli
