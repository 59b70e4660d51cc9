#pragma once

#include "utils.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace sfa {

    using namespace std::string_view_literals;

    /*
     * Agent Startup Config Options
     *
     * Output and UX
     * - output: Result shape on stdout ("text" or "json").
     * - quiet: Suppress progress lines on stderr.
     * - verbose: Emit execution records and extra diagnostics on stderr.
     *
     * Input
     * - context: Inline input context (--context).
     * - context_file: Read input context from a file (--context-file).
     *
     * Safety and resource limits
     * - timeout_seconds: Wall-time budget for one execution or one tool call; 0 disables it.
     * - max_depth: Explicit max invocation depth; overrides the inherited SFA_MAX_DEPTH.
     *
     * Modes (one-shot startup actions)
     * - mcp: Serve JSON-RPC tool calls on stdin/stdout instead of running once.
     * - describe: Print JSON metadata for the agent and exit.
     */

    enum class output_format { text, json };

    // Process exit codes shared by every agent
    namespace exit_code {
        inline constexpr int success = 0;
        inline constexpr int failure = 1;
        inline constexpr int invalid_usage = 2;
        inline constexpr int timeout = 3;
        inline constexpr int guardrail = 5;
        inline constexpr int interrupted = 130;
        inline constexpr int terminated = 143;
    }  // namespace exit_code

    inline constexpr int default_max_depth = 5;
    inline constexpr int default_timeout_seconds = 120;

    inline constexpr std::string_view to_string(output_format format) {
        switch (format) {
            case output_format::text:
                return "text"sv;
            case output_format::json:
                return "json"sv;
        }
        return "text"sv;
    }

    inline constexpr bool try_parse_output_format(std::string_view text, output_format& out) {
        if (utils::str_case_eq(text, "text"sv)) {
            out = output_format::text;
            return true;
        }
        if (utils::str_case_eq(text, "json"sv)) {
            out = output_format::json;
            return true;
        }
        return false;
    }

    struct startup_config {
        output_format output{output_format::text};
        bool quiet{false};
        bool verbose{false};

        std::optional<std::string> context{};
        std::optional<std::filesystem::path> context_file{};

        int timeout_seconds{default_timeout_seconds};
        std::optional<int> max_depth{};

        bool mcp{false};
        bool describe{false};
    };

}  // namespace sfa
