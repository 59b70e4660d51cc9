#pragma once

#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace sfa {

    using environment_map = std::map<std::string, std::string, std::less<>>;

    // Snapshot of the current process environment.
    environment_map current_environment();

    // An environment variable the agent requires or uses.
    struct env_declaration {
        std::string name{};
        bool required{false};
        bool secret{false};
        std::optional<std::string> default_value{};
        std::string description{};
    };

    struct resolved_env {
        environment_map values{};
        std::set<std::string, std::less<>> secrets{};

        std::optional<std::string> get(std::string_view name) const;
        bool is_secret(std::string_view name) const { return secrets.contains(name); }
    };

    // Precedence: process environment > declared default.
    resolved_env resolve_env(const std::vector<env_declaration>& declarations, const environment_map& process_env);

    // Required declarations without a non-empty resolved value.
    std::vector<env_declaration> validate_env(
            const std::vector<env_declaration>& declarations, const resolved_env& resolved);

    std::string format_missing_env(std::string_view agent_name, const std::vector<env_declaration>& missing);

    // Replaces every non-empty secret value in `text` with "***".
    std::string mask_secrets(std::string text, const resolved_env& resolved);

    /*
     * Generic system variables forwarded to subagents alongside the coordination namespace.
     * Everything else, including agent-declared variables and secrets, stays in this process.
     */
    inline constexpr std::string_view system_env_allow_list[] = {
            "PATH", "HOME", "USER", "SHELL", "TERM", "LANG", "LC_ALL"};

}  // namespace sfa
