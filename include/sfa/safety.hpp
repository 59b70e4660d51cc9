#pragma once

#include "config.hpp"
#include "errors.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace sfa {

    /*
     * Coordination namespace
     *
     * The only ambient values that cross process boundaries. They are read once at startup
     * (coordination_env::capture) and written only when publishing our own state or building a
     * child environment.
     */
    namespace coordination {
        inline constexpr auto prefix = "SFA_"sv;
        inline constexpr auto depth = "SFA_DEPTH"sv;
        inline constexpr auto max_depth = "SFA_MAX_DEPTH"sv;
        inline constexpr auto call_chain = "SFA_CALL_CHAIN"sv;
        inline constexpr auto session_id = "SFA_SESSION_ID"sv;
    }  // namespace coordination

    struct coordination_env {
        std::optional<std::string> depth{};
        std::optional<std::string> max_depth{};
        std::optional<std::string> call_chain{};
        std::optional<std::string> session_id{};

        static coordination_env capture();
    };

    // depth bounds nesting and call_chain bounds cycles; the two are checked independently
    struct safety_state {
        int depth{};
        int max_depth{default_max_depth};
        std::vector<std::string> call_chain{};
        std::string session_id{};
    };

    /*
     * Builds the process-wide state for `agent_name` from inherited coordination data.
     *
     * Throws loop_detected_error when the agent already appears in the inherited chain; the
     * message reports the would-be chain. On success the agent's name is the last chain element.
     * A session id is generated only when none was inherited.
     */
    safety_state init_safety(
            std::string_view agent_name, const coordination_env& inherited, std::optional<int> max_depth_override);

    // Republishes the state into the process environment for children that bypass the invoker.
    void publish_coordination(const safety_state& state);

    void check_depth_limit(const safety_state& state);
    void check_loop(const safety_state& state, std::string_view target_name);

    // The child appends its own name to the chain during its own init_safety.
    safety_state derive_child(const safety_state& state);

    std::vector<std::pair<std::string, std::string>> coordination_variables(const safety_state& state);

    std::string format_chain(const std::vector<std::string>& chain);

    std::string generate_session_id();

}  // namespace sfa
