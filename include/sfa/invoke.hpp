#pragma once

#include "env.hpp"
#include "safety.hpp"

#include <sys/types.h>

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <set>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace sfa {

    struct invoke_options {
        // Piped to the child's stdin; empty means the child reads /dev/null.
        std::string context{};
        std::vector<std::string> args{};
        // Seconds; overrides the caller's remaining budget when set.
        std::optional<double> timeout{};
    };

    struct invoke_result {
        bool ok{false};
        int exit_code{};
        std::string output{};
        std::string stderr_output{};
    };

    // Grace window between SIGTERM and SIGKILL once a child outlives its timeout.
    inline constexpr std::chrono::milliseconds kill_grace{5'000};

    /*
     * Process-wide set of live child processes.
     *
     * Every spawned child stays registered until it has been reaped. terminate_all() sends SIGTERM
     * to whatever is still registered; it runs from an atexit hook and from the signal exit path.
     * Best effort only: a parent killed with SIGKILL cannot clean up.
     */
    class child_registry {
      public:
        static child_registry& instance();

        void add(pid_t pid);
        void remove(pid_t pid);
        void terminate_all();

        size_t live_count() const;
        // Number of children ever spawned by this process.
        uint64_t spawned_total() const;

      private:
        child_registry() = default;

        mutable std::mutex mutex_{};
        std::set<pid_t> live_{};
        uint64_t spawned_{};
    };

    /*
     * Environment handed to a subagent: only coordination (SFA_*) variables and the system
     * allow-list survive from `current`, then the coordination values are overwritten with
     * derive_child(caller).
     */
    environment_map build_child_environment(const environment_map& current, const safety_state& caller);

    /*
     * Spawns `target_name` (resolved through PATH) as a subagent and waits for it.
     *
     * Guardrails run first: check_depth_limit, then check_loop; either throws before any process
     * exists. The effective timeout is options.timeout, else `remaining_budget`, else none. On
     * timeout the child gets SIGTERM, then SIGKILL after kill_grace, and the result reports
     * exit_code::timeout. When `cancel` fires the child gets SIGTERM at once.
     *
     * Throws spawn_error when the executable cannot be started.
     */
    invoke_result invoke(
            std::string_view target_name,
            const safety_state& caller,
            std::optional<std::chrono::milliseconds> remaining_budget,
            std::stop_token cancel,
            const invoke_options& options = {});

}  // namespace sfa
