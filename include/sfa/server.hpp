#pragma once

#include "agent.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace sfa {

    inline constexpr auto mcp_protocol_version = "2024-11-05"sv;

    enum class server_state { idle, serving, draining, terminated };

    std::string_view to_string(server_state state);

    // Methods the server answers; every other name is unsupported.
    enum class rpc_method { initialize, ping, tools_list, tools_call, notification, unsupported };

    rpc_method classify_method(std::string_view name);

    // Schema of the primary tool: a `context` string plus one property per declared option.
    std::string primary_input_schema(const agent_definition& definition);

    struct server_options {
        // Per-call budget; nullopt disables the per-call timeout.
        std::optional<std::chrono::milliseconds> call_timeout{std::chrono::seconds{default_timeout_seconds}};
        // Upper bound on waiting for in-flight calls once draining starts.
        std::chrono::milliseconds drain_grace{5'000};
        // Start draining on SIGINT/SIGTERM.
        bool handle_signals{true};
    };

    /*
     * Line-delimited JSON-RPC 2.0 tool server.
     *
     * The reader is sequential: initialize, ping and tools/list are answered inline, while each
     * tools/call runs on its own thread with its own cancel_scope. Responses may therefore leave
     * out of arrival order; every response carries its request's id.
     *
     * run() returns after draining: end of input, a signal, or request_shutdown() stops the
     * reader, then in-flight calls get up to drain_grace to finish. After that the output is
     * closed for good and any call still running is cancelled.
     */
    class tool_server {
      public:
        tool_server(
                agent_definition definition,
                safety_state safety,
                resolved_env env,
                std::shared_ptr<execution_recorder> recorder,
                bool quiet,
                server_options options = {});
        ~tool_server();

        tool_server(const tool_server&) = delete;
        tool_server& operator=(const tool_server&) = delete;

        int run(int input_fd, std::ostream& out);

        // Thread-safe; may be called before or during run().
        void request_shutdown();

        server_state state() const;
        size_t in_flight() const;

      private:
        struct shared_state;

        std::shared_ptr<shared_state> shared_;
        int wake_read_{-1};
        int wake_write_{-1};

        void handle_line(const std::shared_ptr<const std::string>& line);
    };

}  // namespace sfa
