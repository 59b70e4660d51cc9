#pragma once

#include "cancel.hpp"
#include "env.hpp"
#include "invoke.hpp"
#include "output.hpp"
#include "safety.hpp"

#include <glaze/glaze.hpp>

#include <functional>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace sfa {

    enum class option_type { string, number, boolean };

    std::string_view to_string(option_type type);

    // A typed command-line option, also surfaced as a property of the primary tool's schema.
    struct agent_option {
        std::string name{};
        std::optional<char> alias{};
        std::string description{};
        option_type type{option_type::string};
        std::optional<std::string> default_value{};
        bool required{false};
    };

    /*
     * Options or tool arguments as a JSON object.
     *
     * Command-line options are stored with their declared types; tool arguments arrive as whatever
     * the client sent. Accessors return nullopt for absent keys and for values of another type.
     */
    class tool_arguments {
      public:
        tool_arguments();

        // Throws std::runtime_error when `json` is not a JSON object; empty input is an empty object.
        static tool_arguments parse(std::string_view json);

        bool contains(std::string_view key) const;
        std::optional<std::string> get_string(std::string_view key) const;
        std::optional<double> get_number(std::string_view key) const;
        std::optional<bool> get_bool(std::string_view key) const;

        void set(const std::string& key, std::string value);
        void set(const std::string& key, double value);
        void set(const std::string& key, bool value);

        std::string to_json() const;

        const glz::generic& raw() const { return value_; }

      private:
        const glz::generic* find(std::string_view key) const;

        glz::generic value_{};
    };

    struct agent_result {
        std::string text{};
        // Serialized JSON payload; takes precedence over `text` when set.
        std::optional<std::string> json{};
        std::vector<std::string> warnings{};
        std::optional<std::string> error{};

        static agent_result from_text(std::string text);
        static agent_result from_json(std::string json);

        // Text payload or the serialized JSON payload.
        const std::string& payload() const { return json ? *json : text; }
    };

    /*
     * Everything business logic sees during one execution or one tool call.
     *
     * The context borrows the process's safety state, resolved environment and progress emitter,
     * plus the cancel_scope of the unit of work; none of them may be retained past the call.
     */
    class execute_context {
      public:
        execute_context(
                std::string input,
                tool_arguments options,
                std::string agent_name,
                std::string agent_version,
                const safety_state& safety,
                const resolved_env& env,
                const progress_emitter& emitter,
                const cancel_scope& scope);

        const std::string& input() const { return input_; }
        const tool_arguments& options() const { return options_; }
        const resolved_env& env() const { return env_; }

        int depth() const { return safety_.depth; }
        const std::string& session_id() const { return safety_.session_id; }
        const std::string& agent_name() const { return agent_name_; }
        const std::string& agent_version() const { return agent_version_; }

        std::stop_token stop_token() const { return scope_.token(); }
        bool cancelled() const { return scope_.cancelled(); }

        void progress(std::string_view message) const;

        // Subagent call bounded by what is left of this unit of work's deadline.
        invoke_result invoke(std::string_view target_name, const invoke_options& options = {}) const;

      private:
        std::string input_;
        tool_arguments options_;
        std::string agent_name_;
        std::string agent_version_;
        const safety_state& safety_;
        const resolved_env& env_;
        const progress_emitter& emitter_;
        const cancel_scope& scope_;
    };

    using execute_fn = std::function<agent_result(execute_context&)>;

    struct tool_definition {
        std::string name{};
        std::string description{};
        // Raw JSON schema; an empty object schema is advertised when unset.
        std::optional<std::string> input_schema{};
        execute_fn handler{};
    };

    struct agent_definition {
        std::string name{};
        std::string version{"0.1.0"};
        std::string description{};
        // sandboxed | local | network | privileged
        std::string trust_level{"sandboxed"};
        bool context_required{false};
        std::vector<agent_option> options{};
        std::vector<env_declaration> env{};
        std::vector<std::string> examples{};
        bool mcp_supported{false};
        std::vector<tool_definition> tools{};
        execute_fn execute{};
    };

    /*
     * Entry point for an agent's main().
     *
     * Parses the command line, resolves declared environment, initializes and publishes the
     * safety state, then either serves tool calls (--mcp) or runs `execute` once. Returns the
     * process exit code; see sfa::exit_code.
     */
    int run_agent(const agent_definition& definition, int argc, char** argv);

}  // namespace sfa
