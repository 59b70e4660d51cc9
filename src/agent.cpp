#include "sfa/agent.hpp"

#include "sfa/cli.hpp"
#include "sfa/format.hpp"
#include "sfa/server.hpp"

#include <glaze/glaze.hpp>

#include <unistd.h>

#include <atomic>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <thread>

using namespace sfa::literals;
using namespace std::string_view_literals;

namespace sfa {

    namespace detail {

        struct json_output {
            glz::raw_json result{};
            std::vector<std::string> warnings{};
            std::optional<std::string> error{};
            struct glaze {
                using T = json_output;
                static constexpr auto value = glz::object(&T::result, &T::warnings, &T::error);
            };
        };

        static std::optional<std::chrono::milliseconds> timeout_of(const startup_config& cfg) {
            if (cfg.timeout_seconds <= 0) {
                return std::nullopt;
            }
            return std::chrono::seconds{cfg.timeout_seconds};
        }

        static void print_result(
                const startup_config& cfg, const agent_result& result, const std::optional<std::string>& error) {
            if (cfg.output == output_format::json) {
                json_output out{};
                if (error) {
                    out.result = glz::raw_json{std::string{"null"}};
                }
                else if (result.json) {
                    out.result = glz::raw_json{*result.json};
                }
                else {
                    std::string quoted{};
                    if (auto ec = glz::write_json(result.text, quoted)) {
                        throw std::runtime_error{"failed to serialize result text"};
                    }
                    out.result = glz::raw_json{std::move(quoted)};
                }
                out.warnings = result.warnings;
                out.error = error;

                std::string json{};
                if (auto ec = glz::write_json(out, json)) {
                    throw std::runtime_error{"failed to serialize result: {}"_format(glz::format_error(ec, json))};
                }
                std::cout << json << '\n';
                std::cout.flush();
                return;
            }

            for (const auto& warning : result.warnings) {
                write_warning(warning);
            }
            if (error) {
                write_error(*error);
                return;
            }
            std::cout << result.payload() << '\n';
            std::cout.flush();
        }

        static int run_once(
                const agent_definition& definition,
                const startup_config& cfg,
                tool_arguments options,
                const safety_state& safety,
                const resolved_env& env,
                execution_recorder& recorder) {
            auto input = cli::read_input(cfg);
            if (definition.context_required && utils::trim_view(input).empty()) {
                throw usage_error{"{} requires input context (--context, --context-file or stdin)"_format(
                        definition.name)};
            }

            progress_emitter emitter{definition.name, cfg.quiet, &env};
            cancel_scope scope{timeout_of(cfg)};

            // First signal wins; the process is forced down after the grace period if execute lingers.
            std::atomic<int> received{0};
            signal_subscription signals{[&scope, &received, &emitter](int signo) {
                int expected = 0;
                if (!received.compare_exchange_strong(expected, signo)) {
                    return;
                }
                emitter.emit(signo == SIGINT ? "interrupted"sv : "terminating"sv);
                scope.cancel(signo == SIGINT ? cancel_reason::interrupt : cancel_reason::terminate);
                std::thread{[signo] {
                    std::this_thread::sleep_for(signal_grace(signo));
                    child_registry::instance().terminate_all();
                    std::_Exit(signal_exit_code(signo));
                }}.detach();
            }};

            emitter.emit("starting"sv);
            auto start = std::chrono::system_clock::now();
            execute_context ctx{
                    input, std::move(options), definition.name, definition.version, safety, env, emitter, scope};

            agent_result result{};
            std::optional<std::string> error{};
            int code = exit_code::success;
            try {
                result = definition.execute(ctx);
                if (result.error) {
                    error = result.error;
                    code = exit_code::failure;
                }
            } catch (const guardrail_error& e) {
                error = e.what();
                code = exit_code::guardrail;
            } catch (const std::exception& e) {
                error = e.what();
                code = exit_code::failure;
            }

            if (int signo = received.load(); signo != 0) {
                code = signal_exit_code(signo);
                error = std::string{to_string(signo == SIGINT ? cancel_reason::interrupt : cancel_reason::terminate)};
            }
            else if (scope.timed_out()) {
                code = exit_code::timeout;
                error = "Timeout after {}s"_format(cfg.timeout_seconds);
                emitter.emit("timeout after {}s"_format(cfg.timeout_seconds));
            }
            else if (error) {
                emitter.emit("failed"sv);
            }
            else {
                auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                        std::chrono::system_clock::now() - start);
                emitter.emit("completed in {}ms"_format(elapsed.count()));
            }

            auto record = make_record(
                    definition.name,
                    definition.version,
                    code,
                    start,
                    safety.depth,
                    safety.call_chain,
                    safety.session_id,
                    input,
                    error ? *error : result.payload());
            record_best_effort(recorder, record);

            print_result(cfg, result, error ? std::optional{mask_secrets(*error, env)} : std::nullopt);
            return code;
        }

    }  // namespace detail

    std::string_view to_string(option_type type) {
        switch (type) {
            case option_type::string:
                return "string"sv;
            case option_type::number:
                return "number"sv;
            case option_type::boolean:
                return "boolean"sv;
        }
        return "string"sv;
    }

    // ── tool_arguments ──────────────────────────────────────────────

    tool_arguments::tool_arguments() : value_{glz::generic::object_t{}} {}

    tool_arguments tool_arguments::parse(std::string_view json) {
        tool_arguments args{};
        if (utils::trim_view(json).empty()) {
            return args;
        }

        std::string buffer{json};
        glz::generic value{};
        if (auto ec = glz::read_json(value, buffer)) {
            throw std::runtime_error{"invalid tool arguments: {}"_format(glz::format_error(ec, buffer))};
        }
        if (value.is_null()) {
            return args;
        }
        if (!value.is_object()) {
            throw std::runtime_error{"tool arguments must be a JSON object"};
        }
        args.value_ = std::move(value);
        return args;
    }

    const glz::generic* tool_arguments::find(std::string_view key) const {
        if (!value_.is_object()) {
            return nullptr;
        }
        const auto& object = value_.get_object();
        if (auto it = object.find(key); it != object.end()) {
            return &it->second;
        }
        return nullptr;
    }

    bool tool_arguments::contains(std::string_view key) const {
        return find(key) != nullptr;
    }

    std::optional<std::string> tool_arguments::get_string(std::string_view key) const {
        if (const auto* v = find(key); v && v->is_string()) {
            return v->get_string();
        }
        return std::nullopt;
    }

    std::optional<double> tool_arguments::get_number(std::string_view key) const {
        if (const auto* v = find(key); v && v->is_number()) {
            return v->get_number();
        }
        return std::nullopt;
    }

    std::optional<bool> tool_arguments::get_bool(std::string_view key) const {
        if (const auto* v = find(key); v && v->is_boolean()) {
            return v->get_boolean();
        }
        return std::nullopt;
    }

    void tool_arguments::set(const std::string& key, std::string value) {
        value_.get_object()[key] = std::move(value);
    }

    void tool_arguments::set(const std::string& key, double value) {
        value_.get_object()[key] = value;
    }

    void tool_arguments::set(const std::string& key, bool value) {
        value_.get_object()[key] = value;
    }

    std::string tool_arguments::to_json() const {
        std::string json{};
        if (auto ec = glz::write_json(value_, json)) {
            throw std::runtime_error{"failed to serialize tool arguments: {}"_format(glz::format_error(ec, json))};
        }
        return json;
    }

    // ── agent_result ────────────────────────────────────────────────

    agent_result agent_result::from_text(std::string text) {
        return agent_result{.text = std::move(text)};
    }

    agent_result agent_result::from_json(std::string json) {
        return agent_result{.json = std::move(json)};
    }

    // ── execute_context ─────────────────────────────────────────────

    execute_context::execute_context(
            std::string input,
            tool_arguments options,
            std::string agent_name,
            std::string agent_version,
            const safety_state& safety,
            const resolved_env& env,
            const progress_emitter& emitter,
            const cancel_scope& scope)
            : input_{std::move(input)},
              options_{std::move(options)},
              agent_name_{std::move(agent_name)},
              agent_version_{std::move(agent_version)},
              safety_{safety},
              env_{env},
              emitter_{emitter},
              scope_{scope} {}

    void execute_context::progress(std::string_view message) const {
        emitter_.emit(message);
    }

    invoke_result execute_context::invoke(std::string_view target_name, const invoke_options& options) const {
        auto budget = scope_.remaining();
        if (budget && budget->count() <= 0) {
            budget.reset();
        }
        return sfa::invoke(target_name, safety_, budget, scope_.token(), options);
    }

    // ── Runner ──────────────────────────────────────────────────────

    int run_agent(const agent_definition& definition, int argc, char** argv) {
        try {
            startup_config cfg{};
            tool_arguments options{};
            if (auto cli_result = cli::parse_cli(definition, argc, argv, cfg, options)) {
                return *cli_result;
            }

            auto env = resolve_env(definition.env, current_environment());
            if (auto missing = validate_env(definition.env, env); !missing.empty()) {
                write_error(format_missing_env(definition.name, missing));
                return exit_code::invalid_usage;
            }

            auto safety = init_safety(definition.name, coordination_env::capture(), cfg.max_depth);
            publish_coordination(safety);
            debug_log(definition.name, " depth=", safety.depth, " chain=", format_chain(safety.call_chain));

            std::shared_ptr<execution_recorder> recorder{};
            if (cfg.verbose) {
                recorder = std::make_shared<stream_recorder>(std::cerr);
            }
            else {
                recorder = std::make_shared<null_recorder>();
            }

            if (cfg.mcp) {
                if (!definition.mcp_supported) {
                    write_error("{} does not support --mcp"_format(definition.name));
                    return exit_code::invalid_usage;
                }
                tool_server server{
                        definition,
                        std::move(safety),
                        std::move(env),
                        std::move(recorder),
                        cfg.quiet,
                        server_options{.call_timeout = detail::timeout_of(cfg)}};
                return server.run(STDIN_FILENO, std::cout);
            }

            return detail::run_once(definition, cfg, std::move(options), safety, env, *recorder);
        } catch (const guardrail_error& e) {
            write_error(e.what());
            return exit_code::guardrail;
        } catch (const usage_error& e) {
            write_error(e.what());
            return exit_code::invalid_usage;
        } catch (const std::exception& e) {
            write_error(e.what());
            return exit_code::failure;
        }
    }

}  // namespace sfa
