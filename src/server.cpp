#include "sfa/server.hpp"

#include "sfa/format.hpp"

#include <glaze/ext/jsonrpc.hpp>
#include <glaze/glaze.hpp>

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <condition_variable>
#include <csignal>
#include <cstring>
#include <map>
#include <mutex>
#include <system_error>
#include <thread>
#include <vector>

using namespace sfa::literals;
using namespace std::string_view_literals;

namespace sfa {

    namespace detail {

        static constexpr auto jsonrpc_version = "2.0"sv;

        // ── MCP protocol types ──────────────────────────────────────────

        struct server_info {
            std::string name{};
            std::string version{};
            struct glaze {
                using T = server_info;
                static constexpr auto value = glz::object(&T::name, &T::version);
            };
        };

        struct empty_object {
            struct glaze {
                using T = empty_object;
                static constexpr auto value = glz::object();
            };
        };

        struct server_capabilities {
            empty_object tools{};
            struct glaze {
                using T = server_capabilities;
                static constexpr auto value = glz::object(&T::tools);
            };
        };

        struct initialize_result {
            std::string protocolVersion{};
            server_capabilities capabilities{};
            server_info serverInfo{};
            struct glaze {
                using T = initialize_result;
                static constexpr auto value = glz::object(
                        "protocolVersion",
                        &T::protocolVersion,
                        "capabilities",
                        &T::capabilities,
                        "serverInfo",
                        &T::serverInfo);
            };
        };

        struct tool_entry {
            std::string name{};
            std::string description{};
            glz::raw_json inputSchema{};
            struct glaze {
                using T = tool_entry;
                static constexpr auto value = glz::object(&T::name, &T::description, "inputSchema", &T::inputSchema);
            };
        };

        struct tools_list_result {
            std::vector<tool_entry> tools{};
            struct glaze {
                using T = tools_list_result;
                static constexpr auto value = glz::object(&T::tools);
            };
        };

        struct tool_call_params {
            std::string name{};
            glz::raw_json arguments{};
            struct glaze {
                using T = tool_call_params;
                static constexpr auto value = glz::object(&T::name, &T::arguments);
            };
        };

        struct text_content {
            std::string type{"text"};
            std::string text{};
            struct glaze {
                using T = text_content;
                static constexpr auto value = glz::object(&T::type, &T::text);
            };
        };

        struct tool_call_result {
            std::vector<text_content> content{};
            bool isError{false};
            struct glaze {
                using T = tool_call_result;
                static constexpr auto value = glz::object(&T::content, "isError", &T::isError);
            };
        };

        // ── Tool schemas ────────────────────────────────────────────────

        struct schema_property {
            std::string type{};
            std::string description{};
            std::optional<glz::raw_json> default_value{};
            struct glaze {
                using T = schema_property;
                static constexpr auto value = glz::object(&T::type, &T::description, "default", &T::default_value);
            };
        };

        struct object_schema {
            std::string type{"object"};
            std::map<std::string, schema_property> properties{};
            std::optional<std::vector<std::string>> required{};
            struct glaze {
                using T = object_schema;
                static constexpr auto value = glz::object(&T::type, &T::properties, &T::required);
            };
        };

        static constexpr auto empty_object_schema = R"json({"type":"object","properties":{}})json"sv;

        static std::optional<glz::raw_json> schema_default(const agent_option& opt) {
            if (!opt.default_value) {
                return std::nullopt;
            }
            switch (opt.type) {
                case option_type::number:
                    if (utils::parse_arithmetic<double>(*opt.default_value)) {
                        return glz::raw_json{*opt.default_value};
                    }
                    break;
                case option_type::boolean:
                    return glz::raw_json{
                            std::string{utils::str_case_eq(*opt.default_value, "true"sv) ? "true" : "false"}};
                case option_type::string:
                    break;
            }
            std::string quoted{};
            if (auto ec = glz::write_json(*opt.default_value, quoted)) {
                throw std::runtime_error{"failed to serialize default for {}"_format(opt.name)};
            }
            return glz::raw_json{std::move(quoted)};
        }

        // ── Method table ────────────────────────────────────────────────

        struct method_entry {
            std::string_view name;
            rpc_method method;
        };

        static constexpr std::array method_table{
                method_entry{"initialize"sv, rpc_method::initialize},
                method_entry{"ping"sv, rpc_method::ping},
                method_entry{"tools/list"sv, rpc_method::tools_list},
                method_entry{"tools/call"sv, rpc_method::tools_call},
        };

        static constexpr auto notification_prefix = "notifications/"sv;

        // ── Response helpers ────────────────────────────────────────────

        template <typename T>
        static std::string make_response(const glz::rpc::id_t& id, T&& result) {
            glz::rpc::response_t<std::decay_t<T>> resp{};
            resp.id = id;
            resp.result = std::forward<T>(result);
            std::string json{};
            (void)glz::write_json(resp, json);
            return json;
        }

        static std::string make_error_response(
                const glz::rpc::id_t& id, glz::rpc::error_e code, const std::string& message) {
            glz::rpc::response_t<glz::raw_json> resp{};
            resp.id = id;
            resp.error = glz::rpc::error{code, std::nullopt, message};
            std::string json{};
            (void)glz::write_json(resp, json);
            return json;
        }

        static std::string make_call_response(const glz::rpc::id_t& id, std::string text, bool is_error) {
            tool_call_result result{};
            result.content.push_back(text_content{.text = std::move(text)});
            result.isError = is_error;
            return make_response(id, std::move(result));
        }

        static std::string format_seconds(std::chrono::milliseconds ms) {
            if (ms.count() % 1000 == 0) {
                return "{}"_format(ms.count() / 1000);
            }
            return "{}"_format(static_cast<double>(ms.count()) / 1000.0);
        }

    }  // namespace detail

    std::string_view to_string(server_state state) {
        switch (state) {
            case server_state::idle:
                return "idle"sv;
            case server_state::serving:
                return "serving"sv;
            case server_state::draining:
                return "draining"sv;
            case server_state::terminated:
                return "terminated"sv;
        }
        return "idle"sv;
    }

    rpc_method classify_method(std::string_view name) {
        for (const auto& entry : detail::method_table) {
            if (entry.name == name) {
                return entry.method;
            }
        }
        if (name.starts_with(detail::notification_prefix)) {
            return rpc_method::notification;
        }
        return rpc_method::unsupported;
    }

    std::string primary_input_schema(const agent_definition& definition) {
        detail::object_schema schema{};
        schema.properties.emplace(
                "context", detail::schema_property{.type = "string", .description = "Input context for the agent"});

        std::vector<std::string> required{};
        if (definition.context_required) {
            required.emplace_back("context");
        }

        for (const auto& opt : definition.options) {
            schema.properties.insert_or_assign(
                    opt.name,
                    detail::schema_property{
                            .type = std::string{to_string(opt.type)},
                            .description = opt.description,
                            .default_value = detail::schema_default(opt),
                    });
            if (opt.required) {
                required.push_back(opt.name);
            }
        }

        if (!required.empty()) {
            schema.required = std::move(required);
        }

        std::string json{};
        if (auto ec = glz::write_json(schema, json)) {
            throw std::runtime_error{"failed to serialize tool schema: {}"_format(glz::format_error(ec, json))};
        }
        return json;
    }

    // ── Shared server state ─────────────────────────────────────────

    // Owned jointly by the server and every call thread, so a call that outlives run() stays valid.
    struct tool_server::shared_state : std::enable_shared_from_this<shared_state> {
        agent_definition definition;
        safety_state safety;
        resolved_env env;
        std::shared_ptr<execution_recorder> recorder;
        server_options options;
        progress_emitter progress;

        std::stop_source shutdown{};

        mutable std::mutex state_mutex{};
        server_state state{server_state::idle};

        mutable std::mutex flight_mutex{};
        std::condition_variable flight_cv{};
        size_t in_flight{0};

        std::mutex sink_mutex{};
        std::ostream* sink{nullptr};
        bool closed{false};

        shared_state(
                agent_definition def,
                safety_state s,
                resolved_env e,
                std::shared_ptr<execution_recorder> r,
                bool quiet,
                server_options opts)
                : definition{std::move(def)},
                  safety{std::move(s)},
                  env{std::move(e)},
                  recorder{r ? std::move(r) : std::make_shared<null_recorder>()},
                  options{opts},
                  progress{definition.name, quiet, &env} {}

        void set_state(server_state next) {
            std::lock_guard lock{state_mutex};
            debug_log("server state: ", to_string(state), " -> ", to_string(next));
            state = next;
        }

        server_state get_state() const {
            std::lock_guard lock{state_mutex};
            return state;
        }

        void open_sink(std::ostream& out) {
            std::lock_guard lock{sink_mutex};
            sink = &out;
            closed = false;
        }

        void close_sink() {
            std::lock_guard lock{sink_mutex};
            closed = true;
            sink = nullptr;
        }

        void send(const std::string& json) {
            std::lock_guard lock{sink_mutex};
            if (closed || sink == nullptr) {
                debug_log("dropping response after shutdown");
                return;
            }
            *sink << json << '\n';
            sink->flush();
        }

        void begin_call() {
            std::lock_guard lock{flight_mutex};
            ++in_flight;
        }

        void end_call() {
            {
                std::lock_guard lock{flight_mutex};
                --in_flight;
            }
            flight_cv.notify_all();
        }

        // Holds one in-flight slot for as long as it lives.
        class call_slot {
          public:
            explicit call_slot(std::shared_ptr<shared_state> owner) : owner_{std::move(owner)} {
                owner_->begin_call();
            }
            call_slot(call_slot&& other) noexcept = default;
            call_slot& operator=(call_slot&&) = delete;
            call_slot(const call_slot&) = delete;
            call_slot& operator=(const call_slot&) = delete;

            ~call_slot() {
                if (owner_) {
                    owner_->end_call();
                }
            }

            shared_state& owner() const { return *owner_; }

          private:
            std::shared_ptr<shared_state> owner_;
        };

        size_t current_in_flight() const {
            std::lock_guard lock{flight_mutex};
            return in_flight;
        }

        bool wait_drained(std::chrono::milliseconds grace) {
            std::unique_lock lock{flight_mutex};
            return flight_cv.wait_for(lock, grace, [this] { return in_flight == 0; });
        }

        // ── Handlers ────────────────────────────────────────────────

        std::string handle_initialize(const glz::rpc::id_t& id) const {
            detail::initialize_result result{};
            result.protocolVersion = std::string{mcp_protocol_version};
            result.serverInfo = detail::server_info{.name = definition.name, .version = definition.version};
            return detail::make_response(id, std::move(result));
        }

        std::string handle_tools_list(const glz::rpc::id_t& id) const {
            detail::tools_list_result result{};
            result.tools.push_back(
                    detail::tool_entry{
                            .name = definition.name,
                            .description = definition.description,
                            .inputSchema = glz::raw_json{primary_input_schema(definition)},
                    });
            for (const auto& tool : definition.tools) {
                result.tools.push_back(
                        detail::tool_entry{
                                .name = tool.name,
                                .description = tool.description,
                                .inputSchema = glz::raw_json{std::string{
                                        tool.input_schema ? *tool.input_schema
                                                          : std::string{detail::empty_object_schema}}},
                        });
            }
            return detail::make_response(id, std::move(result));
        }

        const execute_fn* find_handler(std::string_view tool_name) const {
            if (tool_name == definition.name) {
                return &definition.execute;
            }
            for (const auto& tool : definition.tools) {
                if (tool.name == tool_name) {
                    return &tool.handler;
                }
            }
            return nullptr;
        }

        void handle_tools_call(
                const std::shared_ptr<const std::string>& line,
                const glz::rpc::id_t& id,
                bool respond,
                glz::raw_json_view raw_params) {
            detail::tool_call_params params{};
            if (auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(params, raw_params.str)) {
                if (respond) {
                    send(detail::make_error_response(
                            id, glz::rpc::error_e::invalid_params, "Failed to parse tool call params"));
                }
                return;
            }

            const auto* handler = find_handler(params.name);
            if (handler == nullptr) {
                if (respond) {
                    send(detail::make_error_response(
                            id, glz::rpc::error_e::invalid_params, "Unknown tool: {}"_format(params.name)));
                }
                return;
            }

            tool_arguments arguments{};
            try {
                arguments = tool_arguments::parse(params.arguments.str);
            } catch (const std::runtime_error& e) {
                if (respond) {
                    send(detail::make_error_response(id, glz::rpc::error_e::invalid_params, e.what()));
                }
                return;
            }

            try {
                std::thread{[slot = call_slot{shared_from_this()},
                             line,
                             id,
                             respond,
                             handler,
                             tool_name = std::move(params.name),
                             arguments = std::move(arguments)]() mutable {
                    slot.owner().run_call(id, respond, *handler, tool_name, std::move(arguments));
                }}.detach();
            } catch (const std::system_error& e) {
                if (respond) {
                    send(detail::make_call_response(id, "failed to start tool call: {}"_format(e.what()), true));
                }
            }
        }

        void run_call(
                const glz::rpc::id_t& id,
                bool respond,
                const execute_fn& handler,
                const std::string& tool_name,
                tool_arguments arguments) {
            auto start = std::chrono::system_clock::now();
            auto input = arguments.get_string("context").value_or("");

            std::string text{};
            bool is_error = false;
            {
                cancel_scope scope{options.call_timeout, shutdown.get_token()};
                execute_context ctx{
                        input,
                        std::move(arguments),
                        definition.name,
                        definition.version,
                        safety,
                        env,
                        progress,
                        scope};

                try {
                    auto result = handler(ctx);
                    if (result.error) {
                        text = *result.error;
                        is_error = true;
                    }
                    else {
                        text = result.payload();
                    }
                } catch (const std::exception& e) {
                    text = e.what();
                    is_error = true;
                } catch (...) {
                    text = "unknown error";
                    is_error = true;
                }

                if (scope.timed_out()) {
                    text = "Timeout after {}s"_format(detail::format_seconds(*options.call_timeout));
                    is_error = true;
                }
                else if (auto reason = scope.reason()) {
                    text = "Cancelled: {}"_format(to_string(*reason));
                    is_error = true;
                }

                int code = exit_code::success;
                if (scope.timed_out()) {
                    code = exit_code::timeout;
                }
                else if (is_error) {
                    code = exit_code::failure;
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
                        text);
                record.meta.emplace("mcpTool", tool_name);
                record_best_effort(*recorder, record);
            }

            if (respond) {
                send(detail::make_call_response(id, std::move(text), is_error));
            }
        }
    };

    // ── Server ──────────────────────────────────────────────────────

    tool_server::tool_server(
            agent_definition definition,
            safety_state safety,
            resolved_env env,
            std::shared_ptr<execution_recorder> recorder,
            bool quiet,
            server_options options)
            : shared_{std::make_shared<shared_state>(
                      std::move(definition), std::move(safety), std::move(env), std::move(recorder), quiet, options)} {
        int fds[2]{};
        if (::pipe2(fds, O_CLOEXEC | O_NONBLOCK) != 0) {
            throw std::system_error{errno, std::generic_category(), "tool server wake pipe"};
        }
        wake_read_ = fds[0];
        wake_write_ = fds[1];
    }

    tool_server::~tool_server() {
        ::close(wake_read_);
        ::close(wake_write_);
    }

    void tool_server::request_shutdown() {
        char byte = 1;
        [[maybe_unused]] auto n = ::write(wake_write_, &byte, 1);
    }

    server_state tool_server::state() const {
        return shared_->get_state();
    }

    size_t tool_server::in_flight() const {
        return shared_->current_in_flight();
    }

    void tool_server::handle_line(const std::shared_ptr<const std::string>& line) {
        if (utils::trim_view(*line).empty()) {
            return;
        }

        // ids and params are views into *line, which call threads keep alive
        glz::rpc::generic_request_t request{};
        if (auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(request, *line)) {
            debug_log("dropping malformed line: ", glz::format_error(ec, *line));
            return;
        }
        if (request.version != detail::jsonrpc_version) {
            debug_log("dropping message with jsonrpc version '", request.version, "'");
            return;
        }
        if (request.method.empty()) {
            debug_log("dropping message without method");
            return;
        }

        bool respond = !std::holds_alternative<glz::generic::null_t>(request.id);

        switch (classify_method(request.method)) {
            case rpc_method::initialize:
                if (respond) {
                    shared_->send(shared_->handle_initialize(request.id));
                }
                break;
            case rpc_method::ping:
                if (respond) {
                    shared_->send(detail::make_response(request.id, detail::empty_object{}));
                }
                break;
            case rpc_method::tools_list:
                if (respond) {
                    shared_->send(shared_->handle_tools_list(request.id));
                }
                break;
            case rpc_method::tools_call:
                shared_->handle_tools_call(line, request.id, respond, request.params);
                break;
            case rpc_method::notification:
                break;
            case rpc_method::unsupported:
                if (respond) {
                    shared_->send(detail::make_error_response(
                            request.id,
                            glz::rpc::error_e::method_not_found,
                            "Method not found: {}"_format(request.method)));
                }
                break;
        }
    }

    int tool_server::run(int input_fd, std::ostream& out) {
        static std::once_flag sigpipe_once{};
        std::call_once(sigpipe_once, [] { ::signal(SIGPIPE, SIG_IGN); });

        shared_->open_sink(out);
        shared_->set_state(server_state::serving);
        shared_->progress.emit("MCP server started");

        std::optional<signal_subscription> signals{};
        if (shared_->options.handle_signals) {
            signals.emplace([this](int signo) {
                debug_log("tool server received signal ", signo);
                request_shutdown();
            });
        }

        std::string buffer{};
        for (;;) {
            pollfd fds[2]{};
            fds[0] = {.fd = input_fd, .events = POLLIN, .revents = 0};
            fds[1] = {.fd = wake_read_, .events = POLLIN, .revents = 0};

            int ret = ::poll(fds, 2, -1);
            if (ret < 0) {
                if (errno == EINTR) {
                    continue;
                }
                debug_log("poll failed: ", std::strerror(errno));
                break;
            }

            if ((fds[1].revents & POLLIN) != 0) {
                debug_log("shutdown requested");
                break;
            }

            if ((fds[0].revents & (POLLIN | POLLHUP | POLLERR)) == 0) {
                continue;
            }

            char chunk[4096]{};
            auto n = ::read(input_fd, chunk, sizeof(chunk));
            if (n < 0) {
                if (errno == EINTR || errno == EAGAIN) {
                    continue;
                }
                debug_log("read failed: ", std::strerror(errno));
                break;
            }
            if (n == 0) {
                // a trailing partial line is dropped
                break;
            }

            buffer.append(chunk, static_cast<size_t>(n));
            for (auto pos = buffer.find('\n'); pos != std::string::npos; pos = buffer.find('\n')) {
                auto line = std::make_shared<const std::string>(buffer.substr(0, pos));
                buffer.erase(0, pos + 1);
                handle_line(line);
            }
        }

        shared_->set_state(server_state::draining);
        shared_->progress.emit("MCP server shutting down");
        if (!shared_->wait_drained(shared_->options.drain_grace)) {
            write_warning("{} tool call(s) still running after {}ms; cancelling"_format(
                    shared_->current_in_flight(), shared_->options.drain_grace.count()));
        }

        shared_->close_sink();
        shared_->set_state(server_state::terminated);
        shared_->shutdown.request_stop();

        return exit_code::success;
    }

}  // namespace sfa
