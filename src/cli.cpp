#include "sfa/cli.hpp"

#include "sfa/format.hpp"

#include <CLI/CLI.hpp>
#include <glaze/glaze.hpp>

#include <unistd.h>

#include <fstream>
#include <iostream>
#include <iterator>
#include <map>
#include <sstream>

using namespace sfa::literals;

namespace sfa::cli {

    namespace detail {

        using namespace std::string_view_literals;

        // ── --describe document ─────────────────────────────────────────

        struct describe_input {
            bool contextRequired{false};
            std::vector<std::string> accepts{"text", "json"};
            struct glaze {
                using T = describe_input;
                static constexpr auto value =
                        glz::object("contextRequired", &T::contextRequired, "accepts", &T::accepts);
            };
        };

        struct describe_output {
            std::vector<std::string> formats{"text", "json"};
            struct glaze {
                using T = describe_output;
                static constexpr auto value = glz::object(&T::formats);
            };
        };

        struct describe_option {
            std::string name{};
            std::optional<std::string> alias{};
            std::string description{};
            std::string type{};
            std::optional<std::string> default_value{};
            bool required{false};
            struct glaze {
                using T = describe_option;
                static constexpr auto value = glz::object(
                        &T::name,
                        &T::alias,
                        &T::description,
                        &T::type,
                        "default",
                        &T::default_value,
                        &T::required);
            };
        };

        struct describe_env {
            std::string name{};
            bool required{false};
            bool secret{false};
            std::string description{};
            struct glaze {
                using T = describe_env;
                static constexpr auto value = glz::object(&T::name, &T::required, &T::secret, &T::description);
            };
        };

        struct describe_tool {
            std::string name{};
            std::string description{};
            glz::raw_json inputSchema{};
            struct glaze {
                using T = describe_tool;
                static constexpr auto value = glz::object(&T::name, &T::description, "inputSchema", &T::inputSchema);
            };
        };

        struct describe_document {
            std::string name{};
            std::string version{};
            std::string description{};
            std::string trustLevel{};
            std::vector<std::string> capabilities{};
            describe_input input{};
            describe_output output{};
            std::vector<describe_option> options{};
            std::vector<describe_env> env{};
            bool mcpSupported{false};
            std::optional<std::vector<describe_tool>> tools{};
            struct glaze {
                using T = describe_document;
                static constexpr auto value = glz::object(
                        &T::name,
                        &T::version,
                        &T::description,
                        "trustLevel",
                        &T::trustLevel,
                        &T::capabilities,
                        &T::input,
                        &T::output,
                        &T::options,
                        &T::env,
                        "mcpSupported",
                        &T::mcpSupported,
                        &T::tools);
            };
        };

        static constexpr auto empty_object_schema = R"json({"type":"object","properties":{}})json"sv;

        // ── Declared option storage ─────────────────────────────────────

        struct declared_values {
            std::map<std::string, std::string> strings{};
            std::map<std::string, double> numbers{};
            std::map<std::string, bool> flags{};
            std::map<std::string, CLI::Option*> handles{};
        };

        static void add_declared_option(CLI::App& app, const agent_option& opt, declared_values& values) {
            auto names = "--{}"_format(opt.name);
            if (opt.alias) {
                names = "-{},{}"_format(*opt.alias, names);
            }

            CLI::Option* handle = nullptr;
            switch (opt.type) {
                case option_type::string:
                    handle = app.add_option(names, values.strings[opt.name], opt.description);
                    break;
                case option_type::number:
                    handle = app.add_option(names, values.numbers[opt.name], opt.description);
                    break;
                case option_type::boolean:
                    handle = app.add_flag(names, values.flags[opt.name], opt.description);
                    break;
            }
            values.handles.emplace(opt.name, handle);
        }

        static bool apply_default(const agent_option& opt, tool_arguments& options) {
            if (!opt.default_value) {
                return false;
            }
            switch (opt.type) {
                case option_type::string:
                    options.set(opt.name, *opt.default_value);
                    return true;
                case option_type::number:
                    if (auto number = utils::parse_arithmetic<double>(*opt.default_value)) {
                        options.set(opt.name, *number);
                        return true;
                    }
                    write_warning("ignoring non-numeric default for --{}: {}"_format(opt.name, *opt.default_value));
                    return false;
                case option_type::boolean:
                    options.set(opt.name, utils::str_case_eq(*opt.default_value, "true"sv));
                    return true;
            }
            return false;
        }

    }  // namespace detail

    std::string describe(const agent_definition& definition) {
        detail::describe_document doc{};
        doc.name = definition.name;
        doc.version = definition.version;
        doc.description = definition.description;
        doc.trustLevel = definition.trust_level;

        doc.capabilities.emplace_back("cli");
        if (definition.mcp_supported) {
            doc.capabilities.emplace_back("mcp");
        }
        if (!definition.env.empty()) {
            doc.capabilities.emplace_back("env");
        }

        doc.input.contextRequired = definition.context_required;

        for (const auto& opt : definition.options) {
            doc.options.push_back(
                    detail::describe_option{
                            .name = opt.name,
                            .alias = opt.alias ? std::optional{std::string(1, *opt.alias)} : std::nullopt,
                            .description = opt.description,
                            .type = std::string{to_string(opt.type)},
                            .default_value = opt.default_value,
                            .required = opt.required,
                    });
        }

        for (const auto& decl : definition.env) {
            doc.env.push_back(
                    detail::describe_env{
                            .name = decl.name,
                            .required = decl.required,
                            .secret = decl.secret,
                            .description = decl.description,
                    });
        }

        doc.mcpSupported = definition.mcp_supported;
        if (definition.mcp_supported) {
            auto& tools = doc.tools.emplace();
            for (const auto& tool : definition.tools) {
                tools.push_back(
                        detail::describe_tool{
                                .name = tool.name,
                                .description = tool.description,
                                .inputSchema = glz::raw_json{std::string{
                                        tool.input_schema ? *tool.input_schema
                                                          : std::string{detail::empty_object_schema}}},
                        });
            }
        }

        std::string json{};
        if (auto ec = glz::write_json(doc, json)) {
            throw std::runtime_error{"failed to serialize --describe output: {}"_format(glz::format_error(ec, json))};
        }
        return json;
    }

    std::string read_input(const startup_config& cfg) {
        if (cfg.context_file) {
            std::ifstream in{*cfg.context_file};
            if (!in) {
                throw usage_error{"Context file not found: {}"_format(cfg.context_file->string())};
            }
            std::ostringstream buf{};
            buf << in.rdbuf();
            return buf.str();
        }

        if (cfg.context && !cfg.context->empty()) {
            return *cfg.context;
        }

        if (::isatty(STDIN_FILENO) == 0) {
            return std::string{std::istreambuf_iterator<char>{std::cin}, std::istreambuf_iterator<char>{}};
        }

        return {};
    }

    std::optional<int> parse_cli(
            const agent_definition& definition, int argc, char** argv, startup_config& cfg, tool_arguments& options) {
        CLI::App app{definition.description, definition.name};

        bool show_version = false;
        std::string output_arg{std::string{to_string(cfg.output)}};
        std::string context_arg{};
        std::string context_file_arg{};
        int max_depth_arg{0};

        app.add_flag("--version", show_version, "Print version and exit");
        app.add_flag("--describe", cfg.describe, "Print agent metadata as JSON and exit");
        app.add_flag("--verbose", cfg.verbose, "Emit execution records and extra diagnostics on stderr");
        app.add_flag("--quiet", cfg.quiet, "Suppress progress output");
        app.add_option("--output-format", output_arg, "Result format: text|json");
        app.add_option("--timeout", cfg.timeout_seconds, "Execution timeout in seconds, 0 disables")
                ->check(CLI::NonNegativeNumber);
        auto* max_depth_opt = app.add_option("--max-depth", max_depth_arg, "Maximum invocation depth")
                                      ->check(CLI::PositiveNumber);
        auto* context_opt = app.add_option("--context", context_arg, "Input context");
        auto* context_file_opt = app.add_option("--context-file", context_file_arg, "Read input context from a file");
        app.add_flag("--mcp", cfg.mcp, "Serve tool calls over JSON-RPC on stdin/stdout");

        if (!definition.examples.empty()) {
            app.footer("Examples:\n  {}"_format(utils::join_with_separator(definition.examples, "\n  "sv)));
        }

        detail::declared_values values{};
        for (const auto& opt : definition.options) {
            detail::add_declared_option(app, opt, values);
        }

        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            auto code = app.exit(e);
            return std::optional<int>{code == 0 ? exit_code::success : exit_code::invalid_usage};
        }

        if (cfg.quiet && cfg.verbose) {
            write_error("--quiet and --verbose are mutually exclusive");
            return std::optional<int>{exit_code::invalid_usage};
        }

        if (!try_parse_output_format(output_arg, cfg.output)) {
            write_error("invalid --output-format value: {} (expected text|json)"_format(output_arg));
            return std::optional<int>{exit_code::invalid_usage};
        }

        if (max_depth_opt->count() > 0U) {
            cfg.max_depth = max_depth_arg;
        }
        if (context_opt->count() > 0U) {
            cfg.context = context_arg;
        }
        if (context_file_opt->count() > 0U) {
            cfg.context_file = context_file_arg;
        }

        if (show_version) {
            std::cout << definition.name << ' ' << definition.version << '\n';
            return std::optional<int>{exit_code::success};
        }

        if (cfg.describe) {
            std::cout << describe(definition) << '\n';
            return std::optional<int>{exit_code::success};
        }

        std::vector<std::string> missing{};
        for (const auto& opt : definition.options) {
            if (values.handles.at(opt.name)->count() > 0U) {
                switch (opt.type) {
                    case option_type::string:
                        options.set(opt.name, values.strings.at(opt.name));
                        break;
                    case option_type::number:
                        options.set(opt.name, values.numbers.at(opt.name));
                        break;
                    case option_type::boolean:
                        options.set(opt.name, values.flags.at(opt.name));
                        break;
                }
                continue;
            }
            if (detail::apply_default(opt, options)) {
                continue;
            }
            if (opt.required && !cfg.mcp) {
                missing.push_back("--{}"_format(opt.name));
            }
        }

        if (!missing.empty()) {
            write_error("missing required option(s): {}"_format(utils::join_with_separator(missing, ", "sv)));
            return std::optional<int>{exit_code::invalid_usage};
        }

        return std::nullopt;
    }

}  // namespace sfa::cli
