#include "sfa/sfa.hpp"

#include <algorithm>
#include <cctype>
#include <condition_variable>
#include <mutex>

using namespace sfa::literals;

namespace {

    constexpr auto text_schema =
            R"json({"type":"object","properties":{"text":{"type":"string","description":"Text to convert"}},"required":["text"]})json";
    constexpr auto sleep_schema =
            R"json({"type":"object","properties":{"seconds":{"type":"number","description":"How long to wait","default":10}}})json";
    constexpr auto invoke_schema =
            R"json({"type":"object","properties":{"target":{"type":"string","description":"Agent to call"},"context":{"type":"string"}},"required":["target"]})json";

    std::string to_upper(std::string text) {
        std::ranges::transform(text, text.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        return text;
    }

    // Returns false when the wait was cut short by cancellation.
    bool wait_for(const sfa::execute_context& ctx, double seconds) {
        auto duration = std::chrono::milliseconds{static_cast<int64_t>(seconds * 1000.0)};
        std::mutex m{};
        std::condition_variable_any cv{};
        std::unique_lock lock{m};
        (void)cv.wait_for(lock, ctx.stop_token(), duration, [] { return false; });
        return !ctx.cancelled();
    }

    sfa::agent_result echo_input(sfa::execute_context& ctx) {
        if (auto delay = ctx.options().get_number("delay"); delay && *delay > 0) {
            ctx.progress("waiting {}s"_format(*delay));
            if (!wait_for(ctx, *delay)) {
                return sfa::agent_result{.error = "echo interrupted"};
            }
        }

        auto text = "Processed: {}"_format(ctx.input());
        if (ctx.options().get_bool("upper").value_or(false)) {
            text = to_upper(std::move(text));
        }

        auto repeat = static_cast<int>(ctx.options().get_number("repeat").value_or(1));
        ctx.progress("echoing {} byte(s) x{} at depth {}"_format(ctx.input().size(), repeat, ctx.depth()));

        std::vector<std::string> lines(static_cast<size_t>(std::max(repeat, 1)), text);
        return sfa::agent_result::from_text(sfa::utils::join_with_separator(lines, "\n"));
    }

    sfa::agent_result uppercase_tool(sfa::execute_context& ctx) {
        auto text = ctx.options().get_string("text");
        if (!text) {
            throw std::runtime_error{"uppercase requires a text argument"};
        }
        return sfa::agent_result::from_text(to_upper(std::move(*text)));
    }

    sfa::agent_result fail_tool(sfa::execute_context&) {
        throw std::runtime_error{"requested failure"};
    }

    sfa::agent_result sleep_tool(sfa::execute_context& ctx) {
        auto seconds = ctx.options().get_number("seconds").value_or(10.0);
        if (!wait_for(ctx, seconds)) {
            ctx.progress("sleep interrupted");
            return sfa::agent_result{.error = "sleep interrupted"};
        }
        return sfa::agent_result::from_text("slept {}s"_format(seconds));
    }

    sfa::agent_result invoke_tool(sfa::execute_context& ctx) {
        auto target = ctx.options().get_string("target");
        if (!target) {
            throw std::runtime_error{"invoke requires a target argument"};
        }
        auto result = ctx.invoke(*target, sfa::invoke_options{.context = ctx.input()});
        if (!result.ok) {
            throw std::runtime_error{"{} exited with code {}: {}"_format(
                    *target, result.exit_code, sfa::utils::trim_view(result.stderr_output))};
        }
        return sfa::agent_result::from_text(std::string{sfa::utils::trim_view(result.output)});
    }

}  // namespace

int main(int argc, char** argv) {
    sfa::agent_definition definition{
            .name = "sfa-echo",
            .version = "0.1.0",
            .description = "Echoes its input context",
            .trust_level = "sandboxed",
            .context_required = false,
            .options =
                    {
                            {.name = "upper",
                             .alias = 'u',
                             .description = "Uppercase the output",
                             .type = sfa::option_type::boolean},
                            {.name = "repeat",
                             .alias = 'r',
                             .description = "Number of output lines",
                             .type = sfa::option_type::number,
                             .default_value = "1"},
                            {.name = "delay",
                             .description = "Seconds to wait before answering",
                             .type = sfa::option_type::number},
                    },
            .env =
                    {
                            {.name = "ECHO_TOKEN",
                             .secret = true,
                             .description = "Masked in progress output and errors"},
                    },
            .examples = {"sfa-echo --context hello", "echo hello | sfa-echo --upper"},
            .mcp_supported = true,
            .tools =
                    {
                            {.name = "uppercase",
                             .description = "Uppercase the given text",
                             .input_schema = text_schema,
                             .handler = uppercase_tool},
                            {.name = "fail", .description = "Always fails", .handler = fail_tool},
                            {.name = "sleep",
                             .description = "Wait for a number of seconds or until cancelled",
                             .input_schema = sleep_schema,
                             .handler = sleep_tool},
                            {.name = "invoke",
                             .description = "Call another agent with the given context",
                             .input_schema = invoke_schema,
                             .handler = invoke_tool},
                    },
            .execute = echo_input,
    };

    return sfa::run_agent(definition, argc, argv);
}
