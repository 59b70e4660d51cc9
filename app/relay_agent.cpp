#include "sfa/sfa.hpp"

using namespace sfa::literals;

namespace {

    // Forwards its input to another agent and reports what came back.
    sfa::agent_result relay(sfa::execute_context& ctx) {
        auto target = ctx.options().get_string("target").value_or("");
        if (target.empty()) {
            throw sfa::usage_error{"--target is required"};
        }

        sfa::invoke_options options{.context = ctx.input()};
        if (auto timeout = ctx.options().get_number("child-timeout"); timeout && *timeout > 0) {
            options.timeout = *timeout;
        }

        ctx.progress("relaying to {}"_format(target));
        auto result = ctx.invoke(target, options);

        if (!result.ok) {
            if (result.exit_code == sfa::exit_code::timeout) {
                return sfa::agent_result{.error = "{} timed out"_format(target)};
            }
            return sfa::agent_result{
                    .error = "{} exited with code {}: {}"_format(
                            target, result.exit_code, sfa::utils::trim_view(result.stderr_output))};
        }

        return sfa::agent_result::from_text(std::string{sfa::utils::trim_view(result.output)});
    }

}  // namespace

int main(int argc, char** argv) {
    sfa::agent_definition definition{
            .name = "sfa-relay",
            .version = "0.1.0",
            .description = "Forwards its input to another agent",
            .trust_level = "local",
            .options =
                    {
                            {.name = "target",
                             .alias = 't',
                             .description = "Agent to invoke",
                             .type = sfa::option_type::string,
                             .required = true},
                            {.name = "child-timeout",
                             .description = "Timeout for the invoked agent in seconds",
                             .type = sfa::option_type::number},
                    },
            .examples = {"sfa-relay --target sfa-echo --context hello"},
            .mcp_supported = true,
            .execute = relay,
    };

    return sfa::run_agent(definition, argc, argv);
}
