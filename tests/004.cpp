#include "utils.hpp"

namespace sfa::test {
    using namespace std::string_view_literals;

    namespace detail {
        class throwing_recorder final : public execution_recorder {
          public:
            void record(const execution_record&) override { throw std::runtime_error{"disk full"}; }
        };
    }  // namespace detail

    TEST_CASE("004: resolve_env precedence", "[004][env]") {
        std::vector<env_declaration> declarations{
                {.name = "API_KEY", .required = true, .secret = true},
                {.name = "REGION", .default_value = "eu-west-1"},
                {.name = "MODE", .default_value = "fast"},
                {.name = "EMPTY_DEFAULT", .default_value = ""},
                {.name = "UNSET"},
        };
        environment_map process_env{{"API_KEY", "k-123"}, {"MODE", "slow"}, {"REGION", ""}, {"OTHER", "x"}};

        auto resolved = resolve_env(declarations, process_env);

        CHECK(resolved.get("API_KEY") == "k-123");
        CHECK(resolved.get("MODE") == "slow");
        CHECK(resolved.get("REGION") == "eu-west-1");
        CHECK_FALSE(resolved.get("EMPTY_DEFAULT").has_value());
        CHECK_FALSE(resolved.get("UNSET").has_value());
        CHECK_FALSE(resolved.get("OTHER").has_value());

        CHECK(resolved.is_secret("API_KEY"));
        CHECK_FALSE(resolved.is_secret("MODE"));
    }

    TEST_CASE("004: validate_env reports missing required variables", "[004][env]") {
        std::vector<env_declaration> declarations{
                {.name = "API_KEY", .required = true, .description = "Service key"},
                {.name = "TOKEN", .required = true},
                {.name = "OPTIONAL"},
                {.name = "WITH_DEFAULT", .required = true, .default_value = "d"},
        };

        auto resolved = resolve_env(declarations, environment_map{{"TOKEN", "t"}});
        auto missing = validate_env(declarations, resolved);

        REQUIRE(missing.size() == 1);
        CHECK(missing[0].name == "API_KEY");

        CHECK(format_missing_env("alpha", missing) ==
              "Missing required environment variables for alpha:\n  - API_KEY: Service key");

        missing.push_back(declarations[1]);
        CHECK(format_missing_env("alpha", missing) ==
              "Missing required environment variables for alpha:\n  - API_KEY: Service key\n  - TOKEN");
    }

    TEST_CASE("004: mask_secrets replaces every occurrence", "[004][env]") {
        std::vector<env_declaration> declarations{
                {.name = "API_KEY", .secret = true},
                {.name = "REGION"},
        };
        auto resolved = resolve_env(declarations, environment_map{{"API_KEY", "abc"}, {"REGION", "eu"}});

        CHECK(mask_secrets("key=abc again abcabc", resolved) == "key=*** again ******");
        CHECK(mask_secrets("region eu", resolved) == "region eu");
        CHECK(mask_secrets("", resolved).empty());

        SECTION("unset secrets leave text untouched") {
            auto unset = resolve_env(declarations, environment_map{});
            CHECK(mask_secrets("key=abc", unset) == "key=abc");
        }
    }

    TEST_CASE("004: current_environment sees the process environment", "[004][env]") {
        test::detail::scoped_env var{"SFA_TEST_MARKER", "marker=value"};
        auto env = current_environment();

        REQUIRE(env.contains("SFA_TEST_MARKER"));
        CHECK(env.at("SFA_TEST_MARKER") == "marker=value");
    }

    TEST_CASE("004: make_record truncates summaries", "[004][output]") {
        std::string long_input(summary_limit + 20, 'i');
        auto record = make_record(
                "alpha",
                "1.2.3",
                0,
                std::chrono::system_clock::now(),
                1,
                {"root", "alpha"},
                "session",
                long_input,
                "short output");

        CHECK(record.input_summary.size() == summary_limit);
        CHECK(record.output_summary == "short output");
        CHECK(record.call_chain == std::vector<std::string>{"root", "alpha"});
        CHECK(record.meta.empty());
    }

    TEST_CASE("004: stream_recorder writes one JSON object per line", "[004][output]") {
        std::ostringstream os{};
        stream_recorder recorder{os};

        auto record = make_record(
                "alpha", "1.2.3", 3, std::chrono::system_clock::now(), 2, {"root", "alpha"}, "sid", "in", "out");
        record.meta["mcpTool"] = "alpha";
        recorder.record(record);
        recorder.record(record);

        auto lines = test::detail::split_lines(os.str());
        REQUIRE(lines.size() == 2);

        glz::generic parsed{};
        REQUIRE_FALSE(glz::read_json(parsed, lines[0]));
        REQUIRE(parsed.is_object());
        auto& obj = parsed.get_object();

        CHECK(obj.at("agent").get_string() == "alpha");
        CHECK(obj.at("version").get_string() == "1.2.3");
        CHECK(obj.at("exitCode").get_number() == 3);
        CHECK(obj.at("depth").get_number() == 2);
        CHECK(obj.at("sessionId").get_string() == "sid");
        CHECK(obj.at("inputSummary").get_string() == "in");
        CHECK(obj.at("outputSummary").get_string() == "out");
        CHECK(obj.at("durationMs").get_number() >= 0);
        CHECK(obj.at("timestamp").get_string().ends_with("Z"));
        CHECK(obj.at("meta").get_object().at("mcpTool").get_string() == "alpha");
    }

    TEST_CASE("004: recorder failures never propagate", "[004][output]") {
        detail::throwing_recorder recorder{};
        auto record = make_record("alpha", "1", 0, std::chrono::system_clock::now(), 0, {}, "", "", "");

        CHECK_THROWS_AS(recorder.record(record), std::runtime_error);
        CHECK_NOTHROW(record_best_effort(recorder, record));

        null_recorder quiet{};
        CHECK_NOTHROW(record_best_effort(quiet, record));
    }
}  // namespace sfa::test
