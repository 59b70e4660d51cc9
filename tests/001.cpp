#include "utils.hpp"

namespace sfa::test {
    using namespace std::string_view_literals;

    TEST_CASE("001: output format parsing", "[001][config]") {
        output_format format = output_format::text;

        REQUIRE(try_parse_output_format("JSON"sv, format));
        CHECK(format == output_format::json);
        REQUIRE(try_parse_output_format("text"sv, format));
        CHECK(format == output_format::text);
        CHECK_FALSE(try_parse_output_format("yaml"sv, format));
        CHECK(format == output_format::text);

        CHECK(to_string(output_format::text) == "text"sv);
        CHECK(to_string(output_format::json) == "json"sv);
    }

    TEST_CASE("001: exit codes and defaults", "[001][config]") {
        CHECK(exit_code::success == 0);
        CHECK(exit_code::failure == 1);
        CHECK(exit_code::invalid_usage == 2);
        CHECK(exit_code::timeout == 3);
        CHECK(exit_code::guardrail == 5);
        CHECK(exit_code::interrupted == 130);
        CHECK(exit_code::terminated == 143);

        startup_config cfg{};
        CHECK(cfg.timeout_seconds == 120);
        CHECK_FALSE(cfg.max_depth.has_value());
        CHECK(cfg.output == output_format::text);
        CHECK(default_max_depth == 5);
    }

    TEST_CASE("001: string helpers", "[001][utils]") {
        CHECK(utils::split(""sv, ',').empty());
        CHECK(utils::split("a"sv, ',') == std::vector<std::string>{"a"});
        CHECK(utils::split("a,b,c"sv, ',') == std::vector<std::string>{"a", "b", "c"});
        CHECK(utils::split("a,,b"sv, ',') == std::vector<std::string>{"a", "", "b"});

        CHECK(utils::join_with_separator({}, ","sv).empty());
        CHECK(utils::join_with_separator({"a", "b"}, ","sv) == "a,b");

        CHECK(utils::trim_view("  x y \r\n"sv) == "x y"sv);
        CHECK(utils::trim_view(" \t "sv).empty());

        CHECK(utils::truncate("abcdef"sv, 3) == "abc");
        CHECK(utils::truncate("ab"sv, 3) == "ab");

        CHECK(utils::parse_arithmetic<int>("42"sv) == 42);
        CHECK_FALSE(utils::parse_arithmetic<int>("4x"sv).has_value());
        CHECK(utils::parse_arithmetic<double>("0.5"sv) == 0.5);

        CHECK(utils::str_case_eq("Json"sv, "jSON"sv));
        CHECK_FALSE(utils::str_case_eq("json"sv, "jsonl"sv));
    }
}  // namespace sfa::test
