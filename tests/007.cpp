#include "utils.hpp"

namespace sfa::test {
    using namespace std::chrono_literals;
    using namespace std::string_view_literals;
    using namespace sfa::literals;

    namespace detail {
        class collecting_recorder final : public execution_recorder {
          public:
            void record(const execution_record& entry) override {
                std::lock_guard lock{mutex_};
                records_.push_back(entry);
            }

            std::vector<execution_record> records() const {
                std::lock_guard lock{mutex_};
                return records_;
            }

          private:
            mutable std::mutex mutex_{};
            std::vector<execution_record> records_{};
        };

        inline agent_definition server_definition() {
            return agent_definition{
                    .name = "sample",
                    .version = "2.0.0",
                    .description = "Sample server agent",
                    .options = {{.name = "upper", .type = option_type::boolean}},
                    .mcp_supported = true,
                    .tools =
                            {
                                    {.name = "boom",
                                     .description = "Throws",
                                     .handler = [](execute_context&) -> agent_result {
                                         throw std::runtime_error{"kaboom"};
                                     }},
                                    {.name = "soft-fail",
                                     .description = "Returns an error result",
                                     .handler = [](execute_context&) { return agent_result{.error = "not today"}; }},
                                    {.name = "nap",
                                     .description = "Sleeps for `ms` milliseconds",
                                     .handler =
                                             [](execute_context& ctx) {
                                                 auto ms = ctx.options().get_number("ms").value_or(100);
                                                 std::this_thread::sleep_for(
                                                         std::chrono::milliseconds{static_cast<int64_t>(ms)});
                                                 return agent_result::from_text("rested {}ms"_format(ms));
                                             }},
                                    {.name = "block",
                                     .description = "Waits until cancelled",
                                     .handler =
                                             [](execute_context& ctx) {
                                                 std::mutex m{};
                                                 std::condition_variable_any cv{};
                                                 std::unique_lock lock{m};
                                                 (void)cv.wait_for(lock, ctx.stop_token(), 10s, [] { return false; });
                                                 return agent_result::from_text("unblocked");
                                             }},
                            },
                    .execute =
                            [](execute_context& ctx) {
                                auto text = "Processed: {}"_format(ctx.input());
                                if (ctx.options().get_bool("upper").value_or(false)) {
                                    std::ranges::transform(text, text.begin(), [](unsigned char c) {
                                        return static_cast<char>(std::toupper(c));
                                    });
                                }
                                return agent_result::from_text(std::move(text));
                            },
            };
        }

        // Feeds `requests`, closes the input and serves until the server has drained.
        inline std::vector<std::string> serve(
                const std::vector<std::string>& requests,
                server_options options = {.handle_signals = false},
                std::shared_ptr<execution_recorder> recorder = nullptr) {
            test::detail::pipe_fds input{};
            for (const auto& request : requests) {
                input.send_line(request);
            }
            input.close_write();

            std::ostringstream out{};
            tool_server server{
                    server_definition(), test::detail::make_caller(), resolved_env{}, std::move(recorder), true, options};
            CHECK(server.state() == server_state::idle);
            CHECK(server.run(input.read, out) == exit_code::success);
            CHECK(server.state() == server_state::terminated);
            CHECK(server.in_flight() == 0);
            return test::detail::split_lines(out.str());
        }

        inline std::string call(int id, std::string_view tool, std::string_view arguments) {
            return R"({{"jsonrpc":"2.0","id":{},"method":"tools/call","params":{{"name":"{}","arguments":{}}}}})"_format(
                    id, tool, arguments);
        }
    }  // namespace detail

    TEST_CASE("007: method classification", "[007][server]") {
        CHECK(classify_method("initialize") == rpc_method::initialize);
        CHECK(classify_method("ping") == rpc_method::ping);
        CHECK(classify_method("tools/list") == rpc_method::tools_list);
        CHECK(classify_method("tools/call") == rpc_method::tools_call);
        CHECK(classify_method("notifications/initialized") == rpc_method::notification);
        CHECK(classify_method("resources/list") == rpc_method::unsupported);
        CHECK(classify_method("") == rpc_method::unsupported);

        CHECK(to_string(server_state::idle) == "idle"sv);
        CHECK(to_string(server_state::draining) == "draining"sv);
    }

    TEST_CASE("007: initialize, ping and tools/list", "[007][server]") {
        auto lines = detail::serve({
                R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{"protocolVersion":"2024-11-05"}})",
                R"({"jsonrpc":"2.0","method":"notifications/initialized"})",
                R"({"jsonrpc":"2.0","id":2,"method":"ping"})",
                R"({"jsonrpc":"2.0","id":3,"method":"tools/list"})",
        });

        REQUIRE(lines.size() == 3);

        auto init = test::detail::response_for(lines, 1);
        CHECK(test::detail::contains(init, R"("protocolVersion":"2024-11-05")"));
        CHECK(test::detail::contains(init, R"("serverInfo":{"name":"sample","version":"2.0.0"})"));
        CHECK(test::detail::contains(init, R"("capabilities":{"tools":{}})"));

        CHECK(test::detail::contains(test::detail::response_for(lines, 2), R"("result":{})"));

        auto list = test::detail::response_for(lines, 3);
        glz::generic parsed{};
        REQUIRE_FALSE(glz::read_json(parsed, list));
        const auto& tools = parsed.get_object().at("result").get_object().at("tools").get_array();
        REQUIRE(tools.size() == 5);
        CHECK(tools[0].get_object().at("name").get_string() == "sample");
        CHECK(tools[0]
                      .get_object()
                      .at("inputSchema")
                      .get_object()
                      .at("properties")
                      .get_object()
                      .contains("context"));
        CHECK(tools[1].get_object().at("name").get_string() == "boom");
        const auto& aux_schema = tools[1].get_object().at("inputSchema").get_object();
        CHECK(aux_schema.at("type").get_string() == "object");
        CHECK(aux_schema.at("properties").get_object().empty());
    }

    TEST_CASE("007: tools/call runs the primary tool", "[007][server]") {
        auto recorder = std::make_shared<detail::collecting_recorder>();
        auto lines = detail::serve(
                {detail::call(1, "sample", R"({"context":"hello"})"),
                 detail::call(2, "sample", R"({"context":"hello","upper":true})")},
                {.handle_signals = false},
                recorder);

        REQUIRE(lines.size() == 2);
        auto plain = test::detail::response_for(lines, 1);
        CHECK(test::detail::contains(plain, R"("text":"Processed: hello")"));
        CHECK(test::detail::contains(plain, R"("isError":false)"));
        CHECK(test::detail::contains(plain, R"("type":"text")"));

        CHECK(test::detail::contains(test::detail::response_for(lines, 2), R"("text":"PROCESSED: HELLO")"));

        auto records = recorder->records();
        REQUIRE(records.size() == 2);
        for (const auto& record : records) {
            CHECK(record.meta.at("mcpTool") == "sample");
            CHECK(record.exit_code == exit_code::success);
            CHECK(record.input_summary == "hello");
            CHECK(record.call_chain == std::vector<std::string>{"sfa-test"});
        }
    }

    TEST_CASE("007: tool failures become error results", "[007][server]") {
        auto recorder = std::make_shared<detail::collecting_recorder>();
        auto lines = detail::serve(
                {detail::call(1, "boom", "{}"), detail::call(2, "soft-fail", "{}")}, {.handle_signals = false}, recorder);

        REQUIRE(lines.size() == 2);
        auto thrown = test::detail::response_for(lines, 1);
        CHECK(test::detail::contains(thrown, R"("text":"kaboom")"));
        CHECK(test::detail::contains(thrown, R"("isError":true)"));

        auto soft = test::detail::response_for(lines, 2);
        CHECK(test::detail::contains(soft, R"("text":"not today")"));
        CHECK(test::detail::contains(soft, R"("isError":true)"));

        auto records = recorder->records();
        REQUIRE(records.size() == 2);
        CHECK(records[0].exit_code == exit_code::failure);
        CHECK(records[1].exit_code == exit_code::failure);
    }

    TEST_CASE("007: protocol errors", "[007][server]") {
        auto lines = detail::serve({
                detail::call(1, "nope", "{}"),
                R"({"jsonrpc":"2.0","id":2,"method":"resources/list"})",
                R"({"jsonrpc":"2.0","id":3,"method":"tools/call","params":{"name":"sample","arguments":[1]}})",
                R"({"jsonrpc":"2.0","id":4,"method":"tools/call","params":"oops"})",
        });

        REQUIRE(lines.size() == 4);

        auto unknown = test::detail::response_for(lines, 1);
        CHECK(test::detail::contains(unknown, "-32602"));
        CHECK(test::detail::contains(unknown, "Unknown tool: nope"));

        auto missing = test::detail::response_for(lines, 2);
        CHECK(test::detail::contains(missing, "-32601"));
        CHECK(test::detail::contains(missing, "Method not found: resources/list"));

        CHECK(test::detail::contains(test::detail::response_for(lines, 3), "-32602"));
        CHECK(test::detail::contains(test::detail::response_for(lines, 4), "-32602"));
    }

    TEST_CASE("007: malformed lines and notifications are dropped", "[007][server]") {
        auto lines = detail::serve({
                "this is not json",
                "",
                "   ",
                R"({"jsonrpc":"2.0","id":1})",
                R"({"jsonrpc":"2.0","method":"notifications/cancelled","params":{"requestId":9}})",
                R"({"jsonrpc":"2.0","method":"resources/list"})",
                R"({"jsonrpc":"2.0","method":"tools/list"})",
                R"({"id":2,"method":"ping"})",
                R"({"jsonrpc":"1.0","id":3,"method":"ping"})",
                R"({"jsonrpc":"2.0","id":5,"method":"ping"})",
        });

        REQUIRE(lines.size() == 1);
        CHECK(test::detail::has_id(lines[0], 5));
    }

    TEST_CASE("007: string ids are echoed back", "[007][server]") {
        auto lines = detail::serve({R"({"jsonrpc":"2.0","id":"req-7","method":"ping"})"});

        REQUIRE(lines.size() == 1);
        CHECK(test::detail::contains(lines[0], R"("id":"req-7")"));
    }

    TEST_CASE("007: calls run concurrently and answer out of order", "[007][server]") {
        auto lines = detail::serve({
                detail::call(1, "nap", R"({"ms":400})"),
                detail::call(2, "nap", R"({"ms":50})"),
                R"({"jsonrpc":"2.0","id":3,"method":"ping"})",
        });

        REQUIRE(lines.size() == 3);
        CHECK(test::detail::has_id(lines[0], 3));
        CHECK(test::detail::has_id(lines[1], 2));
        CHECK(test::detail::has_id(lines[2], 1));
        CHECK(test::detail::contains(lines[2], "rested 400ms"));
    }

    TEST_CASE("007: per-call timeout", "[007][server]") {
        auto recorder = std::make_shared<detail::collecting_recorder>();
        auto start = std::chrono::steady_clock::now();
        auto lines = detail::serve(
                {detail::call(1, "block", "{}")}, {.call_timeout = 200ms, .handle_signals = false}, recorder);

        REQUIRE(lines.size() == 1);
        CHECK(test::detail::contains(lines[0], R"("text":"Timeout after 0.2s")"));
        CHECK(test::detail::contains(lines[0], R"("isError":true)"));
        CHECK(test::detail::seconds_since(start) < 5.0);

        auto records = recorder->records();
        REQUIRE(records.size() == 1);
        CHECK(records[0].exit_code == exit_code::timeout);
        CHECK(records[0].meta.at("mcpTool") == "block");
    }

    TEST_CASE("007: a trailing partial line is dropped at end of input", "[007][server]") {
        test::detail::pipe_fds input{};
        input.send_line(R"({"jsonrpc":"2.0","id":1,"method":"ping"})");
        input.send_raw(R"({"jsonrpc":"2.0","id":2,"method":"ping"})");
        input.close_write();

        std::ostringstream out{};
        tool_server server{
                detail::server_definition(),
                test::detail::make_caller(),
                resolved_env{},
                nullptr,
                true,
                {.handle_signals = false}};
        REQUIRE(server.run(input.read, out) == exit_code::success);

        auto lines = test::detail::split_lines(out.str());
        REQUIRE(lines.size() == 1);
        CHECK(test::detail::has_id(lines[0], 1));
    }

    TEST_CASE("007: requests split across reads are reassembled", "[007][server]") {
        test::detail::pipe_fds input{};
        std::ostringstream out{};
        tool_server server{
                detail::server_definition(),
                test::detail::make_caller(),
                resolved_env{},
                nullptr,
                true,
                {.handle_signals = false}};

        int code = -1;
        std::thread runner{[&] { code = server.run(input.read, out); }};

        input.send_raw(R"({"jsonrpc":"2.0","id":1,"met)");
        std::this_thread::sleep_for(50ms);
        input.send_raw("hod\":\"tools/call\",\"params\":{\"name\":\"sample\",\"arguments\":{\"context\":\"split\"}}}\n{\"jsonrpc\"");
        std::this_thread::sleep_for(50ms);
        input.send_raw(":\"2.0\",\"id\":2,\"method\":\"ping\"}\n");
        input.close_write();
        runner.join();
        CHECK(code == exit_code::success);

        auto lines = test::detail::split_lines(out.str());
        REQUIRE(lines.size() == 2);
        CHECK(test::detail::contains(test::detail::response_for(lines, 1), "Processed: split"));
        CHECK_FALSE(test::detail::response_for(lines, 2).empty());
    }
}  // namespace sfa::test
