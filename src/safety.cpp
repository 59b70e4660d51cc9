#include "sfa/safety.hpp"

#include "sfa/format.hpp"

#include <algorithm>
#include <array>
#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <random>

using namespace sfa::literals;

namespace sfa {

    namespace detail {

        static constexpr auto chain_arrow = " → "sv;

        static std::optional<std::string> read_env(std::string_view name) {
            if (auto* value = std::getenv(std::string{name}.c_str())) {
                return std::string{value};
            }
            return std::nullopt;
        }

        static int parse_int_or(const std::optional<std::string>& text, int fallback) {
            if (!text) {
                return fallback;
            }
            auto trimmed = utils::trim_view(*text);
            if (trimmed.empty()) {
                return fallback;
            }
            // out-of-range values saturate instead of falling back
            int value{};
            auto [ptr, ec] = std::from_chars(trimmed.data(), trimmed.data() + trimmed.size(), value);
            if (ptr != trimmed.data() + trimmed.size()) {
                return fallback;
            }
            if (ec == std::errc::result_out_of_range) {
                return trimmed.front() == '-' ? std::numeric_limits<int>::min() : std::numeric_limits<int>::max();
            }
            return ec == std::errc{} ? value : fallback;
        }

        static bool contains(const std::vector<std::string>& chain, std::string_view name) {
            return std::ranges::find(chain, name) != chain.end();
        }

        static std::string would_be_chain(std::vector<std::string> chain, std::string_view name) {
            chain.emplace_back(name);
            return format_chain(chain);
        }

    }  // namespace detail

    depth_exceeded_error::depth_exceeded_error(int depth, int max_depth)
            : guardrail_error{"depth limit reached: current depth {}, max depth {}"_format(depth, max_depth)},
              depth_{depth},
              max_depth_{max_depth} {}

    loop_detected_error::loop_detected_error(const std::string& chain_text)
            : guardrail_error{"loop detected: {}"_format(chain_text)} {}

    coordination_env coordination_env::capture() {
        return coordination_env{
                .depth = detail::read_env(coordination::depth),
                .max_depth = detail::read_env(coordination::max_depth),
                .call_chain = detail::read_env(coordination::call_chain),
                .session_id = detail::read_env(coordination::session_id),
        };
    }

    safety_state init_safety(
            std::string_view agent_name, const coordination_env& inherited, std::optional<int> max_depth_override) {
        auto chain = utils::split(inherited.call_chain.value_or(std::string{}), ',');

        // self-loop check comes before anything else
        if (detail::contains(chain, agent_name)) {
            throw loop_detected_error{detail::would_be_chain(std::move(chain), agent_name)};
        }

        safety_state state{};
        state.depth = detail::parse_int_or(inherited.depth, 0);
        state.max_depth = max_depth_override ? *max_depth_override
                                             : detail::parse_int_or(inherited.max_depth, default_max_depth);
        state.call_chain = std::move(chain);
        state.call_chain.emplace_back(agent_name);

        if (inherited.session_id && !inherited.session_id->empty()) {
            state.session_id = *inherited.session_id;
        }
        else {
            state.session_id = generate_session_id();
        }

        debug_log("safety initialized: depth=", state.depth, " max_depth=", state.max_depth,
                  " chain=", format_chain(state.call_chain));
        return state;
    }

    void publish_coordination(const safety_state& state) {
        for (const auto& [name, value] : coordination_variables(state)) {
            ::setenv(name.c_str(), value.c_str(), 1);
        }
    }

    void check_depth_limit(const safety_state& state) {
        if (static_cast<int64_t>(state.depth) + 1 >= state.max_depth) {
            throw depth_exceeded_error{state.depth, state.max_depth};
        }
    }

    void check_loop(const safety_state& state, std::string_view target_name) {
        if (detail::contains(state.call_chain, target_name)) {
            throw loop_detected_error{detail::would_be_chain(state.call_chain, target_name)};
        }
    }

    safety_state derive_child(const safety_state& state) {
        return safety_state{
                .depth = state.depth < std::numeric_limits<int>::max() ? state.depth + 1 : state.depth,
                .max_depth = state.max_depth,
                .call_chain = state.call_chain,
                .session_id = state.session_id,
        };
    }

    std::vector<std::pair<std::string, std::string>> coordination_variables(const safety_state& state) {
        return {
                {std::string{coordination::depth}, std::to_string(state.depth)},
                {std::string{coordination::max_depth}, std::to_string(state.max_depth)},
                {std::string{coordination::call_chain}, utils::join_with_separator(state.call_chain, ",")},
                {std::string{coordination::session_id}, state.session_id},
        };
    }

    std::string format_chain(const std::vector<std::string>& chain) {
        return utils::join_with_separator(chain, detail::chain_arrow);
    }

    std::string generate_session_id() {
        thread_local std::mt19937_64 engine{[] {
            std::random_device rd{};
            std::seed_seq seq{rd(), rd(), rd(), rd()};
            return std::mt19937_64{seq};
        }()};

        std::array<uint8_t, 16> bytes{};
        for (size_t i = 0; i < bytes.size(); i += 8) {
            auto word = engine();
            for (size_t j = 0; j < 8; ++j) {
                bytes[i + j] = static_cast<uint8_t>(word >> (j * 8));
            }
        }
        bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0f) | 0x40);  // version 4
        bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3f) | 0x80);  // variant 10

        std::string out{};
        out.reserve(36);
        for (size_t i = 0; i < bytes.size(); ++i) {
            if (i == 4 || i == 6 || i == 8 || i == 10) {
                out.push_back('-');
            }
            out += "{:02x}"_format(bytes[i]);
        }
        return out;
    }

}  // namespace sfa
