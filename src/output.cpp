#include "sfa/output.hpp"

#include "sfa/format.hpp"

#include <glaze/glaze.hpp>

#include <cstdint>
#include <exception>
#include <iostream>
#include <stdexcept>

using namespace sfa::literals;

namespace sfa {

    namespace detail {

        static std::mutex& stderr_mutex() {
            // leaked so detached call threads can still write during static destruction
            static auto* m = new std::mutex{};
            return *m;
        }

        static void write_stderr_line(std::string_view line) {
            std::lock_guard lock{stderr_mutex()};
            std::cerr << line << '\n';
            std::cerr.flush();
        }

        struct record_json {
            std::string timestamp{};
            std::string agent{};
            std::string version{};
            int exitCode{};
            int64_t durationMs{};
            int depth{};
            std::vector<std::string> callChain{};
            std::string inputSummary{};
            std::string outputSummary{};
            std::string sessionId{};
            std::map<std::string, std::string> meta{};
            struct glaze {
                using T = record_json;
                static constexpr auto value = glz::object(
                        &T::timestamp,
                        &T::agent,
                        &T::version,
                        "exitCode",
                        &T::exitCode,
                        "durationMs",
                        &T::durationMs,
                        &T::depth,
                        "callChain",
                        &T::callChain,
                        "inputSummary",
                        &T::inputSummary,
                        "outputSummary",
                        &T::outputSummary,
                        "sessionId",
                        &T::sessionId,
                        &T::meta);
            };
        };

    }  // namespace detail

    progress_emitter::progress_emitter(std::string agent_name, bool quiet, const resolved_env* secrets)
            : agent_name_{std::move(agent_name)}, quiet_{quiet}, secrets_{secrets} {}

    void progress_emitter::emit(std::string_view message) const {
        if (quiet_) {
            return;
        }
        if (secrets_ != nullptr) {
            emit_progress(agent_name_, mask_secrets(std::string{message}, *secrets_));
            return;
        }
        emit_progress(agent_name_, message);
    }

    void emit_progress(std::string_view agent_name, std::string_view message) {
        detail::write_stderr_line("[agent:{}] {}"_format(agent_name, message));
    }

    void write_error(std::string_view message) {
        detail::write_stderr_line("error: {}"_format(message));
    }

    void write_warning(std::string_view message) {
        detail::write_stderr_line("warning: {}"_format(message));
    }

    execution_record make_record(
            std::string_view agent,
            std::string_view version,
            int exit_code,
            std::chrono::system_clock::time_point start_time,
            int depth,
            const std::vector<std::string>& call_chain,
            std::string_view session_id,
            std::string_view input,
            std::string_view output) {
        return execution_record{
                .agent = std::string{agent},
                .version = std::string{version},
                .exit_code = exit_code,
                .start_time = start_time,
                .depth = depth,
                .call_chain = call_chain,
                .session_id = std::string{session_id},
                .input_summary = utils::truncate(input, summary_limit),
                .output_summary = utils::truncate(output, summary_limit),
        };
    }

    void stream_recorder::record(const execution_record& entry) {
        auto now = std::chrono::system_clock::now();
        detail::record_json payload{
                .timestamp = "{:%FT%TZ}"_format(std::chrono::floor<std::chrono::seconds>(now)),
                .agent = entry.agent,
                .version = entry.version,
                .exitCode = entry.exit_code,
                .durationMs =
                        std::chrono::duration_cast<std::chrono::milliseconds>(now - entry.start_time).count(),
                .depth = entry.depth,
                .callChain = entry.call_chain,
                .inputSummary = entry.input_summary,
                .outputSummary = entry.output_summary,
                .sessionId = entry.session_id,
                .meta = entry.meta,
        };

        std::string json{};
        if (auto ec = glz::write_json(payload, json)) {
            throw std::runtime_error{"failed to serialize execution record"};
        }

        std::lock_guard lock{mutex_};
        os_ << json << '\n';
        os_.flush();
        if (!os_) {
            throw std::runtime_error{"failed to write execution record"};
        }
    }

    void record_best_effort(execution_recorder& recorder, const execution_record& entry) noexcept {
        try {
            recorder.record(entry);
        } catch (const std::exception& e) {
            write_warning("execution record dropped: {}"_format(e.what()));
        }
    }

}  // namespace sfa
