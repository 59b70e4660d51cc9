#pragma once

#include "env.hpp"

#include <chrono>
#include <map>
#include <mutex>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace sfa {

    // Writes "[agent:<name>] <message>" lines to stderr, the side channel distinct from results.
    class progress_emitter {
      public:
        progress_emitter(std::string agent_name, bool quiet, const resolved_env* secrets = nullptr);

        void emit(std::string_view message) const;

        const std::string& agent_name() const { return agent_name_; }

      private:
        std::string agent_name_;
        bool quiet_;
        const resolved_env* secrets_;
    };

    void emit_progress(std::string_view agent_name, std::string_view message);

    // "error: ..." / "warning: ..." diagnostics on stderr.
    void write_error(std::string_view message);
    void write_warning(std::string_view message);

    inline constexpr size_t summary_limit = 500;

    struct execution_record {
        std::string agent{};
        std::string version{};
        int exit_code{};
        std::chrono::system_clock::time_point start_time{};
        int depth{};
        std::vector<std::string> call_chain{};
        std::string session_id{};
        std::string input_summary{};
        std::string output_summary{};
        std::map<std::string, std::string> meta{};
    };

    execution_record make_record(
            std::string_view agent,
            std::string_view version,
            int exit_code,
            std::chrono::system_clock::time_point start_time,
            int depth,
            const std::vector<std::string>& call_chain,
            std::string_view session_id,
            std::string_view input,
            std::string_view output);

    // Logging collaborator; invoked once per top-level execution and once per tool call.
    class execution_recorder {
      public:
        virtual ~execution_recorder() = default;
        virtual void record(const execution_record& entry) = 0;
    };

    class null_recorder final : public execution_recorder {
      public:
        void record(const execution_record&) override {}
    };

    // One JSON object per line on the given stream.
    class stream_recorder final : public execution_recorder {
      public:
        explicit stream_recorder(std::ostream& os) : os_{os} {}
        void record(const execution_record& entry) override;

      private:
        std::ostream& os_;
        std::mutex mutex_{};
    };

    // Recorder failures are reported as a warning and never propagate.
    void record_best_effort(execution_recorder& recorder, const execution_record& entry) noexcept;

}  // namespace sfa
