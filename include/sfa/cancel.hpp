#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string_view>
#include <thread>

namespace sfa {

    enum class cancel_reason { manual, timeout, interrupt, terminate, parent };

    std::string_view to_string(cancel_reason reason);

    /*
     * One cancellable unit of work: the whole top-level execution, or one tool call in server
     * mode. Cancellation is cooperative; consumers observe token() and only the invoker turns a
     * cancelled scope into OS signals for a child process.
     *
     * A scope with a timeout owns a timer thread that fires cancel(cancel_reason::timeout) at the
     * deadline. A scope linked to a parent token is cancelled with cancel_reason::parent as soon
     * as the parent is. The first reason to fire wins.
     */
    class cancel_scope {
      public:
        using clock = std::chrono::steady_clock;

        explicit cancel_scope(
                std::optional<std::chrono::milliseconds> timeout = std::nullopt, std::stop_token parent = {});
        ~cancel_scope();

        cancel_scope(const cancel_scope&) = delete;
        cancel_scope& operator=(const cancel_scope&) = delete;

        void cancel(cancel_reason reason = cancel_reason::manual);

        std::stop_token token() const noexcept { return source_.get_token(); }
        bool cancelled() const noexcept { return source_.stop_requested(); }
        std::optional<cancel_reason> reason() const;
        bool timed_out() const { return reason() == cancel_reason::timeout; }

        std::optional<clock::time_point> deadline() const noexcept { return deadline_; }

        // Time left before the deadline; nullopt when the scope is unbounded.
        std::optional<std::chrono::milliseconds> remaining() const;

      private:
        std::stop_source source_{};
        std::optional<clock::time_point> deadline_{};

        mutable std::mutex mutex_{};
        std::optional<cancel_reason> reason_{};

        std::optional<std::stop_callback<std::function<void()>>> parent_link_{};
        std::condition_variable_any timer_cv_{};
        std::jthread timer_{};
    };

    /*
     * Process-wide SIGINT/SIGTERM fan-out.
     *
     * Each live subscription receives every signal independently. The OS handlers are installed
     * when the first subscription is created and the previous dispositions restored when the last
     * one is destroyed, so nested or concurrent scopes can subscribe and unsubscribe freely.
     * Listeners run on a dedicated watcher thread, never inside the signal handler.
     */
    class signal_subscription {
      public:
        using listener = std::function<void(int signo)>;

        explicit signal_subscription(listener on_signal);
        ~signal_subscription();

        signal_subscription(const signal_subscription&) = delete;
        signal_subscription& operator=(const signal_subscription&) = delete;

      private:
        uint64_t id_{};
    };

    // Grace period between a signal and the forced process exit in single-execution mode.
    std::chrono::milliseconds signal_grace(int signo);

    // 130 for SIGINT, 143 for SIGTERM.
    int signal_exit_code(int signo);

}  // namespace sfa
