#include "sfa/cancel.hpp"

#include "sfa/utils.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <csignal>
#include <map>
#include <system_error>
#include <vector>

namespace sfa {

    using namespace std::string_view_literals;

    namespace detail {

        static int signal_pipe_write = -1;

        extern "C" void forward_signal(int signo) {
            int saved_errno = errno;
            auto byte = static_cast<unsigned char>(signo);
            [[maybe_unused]] auto n = ::write(signal_pipe_write, &byte, 1);
            errno = saved_errno;
        }

        class signal_hub {
          public:
            static signal_hub& instance() {
                // intentionally leaked: the watcher thread outlives static destruction
                static auto* hub = new signal_hub{};
                return *hub;
            }

            uint64_t subscribe(signal_subscription::listener on_signal) {
                std::lock_guard lock{mutex_};
                start_watcher();
                auto id = next_id_++;
                listeners_.emplace(id, std::move(on_signal));
                if (listeners_.size() == 1) {
                    install();
                }
                return id;
            }

            void unsubscribe(uint64_t id) {
                std::lock_guard dispatch{dispatch_mutex_};
                std::lock_guard lock{mutex_};
                if (listeners_.erase(id) > 0 && listeners_.empty()) {
                    restore();
                }
            }

          private:
            std::mutex mutex_{};
            std::mutex dispatch_mutex_{};
            std::map<uint64_t, signal_subscription::listener> listeners_{};
            uint64_t next_id_{1};
            bool installed_{false};
            struct sigaction old_int_{};
            struct sigaction old_term_{};
            int read_fd_{-1};

            void start_watcher() {
                if (read_fd_ >= 0) {
                    return;
                }
                int fds[2]{};
                if (::pipe2(fds, O_CLOEXEC) != 0) {
                    throw std::system_error{errno, std::generic_category(), "signal pipe"};
                }
                ::fcntl(fds[1], F_SETFL, ::fcntl(fds[1], F_GETFL) | O_NONBLOCK);
                read_fd_ = fds[0];
                signal_pipe_write = fds[1];

                std::thread{[this] { watch(); }}.detach();
            }

            void install() {
                struct sigaction sa{};
                sa.sa_handler = forward_signal;
                sigemptyset(&sa.sa_mask);
                sa.sa_flags = SA_RESTART;
                ::sigaction(SIGINT, &sa, &old_int_);
                ::sigaction(SIGTERM, &sa, &old_term_);
                installed_ = true;
                debug_log("signal handlers installed"sv);
            }

            void restore() {
                if (!installed_) {
                    return;
                }
                ::sigaction(SIGINT, &old_int_, nullptr);
                ::sigaction(SIGTERM, &old_term_, nullptr);
                installed_ = false;
                debug_log("signal handlers restored"sv);
            }

            void watch() {
                for (;;) {
                    unsigned char byte{};
                    auto n = ::read(read_fd_, &byte, 1);
                    if (n < 0 && errno == EINTR) {
                        continue;
                    }
                    if (n <= 0) {
                        return;
                    }
                    dispatch(static_cast<int>(byte));
                }
            }

            void dispatch(int signo) {
                std::lock_guard dispatch{dispatch_mutex_};
                std::vector<signal_subscription::listener> targets{};
                {
                    std::lock_guard lock{mutex_};
                    for (const auto& [id, fn] : listeners_) {
                        targets.push_back(fn);
                    }
                }
                debug_log("signal ", signo, " delivered to ", targets.size(), " listener(s)");
                for (auto& fn : targets) {
                    fn(signo);
                }
            }
        };

    }  // namespace detail

    std::string_view to_string(cancel_reason reason) {
        switch (reason) {
            case cancel_reason::manual:
                return "cancelled"sv;
            case cancel_reason::timeout:
                return "timeout"sv;
            case cancel_reason::interrupt:
                return "interrupted"sv;
            case cancel_reason::terminate:
                return "terminated"sv;
            case cancel_reason::parent:
                return "parent cancelled"sv;
        }
        return "cancelled"sv;
    }

    cancel_scope::cancel_scope(std::optional<std::chrono::milliseconds> timeout, std::stop_token parent) {
        if (parent.stop_possible()) {
            parent_link_.emplace(std::move(parent), [this] { cancel(cancel_reason::parent); });
        }

        if (!timeout) {
            return;
        }

        deadline_ = clock::now() + *timeout;
        timer_ = std::jthread{[this, deadline = *deadline_](std::stop_token stop) {
            std::unique_lock lock{mutex_};
            auto fired = timer_cv_.wait_until(lock, stop, deadline, [this] { return reason_.has_value(); });
            if (fired || stop.stop_requested()) {
                return;
            }
            lock.unlock();
            cancel(cancel_reason::timeout);
        }};
    }

    cancel_scope::~cancel_scope() {
        parent_link_.reset();
        timer_.request_stop();
        if (timer_.joinable()) {
            timer_.join();
        }
    }

    void cancel_scope::cancel(cancel_reason reason) {
        {
            std::lock_guard lock{mutex_};
            if (reason_) {
                return;
            }
            reason_ = reason;
        }
        timer_cv_.notify_all();
        source_.request_stop();
    }

    std::optional<cancel_reason> cancel_scope::reason() const {
        std::lock_guard lock{mutex_};
        return reason_;
    }

    std::optional<std::chrono::milliseconds> cancel_scope::remaining() const {
        if (!deadline_) {
            return std::nullopt;
        }
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(*deadline_ - clock::now());
        return left.count() > 0 ? left : std::chrono::milliseconds{0};
    }

    signal_subscription::signal_subscription(listener on_signal)
            : id_{detail::signal_hub::instance().subscribe(std::move(on_signal))} {}

    signal_subscription::~signal_subscription() {
        detail::signal_hub::instance().unsubscribe(id_);
    }

    std::chrono::milliseconds signal_grace(int signo) {
        if (signo == SIGINT) {
            return std::chrono::milliseconds{100};
        }
        return std::chrono::milliseconds{5'000};
    }

    int signal_exit_code(int signo) {
        return 128 + signo;
    }

}  // namespace sfa
