#include "sfa/invoke.hpp"

#include "sfa/format.hpp"

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cmath>
#include <csignal>
#include <cstdlib>
#include <cstring>

using namespace sfa::literals;
using namespace std::string_view_literals;

namespace sfa {

    namespace detail {

        using clock = std::chrono::steady_clock;

        static constexpr auto poll_slice = std::chrono::milliseconds{50};
        // Bound on reading pipes that a grandchild may still hold open after the child exits.
        static constexpr auto post_exit_drain = std::chrono::milliseconds{200};

        static bool is_forwarded(std::string_view name) {
            if (name.starts_with(coordination::prefix)) {
                return true;
            }
            for (auto allowed : system_env_allow_list) {
                if (name == allowed) {
                    return true;
                }
            }
            return false;
        }

        static void set_nonblocking(int fd) {
            int flags = ::fcntl(fd, F_GETFL, 0);
            if (flags != -1) {
                ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
            }
        }

        static void close_fd(int& fd) {
            if (fd >= 0) {
                ::close(fd);
                fd = -1;
            }
        }

        struct pipe_pair {
            int read{-1};
            int write{-1};

            pipe_pair(const pipe_pair&) = delete;
            pipe_pair& operator=(const pipe_pair&) = delete;

            pipe_pair() {
                int fds[2]{};
                if (::pipe2(fds, O_CLOEXEC) != 0) {
                    throw spawn_error{"pipe() failed: {}"_format(std::strerror(errno))};
                }
                read = fds[0];
                write = fds[1];
            }

            ~pipe_pair() {
                close_fd(read);
                close_fd(write);
            }
        };

        // Signals go through here so nothing is sent to a pid that has already been reaped.
        struct child_handle {
            pid_t pid{-1};
            std::mutex mutex{};
            bool reaped{false};

            void signal(int signo) {
                std::lock_guard lock{mutex};
                if (!reaped && pid > 0) {
                    debug_log("signal ", signo, " -> pid ", pid);
                    ::kill(pid, signo);
                }
            }

            void mark_reaped() {
                std::lock_guard lock{mutex};
                reaped = true;
            }
        };

        // Drains whatever is readable; closes the fd on EOF or a hard error.
        static void drain_pipe(int& fd, std::string& out) {
            char chunk[4096]{};
            for (;;) {
                auto n = ::read(fd, chunk, sizeof(chunk));
                if (n > 0) {
                    out.append(chunk, static_cast<size_t>(n));
                    continue;
                }
                if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)) {
                    return;
                }
                close_fd(fd);
                return;
            }
        }

        static void feed_stdin(int& fd, std::string_view data, size_t& offset) {
            while (offset < data.size()) {
                auto n = ::write(fd, data.data() + offset, data.size() - offset);
                if (n > 0) {
                    offset += static_cast<size_t>(n);
                    continue;
                }
                if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)) {
                    return;
                }
                // child closed its stdin; the remaining context is dropped
                break;
            }
            close_fd(fd);
        }

        static bool has_exited(pid_t pid) {
            siginfo_t info{};
            if (::waitid(P_PID, static_cast<id_t>(pid), &info, WEXITED | WNOHANG | WNOWAIT) != 0) {
                return errno == ECHILD;
            }
            return info.si_pid == pid;
        }

        static int read_exec_errno(int fd) {
            int err = 0;
            for (;;) {
                auto n = ::read(fd, &err, sizeof(err));
                if (n < 0 && errno == EINTR) {
                    continue;
                }
                return n == static_cast<ssize_t>(sizeof(err)) ? err : 0;
            }
        }

        static std::optional<std::chrono::milliseconds> effective_timeout(
                const invoke_options& options, std::optional<std::chrono::milliseconds> remaining_budget) {
            if (options.timeout && *options.timeout > 0) {
                return std::chrono::milliseconds{std::llround(*options.timeout * 1000.0)};
            }
            return remaining_budget;
        }

        static std::vector<char*> to_argv(std::vector<std::string>& values) {
            std::vector<char*> argv{};
            argv.reserve(values.size() + 1);
            for (auto& value : values) {
                argv.push_back(value.data());
            }
            argv.push_back(nullptr);
            return argv;
        }

    }  // namespace detail

    child_registry& child_registry::instance() {
        // intentionally leaked so the atexit hook never sees a destroyed registry
        static auto* registry = [] {
            auto* r = new child_registry{};
            std::atexit([] { child_registry::instance().terminate_all(); });
            return r;
        }();
        return *registry;
    }

    void child_registry::add(pid_t pid) {
        std::lock_guard lock{mutex_};
        live_.insert(pid);
        ++spawned_;
    }

    void child_registry::remove(pid_t pid) {
        std::lock_guard lock{mutex_};
        live_.erase(pid);
    }

    void child_registry::terminate_all() {
        std::lock_guard lock{mutex_};
        for (auto pid : live_) {
            ::kill(pid, SIGTERM);
        }
    }

    size_t child_registry::live_count() const {
        std::lock_guard lock{mutex_};
        return live_.size();
    }

    uint64_t child_registry::spawned_total() const {
        std::lock_guard lock{mutex_};
        return spawned_;
    }

    environment_map build_child_environment(const environment_map& current, const safety_state& caller) {
        environment_map env{};
        for (const auto& [name, value] : current) {
            if (detail::is_forwarded(name)) {
                env.emplace(name, value);
            }
        }
        for (auto& [name, value] : coordination_variables(derive_child(caller))) {
            env.insert_or_assign(std::move(name), std::move(value));
        }
        return env;
    }

    invoke_result invoke(
            std::string_view target_name,
            const safety_state& caller,
            std::optional<std::chrono::milliseconds> remaining_budget,
            std::stop_token cancel,
            const invoke_options& options) {
        check_depth_limit(caller);
        check_loop(caller, target_name);

        static std::once_flag sigpipe_once{};
        std::call_once(sigpipe_once, [] { ::signal(SIGPIPE, SIG_IGN); });

        // everything the child touches is prepared before fork()
        std::vector<std::string> args{std::string{target_name}};
        args.insert(args.end(), options.args.begin(), options.args.end());
        auto argv = detail::to_argv(args);

        std::vector<std::string> env_entries{};
        for (const auto& [name, value] : build_child_environment(current_environment(), caller)) {
            env_entries.push_back("{}={}"_format(name, value));
        }
        auto envp = detail::to_argv(env_entries);

        auto timeout = detail::effective_timeout(options, remaining_budget);
        bool feed_context = !options.context.empty();

        detail::pipe_pair out_pipe{};
        detail::pipe_pair err_pipe{};
        detail::pipe_pair exec_pipe{};
        std::optional<detail::pipe_pair> in_pipe{};
        if (feed_context) {
            in_pipe.emplace();
        }

        auto pid = ::fork();
        if (pid < 0) {
            throw spawn_error{"fork() failed for {}: {}"_format(target_name, std::strerror(errno))};
        }

        if (pid == 0) {
            if (feed_context) {
                ::dup2(in_pipe->read, STDIN_FILENO);
            }
            else {
                int devnull = ::open("/dev/null", O_RDONLY);
                if (devnull >= 0) {
                    ::dup2(devnull, STDIN_FILENO);
                    ::close(devnull);
                }
            }
            ::dup2(out_pipe.write, STDOUT_FILENO);
            ::dup2(err_pipe.write, STDERR_FILENO);

            ::execvpe(argv[0], argv.data(), envp.data());

            int err = errno;
            [[maybe_unused]] auto n = ::write(exec_pipe.write, &err, sizeof(err));
            _exit(127);
        }

        // parent
        auto& registry = child_registry::instance();
        registry.add(pid);
        debug_log("spawned ", target_name, " as pid ", pid);

        detail::close_fd(out_pipe.write);
        detail::close_fd(err_pipe.write);
        detail::close_fd(exec_pipe.write);
        if (in_pipe) {
            detail::close_fd(in_pipe->read);
        }

        if (int exec_errno = detail::read_exec_errno(exec_pipe.read); exec_errno != 0) {
            ::waitpid(pid, nullptr, 0);
            registry.remove(pid);
            throw spawn_error{"failed to invoke {}: {}"_format(target_name, std::strerror(exec_errno))};
        }

        detail::child_handle handle{.pid = pid};
        std::stop_callback on_cancel{cancel, [&handle] { handle.signal(SIGTERM); }};

        int stdout_fd = out_pipe.read;
        int stderr_fd = err_pipe.read;
        int stdin_fd = in_pipe ? in_pipe->write : -1;
        out_pipe.read = -1;
        err_pipe.read = -1;
        if (in_pipe) {
            in_pipe->write = -1;
        }
        detail::set_nonblocking(stdout_fd);
        detail::set_nonblocking(stderr_fd);
        if (stdin_fd >= 0) {
            detail::set_nonblocking(stdin_fd);
        }

        std::string out_buf{};
        std::string err_buf{};
        size_t stdin_offset = 0;

        auto deadline = timeout ? std::optional{detail::clock::now() + *timeout} : std::nullopt;
        std::optional<detail::clock::time_point> kill_at{};
        std::optional<detail::clock::time_point> exited_at{};
        bool timed_out = false;

        for (;;) {
            auto now = detail::clock::now();

            if (!exited_at) {
                if (!timed_out && deadline && now >= *deadline) {
                    timed_out = true;
                    debug_log(target_name, " timed out; sending SIGTERM");
                    handle.signal(SIGTERM);
                    kill_at = now + kill_grace;
                }
                if (kill_at && now >= *kill_at) {
                    debug_log(target_name, " ignored SIGTERM; sending SIGKILL");
                    handle.signal(SIGKILL);
                    kill_at.reset();
                }
                if (detail::has_exited(pid)) {
                    handle.mark_reaped();
                    exited_at = now;
                }
            }

            bool pipes_open = stdout_fd >= 0 || stderr_fd >= 0;
            if (exited_at && (!pipes_open || now - *exited_at >= detail::post_exit_drain)) {
                break;
            }

            pollfd fds[3]{};
            nfds_t nfds = 0;
            if (stdout_fd >= 0) {
                fds[nfds++] = {.fd = stdout_fd, .events = POLLIN, .revents = 0};
            }
            if (stderr_fd >= 0) {
                fds[nfds++] = {.fd = stderr_fd, .events = POLLIN, .revents = 0};
            }
            if (stdin_fd >= 0) {
                fds[nfds++] = {.fd = stdin_fd, .events = POLLOUT, .revents = 0};
            }

            auto wait_ms = static_cast<int>(detail::poll_slice.count());
            if (nfds > 0) {
                int ret = ::poll(fds, nfds, wait_ms);
                if (ret < 0 && errno != EINTR) {
                    break;
                }
            }
            else {
                ::poll(nullptr, 0, wait_ms);
            }

            if (stdout_fd >= 0) {
                detail::drain_pipe(stdout_fd, out_buf);
            }
            if (stderr_fd >= 0) {
                detail::drain_pipe(stderr_fd, err_buf);
            }
            if (stdin_fd >= 0) {
                detail::feed_stdin(stdin_fd, options.context, stdin_offset);
            }
        }

        detail::close_fd(stdout_fd);
        detail::close_fd(stderr_fd);
        detail::close_fd(stdin_fd);

        handle.mark_reaped();
        int status = 0;
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
        registry.remove(pid);

        int code = exit_code::failure;
        if (timed_out) {
            code = exit_code::timeout;
        }
        else if (WIFEXITED(status)) {
            code = WEXITSTATUS(status);
        }
        else if (WIFSIGNALED(status)) {
            code = 128 + WTERMSIG(status);
        }
        debug_log(target_name, " (pid ", pid, ") finished with exit code ", code);

        return invoke_result{
                .ok = code == 0,
                .exit_code = code,
                .output = std::move(out_buf),
                .stderr_output = std::move(err_buf),
        };
    }

}  // namespace sfa
