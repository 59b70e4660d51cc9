#pragma once

#include "sfa/sfa.hpp"

#include <catch2/catch_test_macros.hpp>
#include <glaze/glaze.hpp>

extern "C" {
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
}

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <condition_variable>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <limits>
#include <memory>
#include <mutex>
#include <optional>
#include <ranges>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <vector>

namespace sfa::test::detail {
    namespace fs = std::filesystem;

    using namespace std::chrono_literals;
    using namespace sfa::literals;

    struct temp_dir {
        fs::path path{};

        explicit temp_dir(std::string_view prefix) {
            auto now = std::chrono::system_clock::now().time_since_epoch().count();
            std::ostringstream dir_name{};
            dir_name << prefix << "_" << static_cast<long>(::getpid()) << "_" << now;
            path = fs::temp_directory_path() / dir_name.str();
            fs::create_directories(path);
        }

        ~temp_dir() {
            std::error_code ec{};
            fs::remove_all(path, ec);
        }

        temp_dir(const temp_dir&) = delete;
        temp_dir& operator=(const temp_dir&) = delete;
    };

    inline void write_file(const fs::path& p, std::string_view content) {
        std::ofstream out{p};
        REQUIRE(out.good());
        out << content;
    }

    // Sets an environment variable for the lifetime of the object and restores the old value.
    struct scoped_env {
        std::string name{};
        std::optional<std::string> previous{};

        scoped_env(std::string var, const std::string& value) : name{std::move(var)} {
            if (auto* old = std::getenv(name.c_str())) {
                previous = old;
            }
            ::setenv(name.c_str(), value.c_str(), 1);
        }

        ~scoped_env() {
            if (previous) {
                ::setenv(name.c_str(), previous->c_str(), 1);
            }
            else {
                ::unsetenv(name.c_str());
            }
        }

        scoped_env(const scoped_env&) = delete;
        scoped_env& operator=(const scoped_env&) = delete;
    };

    // Owns argv storage for parse_cli.
    struct argv_builder {
        std::vector<std::string> args{};
        std::vector<char*> ptrs{};

        argv_builder(std::initializer_list<std::string_view> values) {
            for (auto v : values) {
                args.emplace_back(v);
            }
            for (auto& a : args) {
                ptrs.push_back(a.data());
            }
            ptrs.push_back(nullptr);
        }

        int argc() const { return static_cast<int>(args.size()); }
        char** argv() { return ptrs.data(); }
    };

    struct pipe_fds {
        int read{-1};
        int write{-1};

        pipe_fds() {
            int fds[2]{};
            REQUIRE(::pipe(fds) == 0);
            read = fds[0];
            write = fds[1];
        }

        ~pipe_fds() {
            close_read();
            close_write();
        }

        void close_read() {
            if (read >= 0) {
                ::close(read);
                read = -1;
            }
        }

        void close_write() {
            if (write >= 0) {
                ::close(write);
                write = -1;
            }
        }

        void send_line(std::string_view line) const { send_raw(std::string{line} + "\n"); }

        void send_raw(std::string_view data) const {
            auto written = ::write(write, data.data(), data.size());
            REQUIRE(written == static_cast<ssize_t>(data.size()));
        }

        pipe_fds(const pipe_fds&) = delete;
        pipe_fds& operator=(const pipe_fds&) = delete;
    };

    inline std::vector<std::string> split_lines(const std::string& text) {
        std::vector<std::string> lines{};
        std::istringstream in{text};
        for (std::string line{}; std::getline(in, line);) {
            if (!line.empty()) {
                lines.push_back(line);
            }
        }
        return lines;
    }

    inline bool has_id(std::string_view line, int id) {
        auto key = "\"id\":{}"_format(id);
        for (auto pos = line.find(key); pos != std::string_view::npos; pos = line.find(key, pos + 1)) {
            auto end = pos + key.size();
            if (end < line.size() && (line[end] == ',' || line[end] == '}')) {
                return true;
            }
        }
        return false;
    }

    // The response line carrying `id`, or an empty string.
    inline std::string response_for(const std::vector<std::string>& lines, int id) {
        for (const auto& line : lines) {
            if (has_id(line, id)) {
                return line;
            }
        }
        return {};
    }

    inline bool contains(std::string_view haystack, std::string_view needle) {
        return haystack.find(needle) != std::string_view::npos;
    }

    inline safety_state make_caller(
            std::vector<std::string> chain = {"sfa-test"}, int depth = 0, int max_depth = default_max_depth) {
        return safety_state{
                .depth = depth,
                .max_depth = max_depth,
                .call_chain = std::move(chain),
                .session_id = "11111111-2222-4333-8444-555555555555",
        };
    }

    template <typename Pred>
    bool wait_until(Pred pred, std::chrono::milliseconds timeout = 2s) {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline) {
            if (pred()) {
                return true;
            }
            std::this_thread::sleep_for(10ms);
        }
        return pred();
    }

    inline double seconds_since(std::chrono::steady_clock::time_point start) {
        return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    }

}  // namespace sfa::test::detail
