#include "process.hpp"

#include "platform.hpp"

#include "envprobe/errors.hpp"
#include "envprobe/format.hpp"

extern "C" {
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
#if ENVPROBE_PLATFORM_MACOS
#include <mach-o/dyld.h>
#endif
}

#include <algorithm>
#include <cerrno>
#include <cstdint>
#include <chrono>
#include <cstring>
#include <iostream>
#include <system_error>

using namespace envprobe::literals;

namespace envprobe::internal {

    namespace fs = std::filesystem;

    namespace detail {

        static std::string errno_message(int err) {
            return std::error_code{err, std::generic_category()}.message();
        }

        static void close_fd(int& fd) {
            if (fd >= 0) {
                ::close(fd);
                fd = -1;
            }
        }

        struct pipe_pair {
            int read_end{-1};
            int write_end{-1};

            ~pipe_pair() {
                close_fd(read_end);
                close_fd(write_end);
            }

            bool open() {
                int fds[2]{};
                if (::pipe(fds) != 0) {
                    return false;
                }
                read_end = fds[0];
                write_end = fds[1];
                // keep the descriptors out of the exec'd interpreter
                return ::fcntl(read_end, F_SETFD, FD_CLOEXEC) == 0 && ::fcntl(write_end, F_SETFD, FD_CLOEXEC) == 0;
            }
        };

        // errno written by the child when execvp fails; empty read means exec succeeded
        static std::optional<int> read_exec_errno(int fd) {
            int child_errno = 0;
            for (;;) {
                auto n = ::read(fd, &child_errno, sizeof(child_errno));
                if (n < 0 && errno == EINTR) {
                    continue;
                }
                if (n == static_cast<ssize_t>(sizeof(child_errno))) {
                    return child_errno;
                }
                return std::nullopt;
            }
        }

        static int decode_status(int status) {
            if (WIFEXITED(status)) {
                return WEXITSTATUS(status);
            }
            if (WIFSIGNALED(status)) {
                return 128 + WTERMSIG(status);
            }
            return 1;
        }

        static int wait_for(pid_t pid) {
            int status = 0;
            while (::waitpid(pid, &status, 0) < 0) {
                if (errno != EINTR) {
                    throw capture_error{
                            capture_error_kind::execution, "waitpid failed: {}"_format(errno_message(errno))};
                }
            }
            return decode_status(status);
        }

        // exit code once the child has terminated, nullopt while it is still running
        static std::optional<int> try_reap(pid_t pid) {
            int status = 0;
            for (;;) {
                auto ret = ::waitpid(pid, &status, WNOHANG);
                if (ret == 0) {
                    return std::nullopt;
                }
                if (ret == pid) {
                    return decode_status(status);
                }
                if (errno != EINTR) {
                    throw capture_error{
                            capture_error_kind::execution, "waitpid failed: {}"_format(errno_message(errno))};
                }
            }
        }

        // reads whatever is already buffered; background jobs may still hold the write end
        static void drain(int fd, std::string& out) {
            if (fd < 0 || ::fcntl(fd, F_SETFL, ::fcntl(fd, F_GETFL) | O_NONBLOCK) != 0) {
                return;
            }
            char chunk[4096]{};
            for (;;) {
                auto n = ::read(fd, chunk, sizeof(chunk));
                if (n > 0) {
                    out.append(chunk, static_cast<size_t>(n));
                }
                else if (n < 0 && errno == EINTR) {
                    continue;
                }
                else {
                    return;
                }
            }
        }

        static void kill_job(pid_t pid) {
            if (::kill(-pid, SIGKILL) != 0) {
                ::kill(pid, SIGKILL);
            }
        }

    }  // namespace detail

    subprocess_result run_subprocess(const std::vector<std::string>& args, std::optional<int> timeout_ms) {
        if (args.empty()) {
            throw capture_error{capture_error_kind::spawn, "no command to spawn"};
        }

        detail::pipe_pair stdout_pipe{};
        detail::pipe_pair stderr_pipe{};
        detail::pipe_pair exec_pipe{};
        if (!stdout_pipe.open() || !stderr_pipe.open() || !exec_pipe.open()) {
            throw capture_error{capture_error_kind::spawn, "pipe() failed: {}"_format(detail::errno_message(errno))};
        }

        std::vector<char*> argv{};
        argv.reserve(args.size() + 1U);
        for (const auto& arg : args) {
            argv.push_back(const_cast<char*>(arg.c_str()));
        }
        argv.push_back(nullptr);

        auto pid = ::fork();
        if (pid < 0) {
            throw capture_error{capture_error_kind::spawn, "fork() failed: {}"_format(detail::errno_message(errno))};
        }

        if (pid == 0) {
            // own process group so a timeout takes down everything the interpreter started
            if (timeout_ms) {
                ::setpgid(0, 0);
            }
            if (::dup2(stdout_pipe.write_end, STDOUT_FILENO) < 0 || ::dup2(stderr_pipe.write_end, STDERR_FILENO) < 0) {
                int err = errno;
                (void)::write(exec_pipe.write_end, &err, sizeof(err));
                _exit(127);
            }

            ::execvp(argv[0], argv.data());
            int err = errno;
            (void)::write(exec_pipe.write_end, &err, sizeof(err));
            _exit(127);
        }

        // parent
        if (timeout_ms) {
            ::setpgid(pid, pid);
        }
        detail::close_fd(stdout_pipe.write_end);
        detail::close_fd(stderr_pipe.write_end);
        detail::close_fd(exec_pipe.write_end);

        if (auto child_errno = detail::read_exec_errno(exec_pipe.read_end)) {
            (void)detail::wait_for(pid);
            throw capture_error{
                    capture_error_kind::spawn,
                    "failed to execute {}: {}"_format(args[0], detail::errno_message(*child_errno))};
        }

        subprocess_result result{};
        int fds_open = 2;

        pollfd fds[2]{};
        fds[0] = {.fd = stdout_pipe.read_end, .events = POLLIN, .revents = 0};
        fds[1] = {.fd = stderr_pipe.read_end, .events = POLLIN, .revents = 0};

        // the interpreter may exit while a background job still holds the pipes, so poll in
        // bounded slices and reap between them instead of waiting for EOF
        constexpr int reap_interval_ms = 50;
        auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms.value_or(0));
        std::optional<int> exit_code{};

        while (!exit_code) {
            if (fds_open == 0 && !timeout_ms) {
                exit_code = detail::wait_for(pid);
                break;
            }

            int wait_ms = reap_interval_ms;
            if (timeout_ms) {
                auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                                         deadline - std::chrono::steady_clock::now())
                                         .count();
                if (remaining <= 0) {
                    exit_code = detail::try_reap(pid);
                    result.timed_out = !exit_code;
                    break;
                }
                wait_ms = static_cast<int>(std::min<long long>(remaining, reap_interval_ms));
            }

            // closed descriptors are -1 and ignored, so this doubles as the reap interval sleep
            int ret = ::poll(fds, 2, wait_ms);
            if (ret < 0 && errno != EINTR) {
                int err = errno;
                detail::kill_job(pid);
                (void)detail::wait_for(pid);
                throw capture_error{
                        capture_error_kind::execution, "poll failed: {}"_format(detail::errno_message(err))};
            }

            char chunk[4096]{};
            for (int i = 0; ret > 0 && i < 2; ++i) {
                if (fds[i].fd < 0) {
                    continue;
                }
                if ((fds[i].revents & (POLLIN | POLLHUP | POLLERR)) != 0) {
                    auto n = ::read(fds[i].fd, chunk, sizeof(chunk));
                    if (n > 0) {
                        (i == 0 ? result.stdout_output : result.stderr_output).append(chunk, static_cast<size_t>(n));
                    }
                    else if (n < 0 && errno == EINTR) {
                        continue;
                    }
                    else {
                        fds[i].fd = -1;
                        --fds_open;
                    }
                }
            }

            exit_code = detail::try_reap(pid);
        }

        if (result.timed_out) {
            detail::kill_job(pid);
            exit_code = detail::wait_for(pid);
        }

        detail::drain(fds[0].fd, result.stdout_output);
        detail::drain(fds[1].fd, result.stderr_output);

        result.exit_code = *exit_code;
        return result;
    }

    temp_file::temp_file(std::string_view prefix) {
        std::error_code ec{};
        auto dir = fs::temp_directory_path(ec);
        if (ec) {
            throw capture_error{capture_error_kind::temp_file, "no usable temp directory: {}"_format(ec.message())};
        }

        auto pattern = (dir / "{}XXXXXX"_format(prefix)).string();
        auto fd = ::mkstemp(pattern.data());
        if (fd < 0) {
            throw capture_error{
                    capture_error_kind::temp_file,
                    "failed to create temp file in {}: {}"_format(dir.string(), detail::errno_message(errno))};
        }
        ::close(fd);
        path_ = pattern;
        debug_log("created temp file ", path_.string());
    }

    temp_file::~temp_file() {
        std::error_code ec{};
        fs::remove(path_, ec);
        if (ec) {
            std::cerr << "warning: failed to remove temp file " << path_.string() << ": " << ec.message() << '\n';
        }
    }

    fs::path current_executable() {
        if constexpr (platform::is_macos) {
#if ENVPROBE_PLATFORM_MACOS
            uint32_t size = 0;
            (void)::_NSGetExecutablePath(nullptr, &size);
            std::string buf(size, '\0');
            if (::_NSGetExecutablePath(buf.data(), &size) != 0) {
                throw capture_error{capture_error_kind::spawn, "unable to resolve the probe executable"};
            }
            return fs::weakly_canonical(fs::path{buf.c_str()});
#endif
        }

        std::error_code ec{};
        auto exe = fs::read_symlink(fs::path{platform::self_exe_link}, ec);
        if (ec) {
            throw capture_error{
                    capture_error_kind::spawn, "unable to resolve the probe executable: {}"_format(ec.message())};
        }
        return exe;
    }

}  // namespace envprobe::internal
