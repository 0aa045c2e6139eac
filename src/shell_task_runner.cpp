#include <xmit-cpp/task_runner.hpp>

#include <xmit-cpp/error.hpp>

#include <spdlog/spdlog.h>

#include <array>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <string>
#include <string_view>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace xmit_cpp {

namespace {

// Poll interval while waiting for output; bounds cancellation latency.
constexpr int poll_interval_ms = 100;

// Time a terminated task gets before SIGKILL.
constexpr int kill_grace_ms = 2000;

auto search_path(const Project& project) -> std::string {
    auto bin = (project.path / "node_modules" / ".bin").string();
    const auto* current = std::getenv("PATH");
    if (!current || !*current) return bin;
    return bin + ":" + current;
}

// Signal the task's whole process group so grandchildren stop too.
void terminate(pid_t pid) {
    ::kill(-pid, SIGTERM);
    for (int waited = 0; waited < kill_grace_ms; waited += poll_interval_ms) {
        if (::waitpid(pid, nullptr, WNOHANG) == pid) return;
        ::usleep(poll_interval_ms * 1000);
    }
    ::kill(-pid, SIGKILL);
    ::waitpid(pid, nullptr, 0);
}

// Single-quote a word for /bin/sh.
auto shell_quote(std::string_view word) -> std::string {
    auto quoted = std::string{"'"};
    for (auto c : word) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += '\'';
    return quoted;
}

auto exit_code(int status) -> int {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

}  // namespace

auto ShellTaskRunner::run(const Project& project,
                          const Task& task,
                          const TaskOutputCallback& on_output,
                          const CancellationToken& token) -> int {
    token.throw_if_cancelled();

    // Close-on-exec so tasks forked concurrently never hold this pipe open
    auto fds = std::array<int, 2>{};
    if (::pipe2(fds.data(), O_CLOEXEC) != 0) {
        throw PublishError{ErrorKind::build_failed,
            "Failed to start task " + task.name + ": " + std::strerror(errno)};
    }

    // Built before fork; the child only redirects and execs
    auto script = "cd " + shell_quote(project.path.string()) +
                  " && export PATH=" + shell_quote(search_path(project)) +
                  " && " + task.command;

    auto pid = ::fork();
    if (pid < 0) {
        ::close(fds[0]);
        ::close(fds[1]);
        throw PublishError{ErrorKind::build_failed,
            "Failed to start task " + task.name + ": " + std::strerror(errno)};
    }

    if (pid == 0) {
        ::setpgid(0, 0);
        ::dup2(fds[1], STDOUT_FILENO);
        ::dup2(fds[1], STDERR_FILENO);
        ::close(fds[0]);
        ::close(fds[1]);
        ::execl("/bin/sh", "sh", "-c", script.c_str(), static_cast<char*>(nullptr));
        ::_exit(127);
    }

    // Also set from the parent so the group exists before any signal;
    // whichever side runs second gets EACCES or a no-op
    static_cast<void>(::setpgid(pid, pid));
    ::close(fds[1]);
    spdlog::info("running task '{}' (pid {}): {}", task.name, pid, task.command);

    auto buffer = std::array<char, 4096>{};
    auto pfd = pollfd{fds[0], POLLIN, 0};
    while (true) {
        if (token.is_cancelled()) {
            ::close(fds[0]);
            terminate(pid);
            throw PublishError{ErrorKind::cancelled, "cancelled"};
        }
        auto ready = ::poll(&pfd, 1, poll_interval_ms);
        if (ready < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (ready == 0) continue;

        auto n = ::read(fds[0], buffer.data(), buffer.size());
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) break;
        if (on_output) on_output(std::string_view{buffer.data(), static_cast<std::size_t>(n)});
    }
    ::close(fds[0]);

    // The task may outlive its output, e.g. after redirecting stdout
    auto status = 0;
    while (true) {
        auto reaped = ::waitpid(pid, &status, WNOHANG);
        if (reaped == pid) break;
        if (reaped < 0) {
            if (errno == EINTR) continue;
            throw PublishError{ErrorKind::build_failed,
                "Failed to wait for task " + task.name + ": " + std::strerror(errno)};
        }
        if (token.is_cancelled()) {
            terminate(pid);
            throw PublishError{ErrorKind::cancelled, "cancelled"};
        }
        ::usleep(poll_interval_ms * 1000);
    }
    auto code = exit_code(status);
    spdlog::info("task '{}' exited with code {}", task.name, code);
    return code;
}

}  // namespace xmit_cpp
