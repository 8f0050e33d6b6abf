#include "tools/tool_invoker.hpp"

#include <chrono>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
#include <utility>
#include "core/logging/logger.hpp"
#include "core/text/utf8.hpp"

namespace appbridge::tools {

using core::errors::BridgeError;
using core::errors::ErrorCategory;

namespace {

void close_fd(const int fd) {
    if (fd >= 0) {
        static_cast<void>(close(fd));
    }
}

void set_nonblocking(const int fd) {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags == -1) {
        return;
    }
    static_cast<void>(fcntl(fd, F_SETFL, flags | O_NONBLOCK));
}

void set_cloexec(const int fd) {
    const int flags = fcntl(fd, F_GETFD, 0);
    if (flags == -1) {
        return;
    }
    static_cast<void>(fcntl(fd, F_SETFD, flags | FD_CLOEXEC));
}

void drain_pipe(const int fd, bool& is_open, std::string& out) {
    if (!is_open) {
        return;
    }

    char buffer[4096];
    while (true) {
        const ssize_t n = read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            out.append(buffer, static_cast<std::size_t>(n));
            continue;
        }
        if (n == 0) {
            is_open = false;
            static_cast<void>(close(fd));
            return;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
            return;
        }
        is_open = false;
        static_cast<void>(close(fd));
        return;
    }
}

BridgeError spawn_error(const std::string& message, const int err) {
    return BridgeError{ErrorCategory::Internal, message + ": " + std::strerror(err),
                       "spawn_failed"};
}

// Runs argv[0] with the given arguments, stdin from /dev/null, stdout and
// stderr captured. The child is always reaped before returning.
core::errors::Result<InvocationOutcome> run_process(
    const std::vector<std::string>& args, const std::uint32_t timeout_ms,
    const std::shared_ptr<std::atomic_bool>& cancel_token) {
    if (cancel_token && cancel_token->load()) {
        InvocationOutcome outcome;
        outcome.cancelled = true;
        return outcome;
    }

    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1};
    if (pipe(stdout_pipe) != 0 || pipe(stderr_pipe) != 0 || pipe(exec_pipe) != 0) {
        const int err = errno;
        for (const int fd : {stdout_pipe[0], stdout_pipe[1], stderr_pipe[0],
                             stderr_pipe[1], exec_pipe[0], exec_pipe[1]}) {
            close_fd(fd);
        }
        return spawn_error("Failed to create process pipes", err);
    }
    set_cloexec(exec_pipe[1]);

    const auto started = std::chrono::steady_clock::now();
    const pid_t pid = fork();
    if (pid < 0) {
        const int err = errno;
        for (const int fd : {stdout_pipe[0], stdout_pipe[1], stderr_pipe[0],
                             stderr_pipe[1], exec_pipe[0], exec_pipe[1]}) {
            close_fd(fd);
        }
        return spawn_error("Failed to fork interpreter process", err);
    }

    if (pid == 0) {
        // The protocol stream is on our stdin; the child must not see it.
        const int null_fd = open("/dev/null", O_RDONLY);
        if (null_fd >= 0) {
            static_cast<void>(dup2(null_fd, STDIN_FILENO));
            static_cast<void>(close(null_fd));
        }
        static_cast<void>(dup2(stdout_pipe[1], STDOUT_FILENO));
        static_cast<void>(dup2(stderr_pipe[1], STDERR_FILENO));
        static_cast<void>(close(stdout_pipe[0]));
        static_cast<void>(close(stdout_pipe[1]));
        static_cast<void>(close(stderr_pipe[0]));
        static_cast<void>(close(stderr_pipe[1]));
        static_cast<void>(close(exec_pipe[0]));
        execvp(argv[0], argv.data());
        const int err = errno;
        static_cast<void>(write(exec_pipe[1], &err, sizeof(err)));
        _exit(127);
    }

    static_cast<void>(close(stdout_pipe[1]));
    static_cast<void>(close(stderr_pipe[1]));
    static_cast<void>(close(exec_pipe[1]));

    // Zero bytes means exec succeeded and closed the pipe.
    int exec_errno = 0;
    ssize_t exec_read = 0;
    do {
        exec_read = read(exec_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (exec_read < 0 && errno == EINTR);
    static_cast<void>(close(exec_pipe[0]));
    if (exec_read > 0) {
        int status = 0;
        static_cast<void>(waitpid(pid, &status, 0));
        static_cast<void>(close(stdout_pipe[0]));
        static_cast<void>(close(stderr_pipe[0]));
        return spawn_error("Failed to execute interpreter '" + args.front() + "'",
                           exec_errno);
    }

    set_nonblocking(stdout_pipe[0]);
    set_nonblocking(stderr_pipe[0]);

    InvocationOutcome outcome;
    bool stdout_open = true;
    bool stderr_open = true;
    bool child_exited = false;
    bool killed = false;
    int status = 0;

    while (stdout_open || stderr_open || !child_exited) {
        if (cancel_token && cancel_token->load() && !child_exited && !killed) {
            outcome.cancelled = true;
            killed = true;
            static_cast<void>(kill(pid, SIGKILL));
        }

        const auto now = std::chrono::steady_clock::now();
        const auto elapsed =
            std::chrono::duration_cast<std::chrono::milliseconds>(now - started).count();
        const bool deadline_passed =
            timeout_ms > 0 && elapsed > static_cast<std::int64_t>(timeout_ms);
        if (deadline_passed && !killed && !child_exited) {
            outcome.timed_out = true;
            killed = true;
            static_cast<void>(kill(pid, SIGKILL));
        }

        pollfd fds[2];
        nfds_t nfds = 0;
        if (stdout_open) {
            fds[nfds].fd = stdout_pipe[0];
            fds[nfds].events = POLLIN;
            ++nfds;
        }
        if (stderr_open) {
            fds[nfds].fd = stderr_pipe[0];
            fds[nfds].events = POLLIN;
            ++nfds;
        }

        if (nfds > 0) {
            static_cast<void>(poll(fds, nfds, 50));
        } else if (!child_exited) {
            static_cast<void>(poll(nullptr, 0, 10));
        }

        drain_pipe(stdout_pipe[0], stdout_open, outcome.stdout_text);
        drain_pipe(stderr_pipe[0], stderr_open, outcome.stderr_text);

        if (!child_exited) {
            const pid_t waited = waitpid(pid, &status, WNOHANG);
            if (waited == pid) {
                child_exited = true;
            }
        }

        // A grandchild holding the pipes open must not keep us here once
        // the interpreter itself is gone.
        if (child_exited && (killed || deadline_passed)) {
            if (stdout_open) {
                static_cast<void>(close(stdout_pipe[0]));
                stdout_open = false;
            }
            if (stderr_open) {
                static_cast<void>(close(stderr_pipe[0]));
                stderr_open = false;
            }
        }
    }

    if (WIFEXITED(status)) {
        outcome.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        outcome.exit_code = 128 + WTERMSIG(status);
    } else {
        outcome.exit_code = -1;
    }

    const auto ended = std::chrono::steady_clock::now();
    outcome.duration_ms = std::chrono::duration<double, std::milli>(ended - started).count();
    return outcome;
}

}  // namespace

std::string escape_app_name(const std::string& app_name) {
    std::string escaped;
    escaped.reserve(app_name.size() + 8);
    for (const char c : app_name) {
        if (c == '\\' || c == '"') {
            escaped.push_back('\\');
        }
        escaped.push_back(c);
    }
    return escaped;
}

std::string compose_program(const Tool& tool, const std::string& script) {
    std::string program;
    program.reserve(script.size() + tool.app_name.size() + 32);
    program += "tell application \"" + escape_app_name(tool.app_name) + "\"\n";
    program += script;
    if (script.empty() || script.back() != '\n') {
        program.push_back('\n');
    }
    program += "end tell\n";
    return program;
}

ToolInvoker::ToolInvoker(InvocationOptions options, policy::ScriptPolicy script_policy)
    : options_(std::move(options)), script_policy_(std::move(script_policy)) {}

core::errors::Result<std::string> ToolInvoker::prepare(const Tool& tool,
                                                       const std::string& script) const {
    auto app_name = script_policy_.validate_app_name(tool.app_name);
    if (core::errors::is_error(app_name)) {
        return core::errors::get_error(app_name);
    }
    auto validated = script_policy_.validate_script(script);
    if (core::errors::is_error(validated)) {
        return core::errors::get_error(validated);
    }
    return compose_program(tool, core::errors::get_value(validated));
}

core::errors::Result<InvocationOutcome> ToolInvoker::invoke(const Tool& tool,
                                                            const std::string& script) const {
    auto program = prepare(tool, script);
    if (core::errors::is_error(program)) {
        return core::errors::get_error(program);
    }

    std::vector<std::string> args;
    args.reserve(options_.interpreter_args.size() + 2);
    args.push_back(options_.interpreter);
    for (const auto& arg : options_.interpreter_args) {
        args.push_back(arg);
    }
    args.push_back(core::errors::get_value(program));

    LOG_DEBUG("ToolInvoker: running " + tool.name + " via " + options_.interpreter);
    auto capture_result = run_process(args, options_.timeout_ms, options_.cancel_token);
    if (core::errors::is_error(capture_result)) {
        return core::errors::get_error(capture_result);
    }
    auto outcome = core::errors::get_value(capture_result);

    outcome.stdout_text = core::text::to_utf8_lossy(outcome.stdout_text);
    outcome.stderr_text = core::text::to_utf8_lossy(outcome.stderr_text);

    if (outcome.cancelled) {
        outcome.success = false;
        if (!outcome.stderr_text.empty() && outcome.stderr_text.back() != '\n') {
            outcome.stderr_text += "\n";
        }
        outcome.stderr_text += "Invocation cancelled.";
        return outcome;
    }

    if (outcome.timed_out) {
        outcome.success = false;
        if (!outcome.stderr_text.empty() && outcome.stderr_text.back() != '\n') {
            outcome.stderr_text += "\n";
        }
        outcome.stderr_text +=
            "Invocation timed out after " + std::to_string(options_.timeout_ms) + " ms.";
        return outcome;
    }

    outcome.success = (outcome.exit_code == 0);
    LOG_INFO("ToolInvoker: " + tool.name + " exited with status " +
             std::to_string(outcome.exit_code) + " after " +
             std::to_string(static_cast<long long>(outcome.duration_ms)) + " ms");
    return outcome;
}

}  // namespace appbridge::tools
