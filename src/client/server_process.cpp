#include "client/server_process.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
#include "core/logging/logger.hpp"
#include "protocol/envelope.hpp"

namespace appbridge::client {

using core::errors::BridgeError;
using core::errors::ErrorCategory;

namespace {

void close_fd(const int fd) {
    if (fd >= 0) {
        static_cast<void>(close(fd));
    }
}

BridgeError spawn_error(const std::string& message, const int err) {
    return BridgeError{ErrorCategory::Internal, message + ": " + std::strerror(err),
                       "spawn_failed"};
}

}  // namespace

ServerProcess::ServerProcess(const pid_t pid, const int stdin_fd, const int stdout_fd)
    : pid_(pid),
      stdin_fd_(stdin_fd),
      stdout_fd_(stdout_fd),
      transport_(std::make_unique<transport::FdTransport>(stdout_fd, stdin_fd)) {}

ServerProcess::~ServerProcess() {
    shutdown();
}

core::errors::Result<std::unique_ptr<ServerProcess>> ServerProcess::spawn(
    const std::vector<std::string>& args) {
    if (args.empty()) {
        return BridgeError{ErrorCategory::Input, "Server command line is empty.",
                           "missing_server_path"};
    }

    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    int to_child[2] = {-1, -1};
    int from_child[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1};
    if (pipe(to_child) != 0 || pipe(from_child) != 0 || pipe(exec_pipe) != 0) {
        const int err = errno;
        for (const int fd : {to_child[0], to_child[1], from_child[0], from_child[1],
                             exec_pipe[0], exec_pipe[1]}) {
            close_fd(fd);
        }
        return spawn_error("Failed to create server pipes", err);
    }
    for (const int fd : {to_child[1], from_child[0], exec_pipe[1]}) {
        static_cast<void>(fcntl(fd, F_SETFD, FD_CLOEXEC));
    }

    const pid_t pid = fork();
    if (pid < 0) {
        const int err = errno;
        for (const int fd : {to_child[0], to_child[1], from_child[0], from_child[1],
                             exec_pipe[0], exec_pipe[1]}) {
            close_fd(fd);
        }
        return spawn_error("Failed to fork server process", err);
    }

    if (pid == 0) {
        static_cast<void>(dup2(to_child[0], STDIN_FILENO));
        static_cast<void>(dup2(from_child[1], STDOUT_FILENO));
        static_cast<void>(close(to_child[0]));
        static_cast<void>(close(from_child[1]));
        static_cast<void>(close(exec_pipe[0]));
        execvp(argv[0], argv.data());
        const int err = errno;
        static_cast<void>(write(exec_pipe[1], &err, sizeof(err)));
        _exit(127);
    }

    static_cast<void>(close(to_child[0]));
    static_cast<void>(close(from_child[1]));
    static_cast<void>(close(exec_pipe[1]));

    int exec_errno = 0;
    ssize_t exec_read = 0;
    do {
        exec_read = read(exec_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (exec_read < 0 && errno == EINTR);
    static_cast<void>(close(exec_pipe[0]));
    if (exec_read > 0) {
        int status = 0;
        static_cast<void>(waitpid(pid, &status, 0));
        static_cast<void>(close(to_child[1]));
        static_cast<void>(close(from_child[0]));
        return spawn_error("Failed to execute server '" + args.front() + "'", exec_errno);
    }

    LOG_INFO("ServerProcess: started " + args.front() + " as pid " + std::to_string(pid));
    return std::unique_ptr<ServerProcess>(new ServerProcess(pid, to_child[1], from_child[0]));
}

core::errors::Result<std::size_t> ServerProcess::send(const std::string& payload) {
    if (!running()) {
        return BridgeError{ErrorCategory::Transport, "Server process is not running.",
                           "server_not_running"};
    }
    LOG_DEBUG("ServerProcess: sending " + payload);
    return transport_->write(payload);
}

core::errors::Result<std::size_t> ServerProcess::send_request(const std::int64_t id,
                                                              const std::string& method,
                                                              const nlohmann::json& params) {
    protocol::RequestEnvelope request;
    request.id = id;
    request.method = method;
    request.params = params;
    auto encoded = protocol::encode_request(request);
    if (core::errors::is_error(encoded)) {
        return core::errors::get_error(encoded);
    }
    return send(core::errors::get_value(encoded));
}

core::errors::Result<std::size_t> ServerProcess::send_notification(
    const std::string& method, const nlohmann::json& params) {
    protocol::RequestEnvelope request;
    request.method = method;
    request.params = params;
    auto encoded = protocol::encode_request(request);
    if (core::errors::is_error(encoded)) {
        return core::errors::get_error(encoded);
    }
    return send(core::errors::get_value(encoded));
}

core::errors::Result<std::string> ServerProcess::read_response() {
    if (!running()) {
        return BridgeError{ErrorCategory::Transport, "Server process is not running.",
                           "server_not_running"};
    }
    auto frame = transport_->read();
    if (core::errors::is_error(frame)) {
        return core::errors::get_error(frame);
    }
    const auto& payload = core::errors::get_value(frame);
    if (!payload.has_value()) {
        return BridgeError{ErrorCategory::Transport,
                           "Unexpected end of stream while waiting for a response.",
                           "unexpected_eof"};
    }
    return payload.value();
}

void ServerProcess::shutdown() {
    if (pid_ <= 0) {
        return;
    }
    static_cast<void>(kill(pid_, SIGKILL));
    int status = 0;
    while (waitpid(pid_, &status, 0) < 0 && errno == EINTR) {
    }
    LOG_DEBUG("ServerProcess: pid " + std::to_string(pid_) + " reaped");
    pid_ = -1;
    close_fd(stdin_fd_);
    close_fd(stdout_fd_);
    stdin_fd_ = -1;
    stdout_fd_ = -1;
}

}  // namespace appbridge::client
