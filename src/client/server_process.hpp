#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include <sys/types.h>
#include <nlohmann/json.hpp>
#include "core/errors/bridge_errors.hpp"
#include "transport/fd_transport.hpp"

namespace appbridge::client {

// A server child process spoken to over its stdin/stdout. The child is
// killed and reaped by shutdown() or, at the latest, by the destructor,
// whatever it is doing at the time.
class ServerProcess {
public:
    // argv[0] is resolved through PATH. stderr is inherited.
    static core::errors::Result<std::unique_ptr<ServerProcess>> spawn(
        const std::vector<std::string>& argv);

    ~ServerProcess();
    ServerProcess(const ServerProcess&) = delete;
    ServerProcess& operator=(const ServerProcess&) = delete;

    core::errors::Result<std::size_t> send_request(std::int64_t id, const std::string& method,
                                                   const nlohmann::json& params);
    core::errors::Result<std::size_t> send_notification(const std::string& method,
                                                        const nlohmann::json& params);

    // Next framed payload from the server. End of stream is an error here.
    core::errors::Result<std::string> read_response();

    void shutdown();

    pid_t pid() const { return pid_; }
    bool running() const { return pid_ > 0; }

private:
    ServerProcess(pid_t pid, int stdin_fd, int stdout_fd);

    core::errors::Result<std::size_t> send(const std::string& payload);

    pid_t pid_;
    int stdin_fd_;
    int stdout_fd_;
    std::unique_ptr<transport::FdTransport> transport_;
};

}  // namespace appbridge::client
