#include "transport/transport_factory.hpp"

#include <unistd.h>
#include <utility>
#include "transport/fd_transport.hpp"

namespace appbridge::transport {

using core::config::TransportKind;
using core::errors::BridgeError;
using core::errors::ErrorCategory;

core::errors::Result<std::unique_ptr<Transport>> create_transport(
    const core::config::ServerConfig& config,
    std::shared_ptr<std::atomic_bool> stop_token) {
    switch (config.transport) {
        case TransportKind::Stdio: {
            FdTransportOptions options;
            options.max_frame_bytes = config.max_frame_bytes;
            options.stop_token = std::move(stop_token);
            return std::unique_ptr<Transport>(
                std::make_unique<FdTransport>(STDIN_FILENO, STDOUT_FILENO, std::move(options)));
        }
        case TransportKind::UnixSocket:
            return BridgeError{ErrorCategory::Input,
                               "Unix domain socket transport is not implemented yet "
                               "(requested path: " +
                                   (config.socket_path ? config.socket_path->string()
                                                       : std::string("<none>")) +
                                   ")",
                               "transport_not_implemented",
                               "Use --transport stdio."};
    }
    return BridgeError{ErrorCategory::Internal, "Unknown transport kind.",
                       "invalid_transport"};
}

}  // namespace appbridge::transport
