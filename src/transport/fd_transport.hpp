#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include "transport/transport.hpp"

namespace appbridge::transport {

struct FdTransportOptions {
    std::size_t max_frame_bytes = 16 * 1024 * 1024;
    // When set while a read is interrupted by a signal, read() reports end
    // of stream.
    std::shared_ptr<std::atomic_bool> stop_token;
};

// Content-Length framing over a pair of file descriptors (stdin/stdout for
// the server, the child's pipes for the client). The descriptors are not
// owned.
class FdTransport : public Transport {
public:
    FdTransport(int in_fd, int out_fd, FdTransportOptions options = {});

    core::errors::Result<std::optional<std::string>> read() override;
    core::errors::Result<std::size_t> write(const std::string& payload) override;

private:
    enum class FillStatus { Data, EndOfStream };
    enum class LineStatus { Complete, Partial, EndOfStream };

    core::errors::Result<FillStatus> fill();
    core::errors::Result<LineStatus> read_line(std::string& line, bool& too_long);
    core::errors::Result<std::size_t> read_exact(std::size_t length, std::string* out);
    void compact();

    int in_fd_;
    int out_fd_;
    FdTransportOptions options_;
    std::string buffer_;
    std::size_t pos_ = 0;
    bool eof_ = false;
};

}  // namespace appbridge::transport
