#include "transport/fd_transport.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <string_view>
#include <unistd.h>
#include <utility>
#include "core/logging/logger.hpp"
#include "core/text/utf8.hpp"
#include "transport/framing.hpp"

namespace appbridge::transport {

using core::errors::BridgeError;
using core::errors::ErrorCategory;

namespace {

constexpr std::size_t kReadChunk = 4096;
constexpr std::size_t kCompactThreshold = 64 * 1024;

BridgeError io_error(const std::string& what, const int err, const std::string& code) {
    return BridgeError{ErrorCategory::Transport,
                       what + ": " + std::strerror(err), code};
}

}  // namespace

FdTransport::FdTransport(const int in_fd, const int out_fd, FdTransportOptions options)
    : in_fd_(in_fd), out_fd_(out_fd), options_(std::move(options)) {}

core::errors::Result<FdTransport::FillStatus> FdTransport::fill() {
    if (eof_) {
        return FillStatus::EndOfStream;
    }

    char chunk[kReadChunk];
    while (true) {
        const ssize_t n = ::read(in_fd_, chunk, sizeof(chunk));
        if (n > 0) {
            compact();
            buffer_.append(chunk, static_cast<std::size_t>(n));
            return FillStatus::Data;
        }
        if (n == 0) {
            eof_ = true;
            return FillStatus::EndOfStream;
        }
        if (errno == EINTR) {
            if (options_.stop_token && options_.stop_token->load()) {
                LOG_INFO("FdTransport: read interrupted by stop request");
                eof_ = true;
                return FillStatus::EndOfStream;
            }
            continue;
        }
        return io_error("Failed to read from transport", errno, "read_failed");
    }
}

void FdTransport::compact() {
    if (pos_ == buffer_.size()) {
        buffer_.clear();
        pos_ = 0;
    } else if (pos_ > kCompactThreshold) {
        buffer_.erase(0, pos_);
        pos_ = 0;
    }
}

// Reads up to and including the next '\n'. Lines longer than
// kMaxHeaderLineBytes are consumed but not stored.
core::errors::Result<FdTransport::LineStatus> FdTransport::read_line(
    std::string& line, bool& too_long) {
    line.clear();
    too_long = false;
    bool consumed_any = false;

    while (true) {
        while (pos_ < buffer_.size()) {
            const char c = buffer_[pos_++];
            consumed_any = true;
            if (c == '\n') {
                return LineStatus::Complete;
            }
            if (line.size() < kMaxHeaderLineBytes) {
                line.push_back(c);
            } else {
                too_long = true;
            }
        }

        auto filled = fill();
        if (core::errors::is_error(filled)) {
            return core::errors::get_error(filled);
        }
        if (core::errors::get_value(filled) == FillStatus::EndOfStream) {
            return consumed_any ? LineStatus::Partial : LineStatus::EndOfStream;
        }
    }
}

// Moves `length` payload bytes into `out` (or discards them when out is
// null). Returns the number of bytes obtained before end of stream.
core::errors::Result<std::size_t> FdTransport::read_exact(const std::size_t length,
                                                          std::string* out) {
    std::size_t obtained = 0;
    while (obtained < length) {
        if (pos_ == buffer_.size()) {
            auto filled = fill();
            if (core::errors::is_error(filled)) {
                return core::errors::get_error(filled);
            }
            if (core::errors::get_value(filled) == FillStatus::EndOfStream) {
                break;
            }
        }

        const std::size_t available = buffer_.size() - pos_;
        const std::size_t take = std::min(available, length - obtained);
        if (out != nullptr) {
            out->append(buffer_, pos_, take);
        }
        pos_ += take;
        obtained += take;
    }
    return obtained;
}

core::errors::Result<std::optional<std::string>> FdTransport::read() {
    std::optional<std::size_t> content_length;
    std::optional<BridgeError> header_error;
    bool saw_header = false;
    std::string line;

    while (true) {
        bool too_long = false;
        auto status_result = read_line(line, too_long);
        if (core::errors::is_error(status_result)) {
            return core::errors::get_error(status_result);
        }
        const LineStatus status = core::errors::get_value(status_result);

        if (status == LineStatus::EndOfStream) {
            if (!saw_header) {
                return std::optional<std::string>{};
            }
            return BridgeError{ErrorCategory::Framing,
                               "Stream ended inside a frame header.",
                               "unexpected_eof_in_header"};
        }
        if (status == LineStatus::Partial) {
            return BridgeError{ErrorCategory::Framing,
                               "Stream ended inside a frame header.",
                               "unexpected_eof_in_header"};
        }

        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty() && !too_long) {
            // Blank lines ahead of the first header are padding left by
            // peers that terminate each payload with CRLF.
            if (!saw_header) {
                continue;
            }
            break;
        }
        saw_header = true;

        if (too_long) {
            if (!header_error) {
                header_error = BridgeError{ErrorCategory::Framing,
                                           "Frame header line exceeds " +
                                               std::to_string(kMaxHeaderLineBytes) +
                                               " bytes.",
                                           "header_too_long"};
            }
            continue;
        }

        const auto colon = line.find(':');
        if (colon == std::string::npos) {
            LOG_DEBUG("FdTransport: ignoring malformed header line");
            continue;
        }
        std::string_view name(line.data(), colon);
        while (!name.empty() && (name.back() == ' ' || name.back() == '\t')) {
            name.remove_suffix(1);
        }
        while (!name.empty() && (name.front() == ' ' || name.front() == '\t')) {
            name.remove_prefix(1);
        }
        if (!header_name_equals(name, kContentLengthHeader)) {
            continue;
        }

        auto parsed = parse_content_length(std::string_view(line).substr(colon + 1));
        if (core::errors::is_error(parsed)) {
            if (!header_error) {
                header_error = core::errors::get_error(parsed);
            }
            continue;
        }
        content_length = core::errors::get_value(parsed);
    }

    if (header_error) {
        // A usable length still lets us step over the payload.
        if (content_length && *content_length > 0) {
            auto skipped = read_exact(*content_length, nullptr);
            if (core::errors::is_error(skipped)) {
                return core::errors::get_error(skipped);
            }
        }
        return *header_error;
    }
    if (!content_length) {
        return BridgeError{ErrorCategory::Framing, "Frame is missing a Content-Length header.",
                           "missing_content_length"};
    }

    const std::size_t length = *content_length;
    if (length > options_.max_frame_bytes) {
        auto skipped = read_exact(length, nullptr);
        if (core::errors::is_error(skipped)) {
            return core::errors::get_error(skipped);
        }
        if (core::errors::get_value(skipped) < length) {
            return BridgeError{ErrorCategory::Framing,
                               "Stream ended inside an oversized frame payload.",
                               "unexpected_eof_in_payload"};
        }
        return BridgeError{ErrorCategory::Framing,
                           "Frame of " + std::to_string(length) +
                               " bytes exceeds the limit of " +
                               std::to_string(options_.max_frame_bytes) + " bytes.",
                           "frame_too_large"};
    }

    std::string payload;
    payload.reserve(length);
    auto obtained = read_exact(length, &payload);
    if (core::errors::is_error(obtained)) {
        return core::errors::get_error(obtained);
    }
    if (core::errors::get_value(obtained) < length) {
        return BridgeError{ErrorCategory::Framing,
                           "Stream ended after " +
                               std::to_string(core::errors::get_value(obtained)) + " of " +
                               std::to_string(length) + " payload bytes.",
                           "unexpected_eof_in_payload"};
    }

    if (!core::text::is_valid_utf8(payload)) {
        return BridgeError{ErrorCategory::Framing, "Frame payload is not valid UTF-8.",
                           "invalid_utf8"};
    }
    return std::optional<std::string>{std::move(payload)};
}

core::errors::Result<std::size_t> FdTransport::write(const std::string& payload) {
    const std::string frame = encode_frame(payload);
    std::size_t written = 0;
    while (written < frame.size()) {
        const ssize_t n = ::write(out_fd_, frame.data() + written, frame.size() - written);
        if (n > 0) {
            written += static_cast<std::size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        return io_error("Failed to write to transport", n < 0 ? errno : EIO,
                        "write_failed");
    }
    return payload.size();
}

}  // namespace appbridge::transport
