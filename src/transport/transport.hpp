#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include "core/errors/bridge_errors.hpp"

namespace appbridge::transport {

// A message-oriented channel to one peer.
//
// read() yields the next message payload, std::nullopt when the peer closed
// the stream at a frame boundary, or an error. Errors of category Framing only
// cost the offending frame; any other category means the channel is unusable.
class Transport {
public:
    virtual ~Transport() = default;

    virtual core::errors::Result<std::optional<std::string>> read() = 0;

    // Sends one message, returns the payload size in bytes.
    virtual core::errors::Result<std::size_t> write(const std::string& payload) = 0;
};

}  // namespace appbridge::transport
