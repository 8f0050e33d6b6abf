#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include "core/errors/bridge_errors.hpp"

namespace appbridge::transport {

inline constexpr std::string_view kContentLengthHeader = "Content-Length";
inline constexpr std::size_t kMaxHeaderLineBytes = 8 * 1024;

// "Content-Length: N\r\n\r\n" followed by the payload. No trailer.
std::string encode_frame(std::string_view payload);

// Parses the value part of a Content-Length header ("  42 ").
core::errors::Result<std::size_t> parse_content_length(std::string_view value);

// Case-insensitive header name comparison.
bool header_name_equals(std::string_view lhs, std::string_view rhs);

}  // namespace appbridge::transport
