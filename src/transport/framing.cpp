#include "transport/framing.hpp"

#include <cctype>
#include <charconv>
#include <system_error>

namespace appbridge::transport {

using core::errors::BridgeError;
using core::errors::ErrorCategory;

namespace {

std::string_view trim(std::string_view value) {
    while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) {
        value.remove_prefix(1);
    }
    while (!value.empty() && (value.back() == ' ' || value.back() == '\t')) {
        value.remove_suffix(1);
    }
    return value;
}

}  // namespace

std::string encode_frame(std::string_view payload) {
    std::string frame;
    frame.reserve(payload.size() + 32);
    frame.append(kContentLengthHeader);
    frame.append(": ");
    frame.append(std::to_string(payload.size()));
    frame.append("\r\n\r\n");
    frame.append(payload);
    return frame;
}

core::errors::Result<std::size_t> parse_content_length(std::string_view value) {
    const std::string_view digits = trim(value);
    if (digits.empty()) {
        return BridgeError{ErrorCategory::Framing,
                           "Content-Length header has no value.",
                           "invalid_content_length"};
    }

    std::size_t length = 0;
    const char* begin = digits.data();
    const char* end = digits.data() + digits.size();
    auto [ptr, ec] = std::from_chars(begin, end, length);
    if (ec != std::errc() || ptr != end) {
        return BridgeError{ErrorCategory::Framing,
                           "Content-Length is not a non-negative integer: " +
                               std::string(digits),
                           "invalid_content_length"};
    }
    return length;
}

bool header_name_equals(std::string_view lhs, std::string_view rhs) {
    if (lhs.size() != rhs.size()) {
        return false;
    }
    for (std::size_t i = 0; i < lhs.size(); ++i) {
        const auto a = static_cast<unsigned char>(lhs[i]);
        const auto b = static_cast<unsigned char>(rhs[i]);
        if (std::tolower(a) != std::tolower(b)) {
            return false;
        }
    }
    return true;
}

}  // namespace appbridge::transport
