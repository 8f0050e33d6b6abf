#pragma once
#include <cstddef>
#include <string>
#include <string_view>

namespace appbridge::core::text {

// Strict UTF-8 check: rejects overlong forms, surrogates and code points
// above U+10FFFF.
bool is_valid_utf8(std::string_view bytes);

// Copies `bytes`, replacing every invalid sequence with U+FFFD.
std::string to_utf8_lossy(std::string_view bytes);

// Decodes the sequence starting at `pos`. Returns its length in bytes, or 0
// (leaving `code_point` untouched) when it is invalid.
std::size_t decode_code_point(std::string_view bytes, std::size_t pos, char32_t& code_point);

// Unicode White_Space property.
bool is_whitespace(char32_t code_point);

}  // namespace appbridge::core::text
