#include "core/text/utf8.hpp"

#include <cstddef>
#include <cstdint>

namespace appbridge::core::text {

namespace {

constexpr const char* kReplacement = "\xEF\xBF\xBD";

// Length of the valid sequence starting at `pos`, or 0 if it is invalid.
std::size_t sequence_length(std::string_view bytes, const std::size_t pos,
                            char32_t* decoded = nullptr) {
    const auto lead = static_cast<std::uint8_t>(bytes[pos]);
    if (lead < 0x80) {
        if (decoded != nullptr) {
            *decoded = lead;
        }
        return 1;
    }

    std::size_t length = 0;
    std::uint32_t code_point = 0;
    if ((lead & 0xE0) == 0xC0) {
        length = 2;
        code_point = lead & 0x1F;
    } else if ((lead & 0xF0) == 0xE0) {
        length = 3;
        code_point = lead & 0x0F;
    } else if ((lead & 0xF8) == 0xF0) {
        length = 4;
        code_point = lead & 0x07;
    } else {
        return 0;
    }

    if (pos + length > bytes.size()) {
        return 0;
    }
    for (std::size_t i = 1; i < length; ++i) {
        const auto cont = static_cast<std::uint8_t>(bytes[pos + i]);
        if ((cont & 0xC0) != 0x80) {
            return 0;
        }
        code_point = (code_point << 6) | (cont & 0x3F);
    }

    if ((length == 2 && code_point < 0x80) ||
        (length == 3 && code_point < 0x800) ||
        (length == 4 && code_point < 0x10000)) {
        return 0;
    }
    if (code_point > 0x10FFFF) {
        return 0;
    }
    if (code_point >= 0xD800 && code_point <= 0xDFFF) {
        return 0;
    }
    if (decoded != nullptr) {
        *decoded = static_cast<char32_t>(code_point);
    }
    return length;
}

}  // namespace

bool is_valid_utf8(std::string_view bytes) {
    std::size_t pos = 0;
    while (pos < bytes.size()) {
        const std::size_t length = sequence_length(bytes, pos);
        if (length == 0) {
            return false;
        }
        pos += length;
    }
    return true;
}

std::string to_utf8_lossy(std::string_view bytes) {
    std::string out;
    out.reserve(bytes.size());
    std::size_t pos = 0;
    while (pos < bytes.size()) {
        const std::size_t length = sequence_length(bytes, pos);
        if (length == 0) {
            out += kReplacement;
            ++pos;
            continue;
        }
        out.append(bytes.substr(pos, length));
        pos += length;
    }
    return out;
}

std::size_t decode_code_point(std::string_view bytes, const std::size_t pos,
                              char32_t& code_point) {
    if (pos >= bytes.size()) {
        return 0;
    }
    return sequence_length(bytes, pos, &code_point);
}

bool is_whitespace(const char32_t code_point) {
    switch (code_point) {
        case 0x0009: case 0x000A: case 0x000B: case 0x000C: case 0x000D:
        case 0x0020: case 0x0085: case 0x00A0: case 0x1680:
        case 0x2028: case 0x2029: case 0x202F: case 0x205F: case 0x3000:
            return true;
        default:
            return code_point >= 0x2000 && code_point <= 0x200A;
    }
}

}  // namespace appbridge::core::text
