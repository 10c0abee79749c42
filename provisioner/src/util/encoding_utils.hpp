#pragma once

#include <cstdint>
#include <string>

namespace encoding_utils {

inline std::string base64_encode(const std::string& bytes) {
    static const char* alphabet =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

    std::string out;
    out.reserve(((bytes.size() + 2) / 3) * 4);

    size_t i = 0;
    while (i + 2 < bytes.size()) {
        std::uint32_t chunk = (static_cast<std::uint8_t>(bytes[i]) << 16) |
                              (static_cast<std::uint8_t>(bytes[i + 1]) << 8) |
                              static_cast<std::uint8_t>(bytes[i + 2]);
        out += alphabet[(chunk >> 18) & 0x3F];
        out += alphabet[(chunk >> 12) & 0x3F];
        out += alphabet[(chunk >> 6) & 0x3F];
        out += alphabet[chunk & 0x3F];
        i += 3;
    }

    size_t remaining = bytes.size() - i;
    if (remaining == 1) {
        std::uint32_t chunk = static_cast<std::uint8_t>(bytes[i]) << 16;
        out += alphabet[(chunk >> 18) & 0x3F];
        out += alphabet[(chunk >> 12) & 0x3F];
        out += "==";
    } else if (remaining == 2) {
        std::uint32_t chunk = (static_cast<std::uint8_t>(bytes[i]) << 16) |
                              (static_cast<std::uint8_t>(bytes[i + 1]) << 8);
        out += alphabet[(chunk >> 18) & 0x3F];
        out += alphabet[(chunk >> 12) & 0x3F];
        out += alphabet[(chunk >> 6) & 0x3F];
        out += '=';
    }

    return out;
}

// UTF-8 to UTF-16LE. Invalid sequences are replaced with U+FFFD.
inline std::string utf8_to_utf16le(const std::string& utf8) {
    std::string out;
    out.reserve(utf8.size() * 2);

    auto append_unit = [&out](std::uint16_t unit) {
        out += static_cast<char>(unit & 0xFF);
        out += static_cast<char>((unit >> 8) & 0xFF);
    };

    size_t i = 0;
    while (i < utf8.size()) {
        std::uint8_t lead = static_cast<std::uint8_t>(utf8[i]);
        std::uint32_t code_point = 0xFFFD;
        size_t length = 1;

        if (lead < 0x80) {
            code_point = lead;
        } else if ((lead & 0xE0) == 0xC0) {
            length = 2;
            code_point = lead & 0x1F;
        } else if ((lead & 0xF0) == 0xE0) {
            length = 3;
            code_point = lead & 0x0F;
        } else if ((lead & 0xF8) == 0xF0) {
            length = 4;
            code_point = lead & 0x07;
        } else {
            append_unit(0xFFFD);
            ++i;
            continue;
        }

        if (i + length > utf8.size()) {
            append_unit(0xFFFD);
            break;
        }

        bool valid = true;
        for (size_t k = 1; k < length; k++) {
            std::uint8_t next = static_cast<std::uint8_t>(utf8[i + k]);
            if ((next & 0xC0) != 0x80) {
                valid = false;
                break;
            }
            code_point = (code_point << 6) | (next & 0x3F);
        }
        if (!valid) {
            append_unit(0xFFFD);
            ++i;
            continue;
        }

        if (code_point >= 0x10000) {
            code_point -= 0x10000;
            append_unit(static_cast<std::uint16_t>(0xD800 + (code_point >> 10)));
            append_unit(static_cast<std::uint16_t>(0xDC00 + (code_point & 0x3FF)));
        } else {
            append_unit(static_cast<std::uint16_t>(code_point));
        }
        i += length;
    }

    return out;
}

// Encoding Windows Setup expects for <Password><Value> with PlainText set to
// false: base64 of the UTF-16LE password followed by the literal "Password".
// This hides the value from casual reading; it is not encryption.
inline std::string encode_unattend_password(const std::string& plain_password) {
    return base64_encode(utf8_to_utf16le(plain_password + "Password"));
}

} // namespace encoding_utils
