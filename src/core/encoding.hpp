// core/encoding.hpp
// Byte-level helpers shared by the wire codecs
//
//   - Big-endian u32 load/store (UDP ping sequence numbers)
//   - Base64 encode/decode (session ping tokens)
#pragma once

#include <cstdint>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace coverage {

inline void store_be32(uint8_t* out, uint32_t v) {
    out[0] = static_cast<uint8_t>(v >> 24);
    out[1] = static_cast<uint8_t>(v >> 16);
    out[2] = static_cast<uint8_t>(v >> 8);
    out[3] = static_cast<uint8_t>(v);
}

inline uint32_t load_be32(const uint8_t* in) {
    return (static_cast<uint32_t>(in[0]) << 24) |
           (static_cast<uint32_t>(in[1]) << 16) |
           (static_cast<uint32_t>(in[2]) << 8) |
           static_cast<uint32_t>(in[3]);
}

namespace detail {

static const char base64_chars[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

inline int base64_value(char c) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+') return 62;
    if (c == '/') return 63;
    return -1;
}

} // namespace detail

/**
 * Base64 encode (standard alphabet, padded)
 */
inline std::string base64_encode(const uint8_t* data, size_t len) {
    std::string encoded;
    encoded.reserve(((len + 2) / 3) * 4);

    for (size_t i = 0; i < len; i += 3) {
        uint32_t val = (uint32_t)data[i] << 16;
        if (i + 1 < len) val |= (uint32_t)data[i + 1] << 8;
        if (i + 2 < len) val |= data[i + 2];

        encoded.push_back(detail::base64_chars[(val >> 18) & 0x3F]);
        encoded.push_back(detail::base64_chars[(val >> 12) & 0x3F]);
        encoded.push_back((i + 1 < len) ? detail::base64_chars[(val >> 6) & 0x3F] : '=');
        encoded.push_back((i + 2 < len) ? detail::base64_chars[val & 0x3F] : '=');
    }

    return encoded;
}

/**
 * Base64 decode (standard alphabet, padding optional)
 *
 * @param text Encoded text
 * @return Decoded bytes, std::nullopt if text is not valid Base64
 */
inline std::optional<std::vector<uint8_t>> base64_decode(const std::string& text) {
    size_t len = text.size();
    while (len > 0 && text[len - 1] == '=') {
        --len;
    }
    if (text.size() - len > 2 || len % 4 == 1) {
        return std::nullopt;
    }

    std::vector<uint8_t> out;
    out.reserve(len * 3 / 4);

    uint32_t acc = 0;
    int bits = 0;
    for (size_t i = 0; i < len; ++i) {
        int v = detail::base64_value(text[i]);
        if (v < 0) {
            return std::nullopt;
        }
        acc = (acc << 6) | static_cast<uint32_t>(v);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            out.push_back(static_cast<uint8_t>((acc >> bits) & 0xFF));
        }
    }

    return out;
}

} // namespace coverage
