#pragma once

#include "types/Bytes.hpp"

#include <optional>
#include <stdexcept>
#include <string>

namespace cw::database::encoding {

// PostgreSQL hex output format for bytea: "\x" followed by two hex digits per byte.
inline std::string to_hex_bytea(const types::Bytes& bytes) {
    static constexpr char digits[] = "0123456789abcdef";
    std::string out = "\\x";
    out.reserve(2 + bytes.size() * 2);
    for (const auto b : bytes) {
        out += digits[b >> 4];
        out += digits[b & 0x0F];
    }
    return out;
}

inline std::optional<std::string> to_hex_bytea(const std::optional<types::Bytes>& bytes) {
    if (!bytes) return std::nullopt;
    return to_hex_bytea(*bytes);
}

inline uint8_t hex_nibble(const char c) {
    if (c >= '0' && c <= '9') return static_cast<uint8_t>(c - '0');
    if (c >= 'a' && c <= 'f') return static_cast<uint8_t>(c - 'a' + 10);
    if (c >= 'A' && c <= 'F') return static_cast<uint8_t>(c - 'A' + 10);
    throw std::invalid_argument(std::string("Invalid hex digit in bytea: ") + c);
}

inline types::Bytes from_hex_bytea(const std::string& text) {
    if (text.rfind("\\x", 0) != 0) throw std::invalid_argument("bytea value is not in hex format");
    if (text.size() % 2 != 0) throw std::invalid_argument("bytea hex value has odd length");

    types::Bytes out;
    out.reserve((text.size() - 2) / 2);
    for (size_t i = 2; i < text.size(); i += 2)
        out.push_back(static_cast<uint8_t>(hex_nibble(text[i]) << 4 | hex_nibble(text[i + 1])));
    return out;
}

}
