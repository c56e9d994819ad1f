#pragma once

#include <ctime>
#include <optional>
#include <string>

namespace cw::types {

struct AuditLogFilter {
    std::optional<unsigned int> user_id;
    std::optional<std::string> action_prefix;
    std::optional<std::time_t> since, until;  // inclusive bounds on created_at
};

// Keyset position in the (created_at DESC, id DESC) ordering. A page token is the
// position of the last entry already yielded.
struct AuditLogPosition {
    std::time_t created_at{};
    unsigned int id{0};
};

std::string encode_page_token(const AuditLogPosition& pos);

// Throws std::invalid_argument on a malformed token
AuditLogPosition decode_page_token(const std::string& token);

// Escapes LIKE wildcards so a prefix is matched literally
inline std::string like_prefix_pattern(const std::string& prefix) {
    std::string out;
    out.reserve(prefix.size() + 1);
    for (const char c : prefix) {
        if (c == '%' || c == '_' || c == '\\') out += '\\';
        out += c;
    }
    out += '%';
    return out;
}

}
