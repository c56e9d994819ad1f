#include "types/AuditQuery.hpp"

#include <charconv>
#include <stdexcept>

namespace cw::types {

std::string encode_page_token(const AuditLogPosition& pos) {
    return std::to_string(static_cast<long long>(pos.created_at)) + "." + std::to_string(pos.id);
}

AuditLogPosition decode_page_token(const std::string& token) {
    const auto dot = token.find('.');
    if (dot == std::string::npos || dot == 0 || dot + 1 == token.size())
        throw std::invalid_argument("Malformed audit page token: " + token);

    long long ts = 0;
    unsigned int id = 0;
    const auto* begin = token.data();
    const auto* end = token.data() + token.size();

    if (const auto [p, ec] = std::from_chars(begin, begin + dot, ts); ec != std::errc() || p != begin + dot)
        throw std::invalid_argument("Malformed audit page token: " + token);
    if (const auto [p, ec] = std::from_chars(begin + dot + 1, end, id); ec != std::errc() || p != end)
        throw std::invalid_argument("Malformed audit page token: " + token);

    return {static_cast<std::time_t>(ts), id};
}

}
