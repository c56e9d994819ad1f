#pragma once

#include "util/timestamp.hpp"

#include <ctime>
#include <optional>
#include <string>

namespace cw::database::encoding {

// ISO-8601 UTC text, bound with an explicit ::timestamptz cast in SQL
inline std::string to_pg_timestamp(const std::time_t ts) { return util::timestampToString(ts); }

inline std::optional<std::string> to_pg_timestamp(const std::optional<std::time_t>& ts) {
    if (!ts) return std::nullopt;
    return to_pg_timestamp(*ts);
}

}
