#pragma once

#include <optional>
#include <string>

namespace cw::types {

// Caller metadata copied verbatim into the audit entry an operation emits
struct RequestContext {
    std::optional<std::string> ip_address;
    std::optional<std::string> user_agent;
};

}
