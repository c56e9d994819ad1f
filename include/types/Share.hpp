#pragma once

#include <ctime>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace pqxx {
class row;
class result;
}

namespace cw::types {

enum class SharePermission { Read, Write };

std::string to_string(SharePermission permission);
SharePermission share_permission_from_string(const std::string& str);

struct Share {
    unsigned int id{0}, credential_id{0}, shared_with_user_id{0};
    SharePermission permission{SharePermission::Read};
    std::optional<std::time_t> expires_at{std::nullopt};
    std::time_t created_at{};

    Share() = default;
    Share(unsigned int credentialId, unsigned int granteeId, SharePermission permission,
          std::optional<std::time_t> expiresAt);
    explicit Share(const pqxx::row& row);

    // Effective while unexpired: no expiry, or an expiry strictly after `now`.
    [[nodiscard]] bool isEffectiveAt(std::time_t now) const;

    // Write implies read.
    [[nodiscard]] bool allows(SharePermission required) const;
};

// A share as reported to its owner, tagged with effectiveness at query time.
struct ShareView {
    std::shared_ptr<Share> share;
    bool effective{false};
};

void to_json(nlohmann::json& j, const Share& s);
void to_json(nlohmann::json& j, const ShareView& v);
void to_json(nlohmann::json& j, const std::vector<ShareView>& v);

std::vector<std::shared_ptr<Share>> shares_from_pq_res(const pqxx::result& res);

}
