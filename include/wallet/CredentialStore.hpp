#pragma once

#include "database/Store.hpp"
#include "types/Credential.hpp"
#include "types/RequestContext.hpp"
#include "util/Clock.hpp"
#include "wallet/Options.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace cw::wallet {

// Owner-scoped access to encrypted credentials. Non-owners get in only through an
// effective share: read for get(), write for update() and updateDetails().
class CredentialStore {
public:
    CredentialStore(std::shared_ptr<database::Store> store, std::shared_ptr<util::Clock> clock,
                    WalletOptions options);

    std::shared_ptr<types::Credential> create(unsigned int ownerId, const std::string& title,
                                              const std::optional<std::string>& description,
                                              const types::Bytes& ciphertext,
                                              const std::optional<types::Bytes>& iv = std::nullopt,
                                              const types::RequestContext& ctx = {}) const;

    std::shared_ptr<types::Credential> get(unsigned int credentialId, unsigned int requesterId,
                                           const types::RequestContext& ctx = {}) const;

    // Replaces ciphertext and iv
    std::shared_ptr<types::Credential> update(unsigned int credentialId, unsigned int requesterId,
                                              const types::Bytes& ciphertext,
                                              const std::optional<types::Bytes>& iv = std::nullopt,
                                              const types::RequestContext& ctx = {}) const;

    std::shared_ptr<types::Credential> updateDetails(unsigned int credentialId, unsigned int requesterId,
                                                     const std::string& title,
                                                     const std::optional<std::string>& description,
                                                     const types::RequestContext& ctx = {}) const;

    // Owner only. Shares on the credential go with it.
    void remove(unsigned int credentialId, unsigned int requesterId, const types::RequestContext& ctx = {}) const;

    // Owned plus effectively shared, ordered by id
    [[nodiscard]] std::vector<std::shared_ptr<types::Credential>> listForUser(unsigned int userId) const;

private:
    std::shared_ptr<database::Store> store_;
    std::shared_ptr<util::Clock> clock_;
    WalletOptions options_;

    static std::shared_ptr<types::Credential> authorize(database::Transaction& txn, unsigned int credentialId,
                                                        unsigned int requesterId, types::SharePermission required,
                                                        std::time_t now);
};

}
