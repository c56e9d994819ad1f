#pragma once

#include "database/Store.hpp"
#include "types/RequestContext.hpp"
#include "types/User.hpp"
#include "util/Clock.hpp"

#include <memory>
#include <optional>
#include <string>

namespace cw::wallet {

class IdentityStore {
public:
    IdentityStore(std::shared_ptr<database::Store> store, std::shared_ptr<util::Clock> clock);

    // Throws InvalidArgument on an empty email or empty username, Conflict when either
    // is already taken.
    std::shared_ptr<types::User> create(const std::string& email,
                                        const std::optional<std::string>& username = std::nullopt,
                                        const std::optional<std::string>& passwordHash = std::nullopt,
                                        bool isAdmin = false,
                                        const types::RequestContext& ctx = {}) const;

    [[nodiscard]] std::shared_ptr<types::User> get(unsigned int userId) const;
    [[nodiscard]] std::shared_ptr<types::User> getByEmail(const std::string& email) const;

    std::shared_ptr<types::User> setActive(unsigned int userId, bool active,
                                           const std::optional<unsigned int>& actor = std::nullopt,
                                           const types::RequestContext& ctx = {}) const;

    std::shared_ptr<types::User> setAdmin(unsigned int userId, bool admin,
                                          const std::optional<unsigned int>& actor = std::nullopt,
                                          const types::RequestContext& ctx = {}) const;

    // Deletes the user with everything that cascades from it
    void remove(unsigned int userId, const std::optional<unsigned int>& actor = std::nullopt,
                const types::RequestContext& ctx = {}) const;

    // NotFound unless the user exists and is active
    static std::shared_ptr<types::User> requireActive(database::Transaction& txn, unsigned int userId);

private:
    std::shared_ptr<database::Store> store_;
    std::shared_ptr<util::Clock> clock_;

    std::shared_ptr<types::User> updateFlags(const char* ctxName, unsigned int userId,
                                             const std::optional<bool>& active, const std::optional<bool>& admin,
                                             const std::optional<unsigned int>& actor,
                                             const types::RequestContext& ctx) const;
};

}
