#include "wallet/IdentityStore.hpp"
#include "wallet/AuditTrail.hpp"
#include "database/Transactions.hpp"
#include "error/Error.hpp"
#include "log/Registry.hpp"

using namespace cw::wallet;
using namespace cw::types;
using namespace cw::database;
using namespace cw::error;

IdentityStore::IdentityStore(std::shared_ptr<Store> store, std::shared_ptr<util::Clock> clock)
    : store_(std::move(store)), clock_(std::move(clock)) {}

std::shared_ptr<User> IdentityStore::requireActive(Transaction& txn, const unsigned int userId) {
    auto user = txn.getUser(userId);
    if (!user) throw NotFound("User " + std::to_string(userId) + " does not exist");
    if (!user->is_active) throw NotFound("User " + std::to_string(userId) + " is deactivated");
    return user;
}

std::shared_ptr<User> IdentityStore::create(const std::string& email,
                                            const std::optional<std::string>& username,
                                            const std::optional<std::string>& passwordHash,
                                            const bool isAdmin,
                                            const RequestContext& ctx) const {
    if (email.empty()) throw InvalidArgument("User email must not be empty");
    if (username && username->empty()) throw InvalidArgument("Username must not be empty when given");

    const auto now = clock_->now();
    User user(email, username, passwordHash, isAdmin);
    user.created_at = user.updated_at = now;

    const auto entry = Transactions::exec(*store_, "IdentityStore::create", [&](Transaction& txn) {
        user.id = txn.insertUser(user);
        return AuditTrail::record(txn, now, user.id, "user.create", "user", user.id, ctx);
    });

    AuditTrail::publish(entry);
    log::Registry::identity()->info("[IdentityStore::create] Created user {} ({})", user.id, user.email);
    return std::make_shared<User>(user);
}

std::shared_ptr<User> IdentityStore::get(const unsigned int userId) const {
    auto user = Transactions::exec(*store_, "IdentityStore::get", [&](Transaction& txn) {
        return txn.getUser(userId);
    });
    if (!user) throw NotFound("User " + std::to_string(userId) + " does not exist");
    return user;
}

std::shared_ptr<User> IdentityStore::getByEmail(const std::string& email) const {
    auto user = Transactions::exec(*store_, "IdentityStore::getByEmail", [&](Transaction& txn) {
        return txn.getUserByEmail(email);
    });
    if (!user) throw NotFound("No user registered with email " + email);
    return user;
}

std::shared_ptr<User> IdentityStore::updateFlags(const char* ctxName, const unsigned int userId,
                                                 const std::optional<bool>& active, const std::optional<bool>& admin,
                                                 const std::optional<unsigned int>& actor,
                                                 const RequestContext& ctx) const {
    const auto now = clock_->now();
    AuditLogEntry entry;

    auto user = Transactions::exec(*store_, ctxName, [&](Transaction& txn) {
        auto u = txn.getUser(userId);
        if (!u) throw NotFound("User " + std::to_string(userId) + " does not exist");

        u->is_active = active.value_or(u->is_active);
        u->is_admin = admin.value_or(u->is_admin);
        u->updated_at = now;
        txn.updateUserFlags(userId, u->is_active, u->is_admin, now);

        entry = AuditTrail::record(txn, now, actor, "user.update", "user", userId, ctx);
        return u;
    });

    AuditTrail::publish(entry);
    return user;
}

std::shared_ptr<User> IdentityStore::setActive(const unsigned int userId, const bool active,
                                               const std::optional<unsigned int>& actor,
                                               const RequestContext& ctx) const {
    auto user = updateFlags("IdentityStore::setActive", userId, active, std::nullopt, actor, ctx);
    log::Registry::identity()->info("[IdentityStore::setActive] User {} {}", userId,
                                    active ? "reactivated" : "deactivated");
    return user;
}

std::shared_ptr<User> IdentityStore::setAdmin(const unsigned int userId, const bool admin,
                                              const std::optional<unsigned int>& actor,
                                              const RequestContext& ctx) const {
    auto user = updateFlags("IdentityStore::setAdmin", userId, std::nullopt, admin, actor, ctx);
    log::Registry::identity()->info("[IdentityStore::setAdmin] User {} admin flag set to {}", userId, admin);
    return user;
}

void IdentityStore::remove(const unsigned int userId, const std::optional<unsigned int>& actor,
                           const RequestContext& ctx) const {
    const auto now = clock_->now();

    const auto entry = Transactions::exec(*store_, "IdentityStore::remove", [&](Transaction& txn) {
        if (!txn.getUser(userId)) throw NotFound("User " + std::to_string(userId) + " does not exist");

        // Written first: when the actor is the user being removed, the delete nulls it like
        // every other entry of theirs
        auto e = AuditTrail::record(txn, now, actor, "user.delete", "user", userId, ctx);
        txn.deleteUser(userId);
        if (e.user_id == userId) e.user_id.reset();
        return e;
    });

    AuditTrail::publish(entry);
    log::Registry::identity()->info("[IdentityStore::remove] Removed user {} and its dependent records", userId);
}
