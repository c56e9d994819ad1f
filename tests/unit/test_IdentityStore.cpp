#include "WalletFixture.hpp"
#include "error/Error.hpp"

using namespace cw;
using namespace cw::test;

class IdentityStoreTest : public WalletTest {};

TEST_F(IdentityStoreTest, Create_AssignsIdAndTimestamps) {
    const auto user = wallet->identities().create("alice@example.com", "alice", "argon2id$hash");

    EXPECT_GT(user->id, 0u);
    EXPECT_TRUE(user->is_active);
    EXPECT_FALSE(user->is_admin);
    EXPECT_EQ(user->created_at, clock->now());

    const auto fetched = wallet->identities().get(user->id);
    EXPECT_EQ(*fetched, *user);
    EXPECT_EQ(fetched->password_hash, "argon2id$hash");
}

TEST_F(IdentityStoreTest, Create_DuplicateEmail_Conflict) {
    wallet->identities().create("dup@example.com");
    EXPECT_THROW(wallet->identities().create("dup@example.com"), error::Conflict);
}

TEST_F(IdentityStoreTest, Create_DuplicateUsername_Conflict) {
    wallet->identities().create("a@example.com", "same");
    EXPECT_THROW(wallet->identities().create("b@example.com", "same"), error::Conflict);
}

TEST_F(IdentityStoreTest, Create_WithoutUsernames_NoConflict) {
    EXPECT_NO_THROW(wallet->identities().create("a@example.com"));
    EXPECT_NO_THROW(wallet->identities().create("b@example.com"));
}

TEST_F(IdentityStoreTest, Create_RejectsEmptyEmailAndUsername) {
    EXPECT_THROW(wallet->identities().create(""), error::InvalidArgument);
    EXPECT_THROW(wallet->identities().create("x@example.com", std::string{}), error::InvalidArgument);
}

TEST_F(IdentityStoreTest, Create_EmitsAuditEntry) {
    const auto user = wallet->identities().create("alice@example.com");
    const auto entries = auditFor("user.create");
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0]->user_id, user->id);
    EXPECT_EQ(entries[0]->resource_type, "user");
    EXPECT_EQ(entries[0]->resource_id, user->id);
}

TEST_F(IdentityStoreTest, GetMissing_NotFound) {
    EXPECT_THROW(wallet->identities().get(42), error::NotFound);
    EXPECT_THROW(wallet->identities().getByEmail("nobody@example.com"), error::NotFound);
}

TEST_F(IdentityStoreTest, GetByEmail) {
    const auto id = makeUser("bob@example.com");
    EXPECT_EQ(wallet->identities().getByEmail("bob@example.com")->id, id);
}

TEST_F(IdentityStoreTest, SetActiveAndAdmin) {
    const auto id = makeUser("carol@example.com");
    clock->advance(60);

    const auto deactivated = wallet->identities().setActive(id, false);
    EXPECT_FALSE(deactivated->is_active);
    EXPECT_EQ(deactivated->updated_at, clock->now());

    const auto admin = wallet->identities().setAdmin(id, true);
    EXPECT_TRUE(admin->is_admin);
    EXPECT_FALSE(admin->is_active);

    EXPECT_EQ(auditFor("user.update").size(), 2u);
    EXPECT_THROW(wallet->identities().setActive(999, true), error::NotFound);
}

TEST_F(IdentityStoreTest, Remove_MissingUser_NotFound) {
    EXPECT_THROW(wallet->identities().remove(7), error::NotFound);
}

TEST_F(IdentityStoreTest, Remove_CascadesAndNullsAuditActor) {
    const auto alice = makeUser("alice@example.com");
    const auto bob = makeUser("bob@example.com");
    const auto carol = makeUser("carol@example.com");

    const auto aliceCred = makeCredential(alice, "alice-secret");
    const auto bobCred = makeCredential(bob, "bob-secret");
    wallet->shares().grant(aliceCred, alice, carol, "read");
    wallet->shares().grant(bobCred, bob, alice, "write");
    wallet->verifications().start(alice, "onfido");

    wallet->identities().remove(alice, bob);

    EXPECT_THROW(wallet->identities().get(alice), error::NotFound);
    EXPECT_THROW(wallet->credentials().get(aliceCred, alice), error::NotFound);
    EXPECT_TRUE(wallet->shares().listForGrantee(carol).empty());
    EXPECT_TRUE(wallet->shares().listForCredential(bobCred, bob).empty());
    EXPECT_THROW(wallet->verifications().getLatest(alice), error::NotFound);

    // Entries survive with the actor cleared
    types::AuditLogFilter byAlice;
    byAlice.user_id = alice;
    EXPECT_TRUE(wallet->audit().page(byAlice).entries.empty());
    EXPECT_EQ(auditFor("credential.create").size(), 2u);

    const auto deletes = auditFor("user.delete");
    ASSERT_EQ(deletes.size(), 1u);
    EXPECT_EQ(deletes[0]->user_id, bob);
    EXPECT_EQ(deletes[0]->resource_id, alice);
}

TEST_F(IdentityStoreTest, Remove_SelfDeletionLeavesNullActor) {
    const auto alice = makeUser("alice@example.com");
    wallet->identities().remove(alice, alice);

    const auto deletes = auditFor("user.delete");
    ASSERT_EQ(deletes.size(), 1u);
    EXPECT_FALSE(deletes[0]->user_id.has_value());
}
