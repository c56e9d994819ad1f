#include "WalletFixture.hpp"
#include "error/Error.hpp"

using namespace cw;
using namespace cw::test;
using cw::types::Bytes;

class CredentialStoreTest : public WalletTest {
protected:
    unsigned int alice = 0, bob = 0;

    void SetUp() override {
        WalletTest::SetUp();
        alice = makeUser("alice@example.com");
        bob = makeUser("bob@example.com");
    }
};

TEST_F(CredentialStoreTest, Create_StoresBytesVerbatim) {
    const Bytes ciphertext{0x00, 0xFF, 0x10, 0x80};
    const Bytes iv{0x01, 0x02, 0x03};
    const auto cred = wallet->credentials().create(alice, "vpn", "work vpn", ciphertext, iv);

    const auto fetched = wallet->credentials().get(cred->id, alice);
    EXPECT_EQ(fetched->data_encrypted, ciphertext);
    EXPECT_EQ(fetched->iv, iv);
    EXPECT_EQ(fetched->description, "work vpn");
    EXPECT_EQ(fetched->user_id, alice);
}

TEST_F(CredentialStoreTest, Create_Validation) {
    EXPECT_THROW(wallet->credentials().create(alice, "", std::nullopt, {0x01}), error::InvalidArgument);
    EXPECT_THROW(wallet->credentials().create(alice, "t", std::nullopt, {}), error::InvalidArgument);
    EXPECT_THROW(wallet->credentials().create(999, "t", std::nullopt, {0x01}), error::NotFound);

    wallet->identities().setActive(bob, false);
    EXPECT_THROW(wallet->credentials().create(bob, "t", std::nullopt, {0x01}), error::NotFound);
}

TEST_F(CredentialStoreTest, Create_EmitsExactlyOneAuditEntry) {
    const auto id = makeCredential(alice);
    const auto entries = auditFor("credential.");
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0]->action, "credential.create");
    EXPECT_EQ(entries[0]->resource_type, "credential");
    EXPECT_EQ(entries[0]->resource_id, id);
    EXPECT_EQ(entries[0]->user_id, alice);
}

TEST_F(CredentialStoreTest, Get_MissingCredential_NotFound) {
    EXPECT_THROW(wallet->credentials().get(12345, alice), error::NotFound);
}

TEST_F(CredentialStoreTest, Get_NonOwnerWithoutShare_PermissionDenied) {
    const auto id = makeCredential(alice);
    EXPECT_THROW(wallet->credentials().get(id, bob), error::PermissionDenied);
}

TEST_F(CredentialStoreTest, Get_UnknownOrDeactivatedRequester_PermissionDenied) {
    const auto id = makeCredential(alice);
    EXPECT_THROW(wallet->credentials().get(id, 999), error::PermissionDenied);

    wallet->shares().grant(id, alice, bob, "read");
    wallet->identities().setActive(bob, false);
    EXPECT_THROW(wallet->credentials().get(id, bob), error::PermissionDenied);
}

TEST_F(CredentialStoreTest, DeactivatedOwner_KeepsAccessToOwnCredential) {
    const auto id = makeCredential(alice);
    wallet->identities().setActive(alice, false);

    EXPECT_EQ(wallet->credentials().get(id, alice)->id, id);
    EXPECT_NO_THROW(wallet->credentials().update(id, alice, {0x42}));
    EXPECT_NO_THROW(wallet->credentials().remove(id, alice));
    EXPECT_THROW(wallet->credentials().get(id, alice), error::NotFound);
}

TEST_F(CredentialStoreTest, Get_ReadsAreNotAuditedByDefault) {
    const auto id = makeCredential(alice);
    wallet->credentials().get(id, alice);
    EXPECT_TRUE(auditFor("credential.read").empty());
}

TEST_F(CredentialStoreTest, SharedAccessScenario) {
    const auto id = wallet->credentials().create(alice, "bank-pin", std::nullopt, {0xA1, 0xB2})->id;

    const auto listed = wallet->credentials().listForUser(alice);
    ASSERT_EQ(listed.size(), 1u);
    EXPECT_EQ(listed[0]->id, id);

    wallet->shares().grant(id, alice, bob, "read");
    EXPECT_NO_THROW(wallet->credentials().get(id, bob));
    EXPECT_THROW(wallet->credentials().update(id, bob, {0x01}), error::PermissionDenied);

    wallet->shares().grant(id, alice, bob, "write", clock->now() - 1);
    EXPECT_THROW(wallet->credentials().update(id, bob, {0x01}), error::PermissionDenied);
    EXPECT_THROW(wallet->credentials().get(id, bob), error::PermissionDenied);
}

TEST_F(CredentialStoreTest, Update_ByOwnerAndWriteGrantee) {
    const auto id = makeCredential(alice);
    clock->advance(10);

    const auto updated = wallet->credentials().update(id, alice, {0x09, 0x08}, Bytes{0x07});
    EXPECT_EQ(updated->data_encrypted, (Bytes{0x09, 0x08}));
    EXPECT_EQ(updated->updated_at, clock->now());
    EXPECT_LT(updated->created_at, updated->updated_at);

    wallet->shares().grant(id, alice, bob, "write", clock->now() + 3600);
    const auto byBob = wallet->credentials().update(id, bob, {0x42});
    EXPECT_EQ(byBob->data_encrypted, (Bytes{0x42}));
    EXPECT_FALSE(byBob->iv.has_value());

    EXPECT_EQ(wallet->credentials().get(id, alice)->data_encrypted, (Bytes{0x42}));
    EXPECT_EQ(auditFor("credential.update").size(), 2u);
}

TEST_F(CredentialStoreTest, Update_EmptyCiphertext_InvalidArgument) {
    const auto id = makeCredential(alice);
    EXPECT_THROW(wallet->credentials().update(id, alice, {}), error::InvalidArgument);
}

TEST_F(CredentialStoreTest, UpdateDetails) {
    const auto id = makeCredential(alice);
    const auto updated = wallet->credentials().updateDetails(id, alice, "renamed", "new description");
    EXPECT_EQ(updated->title, "renamed");
    EXPECT_EQ(wallet->credentials().get(id, alice)->description, "new description");

    EXPECT_THROW(wallet->credentials().updateDetails(id, alice, "", std::nullopt), error::InvalidArgument);
    EXPECT_THROW(wallet->credentials().updateDetails(id, bob, "x", std::nullopt), error::PermissionDenied);
}

TEST_F(CredentialStoreTest, ShareExpiresExactlyAtNow) {
    const auto id = makeCredential(alice);
    wallet->shares().grant(id, alice, bob, "read", clock->now() + 5);

    clock->advance(4);
    EXPECT_NO_THROW(wallet->credentials().get(id, bob));

    clock->advance(1);
    EXPECT_THROW(wallet->credentials().get(id, bob), error::PermissionDenied);
}

TEST_F(CredentialStoreTest, Remove_OwnerOnlyAndCascadesShares) {
    const auto id = makeCredential(alice);
    wallet->shares().grant(id, alice, bob, "write");

    EXPECT_THROW(wallet->credentials().remove(id, bob), error::PermissionDenied);

    wallet->credentials().remove(id, alice);
    EXPECT_THROW(wallet->credentials().get(id, alice), error::NotFound);
    EXPECT_TRUE(wallet->shares().listForGrantee(bob).empty());
    EXPECT_THROW(wallet->credentials().remove(id, alice), error::NotFound);
    EXPECT_EQ(auditFor("credential.delete").size(), 1u);
}

TEST_F(CredentialStoreTest, ListForUser_OwnedAndEffectivelySharedOrderedById) {
    const auto carol = makeUser("carol@example.com");
    const auto bobFirst = makeCredential(bob, "bob-1");
    const auto aliceOwn = makeCredential(alice, "alice-1");
    const auto expired = makeCredential(carol, "carol-expired");
    const auto bobSecond = makeCredential(bob, "bob-2");

    wallet->shares().grant(bobFirst, bob, alice, "read");
    wallet->shares().grant(bobSecond, bob, alice, "write", clock->now() + 60);
    wallet->shares().grant(expired, carol, alice, "read", clock->now() - 60);

    const auto listed = wallet->credentials().listForUser(alice);
    ASSERT_EQ(listed.size(), 3u);
    EXPECT_EQ(listed[0]->id, bobFirst);
    EXPECT_EQ(listed[1]->id, aliceOwn);
    EXPECT_EQ(listed[2]->id, bobSecond);
}

TEST_F(CredentialStoreTest, ListForUser_UnknownUser_PermissionDenied) {
    EXPECT_THROW(wallet->credentials().listForUser(999), error::PermissionDenied);
}

class AuditedReadsTest : public CredentialStoreTest {
protected:
    wallet::WalletOptions options() const override {
        wallet::WalletOptions opts;
        opts.audit_credential_reads = true;
        return opts;
    }
};

TEST_F(AuditedReadsTest, Get_EmitsReadEntryWithRequestContext) {
    const auto id = makeCredential(alice);
    wallet->shares().grant(id, alice, bob, "read");

    types::RequestContext ctx{"10.0.0.7", "credwallet-tests/1.0"};
    wallet->credentials().get(id, bob, ctx);

    const auto reads = auditFor("credential.read");
    ASSERT_EQ(reads.size(), 1u);
    EXPECT_EQ(reads[0]->user_id, bob);
    EXPECT_EQ(reads[0]->resource_id, id);
    EXPECT_EQ(reads[0]->ip_address, "10.0.0.7");
    EXPECT_EQ(reads[0]->user_agent, "credwallet-tests/1.0");
}

TEST_F(AuditedReadsTest, DeniedRead_IsNotAudited) {
    const auto id = makeCredential(alice);
    EXPECT_THROW(wallet->credentials().get(id, bob), error::PermissionDenied);
    EXPECT_TRUE(auditFor("credential.read").empty());
}
