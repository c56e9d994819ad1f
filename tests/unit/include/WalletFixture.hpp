#pragma once

#include <gtest/gtest.h>

#include "ManualClock.hpp"
#include "database/MemoryStore.hpp"
#include "wallet/Wallet.hpp"

#include <memory>

namespace cw::test {

class WalletTest : public ::testing::Test {
protected:
    std::shared_ptr<database::MemoryStore> store;
    std::shared_ptr<ManualClock> clock;
    std::unique_ptr<wallet::Wallet> wallet;

    void SetUp() override {
        store = std::make_shared<database::MemoryStore>();
        clock = std::make_shared<ManualClock>();
        wallet = std::make_unique<wallet::Wallet>(store, clock, options());
        store->bootstrap();
    }

    virtual wallet::WalletOptions options() const { return {}; }

    unsigned int makeUser(const std::string& email) const {
        return wallet->identities().create(email)->id;
    }

    unsigned int makeCredential(const unsigned int owner, const std::string& title = "bank-pin") const {
        return wallet->credentials().create(owner, title, std::nullopt, {0xA1, 0xB2})->id;
    }

    std::vector<std::shared_ptr<types::AuditLogEntry>> auditFor(const std::string& actionPrefix) const {
        types::AuditLogFilter filter;
        filter.action_prefix = actionPrefix;
        return wallet->audit().page(filter, 1000).entries;
    }
};

}
