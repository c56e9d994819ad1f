#pragma once

#include "database/Store.hpp"
#include "error/Error.hpp"
#include "log/Registry.hpp"

#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

namespace cw::database {

class Transactions {
  public:
    // Runs func inside one transaction on store, committing on return and rolling back
    // (by destroying the uncommitted transaction) when func or the commit throws.
    template <typename Func>
    static auto exec(Store& store, const std::string& ctx, Func&& func)
        -> decltype(func(std::declval<Transaction&>())) {
        log::Registry::db()->trace("[Transactions::exec] Starting transaction: {}", ctx);
        auto txn = store.begin();

        try {
            if constexpr (std::is_void_v<decltype(func(*txn))>) {
                func(*txn);
                txn->commit();
                log::Registry::db()->trace("[Transactions::exec] Transaction committed: {}", ctx);
            } else {
                auto result = func(*txn);
                txn->commit();
                log::Registry::db()->trace("[Transactions::exec] Transaction committed: {}", ctx);
                return result;
            }
        } catch (const error::StorageFailure& e) {
            log::Registry::db()->error("[Transactions::exec] Storage failure in '{}', rolling back: {}", ctx, e.what());
            throw;
        } catch (const error::Error& e) {
            log::Registry::db()->debug("[Transactions::exec] '{}' rejected ({}), rolling back: {}",
                                       ctx, error::to_string(e.kind()), e.what());
            throw;
        } catch (const std::exception& e) {
            log::Registry::db()->error("[Transactions::exec] Exception in transaction context '{}', rolling back: {}",
                                       ctx, e.what());
            throw;
        }

        if constexpr (!std::is_void_v<decltype(func(*txn))>) {
            throw std::logic_error("Unreachable path in Transactions::exec");
        }
    }
};

} // namespace cw::database
