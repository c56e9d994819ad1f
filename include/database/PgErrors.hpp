#pragma once

#include "error/Error.hpp"

#include <stdexcept>
#include <string>
#include <pqxx/except>

namespace cw::database {

// Runs func and translates what escapes into the wallet's error taxonomy: unique
// violations become Conflict, foreign-key violations NotFound, and every other libpqxx
// failure StorageFailure. Rows that fail to decode (unknown enum text, bad timestamps,
// pqxx conversion errors) are StorageFailure too. Wallet errors pass through untouched.
template <typename Func>
auto pg_guard(const std::string& op, Func&& func) -> decltype(func()) {
    try {
        return func();
    } catch (const error::Error&) {
        throw;
    } catch (const pqxx::unique_violation& e) {
        throw error::Conflict(op + ": " + e.what());
    } catch (const pqxx::foreign_key_violation& e) {
        throw error::NotFound(op + ": referenced row does not exist (" + e.what() + ")");
    } catch (const pqxx::failure& e) {
        throw error::StorageFailure(op + ": " + e.what());
    } catch (const std::logic_error& e) {
        throw error::StorageFailure(op + ": undecodable row: " + e.what());
    } catch (const std::runtime_error& e) {
        throw error::StorageFailure(op + ": " + e.what());
    }
}

}
