// STAKELEDGER - Ledger Store
// Copyright (c) 2024 STAKELEDGER Developers
// MIT License
//
// Persists the ledger, the admin roster and payout balances in a key-value
// database. Each save is one atomic batch.
//
// Key layout (prefix byte, then the serialized key):
//   'V'            -> schema version (uint32)
//   'P'            -> deposit floor, cooldown period
//   'X'            -> confiscated total
//   'K'            -> custody balance              (version 2+)
//   'r' + identity -> participant record
//   'a' + identity -> admin marker
//   'p' + identity -> payout balance
//   'D'            -> state digest                 (version 2+)

#ifndef STAKELEDGER_STORE_LEDGER_STORE_H
#define STAKELEDGER_STORE_LEDGER_STORE_H

#include "stakeledger/core/types.h"
#include "stakeledger/db/database.h"
#include "stakeledger/ledger/types.h"

#include <cstdint>
#include <functional>
#include <map>
#include <set>
#include <string>

namespace stakeledger {
namespace store {

/// Schema written by this build
constexpr uint32_t CURRENT_SCHEMA_VERSION = 2;

/// Oldest schema that MigrateSchema() can upgrade
constexpr uint32_t MIN_SCHEMA_VERSION = 1;

namespace prefix {
    constexpr char VERSION = 'V';
    constexpr char PARAMS = 'P';
    constexpr char CONFISCATED = 'X';
    constexpr char CUSTODY = 'K';
    constexpr char RECORD = 'r';
    constexpr char ADMIN = 'a';
    constexpr char PAYOUT = 'p';
    constexpr char DIGEST = 'D';
}

/// Everything kept in one store
struct PersistedLedger {
    ledger::LedgerState state;
    std::set<Identity> admins;
    std::map<Identity, Amount> payouts;
};

class LedgerStore {
public:
    /// The database must outlive the store
    explicit LedgerStore(db::Database& database);

    /// True once a schema version has been written
    bool IsInitialized();

    /// Read the schema version; NotFound for an empty store
    db::Status GetSchemaVersion(uint32_t& version);

    /**
     * Bring an older store up to CURRENT_SCHEMA_VERSION in one batch.
     *
     * Version 1 stores get a custody balance derived from their stakes and
     * pool, and a state digest. Stores newer than this build are refused
     * with NotSupported.
     */
    db::Status MigrateSchema();

    /**
     * Load the whole store.
     *
     * Fails with Corruption if the digest does not match the loaded state
     * or the stored bytes are malformed, and with NotSupported if the store
     * needs migrating or is newer than this build.
     */
    db::Status Load(PersistedLedger& out);

    /// Replace the stored contents with data, including the digest
    db::Status Save(const PersistedLedger& data);

private:
    /// Keys under prefix, for deleting entries no longer present
    db::Status CollectKeys(char keyPrefix, std::set<std::string>& keys);

    template<typename T>
    db::Status ReadValue(const std::string& key, T& value);

    /// Visit every identity-keyed entry under prefix
    db::Status ScanIdentities(
        char keyPrefix,
        const std::function<db::Status(const Identity&, const std::string&)>& visit);

    db::Database& db_;
};

} // namespace store
} // namespace stakeledger

#endif // STAKELEDGER_STORE_LEDGER_STORE_H
