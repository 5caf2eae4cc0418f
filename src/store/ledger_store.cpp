// STAKELEDGER - Ledger Store Implementation
// Copyright (c) 2024 STAKELEDGER Developers
// MIT License

#include "stakeledger/store/ledger_store.h"
#include "stakeledger/util/logging.h"

namespace stakeledger {
namespace store {

namespace {

/// Stored value for an admin marker
constexpr uint8_t ADMIN_MARKER = 1;

struct Params {
    Amount depositFloor{0};
    Duration cooldownPeriod{0};
};

template<typename Stream>
void Serialize(Stream& s, const Params& p) {
    ser_writedata64(s, p.depositFloor);
    ser_writedata64(s, p.cooldownPeriod);
}

template<typename Stream>
void Unserialize(Stream& s, Params& p) {
    p.depositFloor = ser_readdata64(s);
    p.cooldownPeriod = ser_readdata64(s);
}

} // namespace

LedgerStore::LedgerStore(db::Database& database) : db_(database) {}

// ============================================================================
// Low-level access
// ============================================================================

template<typename T>
db::Status LedgerStore::ReadValue(const std::string& key, T& value) {
    std::string raw;
    db::Status s = db_.Get(key, &raw);
    if (!s.ok()) {
        return s;
    }
    if (!db::DeserializeFromString(raw, value)) {
        return db::Status::Corruption("malformed value under key '" +
                                      std::string(1, key[0]) + "'");
    }
    return db::Status::Ok();
}

db::Status LedgerStore::ScanIdentities(
    char keyPrefix,
    const std::function<db::Status(const Identity&, const std::string&)>& visit) {
    const std::string start(1, keyPrefix);
    auto it = db_.NewIterator();
    for (it->Seek(start); it->Valid() && it->key().starts_with(start); it->Next()) {
        db::Slice key = it->key();
        if (key.size() != 1 + Identity::SIZE) {
            return db::Status::Corruption("bad key length under prefix '" + start + "'");
        }
        Identity identity(Hash160(reinterpret_cast<const Byte*>(key.data() + 1), Identity::SIZE));
        db::Status s = visit(identity, it->value().ToString());
        if (!s.ok()) {
            return s;
        }
    }
    return it->status();
}

db::Status LedgerStore::CollectKeys(char keyPrefix, std::set<std::string>& keys) {
    const std::string start(1, keyPrefix);
    auto it = db_.NewIterator();
    for (it->Seek(start); it->Valid() && it->key().starts_with(start); it->Next()) {
        keys.insert(it->key().ToString());
    }
    return it->status();
}

// ============================================================================
// Schema
// ============================================================================

bool LedgerStore::IsInitialized() {
    return db_.Exists(db::MakeKey(prefix::VERSION));
}

db::Status LedgerStore::GetSchemaVersion(uint32_t& version) {
    return ReadValue(db::MakeKey(prefix::VERSION), version);
}

db::Status LedgerStore::MigrateSchema() {
    uint32_t version = 0;
    db::Status s = GetSchemaVersion(version);
    if (!s.ok()) {
        return s;
    }

    if (version == CURRENT_SCHEMA_VERSION) {
        return db::Status::Ok();
    }
    if (version > CURRENT_SCHEMA_VERSION) {
        LOG_ERROR(util::LogCategory::STORE) << "Store schema v" << version
                                            << " is newer than supported v"
                                            << CURRENT_SCHEMA_VERSION;
        return db::Status::NotSupported("schema version " + std::to_string(version) +
                                        " is newer than " +
                                        std::to_string(CURRENT_SCHEMA_VERSION));
    }
    if (version < MIN_SCHEMA_VERSION) {
        return db::Status::Corruption("invalid schema version " + std::to_string(version));
    }

    // v1 -> v2: derive custody and add the digest
    ledger::LedgerState state;
    Params params;
    s = ReadValue(db::MakeKey(prefix::PARAMS), params);
    if (!s.ok()) return s;
    state.depositFloor = params.depositFloor;
    state.cooldownPeriod = params.cooldownPeriod;

    s = ReadValue(db::MakeKey(prefix::CONFISCATED), state.confiscatedTotal);
    if (!s.ok()) return s;

    s = ScanIdentities(prefix::RECORD, [&state](const Identity& id, const std::string& raw) {
        ledger::ParticipantRecord record;
        if (!db::DeserializeFromString(raw, record) || !record.IsRegistered()) {
            return db::Status::Corruption("bad record for " + id.ToHex());
        }
        state.records.emplace(id, record);
        return db::Status::Ok();
    });
    if (!s.ok()) return s;

    try {
        state.custodyBalance = CheckedAdd(state.TotalStaked(), state.confiscatedTotal);
    } catch (const AmountOverflow& e) {
        return db::Status::Corruption(std::string("stored balances overflow: ") + e.what());
    }

    db::WriteBatch batch;
    batch.Put(db::MakeKey(prefix::CUSTODY), db::SerializeToString(state.custodyBalance));
    batch.Put(db::MakeKey(prefix::DIGEST),
              db::SerializeToString(ledger::ComputeStateDigest(state)));
    batch.Put(db::MakeKey(prefix::VERSION), db::SerializeToString(CURRENT_SCHEMA_VERSION));

    db::WriteOptions options;
    options.sync = true;
    s = db_.Write(options, &batch);
    if (!s.ok()) {
        return s;
    }

    LOG_INFO(util::LogCategory::STORE) << "Migrated store from schema v" << version
                                       << " to v" << CURRENT_SCHEMA_VERSION
                                       << ", custody " << state.custodyBalance;
    return db::Status::Ok();
}

// ============================================================================
// Load / Save
// ============================================================================

db::Status LedgerStore::Load(PersistedLedger& out) {
    uint32_t version = 0;
    db::Status s = GetSchemaVersion(version);
    if (!s.ok()) {
        return s;
    }
    if (version != CURRENT_SCHEMA_VERSION) {
        return db::Status::NotSupported("schema version " + std::to_string(version) +
                                        (version < CURRENT_SCHEMA_VERSION
                                             ? " requires migration"
                                             : " is newer than this build"));
    }

    PersistedLedger data;
    Params params;
    s = ReadValue(db::MakeKey(prefix::PARAMS), params);
    if (!s.ok()) return s;
    data.state.depositFloor = params.depositFloor;
    data.state.cooldownPeriod = params.cooldownPeriod;

    s = ReadValue(db::MakeKey(prefix::CONFISCATED), data.state.confiscatedTotal);
    if (!s.ok()) return s;
    s = ReadValue(db::MakeKey(prefix::CUSTODY), data.state.custodyBalance);
    if (!s.ok()) return s;

    s = ScanIdentities(prefix::RECORD, [&data](const Identity& id, const std::string& raw) {
        ledger::ParticipantRecord record;
        if (!db::DeserializeFromString(raw, record) || !record.IsRegistered()) {
            return db::Status::Corruption("bad record for " + id.ToHex());
        }
        data.state.records.emplace(id, record);
        return db::Status::Ok();
    });
    if (!s.ok()) return s;

    s = ScanIdentities(prefix::ADMIN, [&data](const Identity& id, const std::string&) {
        data.admins.insert(id);
        return db::Status::Ok();
    });
    if (!s.ok()) return s;

    s = ScanIdentities(prefix::PAYOUT, [&data](const Identity& id, const std::string& raw) {
        Amount balance = 0;
        if (!db::DeserializeFromString(raw, balance)) {
            return db::Status::Corruption("bad payout balance for " + id.ToHex());
        }
        data.payouts.emplace(id, balance);
        return db::Status::Ok();
    });
    if (!s.ok()) return s;

    Hash256 stored;
    s = ReadValue(db::MakeKey(prefix::DIGEST), stored);
    if (!s.ok()) {
        return s.IsNotFound() ? db::Status::Corruption("state digest missing") : s;
    }
    Hash256 computed = ledger::ComputeStateDigest(data.state);
    if (stored != computed) {
        LOG_ERROR(util::LogCategory::STORE) << "State digest mismatch: stored "
                                            << stored.ToHex() << ", computed "
                                            << computed.ToHex();
        return db::Status::Corruption("state digest mismatch");
    }
    if (!data.state.IsConserved()) {
        return db::Status::Corruption("custody does not cover stakes and pool");
    }

    LOG_DEBUG(util::LogCategory::STORE) << "Loaded " << data.state.records.size()
                                        << " participants, " << data.admins.size()
                                        << " admins, " << data.payouts.size() << " payouts";
    out = std::move(data);
    return db::Status::Ok();
}

db::Status LedgerStore::Save(const PersistedLedger& data) {
    std::set<std::string> stale;
    for (char p : {prefix::RECORD, prefix::ADMIN, prefix::PAYOUT}) {
        db::Status s = CollectKeys(p, stale);
        if (!s.ok()) {
            return s;
        }
    }

    db::WriteBatch batch;
    const ledger::LedgerState& state = data.state;

    batch.Put(db::MakeKey(prefix::VERSION), db::SerializeToString(CURRENT_SCHEMA_VERSION));
    batch.Put(db::MakeKey(prefix::PARAMS),
              db::SerializeToString(Params{state.depositFloor, state.cooldownPeriod}));
    batch.Put(db::MakeKey(prefix::CONFISCATED), db::SerializeToString(state.confiscatedTotal));
    batch.Put(db::MakeKey(prefix::CUSTODY), db::SerializeToString(state.custodyBalance));

    for (const auto& [identity, record] : state.records) {
        std::string key = db::MakeKey(prefix::RECORD, identity);
        stale.erase(key);
        batch.Put(key, db::SerializeToString(record));
    }
    for (const auto& identity : data.admins) {
        std::string key = db::MakeKey(prefix::ADMIN, identity);
        stale.erase(key);
        batch.Put(key, db::SerializeToString(ADMIN_MARKER));
    }
    for (const auto& [identity, balance] : data.payouts) {
        std::string key = db::MakeKey(prefix::PAYOUT, identity);
        stale.erase(key);
        batch.Put(key, db::SerializeToString(balance));
    }
    for (const auto& key : stale) {
        batch.Delete(key);
    }

    batch.Put(db::MakeKey(prefix::DIGEST),
              db::SerializeToString(ledger::ComputeStateDigest(state)));

    db::WriteOptions options;
    options.sync = true;
    db::Status s = db_.Write(options, &batch);
    if (!s.ok()) {
        LOG_ERROR(util::LogCategory::STORE) << "Save failed: " << s.ToString();
        return s;
    }

    LOG_DEBUG(util::LogCategory::STORE) << "Saved " << state.records.size()
                                        << " participants (" << batch.Count()
                                        << " writes)";
    return db::Status::Ok();
}

} // namespace store
} // namespace stakeledger
