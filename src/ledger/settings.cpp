// STAKELEDGER - Ledger Settings Implementation
// Copyright (c) 2024 STAKELEDGER Developers
// MIT License

#include "stakeledger/ledger/settings.h"
#include "stakeledger/core/hex.h"

#include <stdexcept>

namespace stakeledger {
namespace ledger {

namespace {

bool ParseIdentities(const std::vector<std::string>& values, const char* key,
                     std::vector<Identity>& out, std::string& error) {
    out.clear();
    for (const auto& value : values) {
        try {
            out.push_back(Identity::FromHex(StripHexPrefix(value)));
        } catch (const std::invalid_argument&) {
            error = std::string("invalid identity for -") + key + ": '" + value + "'";
            return false;
        }
    }
    return true;
}

bool ReadUInt(const util::ConfigManager& config, const char* key, uint64_t& out,
              std::string& error) {
    if (!config.HasKey(key)) {
        return true;
    }
    auto value = config.TryGetUInt(key);
    if (!value) {
        error = std::string("invalid value for -") + key + ": '" +
                config.GetString(key, "") + "'";
        return false;
    }
    out = *value;
    return true;
}

} // namespace

bool LedgerSettings::FromConfig(const util::ConfigManager& config, LedgerSettings& out,
                                std::string& error) {
    using namespace util::ConfigKeys;

    LedgerSettings settings;
    settings.dataDir = config.GetPath(DATADIR, util::ConfigManager::GetDefaultDataDir());
    settings.logFile = config.GetPath(LOGFILE, "");
    settings.logLevel = util::LogLevelFromString(config.GetString(LOGLEVEL, "info"));
    settings.printToConsole = config.GetBool(PRINTTOCONSOLE, true);

    if (!ReadUInt(config, DEPOSITFLOOR, settings.depositFloor, error) ||
        !ReadUInt(config, COOLDOWN, settings.cooldownPeriod, error)) {
        return false;
    }

    if (!ParseIdentities(config.GetList(ADMIN), ADMIN, settings.admins, error) ||
        !ParseIdentities(config.GetList(REFUSE), REFUSE, settings.refused, error)) {
        return false;
    }

    out = std::move(settings);
    return true;
}

} // namespace ledger
} // namespace stakeledger
