// STAKELEDGER - Ledger Settings
// Copyright (c) 2024 STAKELEDGER Developers
// MIT License

#ifndef STAKELEDGER_LEDGER_SETTINGS_H
#define STAKELEDGER_LEDGER_SETTINGS_H

#include "stakeledger/core/types.h"
#include "stakeledger/util/config.h"
#include "stakeledger/util/logging.h"
#include "stakeledger/util/time.h"

#include <string>
#include <vector>

namespace stakeledger {
namespace ledger {

constexpr Amount DEFAULT_DEPOSIT_FLOOR = 0;
constexpr Duration DEFAULT_COOLDOWN_PERIOD = util::SECONDS_PER_DAY;

/// Settings read from the configuration file and command line
struct LedgerSettings {
    std::string dataDir;
    std::string logFile;
    util::LogLevel logLevel{util::LogLevel::Info};
    bool printToConsole{true};

    /// Initial parameters and admins, applied when a ledger is created
    Amount depositFloor{DEFAULT_DEPOSIT_FLOOR};
    Duration cooldownPeriod{DEFAULT_COOLDOWN_PERIOD};
    std::vector<Identity> admins;

    /// Payout recipients whose transfers are refused
    std::vector<Identity> refused;

    /**
     * Read settings from config.
     * @return false with error set if a value is malformed
     */
    static bool FromConfig(const util::ConfigManager& config, LedgerSettings& out,
                           std::string& error);
};

} // namespace ledger
} // namespace stakeledger

#endif // STAKELEDGER_LEDGER_SETTINGS_H
