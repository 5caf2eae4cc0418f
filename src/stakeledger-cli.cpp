// STAKELEDGER CLI - Command Line Interface
// Copyright (c) 2024 STAKELEDGER Developers
// MIT License
//
// Runs one ledger operation against the ledger stored in a data directory
// and saves the result if the operation succeeded.

#include "stakeledger/authority/admin_roster.h"
#include "stakeledger/core/hex.h"
#include "stakeledger/db/database.h"
#include "stakeledger/ledger/ledger.h"
#include "stakeledger/ledger/settings.h"
#include "stakeledger/store/ledger_store.h"
#include "stakeledger/transfer/payout_book.h"
#include "stakeledger/util/config.h"
#include "stakeledger/util/logging.h"
#include "stakeledger/util/time.h"

#include <algorithm>
#include <filesystem>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace stakeledger {
namespace cli {

constexpr const char* VERSION = "0.1.0";
constexpr const char* DATABASE_DIRNAME = "ledger";

/// Process exit codes
constexpr int EXIT_OK = 0;
constexpr int EXIT_LEDGER_ERROR = 1;
constexpr int EXIT_USAGE = 2;

/// Thrown for bad arguments; reported with EXIT_USAGE
class UsageError : public std::runtime_error {
public:
    explicit UsageError(const std::string& what) : std::runtime_error(what) {}
};

// ============================================================================
// Help
// ============================================================================

void PrintHelp() {
    std::cout << "stakeledger-cli " << VERSION << "\n\n"
              << "Usage: stakeledger-cli [options] <command> [args]\n\n"
              << "Options:\n"
              << "  -datadir=<dir>      Data directory (default ~/.stakeledger)\n"
              << "  -conf=<file>        Config file (default <datadir>/stakeledger.conf)\n"
              << "  -caller=<id>        Calling identity (40 hex characters)\n"
              << "  -value=<amount>     Value attached to register/stake\n"
              << "  -time=<seconds>     Ledger time of the call (default: now)\n"
              << "  -loglevel=<level>   trace, debug, info, warn, error\n"
              << "  -logfile=<file>     Also write log to file\n\n"
              << "Commands:\n"
              << "  init                        Create the ledger from config\n"
              << "  setconfig FLOOR COOLDOWN    Replace ledger parameters (admin)\n"
              << "  register                    Register with -value as deposit\n"
              << "  unregister                  Leave and withdraw all stake\n"
              << "  stake                       Add -value to stake\n"
              << "  unstake AMOUNT              Withdraw part of the stake\n"
              << "  slash TARGET AMOUNT         Confiscate stake (admin)\n"
              << "  sweep AMOUNT                Withdraw confiscated funds (admin)\n"
              << "  grantadmin ID               Grant the admin capability (admin)\n"
              << "  revokeadmin ID              Revoke the admin capability (admin)\n"
              << "  getrecord ID                Show a participant record\n"
              << "  getstate                    Show ledger totals\n";
}

// ============================================================================
// Argument helpers
// ============================================================================

Identity ParseIdentityArg(const std::string& text, const char* what) {
    try {
        return Identity::FromHex(StripHexPrefix(text));
    } catch (const std::invalid_argument&) {
        throw UsageError(std::string("invalid ") + what + ": '" + text + "'");
    }
}

Amount ParseAmountArg(const std::string& text, const char* what) {
    const std::string message = std::string("invalid ") + what + ": '" + text + "'";
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
        throw UsageError(message);
    }
    try {
        return std::stoull(text);
    } catch (const std::out_of_range&) {
        throw UsageError(message);
    }
}

void RequireArgs(const std::vector<std::string>& args, size_t count, const std::string& usage) {
    if (args.size() != count + 1) {
        throw UsageError("usage: " + usage);
    }
}

// ============================================================================
// Setup
// ============================================================================

bool LoadConfiguration(int argc, char* argv[], util::ConfigManager& config,
                       std::vector<std::string>& positional) {
    util::ConfigParseResult result = config.ParseCommandLine(argc, argv, &positional);
    if (!result.success) {
        std::cerr << "Error: " << result.ToString() << "\n";
        return false;
    }

    std::string dataDir = config.GetPath(util::ConfigKeys::DATADIR,
                                         util::ConfigManager::GetDefaultDataDir());
    if (config.HasKey(util::ConfigKeys::CONF)) {
        result = config.ParseFile(config.GetPath(util::ConfigKeys::CONF));
        if (!result.success) {
            std::cerr << "Error reading config: " << result.ToString() << "\n";
            return false;
        }
    } else {
        std::filesystem::path defaultConf =
            std::filesystem::path(dataDir) / util::DEFAULT_CONFIG_FILENAME;
        std::error_code ec;
        if (std::filesystem::exists(defaultConf, ec)) {
            result = config.ParseFile(defaultConf.string());
            if (!result.success) {
                std::cerr << "Error reading config: " << result.ToString() << "\n";
                return false;
            }
        }
    }
    return true;
}

void SetupLogging(const ledger::LedgerSettings& settings) {
    auto& logger = util::Logger::Instance();
    logger.ClearSinks();
    logger.SetLevel(settings.logLevel);

    if (settings.printToConsole) {
        // Console carries warnings only so stdout stays machine-readable
        util::ConsoleSink::Config console;
        console.level = std::max(settings.logLevel, util::LogLevel::Warn);
        console.showTimestamp = false;
        logger.AddSink(std::make_shared<util::ConsoleSink>(console));
    }
    if (!settings.logFile.empty()) {
        auto file = std::make_shared<util::FileSink>(settings.logFile, settings.logLevel);
        if (file->IsOpen()) {
            logger.AddSink(file);
        } else {
            std::cerr << "Warning: cannot open log file " << settings.logFile << "\n";
        }
    }
}

// ============================================================================
// Commands
// ============================================================================

int Initialize(store::LedgerStore& ledgerStore, const ledger::LedgerSettings& settings) {
    if (ledgerStore.IsInitialized()) {
        std::cerr << "Error: ledger already initialized in " << settings.dataDir << "\n";
        return EXIT_USAGE;
    }
    if (settings.admins.empty()) {
        std::cerr << "Error: init requires at least one -admin\n";
        return EXIT_USAGE;
    }

    authority::AdminRoster roster;
    if (!roster.Seed(settings.admins)) {
        std::cerr << "Error: admin roster already seeded\n";
        return EXIT_USAGE;
    }

    store::PersistedLedger data;
    data.state.depositFloor = settings.depositFloor;
    data.state.cooldownPeriod = settings.cooldownPeriod;
    data.admins = roster.GetAdmins();

    db::Status s = ledgerStore.Save(data);
    if (!s.ok()) {
        std::cerr << "Error: " << s.ToString() << "\n";
        return EXIT_USAGE;
    }

    LOG_INFO(util::LogCategory::STORE) << "Initialized ledger in " << settings.dataDir;
    std::cout << "initialized: depositfloor=" << settings.depositFloor
              << " cooldown=" << settings.cooldownPeriod
              << " admins=" << data.admins.size() << "\n";
    return EXIT_OK;
}

void PrintRecord(const ledger::StakeLedger& stakeLedger, const Identity& identity) {
    ledger::ParticipantRecord record = stakeLedger.GetRecord(identity);
    std::cout << "identity: " << identity.ToHex() << "\n"
              << "registered: " << (record.IsRegistered() ? "yes" : "no") << "\n"
              << "registeredAt: " << record.registeredAt << "\n"
              << "stakedAmount: " << record.stakedAmount << "\n";
    if (auto ends = stakeLedger.CooldownEndsAt(identity)) {
        std::cout << "cooldownEndsAt: " << *ends << "\n";
    }
}

void PrintState(const ledger::StakeLedger& stakeLedger, const authority::AdminRoster& roster,
                const transfer::PayoutBook& payouts) {
    std::cout << "depositFloor: " << stakeLedger.GetDepositFloor() << "\n"
              << "cooldownPeriod: " << stakeLedger.GetCooldownPeriod() << "\n"
              << "participants: " << stakeLedger.ParticipantCount() << "\n"
              << "totalStaked: " << stakeLedger.GetTotalStaked() << "\n"
              << "confiscatedTotal: " << stakeLedger.GetConfiscatedTotal() << "\n"
              << "custodyBalance: " << stakeLedger.GetCustodyBalance() << "\n"
              << "conserved: " << (stakeLedger.CheckConservation() ? "yes" : "no") << "\n";
    for (const auto& admin : roster.GetAdmins()) {
        std::cout << "admin: " << admin.ToHex() << "\n";
    }
    for (const auto& [identity, balance] : payouts.GetBalances()) {
        std::cout << "payout: " << identity.ToHex() << " " << balance << "\n";
    }
}

int RunCommand(const util::ConfigManager& config, const std::vector<std::string>& args,
               const ledger::LedgerSettings& settings) {
    const std::string& command = args[0];

    auto [status, database] = db::OpenDatabase(
        std::filesystem::path(settings.dataDir) / DATABASE_DIRNAME);
    if (!status.ok()) {
        std::cerr << "Error: cannot open ledger: " << status.ToString() << "\n";
        return EXIT_USAGE;
    }
    store::LedgerStore ledgerStore(*database);

    if (command == "init") {
        RequireArgs(args, 0, "init");
        return Initialize(ledgerStore, settings);
    }

    if (!ledgerStore.IsInitialized()) {
        std::cerr << "Error: no ledger in " << settings.dataDir << " (run init first)\n";
        return EXIT_USAGE;
    }

    db::Status s = ledgerStore.MigrateSchema();
    store::PersistedLedger data;
    if (s.ok()) {
        s = ledgerStore.Load(data);
    }
    if (!s.ok()) {
        std::cerr << "Error: cannot load ledger: " << s.ToString() << "\n";
        return EXIT_USAGE;
    }

    authority::AdminRoster roster(data.admins);
    transfer::PayoutBook payouts;
    payouts.SetBalances(data.payouts);
    for (const auto& identity : settings.refused) {
        payouts.Refuse(identity);
    }

    ledger::StakeLedger stakeLedger(roster, payouts);
    stakeLedger.Restore(data.state);

    // Read-only commands
    if (command == "getrecord") {
        RequireArgs(args, 1, "getrecord ID");
        PrintRecord(stakeLedger, ParseIdentityArg(args[1], "identity"));
        return EXIT_OK;
    }
    if (command == "getstate") {
        RequireArgs(args, 0, "getstate");
        PrintState(stakeLedger, roster, payouts);
        return EXIT_OK;
    }

    // State-changing commands
    if (!config.HasKey(util::ConfigKeys::CALLER)) {
        throw UsageError(command + " requires -caller");
    }
    ledger::CallContext ctx;
    ctx.caller = ParseIdentityArg(config.GetString(util::ConfigKeys::CALLER, ""), "caller");
    if (config.HasKey(util::ConfigKeys::TIME)) {
        util::EnableMockTime();
        util::SetMockTime(ParseAmountArg(config.GetString(util::ConfigKeys::TIME, ""), "time"));
    }
    ctx.timestamp = util::GetTime();

    std::optional<Amount> value;
    if (config.HasKey(util::ConfigKeys::VALUE)) {
        value = ParseAmountArg(config.GetString(util::ConfigKeys::VALUE, ""), "value");
    }
    bool payable = command == "register" || command == "stake";
    if (value && !payable) {
        throw UsageError(command + " does not accept -value");
    }

    // Printed only once the change is persisted
    ledger::EventRecorder recorder(stakeLedger);

    ledger::LedgerResult result;
    if (command == "setconfig") {
        RequireArgs(args, 2, "setconfig FLOOR COOLDOWN");
        result = stakeLedger.SetConfiguration(ctx, ParseAmountArg(args[1], "floor"),
                                              ParseAmountArg(args[2], "cooldown"));
    } else if (command == "register") {
        RequireArgs(args, 0, "register");
        result = stakeLedger.Register(ctx, value.value_or(0));
    } else if (command == "unregister") {
        RequireArgs(args, 0, "unregister");
        result = stakeLedger.Unregister(ctx);
    } else if (command == "stake") {
        RequireArgs(args, 0, "stake");
        result = stakeLedger.Stake(ctx, value.value_or(0));
    } else if (command == "unstake") {
        RequireArgs(args, 1, "unstake AMOUNT");
        result = stakeLedger.Unstake(ctx, ParseAmountArg(args[1], "amount"));
    } else if (command == "slash") {
        RequireArgs(args, 2, "slash TARGET AMOUNT");
        result = stakeLedger.Slash(ctx, ParseIdentityArg(args[1], "target"),
                                   ParseAmountArg(args[2], "amount"));
    } else if (command == "sweep") {
        RequireArgs(args, 1, "sweep AMOUNT");
        result = stakeLedger.Sweep(ctx, ParseAmountArg(args[1], "amount"));
    } else if (command == "grantadmin") {
        RequireArgs(args, 1, "grantadmin ID");
        result = roster.Grant(ctx, ParseIdentityArg(args[1], "identity"));
    } else if (command == "revokeadmin") {
        RequireArgs(args, 1, "revokeadmin ID");
        result = roster.Revoke(ctx, ParseIdentityArg(args[1], "identity"));
    } else {
        throw UsageError("unknown command '" + command + "'");
    }

    if (!result.ok()) {
        std::cerr << "error: " << result.ToString() << "\n";
        return EXIT_LEDGER_ERROR;
    }

    data.state = stakeLedger.Snapshot();
    data.admins = roster.GetAdmins();
    data.payouts = payouts.GetBalances();
    s = ledgerStore.Save(data);
    if (!s.ok()) {
        std::cerr << "Error: cannot save ledger: " << s.ToString() << "\n";
        return EXIT_USAGE;
    }

    for (const auto& event : recorder.Events()) {
        std::cout << "event: " << event.ToString() << "\n";
    }
    std::cout << "ok\n";
    return EXIT_OK;
}

// ============================================================================
// Main Entry Point
// ============================================================================

int AppMain(int argc, char* argv[]) {
    util::ConfigManager config;
    std::vector<std::string> args;
    if (!LoadConfiguration(argc, argv, config, args)) {
        return EXIT_USAGE;
    }

    if (config.GetBool("help", false) || config.GetBool("h", false)) {
        PrintHelp();
        return EXIT_OK;
    }
    if (config.GetBool("version", false)) {
        std::cout << "stakeledger-cli " << VERSION << "\n";
        return EXIT_OK;
    }
    if (args.empty()) {
        std::cerr << "Error: No command specified.\n"
                  << "Use 'stakeledger-cli -help' for usage information.\n";
        return EXIT_USAGE;
    }

    ledger::LedgerSettings settings;
    std::string error;
    if (!ledger::LedgerSettings::FromConfig(config, settings, error)) {
        std::cerr << "Error: " << error << "\n";
        return EXIT_USAGE;
    }
    SetupLogging(settings);

    try {
        return RunCommand(config, args, settings);
    } catch (const UsageError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return EXIT_USAGE;
    }
}

} // namespace cli
} // namespace stakeledger

// ============================================================================
// Main
// ============================================================================

int main(int argc, char* argv[]) {
    int rc;
    try {
        rc = stakeledger::cli::AppMain(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        rc = stakeledger::cli::EXIT_USAGE;
    }
    stakeledger::util::Logger::Instance().Flush();
    return rc;
}
