// LOCKVAULT CLI - Command Line Interface
// Copyright (c) 2024 LOCKVAULT Developers
// MIT License
//
// The lockvault-cli tool runs vault operations against a data directory
// holding the vault store and the token ledger, either one command per
// invocation or a script of commands.

#include <lockvault/token/ledger.h>
#include <lockvault/util/config.h>
#include <lockvault/util/logging.h>
#include <lockvault/util/time.h>
#include <lockvault/vault/params.h>
#include <lockvault/vault/vault.h>
#include <lockvault/vault/vaultdb.h>

#include <filesystem>
#include <fstream>
#include <getopt.h>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace lockvault {
namespace cli {

// ============================================================================
// Version Information
// ============================================================================

constexpr const char* VERSION = "0.1.0";
constexpr const char* CLIENT_NAME = "LOCKVAULT CLI";

// ============================================================================
// CLI Configuration
// ============================================================================

struct CLIConfig {
    // Paths
    std::string dataDir;
    std::string configFile;
    std::string scriptFile;

    /// Unix time or ISO 8601 to run at (default: wall clock)
    std::string timeOverride;

    /// section.key=value overrides
    std::vector<std::string> overrides;

    // Logging
    bool debug{false};
    std::string logLevel;

    // Command
    std::string command;
    std::vector<std::string> args;

    // Flags
    bool showHelp{false};
    bool showVersion{false};
};

// ============================================================================
// Help and Version
// ============================================================================

void PrintHelp() {
    std::cout << CLIENT_NAME << " v" << VERSION << "\n\n";
    std::cout << "Usage: lockvault-cli [options] <command> [args...]\n";
    std::cout << "       lockvault-cli [options] --script=FILE\n\n";
    std::cout << "Options:\n";
    std::cout << "  -h, --help                 Show this help message\n";
    std::cout << "  -v, --version              Show version information\n";
    std::cout << "  -c, --conf=FILE            Config file (default: <datadir>/lockvault.conf)\n";
    std::cout << "  -d, --datadir=DIR          Data directory (default: ~/.lockvault)\n";
    std::cout << "  -t, --time=TIME            Run at TIME (unix seconds or ISO 8601)\n";
    std::cout << "  -s, --script=FILE          Run commands from FILE, one per line\n";
    std::cout << "      --set=SECTION.KEY=VAL  Override a config value\n";
    std::cout << "      --debug                Log at debug level\n";
    std::cout << "      --loglevel=LEVEL       trace, debug, info, warn, error\n";
    std::cout << "\nAccounts are 40-hex-digit addresses or labels (hashed to an address).\n";
    std::cout << "Amounts are in tokens (\"1000\", \"0.5\"); durations take s/m/h/d/w.\n";
    std::cout << "\nLedger:\n";
    std::cout << "  mint <account> <amount>                     Create balance\n";
    std::cout << "  approve <owner> <amount>                    Allow the vault to pull\n";
    std::cout << "  balance <account>                           Show ledger balance\n";
    std::cout << "\nStaking:\n";
    std::cout << "  stake <user> <amount> <lockup>\n";
    std::cout << "  increase-amount <user> <amount>\n";
    std::cout << "  increase-lockup <user> <duration>\n";
    std::cout << "  increase-stake <user> <amount> <duration>\n";
    std::cout << "  initiate-unstake <user> <amount>\n";
    std::cout << "  unstake <user> <amount>\n";
    std::cout << "  initiate-early-unstake <user> <amount>\n";
    std::cout << "  early-unstake <user> <amount>\n";
    std::cout << "\nQuality control and administration:\n";
    std::cout << "  qa-penalty <caller> <user> <amount>\n";
    std::cout << "  pause <admin> | unpause <admin>\n";
    std::cout << "  set-treasury <admin> <account>\n";
    std::cout << "  set-qa <admin> <account>\n";
    std::cout << "  set-max-stake <admin> <amount>\n";
    std::cout << "  emergency-withdraw <admin> <to> <amount>\n";
    std::cout << "\nQueries:\n";
    std::cout << "  info [user]                                 Vault or user summary\n";
    std::cout << "  multiplier [amount duration]                Table or a single lookup\n";
    std::cout << "\nScripts only:\n";
    std::cout << "  warp <duration>                             Advance the clock\n";
    std::cout << "\nExamples:\n";
    std::cout << "  lockvault-cli mint alice 5000\n";
    std::cout << "  lockvault-cli approve alice 5000\n";
    std::cout << "  lockvault-cli stake alice 1000 30d\n";
    std::cout << "  lockvault-cli --time=2025-03-01T00:00:00 info alice\n";
    std::cout << "\n";
}

void PrintVersion() {
    std::cout << CLIENT_NAME << " v" << VERSION << "\n";
    std::cout << "Copyright (c) 2024 LOCKVAULT Developers\n";
    std::cout << "MIT License\n";
}

// ============================================================================
// Command Line Parsing
// ============================================================================

bool ParseCommandLine(int argc, char* argv[], CLIConfig& config) {
    static struct option longOptions[] = {
        {"help", no_argument, nullptr, 'h'},
        {"version", no_argument, nullptr, 'v'},
        {"conf", required_argument, nullptr, 'c'},
        {"datadir", required_argument, nullptr, 'd'},
        {"time", required_argument, nullptr, 't'},
        {"script", required_argument, nullptr, 's'},
        {"set", required_argument, nullptr, 1001},
        {"debug", no_argument, nullptr, 1002},
        {"loglevel", required_argument, nullptr, 1003},
        {nullptr, 0, nullptr, 0}
    };

    int opt;
    int optionIndex = 0;

    optind = 1;

    // "+" stops at the first non-option so command arguments are left alone
    while ((opt = getopt_long(argc, argv, "+hvc:d:t:s:", longOptions, &optionIndex)) != -1) {
        switch (opt) {
            case 'h':
                config.showHelp = true;
                return true;
            case 'v':
                config.showVersion = true;
                return true;
            case 'c':
                config.configFile = optarg;
                break;
            case 'd':
                config.dataDir = optarg;
                break;
            case 't':
                config.timeOverride = optarg;
                break;
            case 's':
                config.scriptFile = optarg;
                break;
            case 1001:  // --set
                config.overrides.push_back(optarg);
                break;
            case 1002:  // --debug
                config.debug = true;
                break;
            case 1003:  // --loglevel
                config.logLevel = optarg;
                break;
            case '?':
            default:
                return false;
        }
    }

    for (int i = optind; i < argc; ++i) {
        if (config.command.empty()) {
            config.command = argv[i];
        } else {
            config.args.push_back(argv[i]);
        }
    }

    return true;
}

// ============================================================================
// Argument Parsing
// ============================================================================

/// Thrown for malformed command arguments; reported without a stack of context
class UsageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

Address ParseAccount(const std::string& arg) {
    if (auto addr = Address::Parse(arg)) {
        return *addr;
    }
    if (arg.empty()) {
        throw UsageError("empty account");
    }
    return Address::FromLabel(arg);
}

Amount ParseTokenAmount(const std::string& arg) {
    auto amount = ParseAmount(arg);
    if (!amount) {
        throw UsageError("invalid amount '" + arg + "'");
    }
    return *amount;
}

int64_t ParseDurationArg(const std::string& arg) {
    auto seconds = util::ParseDuration(arg);
    if (!seconds) {
        throw UsageError("invalid duration '" + arg + "'");
    }
    return *seconds;
}

std::optional<int64_t> ParseTimeArg(const std::string& arg) {
    if (!arg.empty() && arg.find_first_not_of("0123456789") == std::string::npos) {
        try {
            return std::stoll(arg);
        } catch (const std::out_of_range&) {
            return std::nullopt;
        }
    }
    std::string trimmed = arg;
    if (!trimmed.empty() && trimmed.back() == 'Z') {
        trimmed.pop_back();
    }
    return util::ParseISO8601(trimmed);
}

/// "section.key=value" or "key=value"
bool ApplyOverride(util::ConfigManager& config, const std::string& spec) {
    size_t eq = spec.find('=');
    if (eq == std::string::npos || eq == 0) {
        return false;
    }
    std::string name = spec.substr(0, eq);
    std::string value = spec.substr(eq + 1);

    size_t dot = name.find('.');
    if (dot == std::string::npos) {
        config.Set(name, value);
    } else {
        config.Set(name.substr(dot + 1), value, name.substr(0, dot));
    }
    return true;
}

// ============================================================================
// Logging Setup
// ============================================================================

void SetupLogging(const CLIConfig& cli, const util::ConfigManager& config) {
    auto& logger = util::Logger::Instance();

    util::LogLevel level = util::LogLevel::Warn;
    if (!cli.logLevel.empty()) {
        level = util::LogLevelFromString(cli.logLevel);
    } else if (auto configured = config.TryGetString(util::ConfigKeys::LOGLEVEL)) {
        level = util::LogLevelFromString(*configured);
    }
    if (cli.debug || config.GetBool(util::ConfigKeys::DEBUG, false)) {
        level = util::LogLevel::Debug;
    }
    logger.SetLevel(level);

    logger.ClearSinks();
    if (config.GetBool(util::ConfigKeys::PRINTTOCONSOLE, true)) {
        util::ConsoleSink::Options console;
        console.level = level;
        logger.AddSink(std::make_shared<util::ConsoleSink>(console));
    }

    std::string logFile = config.GetPath(util::ConfigKeys::LOGFILE, "");
    if (!logFile.empty()) {
        util::FileSink::Options file;
        file.path = logFile;
        file.level = level;
        auto sink = std::make_shared<util::FileSink>(file);
        if (sink->IsOpen()) {
            logger.AddSink(sink);
        } else {
            LOG_WARN(util::LogCategory::CLI) << "Cannot open log file " << logFile;
        }
    }
}

// ============================================================================
// Output
// ============================================================================

void PrintSummary(const vault::StakingVault& v, const Address& user) {
    vault::UserStakingSummary s = v.GetUserSummary(user);
    auto dur = [](int64_t secs) { return util::FormatDuration(util::Seconds{secs}); };

    std::cout << "user:                  " << user.ToString() << "\n";
    std::cout << "active:                " << (s.hasActiveStake ? "yes" : "no") << "\n";
    std::cout << "staked:                " << FormatAmount(s.userTotalStaked) << "\n";
    std::cout << "unlocked:              " << FormatAmount(s.totalUnlocked) << "\n";
    std::cout << "locked:                " << FormatAmount(s.totalLocked) << "\n";
    std::cout << "in cooldown:           " << FormatAmount(s.totalInCooldown)
              << " (ready " << FormatAmount(s.totalReadyForUnstake)
              << ", " << dur(s.timeUntilCooldownComplete) << " left)\n";
    std::cout << "in early cooldown:     " << FormatAmount(s.totalInEarlyCooldown)
              << " (ready " << FormatAmount(s.totalReadyForEarlyUnstake)
              << ", " << dur(s.timeUntilEarlyCooldownComplete) << " left)\n";
    std::cout << "multiplier:            " << FormatBps(s.effectiveMultiplier) << "\n";
    std::cout << "effective lockup:      " << dur(s.effectiveLockupPeriod) << "\n";
    std::cout << "time until unlock:     " << dur(s.timeUntilUnlock) << "\n";
}

void PrintVaultInfo(const vault::StakingVault& v, const token::TokenLedger& ledger) {
    std::cout << "vault:                 " << v.GetVaultAddress().ToString() << "\n";
    std::cout << "time:                  " << util::FormatTimestamp(util::GetTime()) << "\n";
    std::cout << "paused:                " << (v.IsPaused() ? "yes" : "no") << "\n";
    std::cout << "stakers:               " << v.GetStakerCount() << "\n";
    std::cout << "total staked:          " << FormatAmount(v.GetTotalStaked()) << "\n";
    std::cout << "total in cooldown:     " << FormatAmount(v.GetTotalInCooldown()) << "\n";
    std::cout << "total early cooldown:  " << FormatAmount(v.GetTotalInEarlyCooldown()) << "\n";
    std::cout << "custody balance:       "
              << FormatAmount(ledger.BalanceOf(v.GetVaultAddress())) << "\n";
    std::cout << "maximum stake:         " << FormatAmount(v.GetMaximumStake()) << "\n";
    std::cout << "treasury:              " << v.GetTreasury().ToString() << "\n";
    std::cout << "quality control:       " << v.GetQualityControlCaller().ToString() << "\n";
    std::cout << "admin:                 " << v.GetAdmin().ToString() << "\n";
}

// ============================================================================
// Command Execution
// ============================================================================

class CommandRunner {
public:
    CommandRunner(vault::StakingVault& v, token::TokenLedger& ledger, bool scripted)
        : vault_(v), ledger_(ledger), scripted_(scripted) {}

    /// Returns 0 on success, 1 on a rejected operation, 2 on bad usage
    int Run(const std::string& command, const std::vector<std::string>& args);

private:
    void Need(const std::vector<std::string>& args, size_t n, const char* usage) const {
        if (args.size() != n) {
            throw UsageError(std::string("usage: ") + usage);
        }
    }

    int Report(vault::VaultError err) const {
        if (err != vault::VaultError::OK) {
            std::cerr << "error: " << vault::VaultErrorToString(err) << "\n";
            return 1;
        }
        std::cout << "ok\n";
        return 0;
    }

    int ReportLedger(bool ok, const char* what) const {
        if (!ok) {
            std::cerr << "error: " << what << " failed\n";
            return 1;
        }
        std::cout << "ok\n";
        return 0;
    }

    vault::StakingVault& vault_;
    token::TokenLedger& ledger_;
    bool scripted_;
};

int CommandRunner::Run(const std::string& command, const std::vector<std::string>& a) {
    using vault::VaultError;

    if (command == "mint") {
        Need(a, 2, "mint <account> <amount>");
        return ReportLedger(ledger_.Mint(ParseAccount(a[0]), ParseTokenAmount(a[1])), "mint");
    }
    if (command == "approve") {
        Need(a, 2, "approve <owner> <amount>");
        return ReportLedger(ledger_.Approve(ParseAccount(a[0]), vault_.GetVaultAddress(),
                                            ParseTokenAmount(a[1])), "approve");
    }
    if (command == "balance") {
        Need(a, 1, "balance <account>");
        std::cout << FormatAmount(ledger_.BalanceOf(ParseAccount(a[0]))) << "\n";
        return 0;
    }
    if (command == "stake") {
        Need(a, 3, "stake <user> <amount> <lockup>");
        return Report(vault_.Stake(ParseAccount(a[0]), ParseTokenAmount(a[1]),
                                   ParseDurationArg(a[2])));
    }
    if (command == "increase-amount") {
        Need(a, 2, "increase-amount <user> <amount>");
        return Report(vault_.IncreaseAmount(ParseAccount(a[0]), ParseTokenAmount(a[1])));
    }
    if (command == "increase-lockup") {
        Need(a, 2, "increase-lockup <user> <duration>");
        return Report(vault_.IncreaseLockup(ParseAccount(a[0]), ParseDurationArg(a[1])));
    }
    if (command == "increase-stake") {
        Need(a, 3, "increase-stake <user> <amount> <duration>");
        return Report(vault_.IncreaseStake(ParseAccount(a[0]), ParseTokenAmount(a[1]),
                                           ParseDurationArg(a[2])));
    }
    if (command == "initiate-unstake") {
        Need(a, 2, "initiate-unstake <user> <amount>");
        return Report(vault_.InitiateUnstake(ParseAccount(a[0]), ParseTokenAmount(a[1])));
    }
    if (command == "unstake") {
        Need(a, 2, "unstake <user> <amount>");
        return Report(vault_.Unstake(ParseAccount(a[0]), ParseTokenAmount(a[1])));
    }
    if (command == "initiate-early-unstake") {
        Need(a, 2, "initiate-early-unstake <user> <amount>");
        return Report(vault_.InitiateEarlyUnstake(ParseAccount(a[0]), ParseTokenAmount(a[1])));
    }
    if (command == "early-unstake") {
        Need(a, 2, "early-unstake <user> <amount>");
        return Report(vault_.EarlyUnstake(ParseAccount(a[0]), ParseTokenAmount(a[1])));
    }
    if (command == "qa-penalty") {
        Need(a, 3, "qa-penalty <caller> <user> <amount>");
        Amount requested = ParseTokenAmount(a[2]);
        vault::PenaltyResult result =
            vault_.ProcessQAPenalty(ParseAccount(a[0]), ParseAccount(a[1]), requested);
        if (result.error != VaultError::OK) {
            return Report(result.error);
        }
        std::cout << "applied " << FormatAmount(result.applied) << " of "
                  << FormatAmount(requested) << "\n";
        return 0;
    }
    if (command == "pause") {
        Need(a, 1, "pause <admin>");
        return Report(vault_.Pause(ParseAccount(a[0])));
    }
    if (command == "unpause") {
        Need(a, 1, "unpause <admin>");
        return Report(vault_.Unpause(ParseAccount(a[0])));
    }
    if (command == "set-treasury") {
        Need(a, 2, "set-treasury <admin> <account>");
        return Report(vault_.SetTreasury(ParseAccount(a[0]), ParseAccount(a[1])));
    }
    if (command == "set-qa") {
        Need(a, 2, "set-qa <admin> <account>");
        return Report(vault_.SetQualityControlCaller(ParseAccount(a[0]), ParseAccount(a[1])));
    }
    if (command == "set-max-stake") {
        Need(a, 2, "set-max-stake <admin> <amount>");
        return Report(vault_.SetMaximumStake(ParseAccount(a[0]), ParseTokenAmount(a[1])));
    }
    if (command == "emergency-withdraw") {
        Need(a, 3, "emergency-withdraw <admin> <to> <amount>");
        return Report(vault_.EmergencyWithdraw(ParseAccount(a[0]), ParseAccount(a[1]),
                                               ParseTokenAmount(a[2])));
    }
    if (command == "info") {
        if (a.empty()) {
            PrintVaultInfo(vault_, ledger_);
        } else {
            Need(a, 1, "info [user]");
            PrintSummary(vault_, ParseAccount(a[0]));
        }
        return 0;
    }
    if (command == "multiplier") {
        if (a.empty()) {
            std::cout << vault_.GetParams().multipliers.ToString() << "\n";
        } else {
            Need(a, 2, "multiplier [amount duration]");
            std::cout << FormatBps(vault_.CalculateMultiplier(ParseTokenAmount(a[0]),
                                                              ParseDurationArg(a[1])))
                      << "\n";
        }
        return 0;
    }
    if (command == "warp") {
        Need(a, 1, "warp <duration>");
        if (!scripted_) {
            throw UsageError("warp is only available in scripts; use --time instead");
        }
        util::AdvanceMockTime(util::Seconds{ParseDurationArg(a[0])});
        std::cout << "now " << util::FormatTimestamp(util::GetTime()) << "\n";
        return 0;
    }

    throw UsageError("unknown command '" + command + "'");
}

int RunScript(CommandRunner& runner, const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        std::cerr << "Error: cannot open script " << path << "\n";
        return 1;
    }

    std::string line;
    int lineNum = 0;
    while (std::getline(file, line)) {
        ++lineNum;
        std::istringstream words(line);
        std::string command;
        if (!(words >> command) || command[0] == '#') {
            continue;
        }
        std::vector<std::string> args;
        std::string word;
        while (words >> word) {
            args.push_back(word);
        }

        std::cout << "> " << line << "\n";
        int rc;
        try {
            rc = runner.Run(command, args);
        } catch (const UsageError& e) {
            std::cerr << path << ":" << lineNum << ": " << e.what() << "\n";
            return 2;
        }
        if (rc != 0) {
            std::cerr << path << ":" << lineNum << ": command failed\n";
            return rc;
        }
    }
    return 0;
}

// ============================================================================
// Main Entry Point
// ============================================================================

Address RoleAddress(const util::ConfigManager& config, const char* key, const char* label) {
    std::string value = config.GetString(key, label, util::ConfigKeys::ROLES_SECTION);
    return ParseAccount(value);
}

int AppMain(int argc, char* argv[]) {
    CLIConfig cli;

    if (!ParseCommandLine(argc, argv, cli)) {
        std::cerr << "Error parsing command line. Use --help for usage.\n";
        return 2;
    }

    if (cli.showHelp) {
        PrintHelp();
        return 0;
    }

    if (cli.showVersion) {
        PrintVersion();
        return 0;
    }

    if (cli.command.empty() && cli.scriptFile.empty()) {
        std::cerr << "Error: No command specified.\n";
        std::cerr << "Use 'lockvault-cli --help' for usage information.\n";
        return 2;
    }

    // Configuration: file, then command-line overrides
    util::ConfigManager config;
    std::string dataDir = cli.dataDir.empty() ? util::ConfigManager::GetDefaultDataDir()
                                              : util::ConfigManager::ExpandTilde(cli.dataDir);
    util::ConfigParseResult parsed = cli.configFile.empty()
        ? config.LoadDataDirConfig(dataDir)
        : config.ParseFile(cli.configFile);
    if (!parsed.success) {
        std::cerr << "Error: " << parsed.ToString() << "\n";
        return 1;
    }
    for (const auto& spec : cli.overrides) {
        if (!ApplyOverride(config, spec)) {
            std::cerr << "Error: malformed --set '" << spec << "'\n";
            return 2;
        }
    }
    if (cli.dataDir.empty()) {
        dataDir = config.GetPath(util::ConfigKeys::DATADIR, dataDir);
    }

    SetupLogging(cli, config);

    vault::AllowVaultConfigKeys(config);
    for (const auto& warning : config.Validate()) {
        LOG_WARN(util::LogCategory::CONFIG) << warning;
    }

    vault::VaultParams params;
    parsed = vault::LoadVaultParams(config, params);
    if (!parsed.success) {
        std::cerr << "Error: " << parsed.ToString() << "\n";
        return 1;
    }

    // The clock is always mock time so scripts can warp it
    if (!cli.timeOverride.empty()) {
        auto when = ParseTimeArg(cli.timeOverride);
        if (!when) {
            std::cerr << "Error: invalid --time '" << cli.timeOverride << "'\n";
            return 2;
        }
        util::SetMockTime(*when);
    }
    util::EnableMockTime();

    vault::VaultRoles roles;
    Address vaultAddress;
    try {
        roles.admin = RoleAddress(config, util::ConfigKeys::ADMIN, "admin");
        roles.treasury = RoleAddress(config, util::ConfigKeys::TREASURY, "treasury");
        roles.qualityControlCaller = RoleAddress(config, util::ConfigKeys::QACALLER, "qa");
        vaultAddress = RoleAddress(config, util::ConfigKeys::VAULTADDRESS, "vault");
    } catch (const UsageError& e) {
        std::cerr << "Error: [roles] " << e.what() << "\n";
        return 1;
    }

    std::filesystem::path root(dataDir);
    LOG_DEBUG(util::LogCategory::CLI) << "Using data directory " << root.string();

    token::DatabaseTokenLedger ledger(root / "ledger");
    vault::StakingVault stakingVault(params, roles, ledger, vaultAddress,
                                     std::make_unique<vault::VaultDB>(root / "vault"));

    stakingVault.SetEventCallback([](const vault::VaultEvent& event) {
        std::cout << "event " << event.ToString() << "\n";
    });

    CommandRunner runner(stakingVault, ledger, !cli.scriptFile.empty());

    int rc = 0;
    if (!cli.scriptFile.empty()) {
        rc = RunScript(runner, cli.scriptFile);
    } else {
        try {
            rc = runner.Run(cli.command, cli.args);
        } catch (const UsageError& e) {
            std::cerr << "Error: " << e.what() << "\n";
            rc = 2;
        }
    }

    util::Logger::Instance().Flush();
    return rc;
}

} // namespace cli
} // namespace lockvault

// ============================================================================
// Main
// ============================================================================

int main(int argc, char* argv[]) {
    try {
        return lockvault::cli::AppMain(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
