// VELOCK Simulator - Main Entry Point
// Copyright (c) 2024 VELOCK Developers
// MIT License
//
// velock-sim drives a stake ledger and governance module from a command
// script under a simulated clock. It provides:
// - Configuration from a file and the command line
// - Optional snapshot persistence in a LevelDB data directory
// - One result line per script command on stdout

#include <velock/core/types.h>
#include <velock/db/ledgerdb.h>
#include <velock/governance/governance.h>
#include <velock/staking/asset.h>
#include <velock/staking/ledger.h>
#include <velock/util/config.h>
#include <velock/util/logging.h>
#include <velock/util/time.h>

#include <cerrno>
#include <cstdlib>
#include <exception>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace velock {

// ============================================================================
// Version Information
// ============================================================================

constexpr const char* VERSION = "0.1.0";
constexpr const char* CLIENT_NAME = "VELOCK Simulator";

namespace defaults {
    constexpr const char* LOG_LEVEL = "warn";
    constexpr const char* LEDGER_DIR = "ledger";

    /// Seed account holding locked principal
    constexpr const char* CUSTODY = "custody";
}

// ============================================================================
// Helpers
// ============================================================================

namespace {

void PrintHelp() {
    std::cout << CLIENT_NAME << " v" << VERSION << "\n\n";
    std::cout << "Usage: velock-sim [options] [script]\n\n";
    std::cout << "Options:\n";
    std::cout << "  --help                     Show this help message\n";
    std::cout << "  --conf=FILE                Config file path\n";
    std::cout << "  --datadir=DIR              Load and save the ledger snapshot here\n";
    std::cout << "  --script=FILE              Command script (default: stdin)\n";
    std::cout << "  --loglevel=LEVEL           trace, debug, info, warn, error, none\n";
    std::cout << "  --logfile=FILE             Also log to FILE\n";
    std::cout << "  --printtoconsole=0/1       Log to stderr (default: 1)\n";
    std::cout << "  --debug=CAT[,CAT...]       Only log these categories\n";
    std::cout << "  --ledger.epoch_width=N     Seconds per epoch\n";
    std::cout << "  --governance.vote_timing=after-window|during-window\n";
    std::cout << "\nCommands:\n";
    std::cout << "  mint <acct> <amount>           approve <acct> <amount>\n";
    std::cout << "  balance <acct>                 epoch [n]\n";
    std::cout << "  advance [n]                    lock <acct> <amount> <epochs>\n";
    std::cout << "  unlock <acct>                  power <acct> [epoch]\n";
    std::cout << "  total [epoch]                  propose <acct> ok|fail\n";
    std::cout << "  vote <acct> <id> yes|no        execute <id>\n";
    std::cout << "  state <id>                     check\n";
}

void SetupLogging(const util::ConfigManager& config) {
    namespace keys = util::ConfigKeys;
    auto& logger = util::Logger::Instance();
    logger.Initialize();
    logger.ClearSinks();

    util::LogLevel level = util::LogLevelFromString(
        config.GetString(keys::LOGLEVEL, defaults::LOG_LEVEL));
    logger.SetLevel(level);

    if (config.GetBool(keys::PRINTTOCONSOLE, true)) {
        util::ConsoleSink::Config consoleConfig;
        consoleConfig.level = level;
        consoleConfig.useStderr = true;
        logger.AddSink(std::make_shared<util::ConsoleSink>(consoleConfig));
    }

    std::string logFile = config.GetPath(keys::LOGFILE);
    if (!logFile.empty()) {
        util::FileSink::Config fileConfig;
        fileConfig.path = logFile;
        fileConfig.level = util::LogLevel::Debug;
        auto fileSink = std::make_shared<util::FileSink>(fileConfig);
        if (fileSink->IsOpen()) {
            logger.AddSink(fileSink);
        } else {
            std::cerr << "Warning: cannot open log file " << logFile << "\n";
        }
    }

    if (auto debug = config.TryGetString(keys::DEBUG)) {
        std::stringstream ss(*debug);
        std::string category;
        while (std::getline(ss, category, ',')) {
            if (!category.empty() && category != "1") {
                logger.EnableCategory(category);
            }
        }
    }
}

std::optional<uint64_t> ParseNumber(const std::string& token) {
    if (token.empty() || token[0] == '-') {
        return std::nullopt;
    }
    char* end = nullptr;
    errno = 0;
    unsigned long long value = std::strtoull(token.c_str(), &end, 10);
    if (errno != 0 || end == token.c_str() || *end != '\0') {
        return std::nullopt;
    }
    return static_cast<uint64_t>(value);
}

} // namespace

// ============================================================================
// Simulation
// ============================================================================

class Simulation {
public:
    Simulation(const staking::LedgerParams& ledgerParams,
               const governance::GovernanceParams& govParams)
        : custody_(AccountId::FromName(defaults::CUSTODY).value()),
          asset_(token_, custody_),
          ledger_(ledgerParams, asset_, custody_),
          governance_(ledger_, govParams) {}

    staking::StakeLedger& Ledger() { return ledger_; }
    staking::TokenLedger& Token() { return token_; }

    /// Run one script line; false if the command is malformed
    bool Execute(const std::string& line, std::ostream& out);

    size_t GetFailedChecks() const { return failedChecks_; }

    /// Move the mock clock to the start of epoch; false if it has no
    /// representable start
    bool JumpToEpoch(Epoch epoch);

    /// Move the mock clock forward by whole epochs; false on overflow
    bool AdvanceEpochs(uint64_t epochs);

private:
    void Report(std::ostream& out, const OpResult& result) {
        if (result.IsOk()) {
            out << "ok";
        } else {
            out << "error " << ErrorCodeToString(result.code) << ": " << result.message;
        }
    }

    AccountId custody_;
    staking::TokenLedger token_;
    staking::TokenAsset asset_;
    staking::StakeLedger ledger_;
    governance::GovernanceModule governance_;
    size_t failedChecks_{0};
};

bool Simulation::Execute(const std::string& line, std::ostream& out) {
    std::istringstream in(line);
    std::vector<std::string> args;
    for (std::string word; in >> word;) {
        args.push_back(word);
    }
    if (args.empty()) {
        return true;
    }

    const std::string& cmd = args[0];
    auto number = [&args](size_t i) -> std::optional<uint64_t> {
        return i < args.size() ? ParseNumber(args[i]) : std::nullopt;
    };
    auto account = [&args](size_t i) -> std::optional<AccountId> {
        return i < args.size() ? AccountId::FromName(args[i]) : std::nullopt;
    };

    LOG_DEBUG(util::LogCategory::SIM) << "> " << line;

    if (cmd == "mint" && args.size() == 3 && account(1) && number(2)) {
        bool ok = token_.Mint(*account(1), *number(2));
        out << (ok ? "ok" : "error supply overflow");
    } else if (cmd == "approve" && args.size() == 3 && account(1) && number(2)) {
        token_.Approve(*account(1), custody_, *number(2));
        out << "ok";
    } else if (cmd == "balance" && args.size() == 2 && account(1)) {
        out << token_.BalanceOf(*account(1));
    } else if (cmd == "epoch" && args.size() == 1) {
        out << ledger_.CurrentEpoch();
    } else if (cmd == "epoch" && args.size() == 2 && number(1)) {
        if (JumpToEpoch(*number(1))) {
            out << ledger_.CurrentEpoch();
        } else {
            out << "error epoch out of range";
        }
    } else if (cmd == "advance" && args.size() <= 2) {
        uint64_t epochs = 1;
        if (args.size() == 2) {
            if (!number(1)) return false;
            epochs = *number(1);
        }
        if (AdvanceEpochs(epochs)) {
            out << ledger_.CurrentEpoch();
        } else {
            out << "error epoch out of range";
        }
    } else if (cmd == "lock" && args.size() == 4 && account(1) && number(2) && number(3)) {
        Report(out, ledger_.Lock(*account(1), *number(2), *number(3)));
    } else if (cmd == "unlock" && args.size() == 2 && account(1)) {
        Amount withdrawn = 0;
        OpResult result = ledger_.Unlock(*account(1), &withdrawn);
        Report(out, result);
        if (result.IsOk()) out << " " << withdrawn;
    } else if (cmd == "power" && account(1) &&
               (args.size() == 2 || (args.size() == 3 && number(2)))) {
        auto power = args.size() == 3 ? ledger_.VotingPowerAt(*account(1), *number(2))
                                      : ledger_.CurrentVotingPower(*account(1));
        if (power) out << *power; else out << "error ArithmeticUnderflow";
    } else if (cmd == "total" && (args.size() == 1 || (args.size() == 2 && number(1)))) {
        auto power = args.size() == 2 ? ledger_.TotalVotingPowerAt(*number(1))
                                      : ledger_.CurrentTotalVotingPower();
        if (power) out << *power; else out << "error ArithmeticUnderflow";
    } else if (cmd == "propose" && args.size() == 3 && account(1) &&
               (args[2] == "ok" || args[2] == "fail")) {
        const bool succeeds = args[2] == "ok";
        auto executor = std::make_shared<governance::CallbackExecutor>([succeeds]() {
            LOG_INFO(util::LogCategory::SIM) << "Executor invoked, "
                                             << (succeeds ? "succeeding" : "failing");
            return succeeds;
        });
        ProposalId id = 0;
        OpResult result = governance_.CreateProposal(*account(1), executor, &id);
        Report(out, result);
        if (result.IsOk()) out << " " << id;
    } else if (cmd == "vote" && args.size() == 4 && account(1) && number(2) &&
               (args[3] == "yes" || args[3] == "no")) {
        Report(out, governance_.Vote(*account(1), *number(2), args[3] == "yes"));
    } else if (cmd == "execute" && args.size() == 2 && number(1)) {
        Report(out, governance_.ExecuteProposal(*number(1)));
    } else if (cmd == "state" && args.size() == 2 && number(1)) {
        auto proposal = governance_.GetProposal(*number(1));
        auto state = governance_.GetProposalState(*number(1));
        if (!proposal || !state) {
            out << "error ProposalNotFound";
        } else {
            out << governance::ProposalStateToString(*state)
                << " yes=" << proposal->yes << " no=" << proposal->no;
        }
    } else if (cmd == "check" && args.size() == 1) {
        std::string error;
        if (ledger_.CheckConsistency(ledger_.CurrentEpoch(), &error)) {
            out << "consistent";
        } else {
            ++failedChecks_;
            out << "inconsistent: " << error;
        }
    } else {
        return false;
    }
    return true;
}

bool Simulation::JumpToEpoch(Epoch epoch) {
    try {
        util::SetMockTime(ledger_.GetClock().EpochStart(epoch));
    } catch (const std::out_of_range& e) {
        LOG_WARN(util::LogCategory::SIM) << "Cannot move clock: " << e.what();
        return false;
    }
    LOG_INFO(util::LogCategory::SIM) << "Clock set to epoch " << epoch << " ("
                                     << util::FormatISO8601(util::GetTime()) << ")";
    return true;
}

bool Simulation::AdvanceEpochs(uint64_t epochs) {
    const int64_t width = ledger_.GetClock().GetEpochWidth();
    uint64_t seconds = 0;
    Timestamp target = 0;
    if (!CheckedMul<uint64_t>(epochs, static_cast<uint64_t>(width), seconds) ||
        seconds > static_cast<uint64_t>(MAX_SIGNED_AMOUNT) ||
        !CheckedAdd<Timestamp>(util::GetTime(), static_cast<Timestamp>(seconds), target)) {
        LOG_WARN(util::LogCategory::SIM) << "Advancing " << epochs << " epochs overflows the clock";
        return false;
    }
    util::AdvanceMockTime(static_cast<Timestamp>(seconds));
    LOG_INFO(util::LogCategory::SIM) << "Advanced "
                                     << util::FormatDuration(static_cast<int64_t>(seconds))
                                     << " to " << util::FormatISO8601(target);
    return true;
}

// ============================================================================
// Application
// ============================================================================

int AppMain(int argc, char* argv[]) {
    namespace keys = util::ConfigKeys;

    util::ConfigManager args;
    auto parsed = args.ParseCommandLine(argc, argv);
    if (!parsed.success) {
        std::cerr << "Error: " << parsed.ToString() << "\n";
        return 1;
    }
    if (args.HasKey("help")) {
        PrintHelp();
        return 0;
    }

    // Config file first, then the command line again so it takes precedence
    util::ConfigManager config;
    std::string confPath = args.GetPath(keys::CONF);
    if (!confPath.empty()) {
        auto result = config.ParseFile(confPath);
        if (!result.success) {
            std::cerr << "Error reading config: " << result.ToString() << "\n";
            return 1;
        }
    }
    config.ParseCommandLine(argc, argv);

    SetupLogging(config);
    LOG_INFO(util::LogCategory::SIM) << CLIENT_NAME << " v" << VERSION << " starting";

    std::string error;
    auto ledgerParams = staking::LedgerParams::FromConfig(config, &error);
    if (!ledgerParams) {
        std::cerr << "Error: " << error << "\n";
        return 1;
    }
    auto govParams = governance::GovernanceParams::FromConfig(config, &error);
    if (!govParams) {
        std::cerr << "Error: " << error << "\n";
        return 1;
    }

    Simulation sim(*ledgerParams, *govParams);
    util::SetMockTime(ledgerParams->originTime);

    std::unique_ptr<db::LedgerDB> ledgerDb;
    std::string dataDir = config.GetPath(keys::DATADIR);
    if (!dataDir.empty()) {
        db::Status status;
        ledgerDb = db::LedgerDB::Open(std::filesystem::path(dataDir) / defaults::LEDGER_DIR,
                                      db::Options(), &status);
        if (!ledgerDb) {
            std::cerr << "Error opening data directory: " << status.ToString() << "\n";
            return 1;
        }
        if (ledgerDb->HasSnapshot()) {
            db::SnapshotMeta meta;
            status = ledgerDb->ReadMeta(&meta);
            if (status.ok()) {
                status = ledgerDb->ReadLedger(sim.Ledger(), &sim.Token());
            }
            if (!status.ok()) {
                std::cerr << "Error loading snapshot: " << status.ToString() << "\n";
                return 1;
            }
            Epoch resume = meta.anchorEpoch > 0 ? meta.anchorEpoch : 1;
            if (!sim.JumpToEpoch(resume)) {
                std::cerr << "Error loading snapshot: anchor epoch " << resume
                          << " is out of range\n";
                return 1;
            }
        }
    }

    std::string scriptPath = config.GetPath(keys::SCRIPT);
    if (scriptPath.empty() && !config.GetPositionalArgs().empty()) {
        scriptPath = config.GetPositionalArgs().front();
    }

    std::ifstream scriptFile;
    if (!scriptPath.empty()) {
        scriptFile.open(scriptPath);
        if (!scriptFile) {
            std::cerr << "Error: cannot read script " << scriptPath << "\n";
            return 1;
        }
    }
    std::istream& script = scriptPath.empty() ? std::cin : scriptFile;

    size_t lineNum = 0;
    size_t malformed = 0;
    for (std::string line; std::getline(script, line);) {
        ++lineNum;
        auto hash = line.find('#');
        if (hash != std::string::npos) {
            line.erase(hash);
        }
        if (line.find_first_not_of(" \t\r") == std::string::npos) {
            continue;
        }
        if (!sim.Execute(line, std::cout)) {
            ++malformed;
            std::cout << "error malformed command at line " << lineNum;
            LOG_WARN(util::LogCategory::SIM) << "Malformed command at line " << lineNum << ": " << line;
        }
        std::cout << "\n";
    }

    if (ledgerDb) {
        db::Status status = ledgerDb->WriteLedger(sim.Ledger(), &sim.Token());
        if (!status.ok()) {
            std::cerr << "Error saving snapshot: " << status.ToString() << "\n";
            return 1;
        }
    }

    LogInfoF(util::LogCategory::SIM, "Processed %zu lines, %zu malformed", lineNum, malformed);
    util::Logger::Instance().Shutdown();
    return sim.GetFailedChecks() > 0 ? 2 : 0;
}

} // namespace velock

int main(int argc, char* argv[]) {
    try {
        return velock::AppMain(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
