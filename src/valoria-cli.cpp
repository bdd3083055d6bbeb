// VALORIA CLI - Command Line Interface
// Copyright (c) 2024 VALORIA Developers
// MIT License
//
// The valoria-cli tool operates the valuation engine on a local data
// directory: oracle administration, price submissions and valuation
// queries.

#include "valoria/db/database.h"
#include "valoria/oracle/engine.h"
#include "valoria/oracle/params.h"
#include "valoria/util/config.h"
#include "valoria/util/logging.h"
#include "valoria/util/time.h"

#include <cstdlib>
#include <filesystem>
#include <functional>
#include <getopt.h>
#include <iostream>
#include <limits>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace valoria {
namespace cli {

// ============================================================================
// Version Information
// ============================================================================

constexpr const char* VERSION = "0.1.0";
constexpr const char* CLIENT_NAME = "VALORIA CLI";

/// Subdirectory of the data directory holding the LevelDB store
constexpr const char* STORE_DIRNAME = "valuations";

/// Exit statuses
constexpr int EXIT_OK = 0;
constexpr int EXIT_USAGE = 1;
constexpr int EXIT_REJECTED = 2;

// ============================================================================
// CLI Configuration
// ============================================================================

struct CLIConfig {
    std::string dataDir;
    std::string configFile;
    std::string caller;
    std::vector<std::pair<std::string, std::string>> overrides;
    std::string command;
    std::vector<std::string> args;
    bool showHelp{false};
    bool showVersion{false};
};

// ============================================================================
// Help Text
// ============================================================================

void PrintHelp() {
    std::cout << CLIENT_NAME << " v" << VERSION << "\n\n";
    std::cout << "Usage: valoria-cli [options] <command> [args]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -h, --help                    Show this help message\n";
    std::cout << "  -v, --version                 Show version information\n";
    std::cout << "  -c, --conf=FILE               Config file (default: <datadir>/valoria.conf)\n";
    std::cout << "  -d, --datadir=DIR             Data directory (default: ~/.valoria)\n";
    std::cout << "  --caller=PRINCIPAL            Identity the command runs as\n";
    std::cout << "\nParameters (seed a new data directory):\n";
    std::cout << "  --admin=PRINCIPAL             Administrative identity\n";
    std::cout << "  --maxoracles=N                Oracle capacity (default: 10)\n";
    std::cout << "  --consensusthreshold=N        Quorum and minimum weight (default: 3)\n";
    std::cout << "  --maxsubmissions=N            Lifetime submissions per oracle (default: 5)\n";
    std::cout << "  --stalenesswindow=SECONDS     Maximum observation age, up to 365 days (default: 3600)\n";
    std::cout << "\nLogging:\n";
    std::cout << "  --debug=LEVEL                 trace, debug, info, warn, error, off\n";
    std::cout << "  --printtoconsole=0|1          Also log to the console\n";
    std::cout << "  --logfile=FILE                Log file (default: <datadir>/debug.log)\n";
    std::cout << "\nCommands:\n";
    std::cout << "  addoracle ORACLE WEIGHT       Approve an oracle (admin)\n";
    std::cout << "  removeoracle ORACLE           Revoke an oracle (admin)\n";
    std::cout << "  setthreshold N                Set the consensus threshold (admin)\n";
    std::cout << "  setmaxoracles N               Set the oracle capacity (admin)\n";
    std::cout << "  setmaxsubmissions N           Set the per-oracle quota (admin)\n";
    std::cout << "  setstalenesswindow SECONDS    Set the staleness window (admin)\n";
    std::cout << "  submit SUBJECT PRICE ORACLE   Submit an observation (caller must be ORACLE)\n";
    std::cout << "  getvaluation SUBJECT          Show the published valuation\n";
    std::cout << "  getoracle ORACLE              Show approval, weight and activity\n";
    std::cout << "  listoracles                   List approved oracles\n";
    std::cout << "  getparams                     Show engine parameters\n";
    std::cout << "\nExamples:\n";
    std::cout << "  valoria-cli --admin=gov --caller=gov addoracle appraiser-1 50\n";
    std::cout << "  valoria-cli --caller=appraiser-1 submit 123 500000 appraiser-1\n";
    std::cout << "  valoria-cli getvaluation 123\n";
    std::cout << "\n";
}

void PrintVersion() {
    std::cout << CLIENT_NAME << " v" << VERSION << "\n";
    std::cout << "Copyright (c) 2024 VALORIA Developers\n";
    std::cout << "MIT License\n";
}

// ============================================================================
// Command Line Parsing
// ============================================================================

bool ParseCommandLine(int argc, char* argv[], CLIConfig& config) {
    enum {
        OPT_CALLER = 1001,
        OPT_OVERRIDE = 1002,
    };

    static struct option longOptions[] = {
        {"help", no_argument, nullptr, 'h'},
        {"version", no_argument, nullptr, 'v'},
        {"conf", required_argument, nullptr, 'c'},
        {"datadir", required_argument, nullptr, 'd'},
        {"caller", required_argument, nullptr, OPT_CALLER},
        {util::ConfigKeys::ADMIN, required_argument, nullptr, OPT_OVERRIDE},
        {util::ConfigKeys::MAXORACLES, required_argument, nullptr, OPT_OVERRIDE},
        {util::ConfigKeys::CONSENSUSTHRESHOLD, required_argument, nullptr, OPT_OVERRIDE},
        {util::ConfigKeys::MAXSUBMISSIONS, required_argument, nullptr, OPT_OVERRIDE},
        {util::ConfigKeys::STALENESSWINDOW, required_argument, nullptr, OPT_OVERRIDE},
        {util::ConfigKeys::DEBUG, required_argument, nullptr, OPT_OVERRIDE},
        {util::ConfigKeys::PRINTTOCONSOLE, required_argument, nullptr, OPT_OVERRIDE},
        {util::ConfigKeys::LOGFILE, required_argument, nullptr, OPT_OVERRIDE},
        {nullptr, 0, nullptr, 0}
    };

    int opt;
    int optionIndex = 0;
    optind = 1;

    // '+' stops at the command so negative numeric arguments reach it intact
    while ((opt = getopt_long(argc, argv, "+hvc:d:", longOptions, &optionIndex)) != -1) {
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
            case OPT_CALLER:
                config.caller = optarg;
                break;
            case OPT_OVERRIDE:
                config.overrides.emplace_back(longOptions[optionIndex].name, optarg);
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

bool ParseInt64(const std::string& str, int64_t& out) {
    try {
        size_t pos = 0;
        long long value = std::stoll(str, &pos, 10);
        if (pos != str.size()) {
            return false;
        }
        out = static_cast<int64_t>(value);
        return true;
    } catch (const std::invalid_argument&) {
        return false;
    } catch (const std::out_of_range&) {
        return false;
    }
}

// ============================================================================
// Setup
// ============================================================================

/// Build the configuration: file first, then command-line overrides
bool LoadConfiguration(const CLIConfig& cli, util::ConfigManager& config) {
    namespace keys = util::ConfigKeys;

    for (const char* key : {keys::DATADIR, keys::CONF, keys::DEBUG, keys::PRINTTOCONSOLE,
                            keys::LOGFILE, keys::ADMIN, keys::MAXORACLES,
                            keys::CONSENSUSTHRESHOLD, keys::MAXSUBMISSIONS,
                            keys::STALENESSWINDOW}) {
        config.AllowKey(key);
    }

    std::string dataDir = cli.dataDir.empty() ? util::ConfigManager::GetDefaultDataDir()
                                              : util::ConfigManager::ExpandTilde(cli.dataDir);
    if (dataDir.empty()) {
        std::cerr << "Error: no data directory (set HOME or use --datadir)\n";
        return false;
    }

    std::string confPath = cli.configFile.empty()
        ? dataDir + "/" + util::DEFAULT_CONFIG_FILENAME
        : cli.configFile;

    if (!cli.configFile.empty() || std::filesystem::exists(confPath)) {
        util::ConfigParseResult result = config.ParseFile(confPath);
        if (!result.success) {
            std::cerr << "Error reading configuration: " << result.ToString() << "\n";
            return false;
        }
        for (const auto& warning : result.warnings) {
            std::cerr << "Warning: " << warning << "\n";
        }
    }

    for (const auto& [key, value] : cli.overrides) {
        config.Set(key, value);
    }
    // A datadir named in the file is ignored once we are reading it from there
    config.Set(keys::DATADIR, dataDir);
    config.Set(keys::CONF, confPath);
    return true;
}

void SetupLogging(const util::ConfigManager& config) {
    namespace keys = util::ConfigKeys;
    auto& logger = util::Logger::Instance();

    logger.SetLevel(util::LogLevelFromString(config.GetString(keys::DEBUG, "info")));

    if (config.GetBool(keys::PRINTTOCONSOLE, false)) {
        util::ConsoleSink::Config consoleConfig;
        consoleConfig.level = logger.GetLevel();
        logger.AddSink(std::make_shared<util::ConsoleSink>(consoleConfig));
    }

    const std::string logFile = config.GetPath(
        keys::LOGFILE, config.GetString(keys::DATADIR, "") + "/debug.log");
    if (!logFile.empty()) {
        util::FileSink::Config fileConfig;
        fileConfig.path = logFile;
        fileConfig.level = logger.GetLevel();
        auto sink = std::make_shared<util::FileSink>(fileConfig);
        if (sink->IsOpen()) {
            logger.AddSink(sink);
        } else {
            std::cerr << "Warning: cannot open log file " << logFile << "\n";
        }
    }

    for (const auto& warning : config.Validate()) {
        LOG_WARN(util::LogCategory::CONFIG) << warning;
    }
}

// ============================================================================
// Command Handlers
// ============================================================================

struct CommandContext {
    oracle::ConsensusEngine& engine;
    const std::string& caller;
    const std::vector<std::string>& args;
};

int ReportRejection(oracle::OracleError error) {
    std::cerr << "error: " << oracle::OracleErrorCode(error) << " "
              << oracle::OracleErrorToString(error) << "\n";
    return EXIT_REJECTED;
}

template<typename T>
int Finish(const oracle::OracleResult<T>& result) {
    if (!result) {
        return ReportRejection(result.error);
    }
    std::cout << "ok\n";
    return EXIT_OK;
}

bool RequireNumber(const std::string& arg, const char* what, int64_t& out) {
    if (!ParseInt64(arg, out)) {
        std::cerr << "Error: " << what << " must be an integer: " << arg << "\n";
        return false;
    }
    return true;
}

/// Out-of-domain numbers map to 0, which the engine rejects with the
/// matching error code
SubjectId ToSubject(int64_t value) {
    return value > 0 ? static_cast<SubjectId>(value) : 0;
}

Weight ToWeight(int64_t value) {
    if (value < std::numeric_limits<Weight>::min() || value > std::numeric_limits<Weight>::max()) {
        return 0;
    }
    return static_cast<Weight>(value);
}

int CmdAddOracle(const CommandContext& ctx) {
    int64_t weight;
    if (!RequireNumber(ctx.args[1], "WEIGHT", weight)) return EXIT_USAGE;
    return Finish(ctx.engine.AddOracle(ctx.caller, ctx.args[0], ToWeight(weight)));
}

int CmdRemoveOracle(const CommandContext& ctx) {
    return Finish(ctx.engine.RemoveOracle(ctx.caller, ctx.args[0]));
}

int CmdSetThreshold(const CommandContext& ctx) {
    int64_t n;
    if (!RequireNumber(ctx.args[0], "N", n)) return EXIT_USAGE;
    return Finish(ctx.engine.SetConsensusThreshold(ctx.caller, n));
}

int CmdSetMaxOracles(const CommandContext& ctx) {
    int64_t n;
    if (!RequireNumber(ctx.args[0], "N", n)) return EXIT_USAGE;
    return Finish(ctx.engine.SetMaxOracles(ctx.caller, n));
}

int CmdSetMaxSubmissions(const CommandContext& ctx) {
    int64_t n;
    if (!RequireNumber(ctx.args[0], "N", n)) return EXIT_USAGE;
    return Finish(ctx.engine.SetMaxSubmissionsPerOracle(ctx.caller, n));
}

int CmdSetStalenessWindow(const CommandContext& ctx) {
    int64_t seconds;
    if (!RequireNumber(ctx.args[0], "SECONDS", seconds)) return EXIT_USAGE;
    return Finish(ctx.engine.SetStalenessWindow(ctx.caller, seconds));
}

int CmdSubmit(const CommandContext& ctx) {
    int64_t subject;
    int64_t price;
    if (!RequireNumber(ctx.args[0], "SUBJECT", subject)) return EXIT_USAGE;
    if (!RequireNumber(ctx.args[1], "PRICE", price)) return EXIT_USAGE;

    auto result = ctx.engine.SubmitDataFeed(ctx.caller, ToSubject(subject), price, ctx.args[2]);
    if (!result) {
        return ReportRejection(result.error);
    }
    std::cout << "accepted " << result.value << "\n";
    return EXIT_OK;
}

int CmdGetValuation(const CommandContext& ctx) {
    int64_t subject;
    if (!RequireNumber(ctx.args[0], "SUBJECT", subject)) return EXIT_USAGE;

    auto valuation = ctx.engine.GetValuation(ToSubject(subject));
    if (!valuation) {
        return ReportRejection(oracle::OracleError::ValuationNotFound);
    }
    std::cout << "value: " << valuation->value << "\n";
    std::cout << "timestamp: " << valuation->timestamp << " ("
              << util::FormatISO8601(valuation->timestamp) << ")\n";
    std::cout << "sources: " << valuation->sourceCount << "\n";
    return EXIT_OK;
}

int CmdGetOracle(const CommandContext& ctx) {
    const std::string& name = ctx.args[0];
    auto weight = ctx.engine.GetOracleWeight(name);
    auto activity = ctx.engine.GetOracleActivity(name);

    std::cout << "oracle: " << name << "\n";
    std::cout << "approved: " << (weight ? "yes" : "no") << "\n";
    if (weight) {
        std::cout << "weight: " << *weight << "\n";
    }
    std::cout << "submissions: " << activity.submissionCount << "\n";
    if (activity.submissionCount > 0) {
        std::cout << "lastactive: " << activity.lastActive << " ("
                  << util::FormatISO8601(activity.lastActive) << ")\n";
    }
    return EXIT_OK;
}

int CmdListOracles(const CommandContext& ctx) {
    for (const auto& entry : ctx.engine.GetApprovedOracles()) {
        std::cout << entry.oracle << " " << entry.weight << "\n";
    }
    return EXIT_OK;
}

int CmdGetParams(const CommandContext& ctx) {
    const oracle::OracleParams params = ctx.engine.GetParams();
    std::cout << "admin: " << params.admin << "\n";
    std::cout << "maxoracles: " << params.maxOracles << "\n";
    std::cout << "consensusthreshold: " << params.consensusThreshold << "\n";
    std::cout << "maxsubmissions: " << params.maxSubmissionsPerOracle << "\n";
    std::cout << "stalenesswindow: " << params.stalenessWindow << " ("
              << util::FormatDuration(util::Seconds{params.stalenessWindow}) << ")\n";
    return EXIT_OK;
}

struct Command {
    size_t argCount;
    bool needsCaller;
    const char* usage;
    std::function<int(const CommandContext&)> handler;
};

const std::map<std::string, Command>& Commands() {
    static const std::map<std::string, Command> commands = {
        {"addoracle",          {2, true,  "addoracle ORACLE WEIGHT", CmdAddOracle}},
        {"removeoracle",       {1, true,  "removeoracle ORACLE", CmdRemoveOracle}},
        {"setthreshold",       {1, true,  "setthreshold N", CmdSetThreshold}},
        {"setmaxoracles",      {1, true,  "setmaxoracles N", CmdSetMaxOracles}},
        {"setmaxsubmissions",  {1, true,  "setmaxsubmissions N", CmdSetMaxSubmissions}},
        {"setstalenesswindow", {1, true,  "setstalenesswindow SECONDS", CmdSetStalenessWindow}},
        {"submit",             {3, true,  "submit SUBJECT PRICE ORACLE", CmdSubmit}},
        {"getvaluation",       {1, false, "getvaluation SUBJECT", CmdGetValuation}},
        {"getoracle",          {1, false, "getoracle ORACLE", CmdGetOracle}},
        {"listoracles",        {0, false, "listoracles", CmdListOracles}},
        {"getparams",          {0, false, "getparams", CmdGetParams}},
    };
    return commands;
}

// ============================================================================
// Main Entry Point
// ============================================================================

int AppMain(int argc, char* argv[]) {
    CLIConfig cli;

    if (!ParseCommandLine(argc, argv, cli)) {
        std::cerr << "Error parsing command line. Use --help for usage.\n";
        return EXIT_USAGE;
    }

    if (cli.showHelp) {
        PrintHelp();
        return EXIT_OK;
    }

    if (cli.showVersion) {
        PrintVersion();
        return EXIT_OK;
    }

    if (cli.command.empty()) {
        std::cerr << "Error: No command specified.\n";
        std::cerr << "Use 'valoria-cli --help' for usage information.\n";
        return EXIT_USAGE;
    }

    auto it = Commands().find(cli.command);
    if (it == Commands().end()) {
        std::cerr << "Error: Unknown command '" << cli.command << "'\n";
        return EXIT_USAGE;
    }
    const Command& command = it->second;

    if (cli.args.size() != command.argCount) {
        std::cerr << "Usage: valoria-cli [options] " << command.usage << "\n";
        return EXIT_USAGE;
    }
    if (command.needsCaller && cli.caller.empty()) {
        std::cerr << "Error: '" << cli.command << "' requires --caller\n";
        return EXIT_USAGE;
    }

    util::ConfigManager config;
    if (!LoadConfiguration(cli, config)) {
        return EXIT_USAGE;
    }
    SetupLogging(config);

    const std::filesystem::path storePath =
        std::filesystem::path(config.GetString(util::ConfigKeys::DATADIR, "")) / STORE_DIRNAME;

    auto [status, store] = db::OpenDatabase(storePath);
    if (!status.ok()) {
        std::cerr << "Error: cannot open " << storePath.string() << ": "
                  << status.ToString() << "\n";
        return EXIT_USAGE;
    }

    // Configuration only matters for a fresh store; an existing one keeps
    // the parameters committed to it.
    oracle::OracleParams params;
    if (auto stored = oracle::LoadParams(*store)) {
        params = *stored;
    } else {
        util::ConfigParseResult result = oracle::ParamsFromConfig(config, params);
        if (!result.success) {
            std::cerr << "Error: cannot initialise " << storePath.string() << ": "
                      << result.errorMessage << "\n";
            return EXIT_USAGE;
        }
    }

    oracle::ConsensusEngine engine(*store, params);

    LOG_DEBUG(util::LogCategory::CLI) << "Running '" << cli.command << "' as "
                                      << (cli.caller.empty() ? "<anonymous>" : cli.caller);

    CommandContext ctx{engine, cli.caller, cli.args};
    int rc = command.handler(ctx);
    util::Logger::Instance().Flush();
    return rc;
}

} // namespace cli
} // namespace valoria

// ============================================================================
// Main
// ============================================================================

int main(int argc, char* argv[]) {
    try {
        return valoria::cli::AppMain(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return valoria::cli::EXIT_USAGE;
    }
}
