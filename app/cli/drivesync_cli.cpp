#include "CancellationToken.h"
#include "Config.h"
#include "CronExpression.h"
#include "Logger.h"
#include "PathUtils.h"
#include "SyncEngine.h"
#include "Version.h"

#include <csignal>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <map>
#include <sstream>
#include <string>
#include <vector>

using namespace DriveSync;

namespace {

// Exit statuses; 3 means the run finished but left conflicts or differences
constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;
constexpr int kExitConflicts = 3;

CancellationToken gCancel;

void signalHandler(int) {
    gCancel.cancel();
}

/**
 * @brief Parsed command line
 */
struct CliOptions {
    std::string command;
    std::vector<std::string> positional;

    std::string dbPath;
    std::string configPath;
    std::string logLevel = "warn";
    bool progress = false;

    // Group, from config (--group) or inline (--master/--backup)
    std::string groupId;
    std::string master;
    std::vector<std::string> backups;
    std::string mode;

    // Option overrides; unset values keep the configured ones
    std::map<std::string, std::string> syncOverrides;
    std::vector<std::string> excludes;

    size_t limit = 20;
    int64_t operationId = 0;
    int64_t conflictId = 0;
    bool all = false;
    std::string choice;
    size_t backupIndex = 0;
};

void printUsage() {
    std::cout << R"(
Usage: drivesync <command> [OPTIONS]

Commands:
  sync                  Synchronize a group
  history               Show recent operations (--operation N lists its files)
  conflicts             List conflicts kept for review
  resolve               Resolve conflicts (--id N or --all, with --choice)
  restore               Copy a backup back into the master
  verify                Compare master and backups without writing
  clear                 Forget tracked state of a group
  parse-schedule TEXT   Show the cron form of a schedule phrase

Global options:
  --db <FILE>           Tracking database (default: ~/.local/share/drivesync/tracking.db)
  --config <FILE>       Configuration file (default: ~/.config/drivesync/drivesync.conf)
  --log-level <LEVEL>   debug, info, warn, error or critical (default: warn)
  --help                Show this help
  --version             Show version

Group options:
  --group <ID>          Group id; read from group.<ID>.* keys unless --master is given
  --master <PATH>       Master root
  --backup <PATH>       Backup root (repeatable)
  --mode <MODE>         bidirectional, master_to_backup or backup_to_master

Sync options:
  --bandwidth <MB/s>    Throttle transfers (0 = unlimited)
  --compress [ALG]      Compress with gzip (default) or lz4
  --level <1-9>         Compression level
  --password <TEXT>     Encrypt with a password
  --key-file <FILE>     Encrypt with a 32-byte key file
  --parallel <N>        Files transferred concurrently
  --full                Re-hash and re-copy every file
  --exclude <PATTERN>   Skip matching paths (repeatable)
  --size-tolerance <N>  Bytes tolerated before an untracked pair is a size mismatch
  --progress            Print phases and progress

Command options:
  --limit <N>           history: rows to show (default: 20)
  --operation <ID>      history: files written by one operation
  --id <N>              resolve: conflict id from 'conflicts'
  --all                 resolve: every pending conflict of the group
  --choice <CHOICE>     resolve: keep_master, keep_backup, keep_both or skip
  --backup-index <N>    restore: which backup to restore from (default: 0)
)" << std::endl;
}

bool parseArguments(int argc, char* argv[], CliOptions& options) {
    auto needValue = [&](int i, const std::string& arg) {
        if (i + 1 >= argc) {
            std::cerr << "Error: " << arg << " needs a value" << std::endl;
            return false;
        }
        return true;
    };

    try {
        for (int i = 1; i < argc; i++) {
            std::string arg = argv[i];

            if (arg == "--help" || arg == "-h") {
                printUsage();
                std::exit(kExitOk);
            } else if (arg == "--version") {
                std::cout << Version::toString() << std::endl;
                std::exit(kExitOk);
            } else if (arg == "--progress") {
                options.progress = true;
            } else if (arg == "--full") {
                options.syncOverrides["incremental"] = "false";
            } else if (arg == "--all") {
                options.all = true;
            } else if (arg == "--compress") {
                options.syncOverrides["compression"] = "true";
                if (i + 1 < argc && argv[i + 1][0] != '-') {
                    options.syncOverrides["compression_algorithm"] = argv[++i];
                }
            } else if (arg.compare(0, 2, "--") == 0) {
                if (!needValue(i, arg)) return false;
                const std::string value = argv[++i];

                if (arg == "--db") options.dbPath = value;
                else if (arg == "--config") options.configPath = value;
                else if (arg == "--log-level") options.logLevel = value;
                else if (arg == "--group") options.groupId = value;
                else if (arg == "--master") options.master = value;
                else if (arg == "--backup") options.backups.push_back(value);
                else if (arg == "--mode") options.mode = value;
                else if (arg == "--bandwidth") options.syncOverrides["bandwidth_limit_mbps"] = value;
                else if (arg == "--level") options.syncOverrides["compression_level"] = value;
                else if (arg == "--parallel") options.syncOverrides["parallel_files"] = value;
                else if (arg == "--size-tolerance") options.syncOverrides["size_tolerance"] = value;
                else if (arg == "--exclude") options.excludes.push_back(value);
                else if (arg == "--password") {
                    options.syncOverrides["encryption"] = "true";
                    options.syncOverrides["encryption_password"] = value;
                } else if (arg == "--key-file") {
                    options.syncOverrides["encryption"] = "true";
                    options.syncOverrides["encryption_key_file"] = value;
                }
                else if (arg == "--limit") options.limit = std::stoul(value);
                else if (arg == "--operation") options.operationId = std::stoll(value);
                else if (arg == "--id") options.conflictId = std::stoll(value);
                else if (arg == "--choice") options.choice = value;
                else if (arg == "--backup-index") options.backupIndex = std::stoul(value);
                else {
                    std::cerr << "Unknown option: " << arg << std::endl;
                    return false;
                }
            } else if (options.command.empty()) {
                options.command = arg;
            } else {
                options.positional.push_back(arg);
            }
        }
    } catch (const std::logic_error&) {
        std::cerr << "Error: invalid number in arguments" << std::endl;
        return false;
    }

    if (options.command.empty()) {
        std::cerr << "Error: missing command" << std::endl;
        return false;
    }
    return true;
}

std::string formatTime(int64_t unixMillis) {
    if (unixMillis <= 0) {
        return "-";
    }
    std::time_t seconds = static_cast<std::time_t>(unixMillis / 1000);
    std::tm local{};
    localtime_r(&seconds, &local);
    std::ostringstream out;
    out << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
    return out.str();
}

std::string formatBytes(uint64_t bytes) {
    std::ostringstream out;
    if (bytes >= 1024ull * 1024 * 1024) {
        out << std::fixed << std::setprecision(2) << bytes / (1024.0 * 1024 * 1024) << " GB";
    } else if (bytes >= 1024ull * 1024) {
        out << std::fixed << std::setprecision(2) << bytes / (1024.0 * 1024) << " MB";
    } else if (bytes >= 1024) {
        out << std::fixed << std::setprecision(1) << bytes / 1024.0 << " KB";
    } else {
        out << bytes << " B";
    }
    return out.str();
}

/**
 * @brief Resolve the group and its options from config plus command-line overrides
 */
Result<GroupDefinition> resolveGroup(const CliOptions& cli, const Config& fileConfig) {
    Config config(fileConfig);
    const std::string id = cli.groupId.empty() ? "cli" : cli.groupId;
    const std::string prefix = "group." + id + ".";

    if (!cli.master.empty()) {
        config.set(prefix + "master", cli.master);
        std::string backups;
        for (const auto& backup : cli.backups) {
            backups += (backups.empty() ? "" : ",") + backup;
        }
        config.set(prefix + "backups", backups);
    } else if (cli.groupId.empty()) {
        return Err<GroupDefinition>(ErrorCode::InvalidArgument, "Specify --group or --master/--backup");
    } else if (!config.hasKey(prefix + "master")) {
        return Err<GroupDefinition>(ErrorCode::NotFound, "Group '" + id + "' is not defined in the configuration");
    }
    if (!cli.mode.empty()) {
        config.set(prefix + "mode", cli.mode);
    }
    for (const auto& entry : cli.syncOverrides) {
        config.set(prefix + "sync." + entry.first, entry.second);
    }
    if (!cli.excludes.empty()) {
        std::vector<std::string> patterns = config.getList(prefix + "sync.exclude");
        if (patterns.empty()) {
            patterns = config.getList("sync.exclude");
        }
        patterns.insert(patterns.end(), cli.excludes.begin(), cli.excludes.end());
        std::string joined;
        for (const auto& pattern : patterns) {
            joined += (joined.empty() ? "" : ",") + pattern;
        }
        config.set(prefix + "sync.exclude", joined);
    }
    return SyncEngine::loadGroup(config, id);
}

void attachProgress(AdvancedSyncOptions& options) {
    options.onPhase = [](SyncPhase phase) {
        std::cerr << "[" << toString(phase) << "]" << std::endl;
    };
    options.onProgress = [](size_t processed, size_t total) {
        std::cerr << "\r  " << processed << "/" << total << std::flush;
        if (processed == total) {
            std::cerr << std::endl;
        }
    };
}

void printConflicts(const std::vector<Conflict>& conflicts) {
    for (const auto& conflict : conflicts) {
        std::cout << "  ";
        if (conflict.id > 0) {
            std::cout << "#" << conflict.id << " ";
        }
        std::cout << toString(conflict.kind) << "  " << conflict.relativePath;
        if (conflict.backupIndex > 0) {
            std::cout << "  (backup " << conflict.backupIndex << ")";
        }
        std::cout << "\n      master: "
                  << (conflict.master ? formatBytes(conflict.master->size) : std::string("missing"))
                  << "   backup: "
                  << (conflict.backup ? formatBytes(conflict.backup->size) : std::string("missing"))
                  << std::endl;
    }
}

void printStatistics(const SyncStatistics& stats) {
    std::cout << "Operation " << stats.operationId << ": " << toString(stats.status) << std::endl;
    std::cout << "  Copied:    " << stats.filesCopied << " (" << formatBytes(stats.bytesCopied) << ")" << std::endl;
    std::cout << "  Deleted:   " << stats.filesDeleted << std::endl;
    std::cout << "  Skipped:   " << stats.filesSkipped << std::endl;
    std::cout << "  Failed:    " << stats.filesFailed << std::endl;
    std::cout << "  Conflicts: " << stats.conflictsDetected << std::endl;
    std::cout << "  Duration:  " << std::fixed << std::setprecision(2) << stats.durationSeconds() << "s" << std::endl;

    const auto& savings = stats.spaceSavings;
    if (savings.filesProcessed > 0 && savings.originalSize != savings.storedSize) {
        std::cout << "  Stored:    " << formatBytes(savings.storedSize) << " of " << formatBytes(savings.originalSize)
                  << " (" << std::setprecision(1) << savings.spaceSavedPercent << "% saved)" << std::endl;
    }
    if (!stats.conflicts.empty()) {
        std::cout << "Unresolved conflicts:" << std::endl;
        printConflicts(stats.conflicts);
    }
}

int reportError(const Error& error) {
    std::cerr << "Error: " << error.message << " [" << errorCodeToString(error.code) << "]" << std::endl;
    return kExitFailure;
}

int runSync(SyncEngine& engine, GroupDefinition definition, bool progress) {
    if (progress) {
        attachProgress(definition.options);
    }
    auto result = engine.synchronizer().sync(definition.group, definition.options, SyncKind::Manual, &gCancel);
    if (!result) {
        return reportError(result.error());
    }
    printStatistics(*result);
    return result->conflictsDetected > 0 ? kExitConflicts : kExitOk;
}

int runRestore(SyncEngine& engine, GroupDefinition definition, size_t backupIndex, bool progress) {
    if (progress) {
        attachProgress(definition.options);
    }
    auto result = engine.synchronizer().restore(definition.group, backupIndex, definition.options, &gCancel);
    if (!result) {
        return reportError(result.error());
    }
    printStatistics(*result);
    return kExitOk;
}

int runVerify(SyncEngine& engine, const GroupDefinition& definition) {
    auto reports = engine.synchronizer().verifyStatus(definition.group, definition.options, &gCancel);
    if (!reports) {
        return reportError(reports.error());
    }

    bool consistent = true;
    for (const auto& report : *reports) {
        std::cout << "Backup " << report.backupIndex << " ("
                  << definition.group.backupPaths[report.backupIndex].string() << "): "
                  << report.inSync.size() << " in sync" << std::endl;
        auto list = [](const char* label, const std::vector<std::string>& paths) {
            for (const auto& path : paths) {
                std::cout << "  " << label << "  " << path << std::endl;
            }
        };
        list("master only", report.masterOnly);
        list("backup only", report.backupOnly);
        list("differs    ", report.differing);
        list("unreadable ", report.unreadable);
        consistent = consistent && report.consistent();
    }
    return consistent ? kExitOk : kExitConflicts;
}

int runHistory(SyncEngine& engine, const CliOptions& cli) {
    if (cli.operationId > 0) {
        auto operation = engine.store().operation(cli.operationId);
        if (!operation) {
            return reportError(operation.error());
        }
        if (!*operation) {
            return reportError(Error(ErrorCode::NotFound, "Operation " + std::to_string(cli.operationId) + " not found"));
        }
        auto files = engine.store().operationFiles(cli.operationId);
        if (!files) {
            return reportError(files.error());
        }
        std::cout << "Operation " << cli.operationId << " (" << (*operation)->groupId << ", "
                  << toString((*operation)->status) << ") wrote " << files->size() << " record(s)" << std::endl;
        for (const auto& record : *files) {
            std::cout << "  " << std::left << std::setw(8) << toString(record.sourceSide) << " "
                      << std::setw(10) << formatBytes(record.size) << " " << record.relativePath << std::endl;
        }
        return kExitOk;
    }

    if (cli.groupId.empty()) {
        std::cerr << "Error: history needs --group or --operation" << std::endl;
        return kExitUsage;
    }
    auto history = engine.store().history(cli.groupId, cli.limit);
    if (!history) {
        return reportError(history.error());
    }
    if (history->empty()) {
        std::cout << "No operations recorded for group " << cli.groupId << std::endl;
        return kExitOk;
    }
    std::cout << std::left << std::setw(6) << "ID" << std::setw(21) << "Started" << std::setw(11) << "Kind"
              << std::setw(11) << "Status" << std::setw(8) << "Copied" << std::setw(8) << "Failed"
              << std::setw(10) << "Conflicts" << "Bytes" << std::endl;
    for (const auto& op : *history) {
        std::cout << std::left << std::setw(6) << op.id << std::setw(21) << formatTime(op.startedAt)
                  << std::setw(11) << toString(op.kind) << std::setw(11) << toString(op.status)
                  << std::setw(8) << op.filesCopied << std::setw(8) << op.filesFailed
                  << std::setw(10) << op.conflictsDetected << formatBytes(op.bytesCopied) << std::endl;
        if (!op.errorMessage.empty()) {
            std::cout << "      " << op.errorMessage << std::endl;
        }
    }
    return kExitOk;
}

int runConflicts(SyncEngine& engine, const std::string& groupId) {
    auto conflicts = engine.store().pendingConflicts(groupId);
    if (!conflicts) {
        return reportError(conflicts.error());
    }
    if (conflicts->empty()) {
        std::cout << "No pending conflicts for group " << groupId << std::endl;
        return kExitOk;
    }
    std::cout << conflicts->size() << " pending conflict(s) for group " << groupId << ":" << std::endl;
    printConflicts(*conflicts);
    return kExitConflicts;
}

int runResolve(SyncEngine& engine, const GroupDefinition& definition, const CliOptions& cli) {
    auto choice = parseResolution(cli.choice);
    if (!choice || *choice == Resolution::Unresolved) {
        std::cerr << "Error: --choice must be keep_master, keep_backup, keep_both or skip" << std::endl;
        return kExitUsage;
    }
    if (!cli.all && cli.conflictId <= 0) {
        std::cerr << "Error: resolve needs --id or --all" << std::endl;
        return kExitUsage;
    }

    auto pending = engine.store().pendingConflicts(definition.group.id);
    if (!pending) {
        return reportError(pending.error());
    }

    std::vector<Conflict> selected;
    for (const auto& conflict : *pending) {
        if (cli.all || conflict.id == cli.conflictId) {
            selected.push_back(conflict);
        }
    }
    if (selected.empty()) {
        return reportError(Error(ErrorCode::NotFound, cli.all ? "No pending conflicts"
                                 : "Conflict #" + std::to_string(cli.conflictId) + " is not pending"));
    }

    auto result = engine.resolver().resolveAll(definition.group, selected, *choice, definition.options);
    if (!result) {
        return reportError(result.error());
    }
    std::cout << "Resolved " << result->resolved << ", skipped " << result->skipped
              << ", failed " << result->failed << std::endl;
    for (const auto& path : result->failedPaths) {
        std::cout << "  failed: " << path << std::endl;
    }
    return result->failed > 0 ? kExitFailure : kExitOk;
}

int runClear(SyncEngine& engine, const std::string& groupId) {
    auto cleared = engine.synchronizer().clearTracking(groupId);
    if (!cleared) {
        return reportError(cleared.error());
    }
    std::cout << "Forgot " << *cleared << " tracked file(s) of group " << groupId << std::endl;
    return kExitOk;
}

int runParseSchedule(const std::vector<std::string>& words) {
    std::string text;
    for (const auto& word : words) {
        text += (text.empty() ? "" : " ") + word;
    }
    if (text.empty()) {
        std::cerr << "Error: parse-schedule needs a phrase or cron expression" << std::endl;
        return kExitUsage;
    }

    std::string cron;
    if (CronExpression::parse(text)) {
        cron = text;
    } else {
        auto friendly = parseFriendlySchedule(text);
        if (!friendly) {
            return reportError(friendly.error());
        }
        if (friendly->type == FriendlySchedule::Type::Interval) {
            std::cout << "interval: every " << friendly->interval.count() << " minute(s)" << std::endl;
            return kExitOk;
        }
        cron = friendly->cronExpression;
    }

    auto expression = CronExpression::parse(cron);
    if (!expression) {
        return reportError(expression.error());
    }
    std::cout << "cron: " << cron << std::endl;
    auto next = std::chrono::system_clock::now();
    for (int i = 0; i < 3; i++) {
        auto fire = expression->nextAfter(next);
        if (!fire) {
            break;
        }
        const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(fire->time_since_epoch()).count();
        std::cout << "  next: " << formatTime(millis) << std::endl;
        next = *fire;
    }
    return kExitOk;
}

} // namespace

int main(int argc, char* argv[]) {
    CliOptions cli;
    if (!parseArguments(argc, argv, cli)) {
        printUsage();
        return kExitUsage;
    }

    auto& logger = Logger::instance();
    auto level = Logger::parseLevel(cli.logLevel);
    if (!level) {
        std::cerr << "Error: unknown log level '" << cli.logLevel << "'" << std::endl;
        return kExitUsage;
    }
    logger.setLevel(*level);
    logger.setComponent("CLI");

    if (cli.command == "parse-schedule") {
        return runParseSchedule(cli.positional);
    }

    static const char* kCommands[] = {"sync", "history", "conflicts", "resolve", "restore", "verify", "clear"};
    bool known = false;
    for (const char* command : kCommands) {
        known = known || cli.command == command;
    }
    if (!known) {
        std::cerr << "Unknown command: " << cli.command << std::endl;
        printUsage();
        return kExitUsage;
    }

    Config fileConfig;
    const std::string configPath = cli.configPath.empty() ? PathUtils::getConfigPath().string() : cli.configPath;
    if (!fileConfig.loadFromFile(configPath) && !cli.configPath.empty()) {
        std::cerr << "Error: cannot read configuration " << configPath << std::endl;
        return kExitFailure;
    }

    std::string dbPath = cli.dbPath;
    if (dbPath.empty()) {
        dbPath = fileConfig.get("database", "");
    }
    if (dbPath.empty()) {
        PathUtils::ensureDirectory(PathUtils::getDataDir());
        dbPath = PathUtils::getDatabasePath().string();
    }

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    EngineConfig engineConfig;
    engineConfig.databasePath = dbPath;
    engineConfig.schedulerWorkers = 1;
    // Only rows whose owning process has exited are failed; a running daemon keeps its own
    engineConfig.recoverInterrupted = true;
    SyncEngine engine(engineConfig);
    auto initialized = engine.initialize();
    if (!initialized) {
        return reportError(initialized.error());
    }

    if (cli.command == "history") {
        return runHistory(engine, cli);
    }
    if (cli.command == "conflicts" || cli.command == "clear") {
        if (cli.groupId.empty()) {
            std::cerr << "Error: " << cli.command << " needs --group" << std::endl;
            return kExitUsage;
        }
        return cli.command == "conflicts" ? runConflicts(engine, cli.groupId) : runClear(engine, cli.groupId);
    }

    auto definition = resolveGroup(cli, fileConfig);
    if (!definition) {
        return reportError(definition.error());
    }

    if (cli.command == "sync") {
        return runSync(engine, std::move(*definition), cli.progress);
    }
    if (cli.command == "restore") {
        return runRestore(engine, std::move(*definition), cli.backupIndex, cli.progress);
    }
    if (cli.command == "verify") {
        return runVerify(engine, *definition);
    }
    return runResolve(engine, *definition, cli);
}
