#include "SyncEngine.h"
#include "CronExpression.h"
#include "LoggerMacros.h"

#include <set>

namespace DriveSync {

namespace {

constexpr const char* kComponent = "SyncEngine";

} // namespace

SyncEngine::SyncEngine(EngineConfig config)
    : config_(std::move(config))
    , sink_(config_.sink ? config_.sink : &loggingSink_)
    , store_(config_.databasePath) {
}

SyncEngine::~SyncEngine() {
    shutdown(true);
}

Result<void> SyncEngine::initialize() {
    if (isInitialized()) {
        return Ok();
    }

    auto opened = store_.open();
    if (!opened) {
        LOG_ERROR_COMP("Cannot open tracking store " + config_.databasePath + ": " + opened.error().message,
                       kComponent);
        return opened;
    }

    if (config_.recoverInterrupted) {
        auto recovered = store_.recoverInterrupted();
        if (!recovered) {
            return recovered.error();
        }
        if (*recovered > 0) {
            LOG_WARN_COMP("Marked " + std::to_string(*recovered) + " interrupted operation(s) as failed", kComponent);
        }
    }

    synchronizer_ = std::make_unique<Synchronizer>(store_, locks_);
    resolver_ = std::make_unique<ConflictResolver>(store_, locks_);
    scheduler_ = std::make_unique<ScheduledController>(*synchronizer_, sink_, config_.schedulerWorkers);
    realtime_ = std::make_unique<RealtimeController>(*synchronizer_, sink_, config_.watcherFactory);

    LOG_INFO_COMP("Engine ready (store " + config_.databasePath + ")", kComponent);
    return Ok();
}

Result<std::pair<std::string, std::string>> SyncEngine::activate(const GroupDefinition& definition) {
    using Ids = std::pair<std::string, std::string>;
    if (!isInitialized()) {
        return Err<Ids>(ErrorCode::InternalError, "Engine is not initialized");
    }

    Ids ids;
    const std::string& groupId = definition.group.id;

    if (!definition.schedule.empty()) {
        auto added = scheduler_->addCronSchedule(groupId + ".schedule", definition.group,
                                                 definition.schedule, definition.options);
        if (!added) {
            return added.error();
        }
        ids.first = added->id;
    } else if (definition.interval.count() > 0) {
        auto added = scheduler_->addIntervalSchedule(groupId + ".schedule", definition.group,
                                                     definition.interval, definition.options);
        if (!added) {
            return added.error();
        }
        ids.first = added->id;
    }

    if (definition.realtime) {
        auto watch = realtime_->enable(definition.group, definition.group.masterPath,
                                       definition.debounce, definition.options);
        if (!watch) {
            if (!ids.first.empty()) {
                auto removed = scheduler_->remove(ids.first);
                if (!removed) {
                    LOG_WARN_COMP("Cannot roll back schedule " + ids.first + ": " + removed.error().message,
                                  kComponent);
                }
            }
            return watch.error();
        }
        ids.second = *watch;
    }
    return ids;
}

void SyncEngine::shutdown(bool waitForRunning) {
    // Watches first: a debounced trigger must not start after the scheduler stops
    if (realtime_) {
        realtime_->shutdown();
    }
    if (scheduler_) {
        scheduler_->shutdown(waitForRunning);
    }
}

Result<std::vector<GroupDefinition>> SyncEngine::loadGroups(const Config& config) {
    std::set<std::string> ids;
    for (const auto& key : config.keysWithPrefix("group.")) {
        const auto rest = key.substr(6);
        const auto dot = rest.find('.');
        if (dot == std::string::npos || dot == 0) {
            return Err<std::vector<GroupDefinition>>(ErrorCode::ConfigError, "Malformed group key: " + key);
        }
        ids.insert(rest.substr(0, dot));
    }

    std::vector<GroupDefinition> groups;
    for (const auto& id : ids) {
        auto group = loadGroup(config, id);
        if (!group) {
            return group.error();
        }
        groups.push_back(std::move(*group));
    }
    return groups;
}

Result<GroupDefinition> SyncEngine::loadGroup(const Config& config, const std::string& groupId) {
    const std::string prefix = "group." + groupId + ".";
    GroupDefinition definition;
    definition.group.id = groupId;
    definition.group.masterPath = config.get(prefix + "master");
    for (const auto& backup : config.getList(prefix + "backups")) {
        definition.group.backupPaths.emplace_back(backup);
    }

    const std::string mode = config.get(prefix + "mode", "master_to_backup");
    auto parsedMode = parseSyncMode(mode);
    if (!parsedMode) {
        return Err<GroupDefinition>(ErrorCode::ConfigError, "Invalid value for " + prefix + "mode: '" + mode + "'");
    }
    definition.group.mode = *parsedMode;

    auto valid = Synchronizer::validateGroup(definition.group);
    if (!valid) {
        return Err<GroupDefinition>(ErrorCode::ConfigError, "Group " + groupId + ": " + valid.error().message);
    }

    // Group overrides are layered on top of the global sync.* keys
    Config layered(config);
    const std::string overridePrefix = prefix + "sync.";
    for (const auto& key : config.keysWithPrefix(overridePrefix)) {
        layered.set("sync." + key.substr(overridePrefix.size()), config.get(key));
    }
    auto options = AdvancedSyncOptions::fromConfig(layered, "sync.");
    if (!options) {
        return Err<GroupDefinition>(ErrorCode::ConfigError, "Group " + groupId + ": " + options.error().message);
    }
    definition.options = std::move(*options);

    const std::string schedule = Config::trim(config.get(prefix + "schedule"));
    if (!schedule.empty()) {
        if (CronExpression::parse(schedule)) {
            definition.schedule = schedule;
        } else {
            auto friendly = parseFriendlySchedule(schedule);
            if (!friendly) {
                return Err<GroupDefinition>(ErrorCode::ConfigError,
                                            "Invalid value for " + prefix + "schedule: '" + schedule + "'");
            }
            if (friendly->type == FriendlySchedule::Type::Cron) {
                definition.schedule = friendly->cronExpression;
            } else {
                definition.interval = friendly->interval;
            }
        }
    } else if (config.hasKey(prefix + "interval_minutes")) {
        const int minutes = config.getInt(prefix + "interval_minutes", 0);
        if (minutes <= 0) {
            return Err<GroupDefinition>(ErrorCode::ConfigError,
                                        "Invalid value for " + prefix + "interval_minutes: '" +
                                        config.get(prefix + "interval_minutes") + "'");
        }
        definition.interval = std::chrono::minutes(minutes);
    }

    definition.realtime = config.getBool(prefix + "realtime", false);
    if (config.hasKey(prefix + "debounce_ms")) {
        const int debounce = config.getInt(prefix + "debounce_ms", -1);
        if (debounce < 0) {
            return Err<GroupDefinition>(ErrorCode::ConfigError,
                                        "Invalid value for " + prefix + "debounce_ms: '" +
                                        config.get(prefix + "debounce_ms") + "'");
        }
        definition.debounce = std::chrono::milliseconds(debounce);
    }
    return definition;
}

} // namespace DriveSync
