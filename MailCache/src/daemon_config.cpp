#include "mailcache/daemon_config.hpp"
#include "mailcache/sync_exception.hpp"
#include "mailcache/constants.hpp"

#include <fstream>
#include <sstream>

#include "spdlog/spdlog.h"

static int intOrDefault(const nlohmann::json & json, const char * key, int fallback) {
    if (json.count(key) && json[key].is_number_integer()) {
        return json[key].get<int>();
    }
    return fallback;
}

DaemonConfig::DaemonConfig(std::string configDir) :
    configDir(configDir), socketPath(configDir + FS_PATH_SEP + "mailcache.sock")
{
}

DaemonConfig DaemonConfig::load(std::string configDir) {
    DaemonConfig config{configDir};
    std::ifstream in(configDir + FS_PATH_SEP + "mailcache.json");
    if (!in.good()) {
        return config;
    }

    std::stringstream buffer;
    buffer << in.rdbuf();
    nlohmann::json json = nlohmann::json::parse(buffer.str(), nullptr, false);
    if (json.is_discarded() || !json.is_object()) {
        spdlog::get("logger")->warn("mailcache.json is not a JSON object, using defaults");
        return config;
    }
    config.applyJSON(json);
    return config;
}

void DaemonConfig::applyJSON(const nlohmann::json & json) {
    recencyWindowDays = intOrDefault(json, "recency_window_days", recencyWindowDays);
    sequenceFloor = intOrDefault(json, "sequence_floor", sequenceFloor);
    prefetchCount = intOrDefault(json, "prefetch_count", prefetchCount);
    syncIntervalSeconds = intOrDefault(json, "sync_interval_seconds", syncIntervalSeconds);
    drainIntervalSeconds = intOrDefault(json, "drain_interval_seconds", drainIntervalSeconds);
    restartGraceMs = intOrDefault(json, "restart_grace_ms", restartGraceMs);
    freshCacheSeconds = intOrDefault(json, "fresh_cache_seconds", freshCacheSeconds);
    if (json.count("socket_path") && json["socket_path"].is_string()) {
        socketPath = json["socket_path"].get<std::string>();
    }
}

ReconcilerOptions DaemonConfig::reconcilerOptions() {
    ReconcilerOptions options;
    options.recencyWindowDays = recencyWindowDays;
    options.sequenceFloor = sequenceFloor;
    options.prefetchCount = prefetchCount;
    return options;
}

std::string DaemonConfig::databasePath() {
    return configDir + FS_PATH_SEP + "mailcache.db";
}

std::string DaemonConfig::identityPath() {
    return configDir + FS_PATH_SEP + "mailcache.pid";
}

std::string DaemonConfig::accountsPath() {
    return configDir + FS_PATH_SEP + "accounts.json";
}

nlohmann::json DaemonConfig::toJSON() {
    return {
        {"recency_window_days", recencyWindowDays},
        {"sequence_floor", sequenceFloor},
        {"prefetch_count", prefetchCount},
        {"sync_interval_seconds", syncIntervalSeconds},
        {"drain_interval_seconds", drainIntervalSeconds},
        {"restart_grace_ms", restartGraceMs},
        {"fresh_cache_seconds", freshCacheSeconds},
        {"socket_path", socketPath},
    };
}

std::vector<std::shared_ptr<Account>> DaemonConfig::loadAccounts() {
    std::vector<std::shared_ptr<Account>> accounts{};
    std::ifstream in(accountsPath());
    if (!in.good()) {
        spdlog::get("logger")->warn("No accounts file at {}", accountsPath());
        return accounts;
    }

    std::stringstream buffer;
    buffer << in.rdbuf();
    nlohmann::json json = nlohmann::json::parse(buffer.str(), nullptr, false);
    if (json.is_discarded() || !json.is_array()) {
        throw SyncException("invalid-accounts", accountsPath() + " must contain a JSON array of accounts", false);
    }

    for (const auto & item : json) {
        auto account = std::make_shared<Account>(item);
        std::string missing = account->valid();
        if (missing != "") {
            throw SyncException("invalid-account", "Account is missing required field: " + missing, false);
        }
        accounts.push_back(account);
    }
    return accounts;
}
