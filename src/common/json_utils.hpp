#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "common/enums.hpp"
#include "common/models.hpp"

namespace syncwarden {

inline std::string toStateString(SupervisorState state)
{
    switch (state) {
    case SupervisorState::Stopped:
        return "stopped";
    case SupervisorState::Starting:
        return "starting";
    case SupervisorState::Running:
        return "running";
    case SupervisorState::Stopping:
        return "stopping";
    case SupervisorState::Restarting:
        return "restarting";
    }
    return "stopped";
}

inline std::string toSyncStateString(FolderSyncState state)
{
    switch (state) {
    case FolderSyncState::Idle:
        return "idle";
    case FolderSyncState::Scanning:
        return "scanning";
    case FolderSyncState::Syncing:
        return "syncing";
    case FolderSyncState::Error:
        return "error";
    case FolderSyncState::Unknown:
        return "unknown";
    }
    return "unknown";
}

inline FolderSyncState parseSyncStateString(const std::string &value)
{
    if (value == "idle") {
        return FolderSyncState::Idle;
    }
    if (value == "scanning") {
        return FolderSyncState::Scanning;
    }
    if (value == "syncing") {
        return FolderSyncState::Syncing;
    }
    if (value == "error") {
        return FolderSyncState::Error;
    }
    return FolderSyncState::Unknown;
}

inline std::string stringOrEmpty(const nlohmann::json &j, const char *key)
{
    if (j.contains(key) && j.at(key).is_string()) {
        return j.at(key).get<std::string>();
    }
    return std::string();
}

inline void from_json(const nlohmann::json &j, ConfigDevice &device)
{
    device.deviceId = stringOrEmpty(j, "deviceID");
    device.name = stringOrEmpty(j, "name");
}

inline void from_json(const nlohmann::json &j, ConfigFolder &folder)
{
    folder.id = stringOrEmpty(j, "id");
    folder.label = stringOrEmpty(j, "label");
    folder.path = stringOrEmpty(j, "path");
}

inline void from_json(const nlohmann::json &j, ServiceConfig &config)
{
    if (j.contains("devices") && j.at("devices").is_array()) {
        config.devices = j.at("devices").get<std::vector<ConfigDevice>>();
    } else {
        config.devices.clear();
    }
    if (j.contains("folders") && j.at("folders").is_array()) {
        config.folders = j.at("folders").get<std::vector<ConfigFolder>>();
    } else {
        config.folders.clear();
    }
}

inline void from_json(const nlohmann::json &j, SystemInfo &info)
{
    info.myId = stringOrEmpty(j, "myID");
    info.tilde = stringOrEmpty(j, "tilde");
}

inline void from_json(const nlohmann::json &j, ServiceVersion &version)
{
    version.version = stringOrEmpty(j, "version");
    version.longVersion = stringOrEmpty(j, "longVersion");
    version.os = stringOrEmpty(j, "os");
    version.arch = stringOrEmpty(j, "arch");
}

inline void from_json(const nlohmann::json &j, ItemConnectionData &data)
{
    data.address = stringOrEmpty(j, "address");
    data.connected = j.value("connected", false);
    data.inBytesTotal = j.value("inBytesTotal", static_cast<std::int64_t>(0));
    data.outBytesTotal = j.value("outBytesTotal", static_cast<std::int64_t>(0));
}

inline void from_json(const nlohmann::json &j, ServiceConnections &connections)
{
    connections.deviceConnections.clear();
    if (j.contains("connections") && j.at("connections").is_object()) {
        for (const auto &item : j.at("connections").items()) {
            connections.deviceConnections.emplace(
                item.key(), item.value().get<ItemConnectionData>());
        }
    }
    if (j.contains("total") && j.at("total").is_object()) {
        connections.total = j.at("total").get<ItemConnectionData>();
    } else {
        connections.total = ItemConnectionData{};
    }
}

inline void from_json(const nlohmann::json &j, IgnorePatterns &ignores)
{
    // The service answers null instead of [] when a folder has no .stignore.
    if (j.contains("ignore") && j.at("ignore").is_array()) {
        ignores.ignorePatterns = j.at("ignore").get<std::vector<std::string>>();
    } else {
        ignores.ignorePatterns.clear();
    }
    if (j.contains("patterns") && j.at("patterns").is_array()) {
        ignores.regexPatterns = j.at("patterns").get<std::vector<std::string>>();
    } else {
        ignores.regexPatterns.clear();
    }
}

inline void from_json(const nlohmann::json &j, ServiceEvent &event)
{
    event.id = j.value("id", static_cast<std::int64_t>(0));
    event.type = stringOrEmpty(j, "type");
    event.time = stringOrEmpty(j, "time");
    if (j.contains("data") && !j.at("data").is_null()) {
        event.data = j.at("data");
    } else {
        event.data = nlohmann::json::object();
    }
}

inline nlohmann::json toJson(const ConnectionStats &stats)
{
    return nlohmann::json{
        {"inBytesTotal", stats.inBytesTotal},
        {"outBytesTotal", stats.outBytesTotal},
        {"inBytesPerSecond", stats.inBytesPerSecond},
        {"outBytesPerSecond", stats.outBytesPerSecond}
    };
}

} // namespace syncwarden
