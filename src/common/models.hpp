#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include <QMetaType>

#include <nlohmann/json.hpp>

namespace syncwarden {

// Payloads returned by the service API. Decoded in common/json_utils.hpp.

struct ConfigDevice {
    std::string deviceId;
    std::string name;
};

struct ConfigFolder {
    std::string id;
    std::string label;
    std::string path;
};

struct ServiceConfig {
    std::vector<ConfigDevice> devices;
    std::vector<ConfigFolder> folders;
};

struct SystemInfo {
    std::string myId;
    // Home directory the service expands "~" against.
    std::string tilde;
};

struct ServiceVersion {
    std::string version;
    std::string longVersion;
    std::string os;
    std::string arch;
};

struct ItemConnectionData {
    std::string address;
    bool connected = false;
    std::int64_t inBytesTotal = 0;
    std::int64_t outBytesTotal = 0;
};

struct ServiceConnections {
    std::map<std::string, ItemConnectionData> deviceConnections;
    ItemConnectionData total;
};

struct IgnorePatterns {
    std::vector<std::string> ignorePatterns;
    std::vector<std::string> regexPatterns;
};

struct ServiceEvent {
    std::int64_t id = 0;
    std::string type;
    std::string time;
    nlohmann::json data;
};

// Aggregate throughput across all device connections.
struct ConnectionStats {
    std::int64_t inBytesTotal = 0;
    std::int64_t outBytesTotal = 0;
    double inBytesPerSecond = 0.0;
    double outBytesPerSecond = 0.0;
};

} // namespace syncwarden

Q_DECLARE_METATYPE(syncwarden::ConnectionStats)
