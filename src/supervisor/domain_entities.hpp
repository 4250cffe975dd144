#pragma once

#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include <QRegularExpression>

#include "common/enums.hpp"
#include "common/models.hpp"

namespace syncwarden {

// Ignore rules of one folder: the literal .stignore lines plus the regexes the
// service compiled them into.
class FolderIgnores {
public:
    FolderIgnores() = default;
    FolderIgnores(std::vector<std::string> ignorePatterns,
                  std::vector<std::string> regexPatterns);

    const std::vector<std::string> &ignorePatterns() const { return m_ignorePatterns; }
    const std::vector<std::string> &regexPatterns() const { return m_regexPatterns; }

    // True if any regex pattern matches the folder-relative path.
    bool isIgnored(const std::string &relativePath) const;

private:
    std::vector<std::string> m_ignorePatterns;
    std::vector<std::string> m_regexPatterns;
    std::vector<QRegularExpression> m_compiled;
};

/**
 * Device is a remote peer from the service configuration.
 *
 * Identity and name are fixed for the lifetime of a loaded session; the
 * connection status is updated in place from live notifications and is safe
 * to read from any thread.
 */
class Device {
public:
    Device(std::string deviceId, std::string name);

    const std::string &deviceId() const { return m_deviceId; }
    const std::string &name() const { return m_name; }

    bool isConnected() const;
    // Empty when disconnected.
    std::optional<std::string> address() const;

    void setConnected(const std::string &address);
    void setDisconnected();

private:
    const std::string m_deviceId;
    const std::string m_name;

    mutable std::mutex m_mutex;
    std::optional<std::string> m_address;
};

class Folder {
public:
    Folder(std::string folderId, std::string path, FolderIgnores ignores);

    const std::string &folderId() const { return m_folderId; }
    const std::string &path() const { return m_path; }

    FolderIgnores ignores() const;
    void setIgnores(FolderIgnores ignores);

    FolderSyncState syncState() const;
    void setSyncState(FolderSyncState state);

    bool isSyncingPath(const std::string &relativePath) const;
    std::vector<std::string> syncingPaths() const;
    void addSyncingPath(const std::string &relativePath);
    void removeSyncingPath(const std::string &relativePath);

private:
    const std::string m_folderId;
    const std::string m_path;

    mutable std::mutex m_mutex;
    FolderIgnores m_ignores;
    FolderSyncState m_syncState = FolderSyncState::Idle;
    std::set<std::string> m_syncingPaths;
};

} // namespace syncwarden
