#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "supervisor/domain_entities.hpp"

namespace syncwarden {

using FolderMap = std::map<std::string, std::shared_ptr<Folder>>;
using DeviceMap = std::map<std::string, std::shared_ptr<Device>>;

// DomainRegistry holds the folders and devices of the current session.
// Each map is an immutable snapshot replaced by pointer swap; entities are
// mutated in place through their own locks.
class DomainRegistry {
public:
    DomainRegistry();

    // Null when the id is unknown.
    std::shared_ptr<Folder> lookupFolder(const std::string &folderId) const;
    std::shared_ptr<Device> lookupDevice(const std::string &deviceId) const;

    std::vector<std::shared_ptr<Folder>> allFolders() const;
    std::vector<std::shared_ptr<Device>> allDevices() const;

    void replaceFolders(FolderMap folders);
    void replaceDevices(DeviceMap devices);

private:
    std::shared_ptr<const FolderMap> folderSnapshot() const;
    std::shared_ptr<const DeviceMap> deviceSnapshot() const;

    mutable std::mutex m_foldersMutex;
    std::shared_ptr<const FolderMap> m_folders;

    mutable std::mutex m_devicesMutex;
    std::shared_ptr<const DeviceMap> m_devices;
};

} // namespace syncwarden
