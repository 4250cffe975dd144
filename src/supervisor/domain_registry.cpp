#include "supervisor/domain_registry.hpp"

#include <utility>

namespace syncwarden {

DomainRegistry::DomainRegistry()
    : m_folders(std::make_shared<const FolderMap>())
    , m_devices(std::make_shared<const DeviceMap>())
{
}

std::shared_ptr<const FolderMap> DomainRegistry::folderSnapshot() const
{
    std::lock_guard<std::mutex> lock(m_foldersMutex);
    return m_folders;
}

std::shared_ptr<const DeviceMap> DomainRegistry::deviceSnapshot() const
{
    std::lock_guard<std::mutex> lock(m_devicesMutex);
    return m_devices;
}

std::shared_ptr<Folder> DomainRegistry::lookupFolder(const std::string &folderId) const
{
    const auto folders = folderSnapshot();
    const auto it = folders->find(folderId);
    if (it == folders->end()) {
        return nullptr;
    }
    return it->second;
}

std::shared_ptr<Device> DomainRegistry::lookupDevice(const std::string &deviceId) const
{
    const auto devices = deviceSnapshot();
    const auto it = devices->find(deviceId);
    if (it == devices->end()) {
        return nullptr;
    }
    return it->second;
}

std::vector<std::shared_ptr<Folder>> DomainRegistry::allFolders() const
{
    const auto folders = folderSnapshot();
    std::vector<std::shared_ptr<Folder>> result;
    result.reserve(folders->size());
    for (const auto &entry : *folders) {
        result.push_back(entry.second);
    }
    return result;
}

std::vector<std::shared_ptr<Device>> DomainRegistry::allDevices() const
{
    const auto devices = deviceSnapshot();
    std::vector<std::shared_ptr<Device>> result;
    result.reserve(devices->size());
    for (const auto &entry : *devices) {
        result.push_back(entry.second);
    }
    return result;
}

void DomainRegistry::replaceFolders(FolderMap folders)
{
    auto snapshot = std::make_shared<const FolderMap>(std::move(folders));
    std::lock_guard<std::mutex> lock(m_foldersMutex);
    m_folders = std::move(snapshot);
}

void DomainRegistry::replaceDevices(DeviceMap devices)
{
    auto snapshot = std::make_shared<const DeviceMap>(std::move(devices));
    std::lock_guard<std::mutex> lock(m_devicesMutex);
    m_devices = std::move(snapshot);
}

} // namespace syncwarden
