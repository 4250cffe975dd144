#include "supervisor/domain_entities.hpp"

#include <utility>

namespace syncwarden {

FolderIgnores::FolderIgnores(std::vector<std::string> ignorePatterns,
                             std::vector<std::string> regexPatterns)
    : m_ignorePatterns(std::move(ignorePatterns))
    , m_regexPatterns(std::move(regexPatterns))
{
    m_compiled.reserve(m_regexPatterns.size());
    for (const auto &pattern : m_regexPatterns) {
        QRegularExpression regex(QString::fromStdString(pattern));
        if (regex.isValid()) {
            m_compiled.push_back(std::move(regex));
        }
    }
}

bool FolderIgnores::isIgnored(const std::string &relativePath) const
{
    const QString path = QString::fromStdString(relativePath);
    for (const auto &regex : m_compiled) {
        if (regex.match(path).hasMatch()) {
            return true;
        }
    }
    return false;
}

Device::Device(std::string deviceId, std::string name)
    : m_deviceId(std::move(deviceId))
    , m_name(std::move(name))
{
}

bool Device::isConnected() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_address.has_value();
}

std::optional<std::string> Device::address() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_address;
}

void Device::setConnected(const std::string &address)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_address = address;
}

void Device::setDisconnected()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_address.reset();
}

Folder::Folder(std::string folderId, std::string path, FolderIgnores ignores)
    : m_folderId(std::move(folderId))
    , m_path(std::move(path))
    , m_ignores(std::move(ignores))
{
}

FolderIgnores Folder::ignores() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_ignores;
}

void Folder::setIgnores(FolderIgnores ignores)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_ignores = std::move(ignores);
}

FolderSyncState Folder::syncState() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_syncState;
}

void Folder::setSyncState(FolderSyncState state)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_syncState = state;
}

bool Folder::isSyncingPath(const std::string &relativePath) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_syncingPaths.count(relativePath) > 0;
}

std::vector<std::string> Folder::syncingPaths() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return std::vector<std::string>(m_syncingPaths.begin(), m_syncingPaths.end());
}

void Folder::addSyncingPath(const std::string &relativePath)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_syncingPaths.insert(relativePath);
}

void Folder::removeSyncingPath(const std::string &relativePath)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_syncingPaths.erase(relativePath);
}

} // namespace syncwarden
