#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <QDateTime>
#include <QFuture>
#include <QObject>
#include <QString>

#include "common/cancellation.hpp"
#include "common/enums.hpp"
#include "common/models.hpp"
#include "common/settings.hpp"
#include "supervisor/collaborators.hpp"
#include "supervisor/domain_registry.hpp"

namespace syncwarden {

struct QObjectDeleteLater {
    void operator()(QObject *object) const;
};

/**
 * SyncSupervisor owns the lifecycle of one supervised sync service.
 *
 * It reacts to the process runner, creates the API client once the service
 * answers, loads the startup snapshot, runs the event and connections
 * watchers, and republishes everything through its own signals. Signals can
 * be emitted from any thread; Qt queues them to receivers living elsewhere.
 *
 * Only failures while starting (through the future returned by start()) and
 * failures of explicit commands propagate to callers.
 */
class SyncSupervisor : public QObject
{
    Q_OBJECT
public:
    SyncSupervisor(std::unique_ptr<ProcessRunner> processRunner,
                   std::unique_ptr<ApiClientFactory> apiClientFactory,
                   std::unique_ptr<EventWatcherFactory> eventWatcherFactory,
                   std::unique_ptr<ConnectionsWatcherFactory> connectionsWatcherFactory,
                   QObject *parent = nullptr);
    ~SyncSupervisor() override;

    SupervisorState state() const;
    bool isDataLoaded() const;
    QDateTime startedTime() const;
    QDateTime lastConnectivityEventTime() const;
    ServiceVersion version() const;
    ConnectionStats totalConnectionStats() const;

    SupervisorSettings settings() const;
    void setSettings(const SupervisorSettings &settings);

    // Launches the process, then connects on the global thread pool. The future
    // finishes once the watchers run, or carries the startup failure.
    QFuture<void> start();
    void stop();
    // False when the service is not running.
    bool restart();
    void kill();
    void killAllInstances();
    void scan(const std::string &folderId, const std::string &subPath);
    void reloadIgnores(const std::string &folderId);

    std::shared_ptr<const Folder> lookupFolder(const std::string &folderId) const;
    std::vector<std::shared_ptr<const Folder>> allFolders() const;
    std::shared_ptr<const Device> lookupDevice(const std::string &deviceId) const;
    std::vector<std::shared_ptr<const Device>> allDevices() const;

signals:
    void dataLoaded();
    void stateChanged(syncwarden::SupervisorState oldState, syncwarden::SupervisorState newState);
    void messageLogged(const QString &message);
    void folderSyncStateChanged(const QString &folderId,
                                syncwarden::FolderSyncState previous,
                                syncwarden::FolderSyncState current);
    void totalConnectionStatsChanged(const syncwarden::ConnectionStats &stats);
    void processExitedWithError();
    void deviceConnected(const QString &deviceId, const QString &address);
    void deviceDisconnected(const QString &deviceId);

private slots:
    void onProcessStarting();
    void onProcessStopped(syncwarden::ExitStatus status);
    void onProcessRestarted();

    void onItemStarted(const QString &folderId, const QString &item);
    void onItemFinished(const QString &folderId, const QString &item);
    void onDeviceConnected(const QString &deviceId, const QString &address);
    void onDeviceDisconnected(const QString &deviceId, const QString &error);
    void onSyncStateChanged(const QString &folderId,
                            syncwarden::FolderSyncState previous,
                            syncwarden::FolderSyncState current);
    void onTotalConnectionStatsChanged(const syncwarden::ConnectionStats &stats);

private:
    using EventWatcherPtr = std::unique_ptr<EventWatcher, QObjectDeleteLater>;
    using ConnectionsWatcherPtr = std::unique_ptr<ConnectionsWatcher, QObjectDeleteLater>;

    void setState(SupervisorState newState);
    void startClient();
    void loadStartupData(const std::shared_ptr<ApiClient> &client, const CancellationToken &token);
    void startWatchers(const std::shared_ptr<ApiClient> &client, const CancellationToken &token);
    void stopApiClients();

    std::shared_ptr<ApiClient> currentApiClient() const;
    bool isCurrentEventWatcher(const QObject *watcher) const;
    bool isCurrentConnectionsWatcher(const QObject *watcher) const;
    ProcessLaunchOptions launchOptions() const;
    void markConnectivityEvent();

    std::unique_ptr<ProcessRunner> m_processRunner;
    std::unique_ptr<ApiClientFactory> m_apiClientFactory;
    std::unique_ptr<EventWatcherFactory> m_eventWatcherFactory;
    std::unique_ptr<ConnectionsWatcherFactory> m_connectionsWatcherFactory;

    mutable std::mutex m_stateMutex;
    SupervisorState m_state = SupervisorState::Stopped;

    // Guards the connection attempt and everything created from it.
    mutable std::mutex m_clientsMutex;
    CancellationSource m_apiAbort;
    std::shared_ptr<ApiClient> m_apiClient;
    EventWatcherPtr m_eventWatcher;
    ConnectionsWatcherPtr m_connectionsWatcher;
    QFuture<void> m_clientFuture;
    bool m_shuttingDown = false;

    mutable std::mutex m_fieldsMutex;
    SupervisorSettings m_settings;
    QDateTime m_startedTime;
    QDateTime m_lastConnectivityEventTime;
    ServiceVersion m_version;
    ConnectionStats m_totalConnectionStats;
    bool m_dataLoaded = false;

    std::atomic<int> m_sessionCounter{0};
    DomainRegistry m_registry;
};

} // namespace syncwarden
