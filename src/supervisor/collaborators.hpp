#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <QMap>
#include <QObject>
#include <QString>
#include <QUrl>

#include "common/cancellation.hpp"
#include "common/enums.hpp"
#include "common/models.hpp"

namespace syncwarden {

// Everything the runner needs to launch the service. Pushed by the supervisor
// each time the runner announces it is starting.
struct ProcessLaunchOptions {
    QString apiKey;
    QString hostAddress;
    QString executablePath;
    QString customHomeDir;
    QMap<QString, QString> environment;
    bool denyUpgrade = false;
    bool runLowPriority = false;
    bool hideDeviceIds = false;
};

/**
 * ProcessRunner owns the OS process of the supervised service.
 *
 * start() must emit starting() before the process is launched so that the
 * options can still be configured. A service-requested restart is reported
 * as processRestarted() followed by a fresh starting().
 */
class ProcessRunner : public QObject
{
    Q_OBJECT
public:
    using QObject::QObject;
    ~ProcessRunner() override = default;

    virtual void configure(const ProcessLaunchOptions &options) = 0;
    virtual void start() = 0;
    virtual void kill() = 0;
    virtual void killAllInstances() = 0;

signals:
    void starting();
    void processStopped(syncwarden::ExitStatus status);
    void processRestarted();
    void messageLogged(const QString &message);
};

// Typed calls against the service REST API. All calls block the calling
// thread and throw ApiError on failure.
class ApiClient {
public:
    virtual ~ApiClient() = default;

    virtual ServiceConfig fetchConfig() = 0;
    virtual SystemInfo fetchSystemInfo() = 0;
    virtual ServiceVersion fetchVersion() = 0;
    virtual ServiceConnections fetchConnections() = 0;
    virtual IgnorePatterns fetchIgnores(const std::string &folderId) = 0;

    // Long-polls the event log for events newer than sinceId. limit <= 0 means
    // no limit. Throws OperationCancelledError once token is cancelled.
    virtual std::vector<ServiceEvent> fetchEvents(std::int64_t sinceId,
                                                  int limit,
                                                  const CancellationToken &token) = 0;

    virtual void scan(const std::string &folderId, const std::string &subPath) = 0;
    virtual void restart() = 0;
    virtual void shutdown() = 0;
};

class ApiClientFactory {
public:
    virtual ~ApiClientFactory() = default;

    // Blocks until the API answers. Throws OperationCancelledError when token
    // is cancelled first, ApiError when connectTimeout elapses.
    virtual std::shared_ptr<ApiClient> createClient(const QUrl &address,
                                                    const QString &apiKey,
                                                    std::chrono::milliseconds connectTimeout,
                                                    const CancellationToken &token) = 0;
};

class EventWatcher : public QObject
{
    Q_OBJECT
public:
    using QObject::QObject;
    ~EventWatcher() override = default;

    virtual void start() = 0;
    // Idempotent. No signal is emitted once dispose() returns.
    virtual void dispose() = 0;

signals:
    void itemStarted(const QString &folderId, const QString &item);
    void itemFinished(const QString &folderId, const QString &item);
    void deviceConnected(const QString &deviceId, const QString &address);
    void deviceDisconnected(const QString &deviceId, const QString &error);
    void syncStateChanged(const QString &folderId,
                          syncwarden::FolderSyncState previous,
                          syncwarden::FolderSyncState current);
};

class EventWatcherFactory {
public:
    virtual ~EventWatcherFactory() = default;
    virtual std::unique_ptr<EventWatcher> createEventWatcher(std::shared_ptr<ApiClient> client) = 0;
};

class ConnectionsWatcher : public QObject
{
    Q_OBJECT
public:
    using QObject::QObject;
    ~ConnectionsWatcher() override = default;

    virtual void start() = 0;
    virtual void dispose() = 0;

signals:
    void totalConnectionStatsChanged(const syncwarden::ConnectionStats &stats);
};

class ConnectionsWatcherFactory {
public:
    virtual ~ConnectionsWatcherFactory() = default;
    virtual std::unique_ptr<ConnectionsWatcher> createConnectionsWatcher(std::shared_ptr<ApiClient> client) = 0;
};

} // namespace syncwarden
