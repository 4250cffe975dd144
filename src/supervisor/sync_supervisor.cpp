#include "supervisor/sync_supervisor.hpp"

#include <utility>

#include <QtConcurrent/QtConcurrent>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "supervisor/startup_loader.hpp"
#include "supervisor/state_machine.hpp"

namespace syncwarden {

namespace {

const QString kComponent = QStringLiteral("SyncSupervisor");

void registerMetaTypes()
{
    qRegisterMetaType<syncwarden::SupervisorState>("syncwarden::SupervisorState");
    qRegisterMetaType<syncwarden::ExitStatus>("syncwarden::ExitStatus");
    qRegisterMetaType<syncwarden::FolderSyncState>("syncwarden::FolderSyncState");
    qRegisterMetaType<syncwarden::ConnectionStats>("syncwarden::ConnectionStats");
}

template <typename T>
std::vector<std::shared_ptr<const T>> asConst(const std::vector<std::shared_ptr<T>> &items)
{
    return std::vector<std::shared_ptr<const T>>(items.begin(), items.end());
}

} // namespace

void QObjectDeleteLater::operator()(QObject *object) const
{
    if (object) {
        object->deleteLater();
    }
}

SyncSupervisor::SyncSupervisor(std::unique_ptr<ProcessRunner> processRunner,
                               std::unique_ptr<ApiClientFactory> apiClientFactory,
                               std::unique_ptr<EventWatcherFactory> eventWatcherFactory,
                               std::unique_ptr<ConnectionsWatcherFactory> connectionsWatcherFactory,
                               QObject *parent)
    : QObject(parent)
    , m_processRunner(std::move(processRunner))
    , m_apiClientFactory(std::move(apiClientFactory))
    , m_eventWatcherFactory(std::move(eventWatcherFactory))
    , m_connectionsWatcherFactory(std::move(connectionsWatcherFactory))
{
    registerMetaTypes();

    connect(m_processRunner.get(), &ProcessRunner::starting,
            this, &SyncSupervisor::onProcessStarting);
    connect(m_processRunner.get(), &ProcessRunner::processStopped,
            this, &SyncSupervisor::onProcessStopped);
    connect(m_processRunner.get(), &ProcessRunner::processRestarted,
            this, &SyncSupervisor::onProcessRestarted);
    connect(m_processRunner.get(), &ProcessRunner::messageLogged,
            this, &SyncSupervisor::messageLogged);
}

SyncSupervisor::~SyncSupervisor()
{
    disconnect(m_processRunner.get(), nullptr, this, nullptr);

    QFuture<void> pending;
    {
        std::lock_guard<std::mutex> lock(m_clientsMutex);
        m_shuttingDown = true;
        m_apiAbort.cancel();
        pending = m_clientFuture;
    }

    try {
        waitForCompletion(pending);
    } catch (const std::exception &ex) {
        SWLOG_DEBUG(kComponent,
                    QStringLiteral("~SyncSupervisor"),
                    QStringLiteral("pending_start_failed"),
                    QStringLiteral("supervisor_destroyed"),
                    QStringLiteral("future_wait"),
                    logging::defaultWho(),
                    QString(),
                    nlohmann::json{{"error", ex.what()}});
    }

    stopApiClients();
}

SupervisorState SyncSupervisor::state() const
{
    std::lock_guard<std::mutex> lock(m_stateMutex);
    return m_state;
}

bool SyncSupervisor::isDataLoaded() const
{
    std::lock_guard<std::mutex> lock(m_fieldsMutex);
    return m_dataLoaded;
}

QDateTime SyncSupervisor::startedTime() const
{
    std::lock_guard<std::mutex> lock(m_fieldsMutex);
    return m_startedTime;
}

QDateTime SyncSupervisor::lastConnectivityEventTime() const
{
    std::lock_guard<std::mutex> lock(m_fieldsMutex);
    return m_lastConnectivityEventTime;
}

ServiceVersion SyncSupervisor::version() const
{
    std::lock_guard<std::mutex> lock(m_fieldsMutex);
    return m_version;
}

ConnectionStats SyncSupervisor::totalConnectionStats() const
{
    std::lock_guard<std::mutex> lock(m_fieldsMutex);
    return m_totalConnectionStats;
}

SupervisorSettings SyncSupervisor::settings() const
{
    std::lock_guard<std::mutex> lock(m_fieldsMutex);
    return m_settings;
}

void SyncSupervisor::setSettings(const SupervisorSettings &settings)
{
    std::lock_guard<std::mutex> lock(m_fieldsMutex);
    m_settings = settings;
}

QFuture<void> SyncSupervisor::start()
{
    SWLOG_INFO(kComponent,
               QStringLiteral("start"),
               QStringLiteral("start_service"),
               QStringLiteral("user_action"),
               QStringLiteral("process_runner"),
               logging::defaultWho(),
               QString(),
               nlohmann::json{{"state", toStateString(state())}});

    m_processRunner->start();

    QFuture<void> future = QtConcurrent::run([this]() { startClient(); });
    std::lock_guard<std::mutex> lock(m_clientsMutex);
    m_clientFuture = future;
    return future;
}

void SyncSupervisor::stop()
{
    if (state() != SupervisorState::Running) {
        return;
    }

    const auto client = currentApiClient();
    if (!client) {
        return;
    }

    client->shutdown();
    setState(SupervisorState::Stopping);
}

bool SyncSupervisor::restart()
{
    if (state() != SupervisorState::Running) {
        return false;
    }

    const auto client = currentApiClient();
    if (!client) {
        return false;
    }

    client->restart();
    return true;
}

void SyncSupervisor::kill()
{
    m_processRunner->kill();
    setState(SupervisorState::Stopped);
}

void SyncSupervisor::killAllInstances()
{
    m_processRunner->configure(launchOptions());
    m_processRunner->killAllInstances();
}

void SyncSupervisor::scan(const std::string &folderId, const std::string &subPath)
{
    const auto client = currentApiClient();
    if (!client) {
        throw ApiError("service API is not connected");
    }
    client->scan(folderId, subPath);
}

void SyncSupervisor::reloadIgnores(const std::string &folderId)
{
    const auto folder = m_registry.lookupFolder(folderId);
    if (!folder) {
        return;
    }

    const auto client = currentApiClient();
    if (!client) {
        throw ApiError("service API is not connected");
    }

    IgnorePatterns ignores = client->fetchIgnores(folderId);
    folder->setIgnores(FolderIgnores(std::move(ignores.ignorePatterns),
                                     std::move(ignores.regexPatterns)));
}

std::shared_ptr<const Folder> SyncSupervisor::lookupFolder(const std::string &folderId) const
{
    return m_registry.lookupFolder(folderId);
}

std::vector<std::shared_ptr<const Folder>> SyncSupervisor::allFolders() const
{
    return asConst(m_registry.allFolders());
}

std::shared_ptr<const Device> SyncSupervisor::lookupDevice(const std::string &deviceId) const
{
    return m_registry.lookupDevice(deviceId);
}

std::vector<std::shared_ptr<const Device>> SyncSupervisor::allDevices() const
{
    return asConst(m_registry.allDevices());
}

void SyncSupervisor::setState(SupervisorState newState)
{
    SupervisorState oldState;
    TransitionOutcome outcome;
    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        oldState = m_state;
        outcome = evaluateTransition(oldState, newState);
        if (outcome != TransitionOutcome::Ignore) {
            m_state = newState;
        }
    }

    if (outcome == TransitionOutcome::Ignore) {
        if (oldState != newState) {
            SWLOG_DEBUG(kComponent,
                        QStringLiteral("setState"),
                        QStringLiteral("transition_rejected"),
                        QStringLiteral("transition_table"),
                        QStringLiteral("state_machine"),
                        logging::defaultWho(),
                        QString(),
                        nlohmann::json{{"from", toStateString(oldState)},
                                       {"to", toStateString(newState)}});
        }
        return;
    }

    SWLOG_DEBUG(kComponent,
                QStringLiteral("setState"),
                QStringLiteral("state_changed"),
                QStringLiteral("transition_table"),
                QStringLiteral("state_machine"),
                logging::defaultWho(),
                QString(),
                nlohmann::json{{"from", toStateString(oldState)},
                               {"to", toStateString(newState)},
                               {"abortApi", outcome == TransitionOutcome::ApplyAndAbort}});

    if (outcome == TransitionOutcome::ApplyAndAbort) {
        stopApiClients();
    }

    emit stateChanged(oldState, newState);
}

void SyncSupervisor::startClient()
{
    const logging::CorrelationScope scope(
        QStringLiteral("session-%1").arg(++m_sessionCounter));

    CancellationToken token;
    QUrl address;
    QString apiKey;
    std::chrono::milliseconds connectTimeout{0};
    {
        std::lock_guard<std::mutex> lock(m_fieldsMutex);
        address = m_settings.address;
        apiKey = m_settings.apiKey;
        connectTimeout = m_settings.connectTimeout;
    }

    try {
        {
            std::lock_guard<std::mutex> lock(m_clientsMutex);
            if (m_shuttingDown) {
                throw OperationCancelledError();
            }
            m_apiAbort = CancellationSource();
            token = m_apiAbort.token();
        }

        SWLOG_DEBUG(kComponent,
                    QStringLiteral("startClient"),
                    QStringLiteral("create_api_client"),
                    QStringLiteral("service_starting"),
                    QStringLiteral("api_client_factory"),
                    logging::defaultWho(),
                    QString(),
                    nlohmann::json{{"address", address.toString().toStdString()}});

        std::shared_ptr<ApiClient> client =
            m_apiClientFactory->createClient(address, apiKey, connectTimeout, token);
        {
            std::lock_guard<std::mutex> lock(m_clientsMutex);
            token.throwIfCancellationRequested();
            m_apiClient = client;
        }

        setState(SupervisorState::Running);
        if (state() != SupervisorState::Running) {
            // The transition was rejected, so this attempt is already stale.
            throw OperationCancelledError();
        }

        loadStartupData(client, token);
        startWatchers(client, token);
    } catch (const OperationCancelledError &) {
        SWLOG_DEBUG(kComponent,
                    QStringLiteral("startClient"),
                    QStringLiteral("start_client_cancelled"),
                    QStringLiteral("connection_aborted"),
                    QStringLiteral("cancellation_token"),
                    logging::defaultWho(),
                    QString(),
                    nlohmann::json{{"state", toStateString(state())}});
    } catch (const std::exception &ex) {
        SWLOG_ERROR(kComponent,
                    QStringLiteral("startClient"),
                    QStringLiteral("start_client_failed"),
                    QStringLiteral("api_error"),
                    QStringLiteral("force_kill"),
                    logging::defaultWho(),
                    QString(),
                    nlohmann::json{{"error", ex.what()}});
        kill();
        throw;
    }
}

void SyncSupervisor::loadStartupData(const std::shared_ptr<ApiClient> &client,
                                     const CancellationToken &token)
{
    StartupSnapshot snapshot = loadStartupSnapshot(client, token);

    m_registry.replaceDevices(std::move(snapshot.devices));
    m_registry.replaceFolders(std::move(snapshot.folders));
    {
        std::lock_guard<std::mutex> lock(m_fieldsMutex);
        m_version = snapshot.version;
    }

    token.throwIfCancellationRequested();
    emit dataLoaded();

    std::lock_guard<std::mutex> lock(m_fieldsMutex);
    m_startedTime = QDateTime::currentDateTimeUtc();
    m_dataLoaded = true;
}

void SyncSupervisor::startWatchers(const std::shared_ptr<ApiClient> &client,
                                   const CancellationToken &token)
{
    ConnectionsWatcherPtr connectionsWatcher(
        m_connectionsWatcherFactory->createConnectionsWatcher(client).release());
    connectionsWatcher->moveToThread(thread());
    connect(connectionsWatcher.get(), &ConnectionsWatcher::totalConnectionStatsChanged,
            this, &SyncSupervisor::onTotalConnectionStatsChanged);

    EventWatcherPtr eventWatcher(m_eventWatcherFactory->createEventWatcher(client).release());
    eventWatcher->moveToThread(thread());
    connect(eventWatcher.get(), &EventWatcher::syncStateChanged,
            this, &SyncSupervisor::onSyncStateChanged);
    connect(eventWatcher.get(), &EventWatcher::itemStarted,
            this, &SyncSupervisor::onItemStarted);
    connect(eventWatcher.get(), &EventWatcher::itemFinished,
            this, &SyncSupervisor::onItemFinished);
    connect(eventWatcher.get(), &EventWatcher::deviceConnected,
            this, &SyncSupervisor::onDeviceConnected);
    connect(eventWatcher.get(), &EventWatcher::deviceDisconnected,
            this, &SyncSupervisor::onDeviceDisconnected);

    ConnectionsWatcherPtr previousConnectionsWatcher;
    EventWatcherPtr previousEventWatcher;
    {
        std::lock_guard<std::mutex> lock(m_clientsMutex);
        token.throwIfCancellationRequested();
        if (m_apiClient != client) {
            throw OperationCancelledError();
        }

        previousConnectionsWatcher = std::move(m_connectionsWatcher);
        previousEventWatcher = std::move(m_eventWatcher);
        m_connectionsWatcher = std::move(connectionsWatcher);
        m_eventWatcher = std::move(eventWatcher);
        m_connectionsWatcher->start();
        m_eventWatcher->start();
    }

    if (previousConnectionsWatcher) {
        previousConnectionsWatcher->dispose();
    }
    if (previousEventWatcher) {
        previousEventWatcher->dispose();
    }
}

void SyncSupervisor::stopApiClients()
{
    std::shared_ptr<ApiClient> client;
    ConnectionsWatcherPtr connectionsWatcher;
    EventWatcherPtr eventWatcher;
    {
        std::lock_guard<std::mutex> lock(m_clientsMutex);
        m_apiAbort.cancel();
        client = std::move(m_apiClient);
        connectionsWatcher = std::move(m_connectionsWatcher);
        eventWatcher = std::move(m_eventWatcher);
    }

    if (!client && !connectionsWatcher && !eventWatcher) {
        return;
    }

    SWLOG_DEBUG(kComponent,
                QStringLiteral("stopApiClients"),
                QStringLiteral("abort_api_clients"),
                QStringLiteral("left_running"),
                QStringLiteral("dispose"),
                logging::defaultWho(),
                QString(),
                nlohmann::json::object());

    if (connectionsWatcher) {
        connectionsWatcher->dispose();
    }
    if (eventWatcher) {
        eventWatcher->dispose();
    }
}

std::shared_ptr<ApiClient> SyncSupervisor::currentApiClient() const
{
    std::lock_guard<std::mutex> lock(m_clientsMutex);
    return m_apiClient;
}

bool SyncSupervisor::isCurrentEventWatcher(const QObject *watcher) const
{
    std::lock_guard<std::mutex> lock(m_clientsMutex);
    return watcher && watcher == m_eventWatcher.get();
}

bool SyncSupervisor::isCurrentConnectionsWatcher(const QObject *watcher) const
{
    std::lock_guard<std::mutex> lock(m_clientsMutex);
    return watcher && watcher == m_connectionsWatcher.get();
}

ProcessLaunchOptions SyncSupervisor::launchOptions() const
{
    std::lock_guard<std::mutex> lock(m_fieldsMutex);
    ProcessLaunchOptions options;
    options.apiKey = m_settings.apiKey;
    options.hostAddress = m_settings.address.toString();
    options.executablePath = m_settings.executablePath;
    options.customHomeDir = m_settings.customHomeDir;
    options.environment = m_settings.environment;
    options.denyUpgrade = m_settings.denyUpgrade;
    options.runLowPriority = m_settings.runLowPriority;
    options.hideDeviceIds = m_settings.hideDeviceIds;
    return options;
}

void SyncSupervisor::markConnectivityEvent()
{
    std::lock_guard<std::mutex> lock(m_fieldsMutex);
    m_lastConnectivityEventTime = QDateTime::currentDateTimeUtc();
}

void SyncSupervisor::onProcessStarting()
{
    m_processRunner->configure(launchOptions());

    const bool isRestart = state() == SupervisorState::Restarting;
    setState(SupervisorState::Starting);

    // A restart asked for by the service never goes through start(), so the
    // API client has to be brought back from here.
    if (!isRestart) {
        return;
    }

    SWLOG_INFO(kComponent,
               QStringLiteral("onProcessStarting"),
               QStringLiteral("restart_client"),
               QStringLiteral("service_restarted"),
               QStringLiteral("thread_pool"),
               logging::defaultWho(),
               QString(),
               nlohmann::json::object());

    QFuture<void> future = QtConcurrent::run([this]() {
        try {
            startClient();
        } catch (const std::exception &ex) {
            // startClient() already logged and killed the process.
            SWLOG_DEBUG(kComponent,
                        QStringLiteral("onProcessStarting"),
                        QStringLiteral("restart_client_failed"),
                        QStringLiteral("api_error"),
                        QStringLiteral("thread_pool"),
                        logging::defaultWho(),
                        QString(),
                        nlohmann::json{{"error", ex.what()}});
        }
    });
    std::lock_guard<std::mutex> lock(m_clientsMutex);
    m_clientFuture = future;
}

void SyncSupervisor::onProcessStopped(ExitStatus status)
{
    SWLOG_INFO(kComponent,
               QStringLiteral("onProcessStopped"),
               QStringLiteral("process_stopped"),
               status == ExitStatus::Error ? QStringLiteral("exit_error")
                                           : QStringLiteral("exit_normal"),
               QStringLiteral("process_runner"),
               logging::defaultWho(),
               QString(),
               nlohmann::json::object());

    setState(SupervisorState::Stopped);
    if (status == ExitStatus::Error) {
        emit processExitedWithError();
    }
}

void SyncSupervisor::onProcessRestarted()
{
    setState(SupervisorState::Restarting);
}

void SyncSupervisor::onItemStarted(const QString &folderId, const QString &item)
{
    if (!isCurrentEventWatcher(sender())) {
        return;
    }

    const auto folder = m_registry.lookupFolder(folderId.toStdString());
    if (!folder) {
        return;
    }
    folder->addSyncingPath(item.toStdString());
}

void SyncSupervisor::onItemFinished(const QString &folderId, const QString &item)
{
    if (!isCurrentEventWatcher(sender())) {
        return;
    }

    const auto folder = m_registry.lookupFolder(folderId.toStdString());
    if (!folder) {
        return;
    }
    folder->removeSyncingPath(item.toStdString());
}

void SyncSupervisor::onDeviceConnected(const QString &deviceId, const QString &address)
{
    if (!isCurrentEventWatcher(sender())) {
        return;
    }

    const auto device = m_registry.lookupDevice(deviceId.toStdString());
    if (!device) {
        SWLOG_WARN(kComponent,
                   QStringLiteral("onDeviceConnected"),
                   QStringLiteral("unexpected_device"),
                   QStringLiteral("not_in_loaded_config"),
                   QStringLiteral("event_watcher"),
                   logging::defaultWho(),
                   QString(),
                   nlohmann::json{{"deviceId", deviceId.toStdString()},
                                  {"address", address.toStdString()}});
        return;
    }

    device->setConnected(address.toStdString());
    markConnectivityEvent();

    emit deviceConnected(deviceId, address);
}

void SyncSupervisor::onDeviceDisconnected(const QString &deviceId, const QString &error)
{
    if (!isCurrentEventWatcher(sender())) {
        return;
    }

    const auto device = m_registry.lookupDevice(deviceId.toStdString());
    if (!device) {
        SWLOG_WARN(kComponent,
                   QStringLiteral("onDeviceDisconnected"),
                   QStringLiteral("unexpected_device"),
                   QStringLiteral("not_in_loaded_config"),
                   QStringLiteral("event_watcher"),
                   logging::defaultWho(),
                   QString(),
                   nlohmann::json{{"deviceId", deviceId.toStdString()},
                                  {"error", error.toStdString()}});
        return;
    }

    device->setDisconnected();
    markConnectivityEvent();

    emit deviceDisconnected(deviceId);
}

void SyncSupervisor::onSyncStateChanged(const QString &folderId,
                                        FolderSyncState previous,
                                        FolderSyncState current)
{
    if (!isCurrentEventWatcher(sender())) {
        return;
    }

    const auto folder = m_registry.lookupFolder(folderId.toStdString());
    if (!folder) {
        return;
    }

    folder->setSyncState(current);
    emit folderSyncStateChanged(folderId, previous, current);
}

void SyncSupervisor::onTotalConnectionStatsChanged(const ConnectionStats &stats)
{
    if (!isCurrentConnectionsWatcher(sender())) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(m_fieldsMutex);
        m_totalConnectionStats = stats;
    }
    emit totalConnectionStatsChanged(stats);
}

} // namespace syncwarden
