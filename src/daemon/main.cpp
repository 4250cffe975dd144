#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDebug>
#include <QFutureWatcher>

#include <memory>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "common/settings.hpp"
#include "common/syncwarden_version.hpp"
#include "service/api_client.hpp"
#include "service/connections_watcher.hpp"
#include "service/event_watcher.hpp"
#include "service/process_runner.hpp"
#include "supervisor/sync_supervisor.hpp"

using syncwarden::SupervisorState;
using syncwarden::logging::defaultWho;

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    QCoreApplication::setApplicationName(QStringLiteral("syncwarden-daemon"));
    QCoreApplication::setApplicationVersion(QStringLiteral(SYNCWARDEN_VERSION));
    qInfo() << "SyncWarden daemon starting...";

    QCommandLineParser parser;
    parser.addHelpOption();
    parser.addVersionOption();
    QCommandLineOption traceOption(QStringList() << "trace",
                                   "Enable verbose trace logging.");
    QCommandLineOption killAllOption(QStringList() << "kill-all",
                                     "Kill every running instance of the service and exit.");
    parser.addOption(traceOption);
    parser.addOption(killAllOption);
    syncwarden::addSettingsOptions(parser);
    parser.process(app);

    const bool trace = parser.isSet(traceOption)
        || qEnvironmentVariableIntValue("SYNCWARDEN_TRACE") == 1;
    const bool killAll = parser.isSet(killAllOption);
    syncwarden::logging::initLogging(QStringLiteral("syncwarden-daemon"), trace);

    const syncwarden::SupervisorSettings settings = syncwarden::loadSettings(parser);
    SWLOG_INFO(QStringLiteral("main"),
               QStringLiteral("main"),
               QStringLiteral("daemon_start"),
               QStringLiteral("user_start"),
               QStringLiteral("settings_loaded"),
               defaultWho(),
               QString(),
               nlohmann::json{{"executable", settings.executablePath.toStdString()},
                              {"address", settings.address.toString().toStdString()},
                              {"version", SYNCWARDEN_VERSION}});

    syncwarden::SyncSupervisor supervisor(
        std::make_unique<syncwarden::QProcessRunner>(),
        std::make_unique<syncwarden::HttpApiClientFactory>(),
        std::make_unique<syncwarden::PollingEventWatcherFactory>(),
        std::make_unique<syncwarden::PollingConnectionsWatcherFactory>());
    supervisor.setSettings(settings);

    if (killAll) {
        supervisor.killAllInstances();
        return 0;
    }

    QObject::connect(&supervisor, &syncwarden::SyncSupervisor::stateChanged,
                     &app, [&app](SupervisorState oldState, SupervisorState newState) {
        SWLOG_INFO(QStringLiteral("main"),
                   QStringLiteral("stateChanged"),
                   QStringLiteral("supervisor_state"),
                   QStringLiteral("lifecycle"),
                   QStringLiteral("signal"),
                   defaultWho(),
                   QString(),
                   nlohmann::json{{"from", syncwarden::toStateString(oldState)},
                                  {"to", syncwarden::toStateString(newState)}});
        if (newState == SupervisorState::Stopped) {
            app.quit();
        }
    });
    QObject::connect(&supervisor, &syncwarden::SyncSupervisor::dataLoaded,
                     &app, [&supervisor]() {
        SWLOG_INFO(QStringLiteral("main"),
                   QStringLiteral("dataLoaded"),
                   QStringLiteral("startup_data_loaded"),
                   QStringLiteral("service_running"),
                   QStringLiteral("signal"),
                   defaultWho(),
                   QString(),
                   nlohmann::json{{"folders", supervisor.allFolders().size()},
                                  {"devices", supervisor.allDevices().size()},
                                  {"serviceVersion", supervisor.version().version}});
    });
    QObject::connect(&supervisor, &syncwarden::SyncSupervisor::messageLogged,
                     &app, [](const QString &message) {
        syncwarden::logging::logServiceOutput(message);
    });
    QObject::connect(&supervisor, &syncwarden::SyncSupervisor::folderSyncStateChanged,
                     &app, [](const QString &folderId,
                              syncwarden::FolderSyncState previous,
                              syncwarden::FolderSyncState current) {
        SWLOG_INFO(QStringLiteral("main"),
                   QStringLiteral("folderSyncStateChanged"),
                   QStringLiteral("folder_state"),
                   QStringLiteral("service_event"),
                   QStringLiteral("signal"),
                   defaultWho(),
                   QString(),
                   nlohmann::json{{"folder", folderId.toStdString()},
                                  {"from", syncwarden::toSyncStateString(previous)},
                                  {"to", syncwarden::toSyncStateString(current)}});
    });
    QObject::connect(&supervisor, &syncwarden::SyncSupervisor::totalConnectionStatsChanged,
                     &app, [](const syncwarden::ConnectionStats &stats) {
        SWLOG_DEBUG(QStringLiteral("main"),
                    QStringLiteral("totalConnectionStatsChanged"),
                    QStringLiteral("connection_stats"),
                    QStringLiteral("poll"),
                    QStringLiteral("signal"),
                    defaultWho(),
                    QString(),
                    syncwarden::toJson(stats));
    });
    QObject::connect(&supervisor, &syncwarden::SyncSupervisor::deviceConnected,
                     &app, [](const QString &deviceId, const QString &address) {
        SWLOG_INFO(QStringLiteral("main"),
                   QStringLiteral("deviceConnected"),
                   QStringLiteral("device_connected"),
                   QStringLiteral("service_event"),
                   QStringLiteral("signal"),
                   defaultWho(),
                   QString(),
                   nlohmann::json{{"device", deviceId.toStdString()},
                                  {"address", address.toStdString()}});
    });
    QObject::connect(&supervisor, &syncwarden::SyncSupervisor::deviceDisconnected,
                     &app, [](const QString &deviceId) {
        SWLOG_INFO(QStringLiteral("main"),
                   QStringLiteral("deviceDisconnected"),
                   QStringLiteral("device_disconnected"),
                   QStringLiteral("service_event"),
                   QStringLiteral("signal"),
                   defaultWho(),
                   QString(),
                   nlohmann::json{{"device", deviceId.toStdString()}});
    });
    QObject::connect(&supervisor, &syncwarden::SyncSupervisor::processExitedWithError,
                     &app, []() {
        SWLOG_ERROR(QStringLiteral("main"),
                    QStringLiteral("processExitedWithError"),
                    QStringLiteral("service_crashed"),
                    QStringLiteral("exit_error"),
                    QStringLiteral("signal"),
                    defaultWho(),
                    QString(),
                    nlohmann::json::object());
    });

    QFutureWatcher<void> startWatcher;
    QObject::connect(&startWatcher, &QFutureWatcher<void>::finished, &app, [&startWatcher]() {
        QFuture<void> future = startWatcher.future();
        try {
            syncwarden::waitForCompletion(future);
        } catch (const std::exception &ex) {
            // The supervisor has already killed the process; the Stopped
            // transition ends the event loop.
            qWarning() << "Failed to connect to the sync service:" << ex.what();
        }
    });
    startWatcher.setFuture(supervisor.start());

    return app.exec();
}
