#include "supervisor/startup_loader.hpp"

#include <utility>
#include <vector>

#include <QDir>
#include <QFuture>
#include <QtConcurrent/QtConcurrent>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/logging.hpp"

namespace syncwarden {

namespace {

QString withForwardSlashes(QString path)
{
    path.replace(QLatin1Char('\\'), QLatin1Char('/'));
    return path;
}

DeviceMap buildDevices(const ServiceConfig &config, const ServiceConnections &connections)
{
    DeviceMap devices;
    for (const auto &configured : config.devices) {
        auto device = std::make_shared<Device>(configured.deviceId, configured.name);
        const auto it = connections.deviceConnections.find(configured.deviceId);
        if (it != connections.deviceConnections.end() && it->second.connected) {
            device->setConnected(it->second.address);
        }
        devices.emplace(configured.deviceId, std::move(device));
    }
    return devices;
}

} // namespace

std::string resolveFolderPath(const std::string &path, const std::string &tilde)
{
    if (path.empty() || path.front() != '~') {
        return path;
    }

    QString rest = withForwardSlashes(QString::fromStdString(path.substr(1)));
    while (rest.startsWith(QLatin1Char('/'))) {
        rest.remove(0, 1);
    }

    const QString home = withForwardSlashes(QString::fromStdString(tilde));
    if (rest.isEmpty()) {
        return QDir::cleanPath(home).toStdString();
    }
    return QDir::cleanPath(home + QLatin1Char('/') + rest).toStdString();
}

StartupSnapshot loadStartupSnapshot(const std::shared_ptr<ApiClient> &client,
                                    const CancellationToken &token)
{
    SWLOG_DEBUG(QStringLiteral("StartupLoader"),
                QStringLiteral("loadStartupSnapshot"),
                QStringLiteral("startup_load_begin"),
                QStringLiteral("service_running"),
                QStringLiteral("parallel_fetch"),
                logging::defaultWho(),
                QString(),
                nlohmann::json::object());

    QFuture<ServiceConfig> configFuture =
        QtConcurrent::run([client]() { return client->fetchConfig(); });
    QFuture<SystemInfo> systemFuture =
        QtConcurrent::run([client]() { return client->fetchSystemInfo(); });
    QFuture<ServiceVersion> versionFuture =
        QtConcurrent::run([client]() { return client->fetchVersion(); });
    QFuture<ServiceConnections> connectionsFuture =
        QtConcurrent::run([client]() { return client->fetchConnections(); });

    token.throwIfCancellationRequested();
    const ServiceConfig config = takeResult(configFuture);
    const SystemInfo systemInfo = takeResult(systemFuture);
    ServiceVersion version = takeResult(versionFuture);
    const ServiceConnections connections = takeResult(connectionsFuture);
    token.throwIfCancellationRequested();

    StartupSnapshot snapshot;
    snapshot.devices = buildDevices(config, connections);

    std::vector<QFuture<IgnorePatterns>> ignoreFutures;
    ignoreFutures.reserve(config.folders.size());
    for (const auto &folder : config.folders) {
        const std::string folderId = folder.id;
        ignoreFutures.push_back(QtConcurrent::run([client, folderId]() {
            return client->fetchIgnores(folderId);
        }));
    }

    for (std::size_t i = 0; i < config.folders.size(); ++i) {
        const ConfigFolder &configured = config.folders[i];
        IgnorePatterns ignores = takeResult(ignoreFutures[i]);
        auto folder = std::make_shared<Folder>(
            configured.id,
            resolveFolderPath(configured.path, systemInfo.tilde),
            FolderIgnores(std::move(ignores.ignorePatterns),
                          std::move(ignores.regexPatterns)));
        snapshot.folders.emplace(configured.id, std::move(folder));
    }
    token.throwIfCancellationRequested();

    snapshot.version = std::move(version);

    SWLOG_DEBUG(QStringLiteral("StartupLoader"),
                QStringLiteral("loadStartupSnapshot"),
                QStringLiteral("startup_load_complete"),
                QStringLiteral("service_running"),
                QStringLiteral("parallel_fetch"),
                logging::defaultWho(),
                QString(),
                nlohmann::json{{"devices", snapshot.devices.size()},
                               {"folders", snapshot.folders.size()},
                               {"version", snapshot.version.version}});
    return snapshot;
}

} // namespace syncwarden
