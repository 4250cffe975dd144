#pragma once

#include <chrono>

#include <QMap>
#include <QString>
#include <QUrl>

class QCommandLineParser;

namespace syncwarden {

struct SupervisorSettings {
    QString executablePath = QStringLiteral("syncthing");
    QString apiKey;
    QUrl address = QUrl(QStringLiteral("http://127.0.0.1:8384"));
    QMap<QString, QString> environment;
    QString customHomeDir;
    bool denyUpgrade = false;
    bool runLowPriority = false;
    bool hideDeviceIds = false;
    std::chrono::seconds connectTimeout{30};
};

// Registers --executable, --api-key, --address, --home, --deny-upgrade,
// --low-priority, --hide-device-ids, --connect-timeout and --env KEY=VALUE.
void addSettingsOptions(QCommandLineParser &parser);

// Environment (SYNCWARDEN_*) first, then the parsed flags on top. An empty API
// key is replaced with a freshly generated one.
SupervisorSettings loadSettings(const QCommandLineParser &parser);

QString generateApiKey();

} // namespace syncwarden
