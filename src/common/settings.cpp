#include "common/settings.hpp"

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QUuid>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"

namespace syncwarden {

namespace {

bool envFlag(const char *name)
{
    return qEnvironmentVariableIntValue(name) == 1;
}

void warnBadValue(const QString &option, const QString &value, const QString &reason)
{
    SWLOG_WARN(QStringLiteral("Settings"),
               QStringLiteral("loadSettings"),
               QStringLiteral("argument_ignored"),
               reason,
               QStringLiteral("command_line"),
               logging::defaultWho(),
               QString(),
               nlohmann::json{{"option", option.toStdString()},
                              {"value", value.toStdString()}});
}

} // namespace

void addSettingsOptions(QCommandLineParser &parser)
{
    parser.addOptions({
        {QStringLiteral("executable"), QStringLiteral("Sync service executable."), QStringLiteral("path")},
        {QStringLiteral("api-key"), QStringLiteral("API key handed to the service."), QStringLiteral("key")},
        {QStringLiteral("address"), QStringLiteral("GUI/API listen address."), QStringLiteral("url")},
        {QStringLiteral("home"), QStringLiteral("Custom service home directory."), QStringLiteral("dir")},
        {QStringLiteral("deny-upgrade"), QStringLiteral("Forbid automatic upgrades.")},
        {QStringLiteral("low-priority"), QStringLiteral("Run the service at low CPU priority.")},
        {QStringLiteral("hide-device-ids"), QStringLiteral("Mask device ids in service output.")},
        {QStringLiteral("connect-timeout"), QStringLiteral("Seconds to wait for the API."), QStringLiteral("seconds")},
        {QStringLiteral("env"), QStringLiteral("Extra service environment, repeatable."), QStringLiteral("KEY=VALUE")},
    });
}

QString generateApiKey()
{
    return QUuid::createUuid().toString(QUuid::Id128);
}

SupervisorSettings loadSettings(const QCommandLineParser &parser)
{
    SupervisorSettings settings;

    const QString executable = qEnvironmentVariable("SYNCWARDEN_EXECUTABLE");
    if (!executable.isEmpty()) {
        settings.executablePath = executable;
    }
    settings.apiKey = qEnvironmentVariable("SYNCWARDEN_API_KEY");
    const QString address = qEnvironmentVariable("SYNCWARDEN_ADDRESS");
    if (!address.isEmpty()) {
        settings.address = QUrl::fromUserInput(address);
    }
    settings.customHomeDir = qEnvironmentVariable("SYNCWARDEN_HOME");
    settings.denyUpgrade = envFlag("SYNCWARDEN_DENY_UPGRADE");
    settings.runLowPriority = envFlag("SYNCWARDEN_LOW_PRIORITY");
    settings.hideDeviceIds = envFlag("SYNCWARDEN_HIDE_DEVICE_IDS");
    bool timeoutOk = false;
    const int envTimeout = qEnvironmentVariableIntValue("SYNCWARDEN_CONNECT_TIMEOUT", &timeoutOk);
    if (timeoutOk && envTimeout > 0) {
        settings.connectTimeout = std::chrono::seconds(envTimeout);
    }

    if (parser.isSet(QStringLiteral("executable"))) {
        settings.executablePath = parser.value(QStringLiteral("executable"));
    }
    if (parser.isSet(QStringLiteral("api-key"))) {
        settings.apiKey = parser.value(QStringLiteral("api-key"));
    }
    if (parser.isSet(QStringLiteral("address"))) {
        settings.address = QUrl::fromUserInput(parser.value(QStringLiteral("address")));
    }
    if (parser.isSet(QStringLiteral("home"))) {
        settings.customHomeDir = parser.value(QStringLiteral("home"));
    }
    settings.denyUpgrade = settings.denyUpgrade || parser.isSet(QStringLiteral("deny-upgrade"));
    settings.runLowPriority = settings.runLowPriority || parser.isSet(QStringLiteral("low-priority"));
    settings.hideDeviceIds = settings.hideDeviceIds || parser.isSet(QStringLiteral("hide-device-ids"));

    if (parser.isSet(QStringLiteral("connect-timeout"))) {
        const QString value = parser.value(QStringLiteral("connect-timeout"));
        bool ok = false;
        const int seconds = value.toInt(&ok);
        if (ok && seconds > 0) {
            settings.connectTimeout = std::chrono::seconds(seconds);
        } else {
            warnBadValue(QStringLiteral("connect-timeout"), value, QStringLiteral("invalid_timeout"));
        }
    }

    for (const QString &pair : parser.values(QStringLiteral("env"))) {
        const int eq = pair.indexOf(QLatin1Char('='));
        if (eq > 0) {
            settings.environment.insert(pair.left(eq), pair.mid(eq + 1));
        } else {
            warnBadValue(QStringLiteral("env"), pair, QStringLiteral("expected_key_value"));
        }
    }

    if (settings.apiKey.isEmpty()) {
        settings.apiKey = generateApiKey();
    }

    return settings;
}

} // namespace syncwarden
