#include <QtTest/QtTest>

#include <QCommandLineParser>
#include <QTemporaryDir>

#include "common/logging.hpp"
#include "common/settings.hpp"

class SettingsTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();
    void init();

    void testDefaults();
    void testEnvironment();
    void testArgumentsOverrideEnvironment();
    void testInvalidValuesIgnored();
    void testUnknownOptionRejected();

private:
    static void clearEnvironment();
    static bool parse(const QStringList &arguments, syncwarden::SupervisorSettings *settings);

    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;
};

void SettingsTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
    syncwarden::logging::initLogging(QStringLiteral("test_settings"), false);
}

void SettingsTests::cleanupTestCase()
{
    clearEnvironment();
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

void SettingsTests::init()
{
    clearEnvironment();
}

void SettingsTests::clearEnvironment()
{
    for (const char *name : {"SYNCWARDEN_EXECUTABLE", "SYNCWARDEN_API_KEY", "SYNCWARDEN_ADDRESS",
                             "SYNCWARDEN_HOME", "SYNCWARDEN_DENY_UPGRADE", "SYNCWARDEN_LOW_PRIORITY",
                             "SYNCWARDEN_HIDE_DEVICE_IDS", "SYNCWARDEN_CONNECT_TIMEOUT"}) {
        qunsetenv(name);
    }
}

bool SettingsTests::parse(const QStringList &arguments, syncwarden::SupervisorSettings *settings)
{
    QCommandLineParser parser;
    syncwarden::addSettingsOptions(parser);
    if (!parser.parse(QStringList{QStringLiteral("syncwarden-daemon")} + arguments)) {
        return false;
    }
    *settings = syncwarden::loadSettings(parser);
    return true;
}

void SettingsTests::testDefaults()
{
    syncwarden::SupervisorSettings settings;
    QVERIFY(parse({}, &settings));

    QCOMPARE(settings.executablePath, QStringLiteral("syncthing"));
    QCOMPARE(settings.address, QUrl(QStringLiteral("http://127.0.0.1:8384")));
    QVERIFY(settings.customHomeDir.isEmpty());
    QVERIFY(settings.environment.isEmpty());
    QVERIFY(!settings.denyUpgrade);
    QVERIFY(!settings.runLowPriority);
    QVERIFY(!settings.hideDeviceIds);
    QVERIFY(settings.connectTimeout == std::chrono::seconds(30));

    // A key is always generated, and differs between runs.
    QCOMPARE(settings.apiKey.size(), 32);
    syncwarden::SupervisorSettings again;
    QVERIFY(parse({}, &again));
    QVERIFY(settings.apiKey != again.apiKey);
}

void SettingsTests::testEnvironment()
{
    qputenv("SYNCWARDEN_EXECUTABLE", "/usr/local/bin/syncthing");
    qputenv("SYNCWARDEN_API_KEY", "env-key");
    qputenv("SYNCWARDEN_ADDRESS", "http://localhost:18384");
    qputenv("SYNCWARDEN_HOME", "/var/lib/sync");
    qputenv("SYNCWARDEN_DENY_UPGRADE", "1");
    qputenv("SYNCWARDEN_LOW_PRIORITY", "0");
    qputenv("SYNCWARDEN_CONNECT_TIMEOUT", "12");

    syncwarden::SupervisorSettings settings;
    QVERIFY(parse({}, &settings));

    QCOMPARE(settings.executablePath, QStringLiteral("/usr/local/bin/syncthing"));
    QCOMPARE(settings.apiKey, QStringLiteral("env-key"));
    QCOMPARE(settings.address, QUrl(QStringLiteral("http://localhost:18384")));
    QCOMPARE(settings.customHomeDir, QStringLiteral("/var/lib/sync"));
    QVERIFY(settings.denyUpgrade);
    QVERIFY(!settings.runLowPriority);
    QVERIFY(settings.connectTimeout == std::chrono::seconds(12));
}

void SettingsTests::testArgumentsOverrideEnvironment()
{
    qputenv("SYNCWARDEN_API_KEY", "env-key");
    qputenv("SYNCWARDEN_ADDRESS", "http://localhost:18384");

    syncwarden::SupervisorSettings settings;
    QVERIFY(parse({
        QStringLiteral("--api-key"), QStringLiteral("cli-key"),
        QStringLiteral("--address"), QStringLiteral("http://127.0.0.1:9090"),
        QStringLiteral("--executable"), QStringLiteral("/opt/syncthing"),
        QStringLiteral("--home"), QStringLiteral("/data/sync"),
        QStringLiteral("--low-priority"),
        QStringLiteral("--hide-device-ids"),
        QStringLiteral("--connect-timeout"), QStringLiteral("45"),
        QStringLiteral("--env"), QStringLiteral("STTRACE=model,scanner"),
        QStringLiteral("--env"), QStringLiteral("GOMAXPROCS=2"),
    }, &settings));

    QCOMPARE(settings.apiKey, QStringLiteral("cli-key"));
    QCOMPARE(settings.address, QUrl(QStringLiteral("http://127.0.0.1:9090")));
    QCOMPARE(settings.executablePath, QStringLiteral("/opt/syncthing"));
    QCOMPARE(settings.customHomeDir, QStringLiteral("/data/sync"));
    QVERIFY(settings.runLowPriority);
    QVERIFY(settings.hideDeviceIds);
    QVERIFY(!settings.denyUpgrade);
    QVERIFY(settings.connectTimeout == std::chrono::seconds(45));
    QCOMPARE(settings.environment.size(), 2);
    QCOMPARE(settings.environment.value(QStringLiteral("STTRACE")), QStringLiteral("model,scanner"));
    QCOMPARE(settings.environment.value(QStringLiteral("GOMAXPROCS")), QStringLiteral("2"));
}

void SettingsTests::testInvalidValuesIgnored()
{
    qputenv("SYNCWARDEN_CONNECT_TIMEOUT", "20");

    syncwarden::SupervisorSettings settings;
    QVERIFY(parse({
        QStringLiteral("--connect-timeout"), QStringLiteral("soon"),
        QStringLiteral("--env"), QStringLiteral("NOEQUALS"),
        QStringLiteral("--env"), QStringLiteral("=value"),
    }, &settings));

    QVERIFY(settings.connectTimeout == std::chrono::seconds(20));
    QVERIFY(settings.environment.isEmpty());
    QCOMPARE(settings.apiKey.size(), 32);
}

void SettingsTests::testUnknownOptionRejected()
{
    syncwarden::SupervisorSettings settings;
    QVERIFY(!parse({QStringLiteral("--unknown-flag")}, &settings));
    // Value-taking option at the end of the line.
    QVERIFY(!parse({QStringLiteral("--api-key")}, &settings));
}

QTEST_MAIN(SettingsTests)
#include "test_settings.moc"
