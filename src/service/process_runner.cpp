#include "service/process_runner.hpp"

#include <functional>

#include <QFileInfo>
#include <QProcessEnvironment>
#include <QRegularExpression>
#include <QThread>

#include <nlohmann/json.hpp>

#include <sys/resource.h>

#include "common/logging.hpp"

namespace syncwarden {

namespace {

const QString kComponent = QStringLiteral("QProcessRunner");

constexpr int kExitRestart = 3;
constexpr int kExitUpgradeRestart = 4;
constexpr int kLowPriorityNice = 10;
constexpr int kKillWaitMs = 3000;

} // namespace

QProcessRunner::QProcessRunner(QObject *parent)
    : ProcessRunner(parent)
    , m_process(new QProcess(this))
{
    m_process->setProcessChannelMode(QProcess::MergedChannels);

    connect(m_process, &QProcess::finished, this, &QProcessRunner::onFinished);
    connect(m_process, &QProcess::errorOccurred, this, &QProcessRunner::onErrorOccurred);
    connect(m_process, &QProcess::readyRead, this, &QProcessRunner::onReadyRead);
}

QProcessRunner::~QProcessRunner()
{
    // Nobody is left to hear about this exit.
    disconnect(m_process, nullptr, this, nullptr);
    if (m_process->state() != QProcess::NotRunning) {
        m_process->kill();
        m_process->waitForFinished(kKillWaitMs);
    }
}

void QProcessRunner::configure(const ProcessLaunchOptions &options)
{
    m_options = options;
}

void QProcessRunner::start()
{
    if (m_process->state() != QProcess::NotRunning) {
        return;
    }

    m_killRequested = false;
    emit starting();
    launch();
}

void QProcessRunner::kill()
{
    m_killRequested = true;
    if (QThread::currentThread() == thread()) {
        killNow();
        return;
    }
    QMetaObject::invokeMethod(this, [this]() { killNow(); }, Qt::QueuedConnection);
}

void QProcessRunner::killAllInstances()
{
    const QString name = QFileInfo(m_options.executablePath).fileName();
    if (name.isEmpty()) {
        return;
    }

    SWLOG_INFO(kComponent,
               QStringLiteral("killAllInstances"),
               QStringLiteral("kill_all_instances"),
               QStringLiteral("user_action"),
               QStringLiteral("pkill"),
               logging::defaultWho(),
               QString(),
               nlohmann::json{{"name", name.toStdString()}});

    QProcess proc;
    proc.start(QStringLiteral("pkill"), {QStringLiteral("-x"), name});
    if (!proc.waitForFinished(kKillWaitMs)) {
        SWLOG_WARN(kComponent,
                   QStringLiteral("killAllInstances"),
                   QStringLiteral("pkill_timeout"),
                   QStringLiteral("process_hung"),
                   QStringLiteral("pkill"),
                   logging::defaultWho(),
                   QString(),
                   nlohmann::json{{"name", name.toStdString()}});
    }
}

QStringList QProcessRunner::launchArguments(const ProcessLaunchOptions &options)
{
    QStringList args = {
        QStringLiteral("-no-browser"),
        QStringLiteral("-no-restart"),
        QStringLiteral("-gui-address=%1").arg(options.hostAddress),
        QStringLiteral("-gui-apikey=%1").arg(options.apiKey),
    };
    if (!options.customHomeDir.isEmpty()) {
        args << QStringLiteral("-home=%1").arg(options.customHomeDir);
    }
    return args;
}

QString QProcessRunner::maskDeviceIds(const QString &line)
{
    static const QRegularExpression deviceId(
        QStringLiteral("\\b([A-Z2-7]{7})(-[A-Z2-7]{7}){7}\\b"));

    QString masked = line;
    masked.replace(deviceId, QStringLiteral("\\1-XXXXXXX"));
    return masked;
}

void QProcessRunner::launch()
{
    QProcessEnvironment env = QProcessEnvironment::systemEnvironment();
    env.insert(QStringLiteral("STNORESTART"), QStringLiteral("1"));
    if (m_options.denyUpgrade) {
        env.insert(QStringLiteral("STNOUPGRADE"), QStringLiteral("1"));
    }
    for (auto it = m_options.environment.cbegin(); it != m_options.environment.cend(); ++it) {
        env.insert(it.key(), it.value());
    }
    m_process->setProcessEnvironment(env);

    if (m_options.runLowPriority) {
        m_process->setChildProcessModifier([]() {
            ::setpriority(PRIO_PROCESS, 0, kLowPriorityNice);
        });
    } else {
        m_process->setChildProcessModifier(std::function<void()>());
    }

    SWLOG_INFO(kComponent,
               QStringLiteral("launch"),
               QStringLiteral("launch_service"),
               QStringLiteral("start_requested"),
               QStringLiteral("qprocess"),
               logging::defaultWho(),
               QString(),
               nlohmann::json{{"executable", m_options.executablePath.toStdString()},
                              {"address", m_options.hostAddress.toStdString()},
                              {"lowPriority", m_options.runLowPriority},
                              {"denyUpgrade", m_options.denyUpgrade}});

    m_process->start(m_options.executablePath, launchArguments(m_options));
}

void QProcessRunner::killNow()
{
    if (m_process->state() == QProcess::NotRunning) {
        return;
    }

    SWLOG_INFO(kComponent,
               QStringLiteral("kill"),
               QStringLiteral("kill_service"),
               QStringLiteral("kill_requested"),
               QStringLiteral("sigkill"),
               logging::defaultWho(),
               QString(),
               nlohmann::json{{"pid", m_process->processId()}});
    m_process->kill();
}

void QProcessRunner::onFinished(int exitCode, QProcess::ExitStatus exitStatus)
{
    onReadyRead();
    if (!m_pendingOutput.isEmpty()) {
        const QString tail = QString::fromUtf8(m_pendingOutput);
        m_pendingOutput.clear();
        emit messageLogged(m_options.hideDeviceIds ? maskDeviceIds(tail) : tail);
    }

    SWLOG_INFO(kComponent,
               QStringLiteral("onFinished"),
               QStringLiteral("service_exited"),
               QStringLiteral("process_finished"),
               QStringLiteral("qprocess"),
               logging::defaultWho(),
               QString(),
               nlohmann::json{{"exitCode", exitCode},
                              {"crashed", exitStatus == QProcess::CrashExit},
                              {"killRequested", m_killRequested.load()}});

    if (m_killRequested) {
        emit processStopped(ExitStatus::Normal);
        return;
    }

    if (exitStatus == QProcess::NormalExit
        && (exitCode == kExitRestart || exitCode == kExitUpgradeRestart)) {
        emit processRestarted();
        start();
        return;
    }

    const bool clean = exitStatus == QProcess::NormalExit && exitCode == 0;
    emit processStopped(clean ? ExitStatus::Normal : ExitStatus::Error);
}

void QProcessRunner::onErrorOccurred(QProcess::ProcessError error)
{
    if (error != QProcess::FailedToStart) {
        return;
    }

    SWLOG_ERROR(kComponent,
                QStringLiteral("onErrorOccurred"),
                QStringLiteral("launch_failed"),
                QStringLiteral("failed_to_start"),
                QStringLiteral("qprocess"),
                logging::defaultWho(),
                QString(),
                nlohmann::json{{"executable", m_options.executablePath.toStdString()},
                               {"error", m_process->errorString().toStdString()}});
    emit processStopped(ExitStatus::Error);
}

void QProcessRunner::onReadyRead()
{
    m_pendingOutput.append(m_process->readAll());

    int newline = m_pendingOutput.indexOf('\n');
    while (newline >= 0) {
        const QString line = QString::fromUtf8(m_pendingOutput.left(newline)).trimmed();
        m_pendingOutput.remove(0, newline + 1);
        if (!line.isEmpty()) {
            emit messageLogged(m_options.hideDeviceIds ? maskDeviceIds(line) : line);
        }
        newline = m_pendingOutput.indexOf('\n');
    }
}

} // namespace syncwarden
