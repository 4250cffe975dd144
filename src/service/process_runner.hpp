#pragma once

#include <atomic>

#include <QProcess>
#include <QString>

#include "supervisor/collaborators.hpp"

namespace syncwarden {

/**
 * QProcessRunner launches the sync service executable as a child process.
 *
 * Exit code 3 (restart requested) and 4 (restart after upgrade) are handled by
 * relaunching: processRestarted() is emitted, then the usual starting()
 * sequence follows. kill() may be called from any thread.
 */
class QProcessRunner : public ProcessRunner
{
    Q_OBJECT
public:
    explicit QProcessRunner(QObject *parent = nullptr);
    ~QProcessRunner() override;

    void configure(const ProcessLaunchOptions &options) override;
    void start() override;
    void kill() override;
    void killAllInstances() override;

    static QStringList launchArguments(const ProcessLaunchOptions &options);
    static QString maskDeviceIds(const QString &line);

private slots:
    void onFinished(int exitCode, QProcess::ExitStatus exitStatus);
    void onErrorOccurred(QProcess::ProcessError error);
    void onReadyRead();

private:
    void launch();
    void killNow();

    QProcess *m_process;
    ProcessLaunchOptions m_options;
    QByteArray m_pendingOutput;
    std::atomic<bool> m_killRequested{false};
};

} // namespace syncwarden
