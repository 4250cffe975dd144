#include "common/logging.hpp"

#include <QCoreApplication>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QThread>

#include <unistd.h>

#include <atomic>
#include <cstdio>
#include <map>
#include <memory>
#include <mutex>
#include <utility>

namespace syncwarden::logging {

namespace {

constexpr qint64 kMaxLogSizeBytes = 5 * 1024 * 1024;
constexpr int kRotatedGenerations = 3;

// Append-only file kept open between writes; rolls over to .1 .. .N.
class LogSink
{
public:
    explicit LogSink(QString path)
        : m_file(std::move(path))
    {
    }

    bool append(const QByteArray &line)
    {
        if (!m_file.isOpen() && !open()) {
            return false;
        }
        if (m_file.size() + line.size() + 1 > kMaxLogSizeBytes) {
            rotate();
            if (!open()) {
                return false;
            }
        }
        m_file.write(line);
        m_file.write("\n");
        m_file.flush();
        return true;
    }

private:
    bool open()
    {
        QDir().mkpath(QFileInfo(m_file.fileName()).absolutePath());
        return m_file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text);
    }

    void rotate()
    {
        m_file.close();
        const QString path = m_file.fileName();
        QFile::remove(QStringLiteral("%1.%2").arg(path).arg(kRotatedGenerations));
        for (int generation = kRotatedGenerations - 1; generation >= 1; --generation) {
            QFile::rename(QStringLiteral("%1.%2").arg(path).arg(generation),
                          QStringLiteral("%1.%2").arg(path).arg(generation + 1));
        }
        QFile::rename(path, path + QStringLiteral(".1"));
    }

    QFile m_file;
};

std::mutex g_logMutex;
std::atomic<bool> g_traceEnabled{false};
QString g_processName;
QString g_logDir;
std::map<QString, std::unique_ptr<LogSink>> g_sinks;

thread_local QString t_corrId;

const char *levelName(LogLevel level)
{
    switch (level) {
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warn:
        return "WARN";
    case LogLevel::Error:
        return "ERROR";
    }
    return "INFO";
}

QString defaultLogDir()
{
    const QString overrideDir = qEnvironmentVariable("SYNCWARDEN_LOG_DIR");
    if (!overrideDir.isEmpty()) {
        return overrideDir;
    }
    const QString home = qEnvironmentVariable("HOME");
    if (home.isEmpty()) {
        return QStringLiteral(".local/share/syncwarden/logs");
    }
    return home + QStringLiteral("/.local/share/syncwarden/logs");
}

// Caller holds g_logMutex.
QString logDirLocked()
{
    return g_logDir.isEmpty() ? defaultLogDir() : g_logDir;
}

QString pathFor(const QString &dir, const QString &processName, const char *suffix)
{
    const QString base = processName.isEmpty() ? QStringLiteral("syncwarden") : processName;
    return dir + QLatin1Char('/') + base + QLatin1String(suffix);
}

// Caller holds g_logMutex.
void writeLocked(const QString &path, const QByteArray &line)
{
    auto &sink = g_sinks[path];
    if (!sink) {
        sink = std::make_unique<LogSink>(path);
    }
    if (!sink->append(line)) {
        fprintf(stderr, "%s\n", line.constData());
    }
}

QString threadIdString()
{
    return QStringLiteral("0x%1")
        .arg(reinterpret_cast<quintptr>(QThread::currentThreadId()), 0, 16);
}

} // namespace

void initLogging(const QString &processName, bool traceEnabled)
{
    std::lock_guard<std::mutex> lock(g_logMutex);
    g_processName = processName;
    g_logDir = defaultLogDir();
    g_traceEnabled = traceEnabled;
    // HOME or the log dir may have moved since the sinks were opened.
    g_sinks.clear();
}

bool isTraceEnabled()
{
    return g_traceEnabled;
}

void setCorrelationId(const QString &corrId)
{
    t_corrId = corrId;
}

QString currentCorrelationId()
{
    return t_corrId;
}

CorrelationScope::CorrelationScope(const QString &corrId)
    : m_prev(t_corrId)
{
    t_corrId = corrId;
}

CorrelationScope::~CorrelationScope()
{
    t_corrId = m_prev;
}

QString defaultProcessName()
{
    {
        std::lock_guard<std::mutex> lock(g_logMutex);
        if (!g_processName.isEmpty()) {
            return g_processName;
        }
    }
    if (QCoreApplication::instance()) {
        const QString appName = QCoreApplication::applicationName();
        if (!appName.isEmpty()) {
            return appName;
        }
    }
    return QStringLiteral("syncwarden");
}

QString defaultWho()
{
    static const QString who = []() {
        char hostname[256] = {};
        if (gethostname(hostname, sizeof(hostname)) != 0) {
            hostname[0] = '\0';
        }
        return QStringLiteral("host:%1,uid:%2")
            .arg(QString::fromUtf8(hostname))
            .arg(static_cast<int>(getuid()));
    }();
    return who;
}

QString logDirectory()
{
    std::lock_guard<std::mutex> lock(g_logMutex);
    return logDirLocked();
}

QString logFilePath(const QString &processName)
{
    return pathFor(logDirectory(), processName, ".log");
}

QString serviceLogFilePath(const QString &processName)
{
    return pathFor(logDirectory(), processName, "-service.log");
}

void logEvent(LogLevel level,
              const QString &processName,
              const QString &component,
              const QString &where,
              const QString &what,
              const QString &why,
              const QString &how,
              const QString &who,
              const QString &correlationId,
              const nlohmann::json &context)
{
    const bool trace = g_traceEnabled;
    if (level == LogLevel::Debug && !trace) {
        return;
    }

    const QString corr = correlationId.isEmpty() ? currentCorrelationId() : correlationId;
    const QString process = processName.isEmpty() ? defaultProcessName() : processName;
    const nlohmann::json payload = {
        {"ts", QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs).toStdString()},
        {"level", levelName(level)},
        {"process", process.toStdString()},
        {"thread", threadIdString().toStdString()},
        {"component", component.toStdString()},
        {"where", where.toStdString()},
        {"what", what.toStdString()},
        {"why", why.toStdString()},
        {"how", how.toStdString()},
        {"who", who.toStdString()},
        {"corr", corr.toStdString()},
        {"context", context}
    };
    const QByteArray line = QByteArray::fromStdString(payload.dump());

    std::lock_guard<std::mutex> lock(g_logMutex);
    const QString dir = logDirLocked();
    writeLocked(pathFor(dir, process, ".log"), line);
    if (trace) {
        writeLocked(pathFor(dir, process, "-trace.log"), line);
    }
}

void logServiceOutput(const QString &line)
{
    const QString process = defaultProcessName();
    const QByteArray stamped = QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs).toUtf8()
                               + ' ' + line.toUtf8();

    std::lock_guard<std::mutex> lock(g_logMutex);
    writeLocked(pathFor(logDirLocked(), process, "-service.log"), stamped);
}

} // namespace syncwarden::logging
