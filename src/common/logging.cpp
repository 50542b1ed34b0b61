#include "common/logging.hpp"

#include <QCoreApplication>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QThread>
#include <QUuid>

#include <unistd.h>

#include <cstdio>
#include <memory>
#include <mutex>

namespace inreact::logging {

namespace {

std::mutex g_logMutex;
bool g_traceEnabled = false;
QString g_processName;
QString g_logDir;
std::unique_ptr<QFile> g_logFile;

thread_local QString t_corrId;

QString levelToString(LogLevel level)
{
    switch (level) {
    case LogLevel::Debug:
        return QStringLiteral("DEBUG");
    case LogLevel::Info:
        return QStringLiteral("INFO");
    case LogLevel::Warn:
        return QStringLiteral("WARN");
    case LogLevel::Error:
        return QStringLiteral("ERROR");
    }
    return QStringLiteral("INFO");
}

QString defaultLogDir()
{
    const QString fromEnv = qEnvironmentVariable("INREACT_LOG_DIR");
    if (!fromEnv.isEmpty()) {
        return fromEnv;
    }
    if (geteuid() == 0) {
        return QStringLiteral("/var/log/inreact");
    }
    const QString home = qEnvironmentVariable("HOME");
    if (home.isEmpty()) {
        return QStringLiteral(".local/share/inreact/logs");
    }
    return home + QStringLiteral("/.local/share/inreact/logs");
}

QString currentLogPath()
{
    const QString dir = g_logDir.isEmpty() ? defaultLogDir() : g_logDir;
    const QString base = g_processName.isEmpty()
        ? QStringLiteral("inreact")
        : g_processName;
    return dir + QDir::separator() + base + QStringLiteral(".log");
}

// Caller holds g_logMutex.
void openLogFileLocked()
{
    const QString path = currentLogPath();
    QDir().mkpath(QFileInfo(path).absolutePath());

    auto file = std::make_unique<QFile>(path);
    if (!file->open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        fprintf(stderr, "inreact: cannot open log file %s\n",
                path.toLocal8Bit().constData());
        g_logFile.reset();
        return;
    }
    g_logFile = std::move(file);
}

void writeLineLocked(const QString &line)
{
    if (!g_logFile) {
        openLogFileLocked();
    }
    if (!g_logFile) {
        fprintf(stderr, "%s\n", line.toUtf8().constData());
        return;
    }

    g_logFile->write(line.toUtf8());
    g_logFile->write("\n");
    g_logFile->flush();
}

QString threadIdString()
{
    return QStringLiteral("0x%1")
        .arg(reinterpret_cast<quintptr>(QThread::currentThreadId()), 0, 16);
}

} // namespace

void initLogging(const QString &processName, bool traceEnabled, const QString &logDir)
{
    std::lock_guard<std::mutex> lock(g_logMutex);
    g_processName = processName;
    g_traceEnabled = traceEnabled;
    g_logDir = logDir;
    g_logFile.reset();
}

bool isTraceEnabled()
{
    return g_traceEnabled;
}

void reopenLog()
{
    std::lock_guard<std::mutex> lock(g_logMutex);
    if (g_logFile) {
        g_logFile->close();
    }
    openLogFileLocked();
}

QString logFilePath()
{
    std::lock_guard<std::mutex> lock(g_logMutex);
    return currentLogPath();
}

void setCorrelationId(const QString &corrId)
{
    t_corrId = corrId;
}

QString currentCorrelationId()
{
    return t_corrId;
}

QString newCorrelationId()
{
    return QUuid::createUuid().toString(QUuid::WithoutBraces);
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
    if (!g_processName.isEmpty()) {
        return g_processName;
    }
    if (QCoreApplication::instance()) {
        const QString appName = QCoreApplication::applicationName();
        if (!appName.isEmpty()) {
            return appName;
        }
    }
    return QStringLiteral("inreact");
}

QString defaultWho()
{
    static const QString who = [] {
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

void logEvent(LogLevel level,
              const QString &component,
              const QString &where,
              const QString &what,
              const QString &why,
              const nlohmann::json &context)
{
    if (level == LogLevel::Debug && !g_traceEnabled) {
        return;
    }

    nlohmann::json payload = {
        {"ts", QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs).toStdString()},
        {"level", levelToString(level).toStdString()},
        {"process", defaultProcessName().toStdString()},
        {"thread", threadIdString().toStdString()},
        {"component", component.toStdString()},
        {"where", where.toStdString()},
        {"what", what.toStdString()},
        {"why", why.toStdString()},
        {"who", defaultWho().toStdString()},
        {"corr", currentCorrelationId().toStdString()},
        {"context", context}
    };

    const QString line = QString::fromStdString(
        payload.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));

    std::lock_guard<std::mutex> lock(g_logMutex);
    writeLineLocked(line);
}

} // namespace inreact::logging
