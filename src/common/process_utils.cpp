#include "common/process_utils.hpp"

#include <QCoreApplication>
#include <QFileInfo>
#include <QLocalSocket>
#include <QProcess>

#include <pthread.h>
#include <signal.h>
#include <unistd.h>

#include "common/logging.hpp"
#include <nlohmann/json.hpp>

namespace inreact {

namespace {

constexpr int kProbeTimeoutMs = 200;

} // namespace

bool isPrivileged()
{
    return geteuid() == 0;
}

bool isProcessRunning(const QString &processName)
{
    if (processName.isEmpty()) {
        return false;
    }
    QProcess proc;
    proc.start(QStringLiteral("pgrep"), {QStringLiteral("-x"), processName});
    if (!proc.waitForFinished(kProbeTimeoutMs)) {
        proc.kill();
        proc.waitForFinished(kProbeTimeoutMs);
        return false;
    }
    return proc.exitStatus() == QProcess::NormalExit && proc.exitCode() == 0;
}

bool isSocketReachable(const QString &socketPath)
{
    QLocalSocket socket;
    socket.connectToServer(socketPath);
    if (socket.waitForConnected(kProbeTimeoutMs)) {
        socket.disconnectFromServer();
        return true;
    }
    return false;
}

void resetChildSignalMask(QProcess &process)
{
    process.setChildProcessModifier([]() {
        sigset_t empty;
        sigemptyset(&empty);
        pthread_sigmask(SIG_SETMASK, &empty, nullptr);
    });
}

bool spawnDetached(const QString &executable, const QStringList &args)
{
    IRLOG_INFO(QStringLiteral("ProcessUtils"),
               QStringLiteral("spawnDetached"),
               QStringLiteral("spawn_process"),
               QStringLiteral("companion_or_restart"),
               (nlohmann::json{{"executable", executable.toStdString()},
                               {"args", args.size()}}));

    if (!QFileInfo(executable).isExecutable()) {
        IRLOG_WARN(QStringLiteral("ProcessUtils"),
                   QStringLiteral("spawnDetached"),
                   QStringLiteral("spawn_failed"),
                   QStringLiteral("not_executable"),
                   (nlohmann::json{{"executable", executable.toStdString()}}));
        return false;
    }
    QProcess process;
    process.setProgram(executable);
    process.setArguments(args);
    resetChildSignalMask(process);
    return process.startDetached();
}

bool spawnReplacementInstance()
{
    const QString self = QCoreApplication::applicationFilePath();
    return spawnDetached(self, QCoreApplication::arguments().mid(1));
}

QString defaultLockFilePath()
{
    const QString fromEnv = qEnvironmentVariable("INREACT_LOCK_FILE");
    if (!fromEnv.isEmpty()) {
        return fromEnv;
    }
    if (isPrivileged()) {
        return QStringLiteral("/run/inreactd.lock");
    }
    const QString runtimeDir = qEnvironmentVariable("XDG_RUNTIME_DIR");
    if (!runtimeDir.isEmpty()) {
        return runtimeDir + QStringLiteral("/inreactd.lock");
    }
    return QStringLiteral("/run/user/%1/inreactd.lock").arg(getuid());
}

} // namespace inreact
