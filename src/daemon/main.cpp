#include <QCoreApplication>
#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QLockFile>

#include <nlohmann/json.hpp>

#include "common/inreact_version.hpp"
#include "common/logging.hpp"
#include "daemon/daemon_options.hpp"
#include "daemon/inreact_daemon.hpp"
#include "daemon/signal_bridge.hpp"

namespace {

// Long enough for a restarting predecessor to drain and exit.
constexpr int kLockWaitMs = 10000;

} // namespace

int main(int argc, char *argv[])
{
    // Before QCoreApplication so no thread misses the mask.
    inreact::SignalBridge::blockHandledSignals();

    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("inreactd"));
    QCoreApplication::setApplicationVersion(QStringLiteral(INREACT_VERSION));
    qInfo() << "inreactd starting...";

    const inreact::DaemonOptionsResult parsed =
        inreact::parseDaemonOptions(QCoreApplication::arguments());
    if (!parsed.ok) {
        qCritical().noquote() << "inreactd:" << parsed.error;
        return 2;
    }
    const inreact::DaemonOptions &options = parsed.options;

    inreact::logging::initLogging(QStringLiteral("inreactd"), options.trace, options.logDir);
    IRLOG_INFO(QStringLiteral("main"),
               QStringLiteral("main"),
               QStringLiteral("daemon_start"),
               QStringLiteral("user_start"),
               (nlohmann::json{{"config", options.configPath.toStdString()},
                               {"who", inreact::logging::defaultWho().toStdString()}}));

    QDir().mkpath(QFileInfo(options.lockFilePath).absolutePath());
    QLockFile lock(options.lockFilePath);
    lock.setStaleLockTime(0);
    if (!lock.tryLock(kLockWaitMs)) {
        IRLOG_ERROR(QStringLiteral("main"),
                    QStringLiteral("main"),
                    QStringLiteral("run_lock_unavailable"),
                    lock.error() == QLockFile::LockFailedError
                        ? QStringLiteral("another_instance_running")
                        : QStringLiteral("lock_file_error"),
                    (nlohmann::json{{"lockFile", options.lockFilePath.toStdString()}}));
        qCritical().noquote() << "inreactd: cannot acquire" << options.lockFilePath;
        return 1;
    }

    // The daemon lives for the lifetime of the process.
    inreact::InreactDaemon daemon(options);
    if (!daemon.start()) {
        return 1;
    }

    return app.exec();
}
