#include <QtTest/QtTest>

#include <QLocalServer>
#include <QLocalSocket>
#include <QSignalSpy>
#include <QTemporaryDir>

#include <pthread.h>
#include <signal.h>

#include "common/process_utils.hpp"
#include "daemon/process_executor.hpp"

using namespace inreact;

namespace {

// Blocked-signal bitmap of the shell that wrote the SigBlk line to path.
quint64 blockedMaskIn(const QString &path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return ~quint64(0);
    }
    const QByteArray line = file.readAll().trimmed();
    const int colon = line.indexOf(':');
    bool ok = false;
    const quint64 bits = line.mid(colon + 1).trimmed().toULongLong(&ok, 16);
    return ok ? bits : ~quint64(0);
}

QString writeBlockedMaskCommand(const QString &path)
{
    return QStringLiteral("grep '^SigBlk' /proc/$$/status > '%1'").arg(path);
}

// Blocks SIGTERM and SIGHUP in the calling thread, as inreactd's main() does.
struct BlockedSignals {
    sigset_t previous;
    BlockedSignals()
    {
        sigset_t set;
        sigemptyset(&set);
        sigaddset(&set, SIGTERM);
        sigaddset(&set, SIGHUP);
        pthread_sigmask(SIG_BLOCK, &set, &previous);
    }
    ~BlockedSignals() { pthread_sigmask(SIG_SETMASK, &previous, nullptr); }
};

} // namespace

class ProcessExecutorTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();

    void testCommandExitCodeReported();
    void testCommandRunsThroughShell();
    void testEmptyCommandRefused();
    void testWorkerStartsWithEmptySignalMask();
    void testDetachedSpawnStartsWithEmptySignalMask();
    void testForwardDeliversPayload();
    void testForwardToUnreachableSocketFails();
    void testForwardToUnknownDaemonRefused();

private:
    QTemporaryDir m_tempDir;
};

void ProcessExecutorTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    qputenv("INREACT_LOG_DIR", (m_tempDir.path() + QStringLiteral("/logs")).toUtf8());
}

void ProcessExecutorTests::cleanupTestCase()
{
    qunsetenv("INREACT_LOG_DIR");
}

void ProcessExecutorTests::testCommandExitCodeReported()
{
    ProcessExecutor executor;
    QSignalSpy spy(&executor, &ActionExecutor::workerFinished);

    const auto id = executor.runCommand("exit 3");
    QVERIFY(id);
    QCOMPARE(executor.inFlight(), 1);

    QTRY_COMPARE(spy.count(), 1);
    const QList<QVariant> args = spy.takeFirst();
    QCOMPARE(args.at(0).toULongLong(), static_cast<qulonglong>(*id));
    QCOMPARE(args.at(1).toInt(), 3);
    QCOMPARE(executor.inFlight(), 0);
}

void ProcessExecutorTests::testCommandRunsThroughShell()
{
    ProcessExecutor executor;
    QSignalSpy spy(&executor, &ActionExecutor::workerFinished);
    const QString marker = m_tempDir.path() + QStringLiteral("/marker");

    const auto id = executor.runCommand(
        QStringLiteral("printf done > '%1' && test -s '%1'").arg(marker).toStdString());
    QVERIFY(id);
    QTRY_COMPARE(spy.count(), 1);
    QCOMPARE(spy.at(0).at(1).toInt(), 0);

    QFile file(marker);
    QVERIFY(file.open(QIODevice::ReadOnly));
    QCOMPARE(file.readAll(), QByteArray("done"));
}

void ProcessExecutorTests::testEmptyCommandRefused()
{
    ProcessExecutor executor;
    QVERIFY(!executor.runCommand(""));
    QCOMPARE(executor.inFlight(), 0);
}

void ProcessExecutorTests::testWorkerStartsWithEmptySignalMask()
{
    BlockedSignals blocked;
    ProcessExecutor executor;
    QSignalSpy spy(&executor, &ActionExecutor::workerFinished);
    const QString maskFile = m_tempDir.path() + QStringLiteral("/worker-mask");

    QVERIFY(executor.runCommand(writeBlockedMaskCommand(maskFile).toStdString()));
    QTRY_COMPARE(spy.count(), 1);
    QCOMPARE(spy.at(0).at(1).toInt(), 0);
    QCOMPARE(blockedMaskIn(maskFile), quint64(0));
}

void ProcessExecutorTests::testDetachedSpawnStartsWithEmptySignalMask()
{
    BlockedSignals blocked;
    const QString maskFile = m_tempDir.path() + QStringLiteral("/detached-mask");

    QVERIFY(spawnDetached(QStringLiteral("/bin/sh"),
                          {QStringLiteral("-c"), writeBlockedMaskCommand(maskFile)}));
    QTRY_VERIFY(QFileInfo(maskFile).size() > 0);
    QCOMPARE(blockedMaskIn(maskFile), quint64(0));
}

void ProcessExecutorTests::testForwardDeliversPayload()
{
    const QString socketPath = m_tempDir.path() + QStringLiteral("/indexer.sock");
    QLocalServer server;
    QVERIFY(server.listen(socketPath));

    QByteArray received;
    connect(&server, &QLocalServer::newConnection, this, [&server, &received]() {
        QLocalSocket *peer = server.nextPendingConnection();
        connect(peer, &QLocalSocket::readyRead, peer, [peer, &received]() {
            received += peer->readAll();
            if (received.endsWith('\n')) {
                peer->write("ok\n");
                peer->flush();
                peer->disconnectFromServer();
            }
        });
    });

    ProcessExecutor executor;
    CompanionDaemon indexer;
    indexer.name = "indexer";
    indexer.socketPath = socketPath.toStdString();
    executor.setCompanions({indexer});
    QSignalSpy spy(&executor, &ActionExecutor::workerFinished);

    const auto id = executor.forwardToDaemon("indexer", "reindex /srv/www");
    QVERIFY(id);
    QTRY_COMPARE(spy.count(), 1);
    QCOMPARE(spy.at(0).at(1).toInt(), 0);
    QCOMPARE(received, QByteArray("reindex /srv/www\n"));
}

void ProcessExecutorTests::testForwardToUnreachableSocketFails()
{
    ProcessExecutor executor;
    QSignalSpy spy(&executor, &ActionExecutor::workerFinished);

    const auto id = executor.forwardToDaemon(
        (m_tempDir.path() + QStringLiteral("/nobody.sock")).toStdString(), "ping");
    QVERIFY(id);
    // Completion is always delivered after the id has been handed out.
    QCOMPARE(spy.count(), 0);

    QTRY_COMPARE(spy.count(), 1);
    QCOMPARE(spy.at(0).at(0).toULongLong(), static_cast<qulonglong>(*id));
    QCOMPARE(spy.at(0).at(1).toInt(), 1);
}

void ProcessExecutorTests::testForwardToUnknownDaemonRefused()
{
    ProcessExecutor executor;
    QVERIFY(!executor.forwardToDaemon("not-configured", "ping"));
    QCOMPARE(executor.inFlight(), 0);
}

QTEST_MAIN(ProcessExecutorTests)
#include "test_process_executor.moc"
