#include <QtTest/QtTest>

#include <QFile>
#include <QSignalSpy>
#include <QTemporaryDir>

#include <unistd.h>

#include "daemon/inotify_source.hpp"

using namespace inreact;

namespace {

void appendTo(const QString &path, const QByteArray &data)
{
    QFile file(path);
    QVERIFY(file.open(QIODevice::WriteOnly | QIODevice::Append));
    file.write(data);
}

WatchCallback noop(CallbackRole role = CallbackRole::Live)
{
    return WatchCallback{role, [](const FsEvent &) {}};
}

} // namespace

class InotifySourceTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();

    void testModifyIsReported();
    void testMissingPathIsNotFound();
    void testSecondPathToSameInodeIsAliased();
    void testRemoveLeavesIgnoredWithoutCallback();
    void testReplaceCallbackSwapsRole();

private:
    QTemporaryDir m_tempDir;
};

void InotifySourceTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    qputenv("INREACT_LOG_DIR", (m_tempDir.path() + QStringLiteral("/logs")).toUtf8());
}

void InotifySourceTests::cleanupTestCase()
{
    qunsetenv("INREACT_LOG_DIR");
}

void InotifySourceTests::testModifyIsReported()
{
    InotifySource source;
    QVERIFY(source.start());
    QSignalSpy spy(&source, &NotificationSource::eventsReady);

    const QString file = m_tempDir.path() + QStringLiteral("/modify.txt");
    appendTo(file, "a");
    const WatchResult result = source.addWatch(file.toStdString(),
                                               mask::Modify | mask::DeleteSelf, noop());
    QVERIFY(result.ok());
    QVERIFY(source.callbackFor(result.handle));

    appendTo(file, "b");
    QTRY_VERIFY(spy.count() > 0);

    const std::vector<FsEvent> events = source.readEvents();
    QVERIFY(!events.empty());
    QCOMPARE(events.front().handle, result.handle);
    QVERIFY(events.front().mask & mask::Modify);
    QCOMPARE(events.front().path, file.toStdString());
    QVERIFY(source.readEvents().empty());
}

void InotifySourceTests::testMissingPathIsNotFound()
{
    InotifySource source;
    QVERIFY(source.start());
    const WatchResult result = source.addWatch(
        (m_tempDir.path() + QStringLiteral("/absent")).toStdString(), mask::Modify, noop());
    QCOMPARE(result.error, WatchError::NotFound);
    QVERIFY(!result.ok());
}

void InotifySourceTests::testSecondPathToSameInodeIsAliased()
{
    InotifySource source;
    QVERIFY(source.start());
    const QString first = m_tempDir.path() + QStringLiteral("/linked");
    const QString second = m_tempDir.path() + QStringLiteral("/linked-too");
    appendTo(first, "x");
    QCOMPARE(::link(first.toLocal8Bit().constData(), second.toLocal8Bit().constData()), 0);

    const WatchResult a = source.addWatch(first.toStdString(), mask::Modify, noop());
    QVERIFY(a.ok());
    const WatchResult b = source.addWatch(second.toStdString(), mask::Attrib, noop());
    QCOMPARE(b.error, WatchError::Aliased);
    QVERIFY(source.callbackFor(a.handle));
}

void InotifySourceTests::testRemoveLeavesIgnoredWithoutCallback()
{
    InotifySource source;
    QVERIFY(source.start());
    QSignalSpy spy(&source, &NotificationSource::eventsReady);

    const QString file = m_tempDir.path() + QStringLiteral("/removed.txt");
    appendTo(file, "a");
    const WatchResult result = source.addWatch(file.toStdString(), mask::Modify, noop());
    QVERIFY(result.ok());

    source.removeWatch(result.handle);
    QVERIFY(!source.callbackFor(result.handle));

    QTRY_VERIFY(spy.count() > 0);
    const std::vector<FsEvent> events = source.readEvents();
    QCOMPARE(events.size(), size_t(1));
    QCOMPARE(events.front().handle, result.handle);
    QVERIFY(events.front().mask & mask::Ignored);
    QVERIFY(events.front().isErrorClass());
}

void InotifySourceTests::testReplaceCallbackSwapsRole()
{
    InotifySource source;
    QVERIFY(source.start());
    const QString file = m_tempDir.path() + QStringLiteral("/role.txt");
    appendTo(file, "a");
    const WatchResult result = source.addWatch(file.toStdString(), mask::Modify, noop());
    QVERIFY(result.ok());

    QVERIFY(source.replaceCallback(result.handle, noop(CallbackRole::Sentinel)));
    QCOMPARE(source.callbackFor(result.handle)->role, CallbackRole::Sentinel);
    QVERIFY(!source.replaceCallback(result.handle + 1000, noop()));
}

QTEST_MAIN(InotifySourceTests)
#include "test_inotify_source.moc"
