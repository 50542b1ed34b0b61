#include <QtTest/QtTest>

#include <QTemporaryDir>

#include <map>

#include "daemon/anomaly_handler.hpp"

using namespace inreact;

namespace {

class RecordingActions : public AnomalyActions
{
public:
    std::optional<std::string> pathForHandle(int handle) const override
    {
        auto it = handles.find(handle);
        if (it == handles.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    bool recreateWatch(const std::string &path) override
    {
        recreated.push_back(path);
        return recreateSucceeds;
    }

    void dropEntry(const std::string &path) override { dropped.push_back(path); }

    void requestRestart(const std::string &reason) override { restarts.push_back(reason); }

    std::map<int, std::string> handles;
    bool recreateSucceeds = true;
    std::vector<std::string> recreated;
    std::vector<std::string> dropped;
    std::vector<std::string> restarts;
};

FsEvent event(int handle, std::uint32_t eventMask)
{
    FsEvent result;
    result.handle = handle;
    result.mask = eventMask;
    return result;
}

} // namespace

class AnomalyHandlerTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();

    void testOrdinaryEventIsNotAnomaly();
    void testOverflowRequestsRestart();
    void testUnmountRecreatesOrDrops();
    void testIgnoredAfterReuseIsStale();
    void testIgnoredWithoutReuseInvalidates();
    void testIgnoredForUnknownHandleIsOrphaned();
    void testOlderRemovalIsForgotten();

private:
    QTemporaryDir m_tempDir;
};

void AnomalyHandlerTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    qputenv("INREACT_LOG_DIR", m_tempDir.path().toUtf8());
}

void AnomalyHandlerTests::cleanupTestCase()
{
    qunsetenv("INREACT_LOG_DIR");
}

void AnomalyHandlerTests::testOrdinaryEventIsNotAnomaly()
{
    RecordingActions actions;
    AnomalyHandler handler(actions);
    QCOMPARE(handler.classify(event(1, mask::Modify)), AnomalyKind::None);
}

void AnomalyHandlerTests::testOverflowRequestsRestart()
{
    RecordingActions actions;
    AnomalyHandler handler(actions);
    QCOMPARE(handler.handle(event(-1, mask::QueueOverflow)), AnomalyKind::QueueOverflow);
    QCOMPARE(actions.restarts, std::vector<std::string>{"queue_overflow"});
}

void AnomalyHandlerTests::testUnmountRecreatesOrDrops()
{
    RecordingActions actions;
    actions.handles[4] = "/mnt/usb/file";
    AnomalyHandler handler(actions);

    QCOMPARE(handler.handle(event(4, mask::Unmount)), AnomalyKind::Unmount);
    QCOMPARE(actions.recreated, std::vector<std::string>{"/mnt/usb/file"});
    QVERIFY(actions.dropped.empty());

    actions.recreateSucceeds = false;
    handler.handle(event(4, mask::Unmount));
    QCOMPARE(actions.dropped, std::vector<std::string>{"/mnt/usb/file"});
}

void AnomalyHandlerTests::testIgnoredAfterReuseIsStale()
{
    RecordingActions actions;
    actions.handles[3] = "/b";
    AnomalyHandler handler(actions);

    handler.noteWatchRemoved(3);
    handler.noteWatchCreated(3);
    QCOMPARE(handler.lastReusedHandle(), 3);

    QCOMPARE(handler.handle(event(3, mask::Ignored)), AnomalyKind::StaleDelivery);
    QVERIFY(actions.dropped.empty());
    QCOMPARE(handler.lastReusedHandle(), -1);

    // A second IGNORED on the same descriptor is no longer explained.
    QCOMPARE(handler.handle(event(3, mask::Ignored)), AnomalyKind::Invalidated);
    QCOMPARE(actions.dropped, std::vector<std::string>{"/b"});
}

void AnomalyHandlerTests::testIgnoredWithoutReuseInvalidates()
{
    RecordingActions actions;
    actions.handles[2] = "/a";
    AnomalyHandler handler(actions);
    handler.noteWatchRemoved(5);
    handler.noteWatchCreated(2);

    QCOMPARE(handler.handle(event(2, mask::Ignored)), AnomalyKind::Invalidated);
    QCOMPARE(actions.dropped, std::vector<std::string>{"/a"});
}

void AnomalyHandlerTests::testIgnoredForUnknownHandleIsOrphaned()
{
    RecordingActions actions;
    AnomalyHandler handler(actions);
    handler.noteWatchRemoved(8);

    QCOMPARE(handler.handle(event(8, mask::Ignored)), AnomalyKind::Orphaned);
    QVERIFY(actions.dropped.empty());
    QVERIFY(actions.restarts.empty());
}

void AnomalyHandlerTests::testOlderRemovalIsForgotten()
{
    RecordingActions actions;
    actions.handles[1] = "/one";
    AnomalyHandler handler(actions);

    handler.noteWatchRemoved(1);
    handler.noteWatchRemoved(2);
    handler.noteWatchCreated(1);

    // Only the most recent removal is remembered.
    QCOMPARE(handler.lastReusedHandle(), -1);
    QCOMPARE(handler.classify(event(1, mask::Ignored)), AnomalyKind::Invalidated);
}

QTEST_MAIN(AnomalyHandlerTests)
#include "test_anomaly_handler.moc"
