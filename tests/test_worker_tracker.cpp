#include <QtTest/QtTest>

#include "daemon/worker_tracker.hpp"

using namespace inreact;

class WorkerTrackerTests : public QObject
{
    Q_OBJECT
private slots:
    void testTrackAndRelease();
    void testUnknownIdIsReported();
    void testSnapshotOrderedById();
};

void WorkerTrackerTests::testTrackAndRelease()
{
    WorkerTracker tracker;
    WorkerRecord record;
    record.path = "/etc/hosts";
    record.reason = WorkerReason::MissingPath;
    record.correlationId = QStringLiteral("corr-7");
    tracker.track(7, record);

    QVERIFY(tracker.hasWorkerFor("/etc/hosts"));
    QCOMPARE(tracker.size(), size_t(1));

    const auto released = tracker.release(7);
    QVERIFY(released);
    QCOMPARE(released->path, std::string("/etc/hosts"));
    QCOMPARE(released->reason, WorkerReason::MissingPath);
    QCOMPARE(released->correlationId, QStringLiteral("corr-7"));
    QVERIFY(!tracker.hasWorkerFor("/etc/hosts"));
}

void WorkerTrackerTests::testUnknownIdIsReported()
{
    WorkerTracker tracker;
    QVERIFY(!tracker.release(1));

    WorkerRecord record;
    record.path = "/a";
    tracker.track(1, record);
    QVERIFY(tracker.release(1));
    QVERIFY(!tracker.release(1));
}

void WorkerTrackerTests::testSnapshotOrderedById()
{
    WorkerTracker tracker;
    WorkerRecord a;
    a.path = "/a";
    WorkerRecord b;
    b.path = "/b";
    tracker.track(20, b);
    tracker.track(3, a);

    const auto snapshot = tracker.snapshot();
    QCOMPARE(snapshot.size(), size_t(2));
    QCOMPARE(snapshot[0].first, WorkerId(3));
    QCOMPARE(snapshot[1].second.path, std::string("/b"));
}

QTEST_MAIN(WorkerTrackerTests)
#include "test_worker_tracker.moc"
