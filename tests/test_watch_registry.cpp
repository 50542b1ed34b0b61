#include <QtTest/QtTest>

#include "daemon/watch_registry.hpp"

using namespace inreact;

namespace {

WatchSpec spec(const std::string &path, const std::string &command, const std::string &owner)
{
    WatchSpec result;
    result.path = path;
    result.mask = mask::Modify | mask::DeleteSelf;
    result.reaction = RunCommand{command};
    result.sourceConfig = owner;
    return result;
}

} // namespace

class WatchRegistryTests : public QObject
{
    Q_OBJECT
private slots:
    void testInsertThenUnchanged();
    void testReplaceReturnsPreviousHandle();
    void testConflictKeepsExisting();
    void testRuntimeStateIgnoredForComparison();
    void testOwnershipQueries();
    void testRemove();
};

void WatchRegistryTests::testInsertThenUnchanged()
{
    WatchRegistry registry;
    QCOMPARE(registry.upsert(spec("/a", "true", "/c1")).outcome, UpsertOutcome::Inserted);
    QCOMPARE(registry.upsert(spec("/a", "true", "/c1")).outcome, UpsertOutcome::Unchanged);
    QCOMPARE(registry.size(), size_t(1));
}

void WatchRegistryTests::testReplaceReturnsPreviousHandle()
{
    WatchRegistry registry;
    registry.upsert(spec("/a", "true", "/c1"));
    registry.get("/a")->watchHandle = 7;

    WatchSpec changed = spec("/a", "true", "/c1");
    changed.mask = mask::Attrib | mask::DeleteSelf;
    const UpsertResult result = registry.upsert(changed);
    QCOMPARE(result.outcome, UpsertOutcome::Replaced);
    QVERIFY(result.previous);
    QCOMPARE(result.previous->watchHandle, std::optional<int>(7));

    const WatchEntry *entry = registry.get("/a");
    QVERIFY(!entry->watchHandle);
    QCOMPARE(entry->mask, mask::Attrib | mask::DeleteSelf);
}

void WatchRegistryTests::testConflictKeepsExisting()
{
    WatchRegistry registry;
    registry.upsert(spec("/a", "first", "/c1"));
    const UpsertResult result = registry.upsert(spec("/a", "second", "/c2"));
    QCOMPARE(result.outcome, UpsertOutcome::Conflict);
    QCOMPARE(result.previous->sourceConfig, std::string("/c1"));
    QVERIFY(registry.get("/a")->reaction == Reaction(RunCommand{"first"}));
}

void WatchRegistryTests::testRuntimeStateIgnoredForComparison()
{
    WatchRegistry registry;
    registry.upsert(spec("/a", "true", "/c1"));
    WatchEntry *entry = registry.get("/a");
    entry->watchHandle = 3;
    entry->lastInode = 99;
    entry->suspended = true;

    WatchSpec same = spec("/a", "true", "/c1");
    same.lineNumber = 42;
    QCOMPARE(registry.upsert(same).outcome, UpsertOutcome::Unchanged);
    QCOMPARE(registry.get("/a")->watchHandle, std::optional<int>(3));
    QVERIFY(registry.get("/a")->suspended);
}

void WatchRegistryTests::testOwnershipQueries()
{
    WatchRegistry registry;
    registry.upsert(spec("/a", "true", "/c1"));
    registry.upsert(spec("/b", "true", "/c2"));
    registry.upsert(spec("/c", "true", "/c1"));
    registry.get("/b")->watchHandle = 5;

    QCOMPARE(registry.pathsOwnedBy("/c1"), (std::vector<std::string>{"/a", "/c"}));
    QCOMPARE(registry.paths().size(), size_t(3));
    QVERIFY(registry.findByHandle(5));
    QCOMPARE(registry.findByHandle(5)->path, std::string("/b"));
    QVERIFY(!registry.findByHandle(6));

    int visited = 0;
    registry.forEachOwnedBy("/c1", [&visited](WatchEntry &entry) {
        entry.suspended = true;
        ++visited;
    });
    QCOMPARE(visited, 2);
    QVERIFY(registry.get("/c")->suspended);
    QVERIFY(!registry.get("/b")->suspended);
}

void WatchRegistryTests::testRemove()
{
    WatchRegistry registry;
    registry.upsert(spec("/a", "true", "/c1"));
    registry.get("/a")->watchHandle = 9;

    const auto removed = registry.remove("/a");
    QVERIFY(removed);
    QCOMPARE(removed->watchHandle, std::optional<int>(9));
    QVERIFY(registry.empty());
    QVERIFY(!registry.remove("/a"));
}

QTEST_MAIN(WatchRegistryTests)
#include "test_watch_registry.moc"
