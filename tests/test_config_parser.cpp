#include <QtTest/QtTest>

#include "daemon/config_parser.hpp"

using namespace inreact;

class ConfigParserTests : public QObject
{
    Q_OBJECT
private slots:
    void testCommandLine();
    void testDeleteSelfAlwaysWatched();
    void testDirectives();
    void testForwardNeedsDaemon();
    void testSetWatchTargetValidated();
    void testCommentsAndBlankLines();
    void testMalformedLinesAreSkipped();
    void testFirstDeclarationWins();
    void testMissingFile();
};

void ConfigParserTests::testCommandLine()
{
    std::string reason;
    const auto spec = parseWatchLine("/etc/hosts  IN_MODIFY|IN_ATTRIB   systemctl reload  dnsmasq # now",
                                     &reason);
    QVERIFY(spec);
    QCOMPARE(spec->path, std::string("/etc/hosts"));
    QCOMPARE(spec->mask, mask::Modify | mask::Attrib | mask::DeleteSelf);
    QVERIFY(spec->sourceConfig.empty());
    const auto *command = std::get_if<RunCommand>(&spec->reaction);
    QVERIFY(command);
    QCOMPARE(command->commandLine, std::string("systemctl reload  dnsmasq # now"));
}

void ConfigParserTests::testDeleteSelfAlwaysWatched()
{
    const auto spec = parseWatchLine("/run/app.sock IN_RUN_SELF start-app");
    QVERIFY(spec);
    QCOMPARE(spec->mask, mask::DeleteSelf);
    QVERIFY(spec->runReactionIfMissing);
    QVERIFY(!spec->createIfMissing);
}

void ConfigParserTests::testDirectives()
{
    const auto selfLoad = parseWatchLine("/etc/inreact/extra.conf IN_CLOSE_WRITE LOAD_CONF");
    QVERIFY(selfLoad);
    QVERIFY(selfLoad->reaction == Reaction(LoadConfig{"/etc/inreact/extra.conf"}));

    const auto otherLoad = parseWatchLine("/data/flag IN_CREATE_SELF LOAD_CONF /etc/inreact/flag.conf");
    QVERIFY(otherLoad);
    QVERIFY(otherLoad->createIfMissing);
    QVERIFY(otherLoad->reaction == Reaction(LoadConfig{"/etc/inreact/flag.conf"}));

    const auto setWatch = parseWatchLine("/run/ready IN_ATTRIB SET_WATCH /var/app.log IN_MODIFY tail -n1 /var/app.log");
    QVERIFY(setWatch);
    QVERIFY(setWatch->reaction == Reaction(SetWatch{"/var/app.log IN_MODIFY tail -n1 /var/app.log"}));

    const auto forward = parseWatchLine("/srv/www IN_CLOSE_WRITE FORWARD indexer reindex /srv/www");
    QVERIFY(forward);
    QVERIFY(forward->reaction == Reaction(ForwardToSocket{"indexer", "reindex /srv/www"}));
}

void ConfigParserTests::testForwardNeedsDaemon()
{
    std::string reason;
    QVERIFY(!parseWatchLine("/srv/www IN_MODIFY FORWARD", &reason));
    QCOMPARE(reason, std::string("FORWARD without daemon name"));
}

void ConfigParserTests::testSetWatchTargetValidated()
{
    std::string reason;
    QVERIFY(!parseWatchLine("/run/ready IN_ATTRIB SET_WATCH relative IN_MODIFY true", &reason));
    QVERIFY(reason.find("SET_WATCH") != std::string::npos);

    QVERIFY(!parseWatchLine("/run/ready IN_ATTRIB SET_WATCH", &reason));
}

void ConfigParserTests::testCommentsAndBlankLines()
{
    std::string reason;
    QVERIFY(!parseWatchLine("   # comment", &reason));
    QVERIFY(reason.empty());
    QVERIFY(!parseWatchLine("   ", &reason));
    QVERIFY(reason.empty());

    const ConfigParseResult result = parseConfigText("# header\n\n/a IN_MODIFY true\n   # indented\n");
    QCOMPARE(result.specs.size(), size_t(1));
    QCOMPARE(result.specs.front().lineNumber, 3);
    QVERIFY(result.issues.empty());
}

void ConfigParserTests::testMalformedLinesAreSkipped()
{
    const ConfigParseResult result = parseConfigText(
        "relative IN_MODIFY true\n"
        "/a\n"
        "/b IN_MODIFY\n"
        "/c IN_NOPE true\n"
        "/d IN_MODIFY true\n");
    QCOMPARE(result.specs.size(), size_t(1));
    QCOMPARE(result.specs.front().path, std::string("/d"));
    QCOMPARE(result.issues.size(), size_t(4));
    QCOMPARE(result.issues[0].lineNumber, 1);
    QCOMPARE(result.issues[0].reason, std::string("path is not absolute"));
    QCOMPARE(result.issues[1].reason, std::string("missing event mask"));
    QCOMPARE(result.issues[2].reason, std::string("missing reaction"));
    QCOMPARE(result.issues[3].reason, std::string("unknown event kind IN_NOPE"));
    QVERIFY(!result.hadError);
}

void ConfigParserTests::testFirstDeclarationWins()
{
    const ConfigParseResult result = parseConfigText("/a IN_MODIFY first\n/a IN_ATTRIB second\n");
    QCOMPARE(result.specs.size(), size_t(1));
    QVERIFY(result.specs.front().reaction == Reaction(RunCommand{"first"}));
    QCOMPARE(result.issues.size(), size_t(1));
    QCOMPARE(result.issues.front().lineNumber, 2);
}

void ConfigParserTests::testMissingFile()
{
    const ConfigParseResult result = parseConfigFile("/nonexistent/inreact/test.conf");
    QVERIFY(result.hadError);
    QVERIFY(result.specs.empty());
}

QTEST_MAIN(ConfigParserTests)
#include "test_config_parser.moc"
