#include "daemon/daemon_options.hpp"

#include <QCommandLineOption>
#include <QCommandLineParser>

#include "common/process_utils.hpp"

namespace inreact {

namespace {

constexpr const char *kDefaultConfigPath = "/etc/inreact/inreact.conf";

QString pick(const QCommandLineParser &parser, const QCommandLineOption &option,
             const char *envName, const QString &fallback)
{
    if (parser.isSet(option)) {
        return parser.value(option);
    }
    const QString fromEnv = qEnvironmentVariable(envName);
    return fromEnv.isEmpty() ? fallback : fromEnv;
}

} // namespace

DaemonOptionsResult parseDaemonOptions(const QStringList &arguments)
{
    DaemonOptionsResult result;

    QCommandLineParser parser;
    parser.setApplicationDescription(
        QStringLiteral("Runs configured reactions when watched files change."));
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption configOption(
        {QStringLiteral("c"), QStringLiteral("config")},
        QStringLiteral("Root configuration resource."),
        QStringLiteral("path"));
    const QCommandLineOption companionsOption(
        QStringLiteral("companions"),
        QStringLiteral("Companion daemon registry (JSON)."),
        QStringLiteral("path"));
    const QCommandLineOption lockOption(
        QStringLiteral("lock-file"),
        QStringLiteral("Singleton run-lock file."),
        QStringLiteral("path"));
    const QCommandLineOption logDirOption(
        QStringLiteral("log-dir"),
        QStringLiteral("Directory for the structured log."),
        QStringLiteral("path"));
    const QCommandLineOption traceOption(
        QStringLiteral("trace"),
        QStringLiteral("Write debug-level log lines."));
    const QCommandLineOption graceOption(
        QStringLiteral("grace-ms"),
        QStringLiteral("How long a missing path may take to reappear."),
        QStringLiteral("ms"),
        QStringLiteral("250"));

    parser.addOption(configOption);
    parser.addOption(companionsOption);
    parser.addOption(lockOption);
    parser.addOption(logDirOption);
    parser.addOption(traceOption);
    parser.addOption(graceOption);

    // process() exits on --help, --version and parse errors.
    parser.process(arguments);

    DaemonOptions &options = result.options;
    options.configPath = pick(parser, configOption, "INREACT_CONFIG",
                              QString::fromLatin1(kDefaultConfigPath));
    options.companionsPath = pick(parser, companionsOption, "INREACT_COMPANIONS", QString());
    options.lockFilePath = parser.isSet(lockOption) ? parser.value(lockOption)
                                                    : defaultLockFilePath();
    options.logDir = parser.value(logDirOption);
    options.trace = parser.isSet(traceOption)
        || qEnvironmentVariableIntValue("INREACT_TRACE") == 1;

    bool graceOk = false;
    const int grace = parser.value(graceOption).toInt(&graceOk);
    if (!graceOk || grace < 0) {
        result.ok = false;
        result.error = QStringLiteral("--grace-ms expects a non-negative integer");
        return result;
    }
    options.graceMs = grace;

    if (!options.configPath.startsWith(QLatin1Char('/'))) {
        result.ok = false;
        result.error = QStringLiteral("configuration path must be absolute: %1")
                           .arg(options.configPath);
    }
    return result;
}

} // namespace inreact
