#pragma once

#include <QString>
#include <QStringList>

namespace inreact {

struct DaemonOptions {
    QString configPath;
    QString companionsPath;
    QString lockFilePath;
    QString logDir;
    bool trace = false;
    int graceMs = 250;
};

struct DaemonOptionsResult {
    DaemonOptions options;
    bool ok = true;
    QString error;
};

// Command line first, then INREACT_* environment variables, then defaults.
// Unknown options and --help/--version are handled by QCommandLineParser.
DaemonOptionsResult parseDaemonOptions(const QStringList &arguments);

} // namespace inreact
