#pragma once

#include <QProcess>
#include <QString>
#include <QStringList>

namespace inreact {

bool isPrivileged();

bool isProcessRunning(const QString &processName);
bool isSocketReachable(const QString &socketPath);

// The daemon blocks its operator signals; children start with an empty mask.
void resetChildSignalMask(QProcess &process);

bool spawnDetached(const QString &executable, const QStringList &args = {});

// Starts a fresh copy of the running binary with the same arguments.
bool spawnReplacementInstance();

QString defaultLockFilePath();

} // namespace inreact
