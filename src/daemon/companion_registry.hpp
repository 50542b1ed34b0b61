#pragma once

#include <string>
#include <vector>

#include "common/models.hpp"

namespace inreact {

struct CompanionLoadResult {
    std::vector<CompanionDaemon> companions;
    bool hadError = false;
    std::string error;
};

// Reads {"companions": [...]} from path. Entries without a name are skipped.
CompanionLoadResult loadCompanions(const std::string &path);
CompanionLoadResult parseCompanions(const std::string &text);

/**
 * Bootstrap watch entries for autostart companions: the socket path is
 * watched for deletion and the companion executable is the reaction, so a
 * missing socket starts the companion and a vanished one restarts it.
 */
std::vector<WatchSpec> companionBootstrapSpecs(const std::vector<CompanionDaemon> &companions);

// An autostart companion whose socket file exists but accepts no connection
// died and left the file behind; the socket watch alone would never respawn it.
bool companionSocketIsStale(const CompanionDaemon &companion);

// "pgrep -x <process> >/dev/null || exec <executable>" with shell quoting.
std::string companionLaunchCommand(const CompanionDaemon &companion);

} // namespace inreact
