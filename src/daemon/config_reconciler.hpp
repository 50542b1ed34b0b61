#pragma once

#include <cstdint>
#include <map>
#include <set>
#include <string>

#include "daemon/reaction_dispatcher.hpp"
#include "daemon/watch_manager.hpp"

namespace inreact {

// A configuration smaller than this is treated as retracted, not as empty.
inline constexpr std::uint64_t kRetractedConfigBytes = 4;

// Events that make the root configuration reload itself.
inline constexpr std::uint32_t kConfigWatchMask =
    mask::CloseWrite | mask::MoveSelf | mask::DeleteSelf;

struct ReconcileReport {
    std::string configPath;
    int added = 0;
    int updated = 0;
    int unchanged = 0;
    int removed = 0;
    int conflicts = 0;
    int skippedLines = 0;
    // The resource was missing or truncated; everything it owned was removed.
    bool retracted = false;
    // Load was refused (cycle) or the file could not be read.
    bool refused = false;

    int mutations() const { return added + updated + removed; }
};

/**
 * ConfigReconciler turns the contents of a configuration resource into
 * registry state. Reloading the same contents is a no-op; entries the
 * resource no longer declares are removed.
 *
 * A LOAD_CONF entry that pulled a nested configuration in is recorded as one
 * of its loaders. The nested configuration is retracted when its last loader
 * goes away; entries that merely reload the root or a configuration further
 * up the load chain are not loaders.
 */
class ConfigReconciler : public DirectiveHandler
{
public:
    explicit ConfigReconciler(WatchManager &manager);

    // Watches the root configuration (owned by bootstrap) and loads it.
    ReconcileReport loadRoot(const std::string &configPath);

    ReconcileReport reconcile(const std::string &configPath);

    // Removes every entry owned by configPath. Returns the number removed.
    int retract(const std::string &configPath);

    // DirectiveHandler
    bool loadConfig(const std::string &configPath, const std::string &owner) override;
    bool setWatch(const std::string &specLine, const std::string &owner) override;

    // Entry paths whose LOAD_CONF pulled configPath in.
    std::set<std::string> loadersOf(const std::string &configPath) const;

private:
    bool removeWithCascade(const std::string &path);
    void releaseLoader(const std::string &loader, const std::string &target);


    WatchManager &m_manager;
    // Configurations currently being reconciled; guards LOAD_CONF cycles.
    std::set<std::string> m_loading;
    std::string m_root;
    std::map<std::string, std::set<std::string>> m_loaders;
};

} // namespace inreact
