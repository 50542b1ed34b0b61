#pragma once

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "common/models.hpp"

namespace inreact {

struct UpsertResult {
    UpsertOutcome outcome = UpsertOutcome::Inserted;
    // Replaced: the entry that was swapped out, still holding its OS handle.
    // Conflict: the owner that kept the path.
    std::optional<WatchEntry> previous;
};

/**
 * WatchRegistry is the in-memory table of watched paths. It never touches
 * the OS; callers own the handle lifecycle of entries they replace or remove.
 */
class WatchRegistry {
public:
    // Conflict when another source owns the path; the existing entry is kept.
    // Same source with identical semantics is Unchanged; otherwise the entry
    // is replaced wholesale and the old one is returned to the caller.
    UpsertResult upsert(const WatchSpec &spec);

    std::optional<WatchEntry> remove(const std::string &path);

    // Pointer stays valid until the entry is removed or replaced.
    WatchEntry *get(const std::string &path);
    const WatchEntry *get(const std::string &path) const;

    WatchEntry *findByHandle(int handle);
    const WatchEntry *findByHandle(int handle) const;

    std::vector<std::string> pathsOwnedBy(const std::string &sourceConfig) const;
    void forEachOwnedBy(const std::string &sourceConfig,
                        const std::function<void(WatchEntry &)> &fn);

    std::vector<std::string> paths() const;
    size_t size() const { return m_entries.size(); }
    bool empty() const { return m_entries.empty(); }

private:
    std::map<std::string, WatchEntry> m_entries;
};

} // namespace inreact
