#include "daemon/watch_registry.hpp"

#include <utility>

namespace inreact {

UpsertResult WatchRegistry::upsert(const WatchSpec &spec)
{
    UpsertResult result;

    auto it = m_entries.find(spec.path);
    if (it == m_entries.end()) {
        m_entries.emplace(spec.path, entryFromSpec(spec));
        result.outcome = UpsertOutcome::Inserted;
        return result;
    }

    WatchEntry &existing = it->second;
    if (existing.sourceConfig != spec.sourceConfig) {
        result.outcome = UpsertOutcome::Conflict;
        result.previous = existing;
        return result;
    }

    if (sameSemantics(existing, spec)) {
        result.outcome = UpsertOutcome::Unchanged;
        return result;
    }

    // Full replace: masks are never patched in place.
    result.outcome = UpsertOutcome::Replaced;
    result.previous = std::move(existing);
    it->second = entryFromSpec(spec);
    return result;
}

std::optional<WatchEntry> WatchRegistry::remove(const std::string &path)
{
    auto it = m_entries.find(path);
    if (it == m_entries.end()) {
        return std::nullopt;
    }
    WatchEntry removed = std::move(it->second);
    m_entries.erase(it);
    return removed;
}

WatchEntry *WatchRegistry::get(const std::string &path)
{
    auto it = m_entries.find(path);
    return it == m_entries.end() ? nullptr : &it->second;
}

const WatchEntry *WatchRegistry::get(const std::string &path) const
{
    auto it = m_entries.find(path);
    return it == m_entries.end() ? nullptr : &it->second;
}

WatchEntry *WatchRegistry::findByHandle(int handle)
{
    for (auto &item : m_entries) {
        if (item.second.watchHandle && *item.second.watchHandle == handle) {
            return &item.second;
        }
    }
    return nullptr;
}

const WatchEntry *WatchRegistry::findByHandle(int handle) const
{
    for (const auto &item : m_entries) {
        if (item.second.watchHandle && *item.second.watchHandle == handle) {
            return &item.second;
        }
    }
    return nullptr;
}

std::vector<std::string> WatchRegistry::pathsOwnedBy(const std::string &sourceConfig) const
{
    std::vector<std::string> owned;
    for (const auto &item : m_entries) {
        if (item.second.sourceConfig == sourceConfig) {
            owned.push_back(item.first);
        }
    }
    return owned;
}

void WatchRegistry::forEachOwnedBy(const std::string &sourceConfig,
                                   const std::function<void(WatchEntry &)> &fn)
{
    for (auto &item : m_entries) {
        if (item.second.sourceConfig == sourceConfig) {
            fn(item.second);
        }
    }
}

std::vector<std::string> WatchRegistry::paths() const
{
    std::vector<std::string> all;
    all.reserve(m_entries.size());
    for (const auto &item : m_entries) {
        all.push_back(item.first);
    }
    return all;
}

} // namespace inreact
