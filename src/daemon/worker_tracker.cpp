#include "daemon/worker_tracker.hpp"

#include <utility>

namespace inreact {

void WorkerTracker::track(WorkerId id, WorkerRecord record)
{
    m_workers[id] = std::move(record);
}

std::optional<WorkerRecord> WorkerTracker::release(WorkerId id)
{
    auto it = m_workers.find(id);
    if (it == m_workers.end()) {
        return std::nullopt;
    }
    WorkerRecord record = std::move(it->second);
    m_workers.erase(it);
    return record;
}

bool WorkerTracker::hasWorkerFor(const std::string &path) const
{
    for (const auto &item : m_workers) {
        if (item.second.path == path) {
            return true;
        }
    }
    return false;
}

std::vector<std::pair<WorkerId, WorkerRecord>> WorkerTracker::snapshot() const
{
    return {m_workers.begin(), m_workers.end()};
}

} // namespace inreact
