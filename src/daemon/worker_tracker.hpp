#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <QString>

#include "common/models.hpp"

namespace inreact {

struct WorkerRecord {
    std::string path;
    WorkerReason reason = WorkerReason::Event;
    QString correlationId;
    std::chrono::system_clock::time_point startedAt;
    // Only this suspension of the path may be ended by the worker.
    std::uint64_t suspension = 0;
};

/**
 * WorkerTracker maps in-flight worker ids to the path whose reaction they
 * execute. Ids are opaque executor-issued numbers, not process ids.
 */
class WorkerTracker {
public:
    void track(WorkerId id, WorkerRecord record);

    // Removes and returns the record; nullopt means the id was never tracked.
    std::optional<WorkerRecord> release(WorkerId id);

    bool hasWorkerFor(const std::string &path) const;
    size_t size() const { return m_workers.size(); }

    std::vector<std::pair<WorkerId, WorkerRecord>> snapshot() const;

private:
    std::map<WorkerId, WorkerRecord> m_workers;
};

} // namespace inreact
