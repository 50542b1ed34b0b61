#pragma once

#include <optional>
#include <string>
#include <vector>

#include "daemon/action_executor.hpp"

namespace inreact::testing {

// Records every request and hands out ids; the test decides when and how a
// worker finishes.
class FakeActionExecutor : public ActionExecutor
{
public:
    struct Request {
        WorkerId id = 0;
        std::string kind;
        std::string target;
        std::string payload;
    };

    std::optional<WorkerId> runCommand(const std::string &commandLine) override
    {
        return record("command", commandLine, std::string());
    }

    std::optional<WorkerId> forwardToDaemon(const std::string &daemon,
                                            const std::string &payload) override
    {
        return record("forward", daemon, payload);
    }

    void finish(WorkerId id, int exitCode = 0)
    {
        emit workerFinished(id, exitCode);
    }

    const Request &last() const { return requests.back(); }

    std::vector<Request> requests;
    bool refuse = false;
    WorkerId nextId = 100;

private:
    std::optional<WorkerId> record(const std::string &kind, const std::string &target,
                                   const std::string &payload)
    {
        if (refuse) {
            return std::nullopt;
        }
        const WorkerId id = nextId++;
        requests.push_back(Request{id, kind, target, payload});
        return id;
    }
};

} // namespace inreact::testing
