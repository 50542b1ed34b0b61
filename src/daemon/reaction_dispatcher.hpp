#pragma once

#include <string>
#include <vector>

#include "common/models.hpp"
#include "daemon/action_executor.hpp"

namespace inreact {

// Internal directives run in-process; implemented by ConfigReconciler.
class DirectiveHandler {
public:
    virtual ~DirectiveHandler() = default;

    virtual bool loadConfig(const std::string &configPath, const std::string &owner) = 0;
    virtual bool setWatch(const std::string &specLine, const std::string &owner) = 0;
};

enum class FireStatus {
    // A worker is running; completion arrives through the executor.
    Spawned,
    // Ran to completion inline.
    Completed,
    Failed
};

struct FireResult {
    FireStatus status = FireStatus::Failed;
    WorkerId worker = 0;
};

/**
 * ReactionDispatcher decides how a reaction runs: commands and forwards go to
 * the ActionExecutor, directives to the DirectiveHandler.
 */
class ReactionDispatcher {
public:
    explicit ReactionDispatcher(ActionExecutor &executor);

    void setDirectiveHandler(DirectiveHandler *handler) { m_directives = handler; }

    // Extra args are appended (shell-quoted for commands, space-joined for forwards).
    FireResult fire(const WatchEntry &entry, const std::vector<std::string> &args = {});

private:
    ActionExecutor &m_executor;
    DirectiveHandler *m_directives = nullptr;
};

std::string shellQuote(const std::string &arg);

} // namespace inreact
