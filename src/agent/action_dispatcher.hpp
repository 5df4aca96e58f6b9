#pragma once

#include <cstdint>
#include <string>

#include "agent/agent_hooks.hpp"
#include "agent/conversation.hpp"
#include "agent/decision.hpp"
#include "agent/tools/tool_registry.hpp"
#include "exec/command_executor.hpp"

namespace shellpilot::agent {

enum class RunClassification {
    kSuccess,
    kFailure,
    kInteractive,
    kSuspectDownload
};

struct RunAssessment {
    RunClassification kind = RunClassification::kSuccess;
    std::string download_path;
    std::uintmax_t download_size = 0;
};

struct DispatchResult {
    bool completed = false;
    std::string summary;
};

// Carries out one validated decision and appends the raw decision text and
// the resulting feedback to the conversation.
class ActionDispatcher {
public:
    ActionDispatcher(const shellpilot::exec::CommandExecutor& executor,
                     tools::ToolRegistry& tools,
                     const AgentHooks& hooks);

    DispatchResult Dispatch(const Decision& decision,
                            const std::string& raw,
                            Conversation& conversation,
                            int step);

    static RunAssessment AssessRun(const std::string& command,
                                   const shellpilot::exec::CommandResult& result,
                                   const std::string& working_dir);
    static std::string BuildRunFeedback(const std::string& command,
                                        const shellpilot::exec::CommandResult& result,
                                        const RunAssessment& assessment);

private:
    std::string HandleRun(const RunAction& action);
    std::string HandleAsk(const AskAction& action);
    std::string HandleSearch(const SearchAction& action);
    std::string HandleFetch(const FetchAction& action);

    const shellpilot::exec::CommandExecutor& executor_;
    tools::ToolRegistry& tools_;
    const AgentHooks& hooks_;
};

}  // namespace shellpilot::agent
