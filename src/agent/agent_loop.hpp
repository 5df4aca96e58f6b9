#pragma once

#include <cstddef>
#include <optional>
#include <string>

#include "agent/agent_hooks.hpp"
#include "agent/context_builder.hpp"
#include "agent/conversation.hpp"
#include "agent/decision.hpp"
#include "agent/retry_policy.hpp"
#include "agent/tools/tool_registry.hpp"
#include "exec/command_executor.hpp"
#include "providers/llm_provider.hpp"
#include "utils/spinner.hpp"

namespace shellpilot::agent {

enum class OutcomeKind {
    kCompleted,
    kFailureCeiling,
    kIterationCeiling
};

const char* ToString(OutcomeKind kind);

struct AgentOutcome {
    OutcomeKind kind = OutcomeKind::kIterationCeiling;
    int steps = 0;
    std::string summary;
    std::string message;

    bool Succeeded() const { return kind == OutcomeKind::kCompleted; }
};

struct AgentLoopOptions {
    std::string model;
    int max_iterations = 60;
    std::size_t history_window = 16;
    RetryPolicy retry;
    shellpilot::providers::ChatOptions chat;
    bool show_spinner = false;
};

class AgentLoop {
public:
    AgentLoop(
        shellpilot::providers::LLMProvider& provider,
        const shellpilot::exec::CommandExecutor& executor,
        tools::ToolRegistry& tools,
        const ContextBuilder& context,
        AgentLoopOptions options,
        AgentHooks hooks = {});

    // Drives one task to a terminal state. Never throws for model or command
    // failures; those end up in the outcome.
    AgentOutcome Run(const std::string& task);

private:
    enum class TurnStatus {
        kDecision,
        kParseFailed,
        kInferenceFailed
    };

    struct Turn {
        TurnStatus status = TurnStatus::kParseFailed;
        std::optional<Decision> decision;
        std::string raw;
    };

    Turn ObtainDecision(Conversation& conversation, const FailureTracker& tracker, int step);
    shellpilot::providers::LLMResponse Generate(const Conversation& conversation, const std::string& label);
    void Notice(const std::string& message) const;

    shellpilot::providers::LLMProvider& provider_;
    const shellpilot::exec::CommandExecutor& executor_;
    tools::ToolRegistry& tools_;
    const ContextBuilder& context_;
    AgentLoopOptions options_;
    AgentHooks hooks_;
    shellpilot::utils::Spinner spinner_;
};

}  // namespace shellpilot::agent
