#include "agent/agent_loop.hpp"

#include <exception>
#include <iostream>
#include <utility>

#include "agent/action_dispatcher.hpp"
#include "agent/response_parser.hpp"
#include "utils/logging.hpp"

namespace shellpilot::agent {

using shellpilot::utils::Log;
using shellpilot::utils::LogLevel;

const char* ToString(OutcomeKind kind) {
    switch (kind) {
        case OutcomeKind::kCompleted: return "completed";
        case OutcomeKind::kFailureCeiling: return "failure_ceiling";
        case OutcomeKind::kIterationCeiling: return "iteration_ceiling";
    }
    return "unknown";
}

AgentLoop::AgentLoop(
    shellpilot::providers::LLMProvider& provider,
    const shellpilot::exec::CommandExecutor& executor,
    tools::ToolRegistry& tools,
    const ContextBuilder& context,
    AgentLoopOptions options,
    AgentHooks hooks)
    : provider_(provider)
    , executor_(executor)
    , tools_(tools)
    , context_(context)
    , options_(std::move(options))
    , hooks_(std::move(hooks))
    , spinner_(std::cout, options_.show_spinner) {}

AgentOutcome AgentLoop::Run(const std::string& task) {
    Conversation conversation(context_.BuildSystemPrompt());
    conversation.AppendUser(context_.BuildTaskMessage(task));

    FailureTracker tracker(options_.retry);
    ActionDispatcher dispatcher(executor_, tools_, hooks_);

    while (tracker.BeginTurn(options_.max_iterations)) {
        const int step = tracker.State().step;
        auto turn = ObtainDecision(conversation, tracker, step);

        if (turn.status != TurnStatus::kDecision) {
            const bool exhausted = tracker.RecordFailure();
            const auto streak = tracker.State().consecutive_failures;
            if (turn.status == TurnStatus::kInferenceFailed) {
                Notice("Model call failed (" + std::to_string(streak) + "/" +
                       std::to_string(tracker.Policy().max_consecutive_failures) + "): " + turn.raw);
            } else {
                Notice("Could not get valid JSON after " +
                       std::to_string(tracker.Policy().max_parse_retries) + " retries.");
            }
            if (exhausted) {
                AgentOutcome outcome{};
                outcome.kind = OutcomeKind::kFailureCeiling;
                outcome.steps = step;
                outcome.message = "Stopping after " + std::to_string(streak) + " consecutive failures.";
                return outcome;
            }
            if (turn.status == TurnStatus::kParseFailed) {
                conversation.HardReset(context_.BuildReanchorMessage(task));
            }
            continue;
        }

        tracker.RecordSuccess();
        const auto dispatched = dispatcher.Dispatch(*turn.decision, turn.raw, conversation, step);
        if (dispatched.completed) {
            tracker.MarkDone();
            AgentOutcome outcome{};
            outcome.kind = OutcomeKind::kCompleted;
            outcome.steps = step;
            outcome.summary = dispatched.summary;
            outcome.message = "Task complete.";
            return outcome;
        }
    }

    AgentOutcome outcome{};
    outcome.kind = OutcomeKind::kIterationCeiling;
    outcome.steps = tracker.State().step;
    outcome.message = "Reached step limit (" + std::to_string(options_.max_iterations) + ").";
    return outcome;
}

AgentLoop::Turn AgentLoop::ObtainDecision(Conversation& conversation,
                                          const FailureTracker& tracker,
                                          int step) {
    Turn turn{};
    auto response = Generate(conversation, "Thinking [step " + std::to_string(step) + "]");
    if (response.IsError()) {
        turn.status = TurnStatus::kInferenceFailed;
        turn.raw = response.content;
        return turn;
    }
    turn.raw = response.content;
    auto parse = ParseDecision(turn.raw);

    for (int attempt = 0; !parse.Ok() && tracker.ShouldRetryParse(attempt); ++attempt) {
        Notice("Bad JSON (attempt " + std::to_string(attempt + 1) + "/" +
               std::to_string(tracker.Policy().max_parse_retries) + ")...");
        Log(LogLevel::kDebug, "agent", "unparsable reply: " + turn.raw.substr(0, 200));
        conversation.AppendAssistant(turn.raw);
        conversation.AppendUser(context_.BuildRetryMessage(parse.error));
        response = Generate(conversation, "Retrying");
        if (response.IsError()) {
            turn.status = TurnStatus::kInferenceFailed;
            turn.raw = response.content;
            return turn;
        }
        turn.raw = response.content;
        parse = ParseDecision(turn.raw);
    }

    if (!parse.Ok()) {
        turn.status = TurnStatus::kParseFailed;
        return turn;
    }
    turn.status = TurnStatus::kDecision;
    turn.decision = std::move(parse.decision);
    return turn;
}

shellpilot::providers::LLMResponse AgentLoop::Generate(const Conversation& conversation,
                                                       const std::string& label) {
    shellpilot::utils::ScopedSpinner spinner(spinner_, label);
    shellpilot::providers::LLMResponse response;
    try {
        response = provider_.Chat(conversation.Window(options_.history_window), options_.model, options_.chat);
    } catch (const std::exception& ex) {
        return shellpilot::providers::MakeErrorResponse(ex.what());
    }
    if (!response.IsError() && !response.usage.empty()) {
        Log(LogLevel::kDebug, "llm", "tokens prompt=" + std::to_string(response.usage["prompt_tokens"]) +
            " completion=" + std::to_string(response.usage["completion_tokens"]));
    }
    return response;
}

void AgentLoop::Notice(const std::string& message) const {
    if (hooks_.on_notice) {
        hooks_.on_notice(message);
    }
    Log(LogLevel::kInfo, "agent", message);
}

}  // namespace shellpilot::agent
