#include <chrono>
#include <utility>
#include <deque>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "agent/agent_loop.hpp"
#include "providers/ollama_provider.hpp"

namespace {

using shellpilot::agent::AgentHooks;
using shellpilot::agent::AgentLoop;
using shellpilot::agent::AgentLoopOptions;
using shellpilot::agent::ContextBuilder;
using shellpilot::agent::EnvironmentInfo;
using shellpilot::agent::OutcomeKind;
using shellpilot::agent::tools::ToolRegistry;
using shellpilot::exec::CommandExecutor;
using shellpilot::exec::CommandResult;
using shellpilot::exec::ExecOptions;
using shellpilot::providers::ChatOptions;
using shellpilot::providers::LLMProvider;
using shellpilot::providers::LLMResponse;
using shellpilot::providers::MakeErrorResponse;
using shellpilot::providers::Message;

// Replays a fixed list of replies and records every request it receives.
class ScriptedProvider : public LLMProvider {
public:
    explicit ScriptedProvider(std::vector<LLMResponse> replies)
        : replies_(replies.begin(), replies.end()) {}

    LLMResponse Chat(const std::vector<Message>& messages,
                     const std::string&,
                     const ChatOptions&) override {
        requests.push_back(messages);
        if (serialize_as_ollama) {
            bodies.push_back(shellpilot::providers::OllamaProvider::BuildRequestBody(
                messages, "fake", ChatOptions{}, shellpilot::providers::EndpointMode::kChat));
        }
        if (replies_.empty()) {
            return Reply(fallback);
        }
        auto reply = replies_.front();
        replies_.pop_front();
        return reply;
    }

    std::string GetDefaultModel() const override { return "fake"; }

    static LLMResponse Reply(const std::string& content) {
        LLMResponse response{};
        response.content = content;
        return response;
    }

    std::vector<std::vector<Message>> requests;
    std::vector<std::string> bodies;
    bool serialize_as_ollama = false;
    std::string fallback = "not json at all";

private:
    std::deque<LLMResponse> replies_;
};

EnvironmentInfo FixedEnvironment() {
    EnvironmentInfo info{};
    info.username = "tester";
    info.home = "/home/tester";
    info.hostname = "box";
    info.os = "Linux";
    info.shell = "/bin/sh";
    info.cwd = "/tmp";
    return info;
}

ExecOptions TmpExecOptions() {
    ExecOptions options{};
    options.working_dir = "/tmp";
    options.timeout = std::chrono::seconds(10);
    return options;
}

struct Harness {
    explicit Harness(std::vector<LLMResponse> replies)
        : provider(std::move(replies))
        , executor(TmpExecOptions())
        , context(tools, "", FixedEnvironment()) {}

    AgentLoop MakeLoop(int max_iterations = 60) {
        AgentLoopOptions options{};
        options.model = "fake";
        options.max_iterations = max_iterations;
        hooks.on_command_end = [this](const CommandResult& result) { results.push_back(result); };
        return AgentLoop(provider, executor, tools, context, options, hooks);
    }

    ScriptedProvider provider;
    ToolRegistry tools;
    CommandExecutor executor;
    ContextBuilder context;
    AgentHooks hooks;
    std::vector<CommandResult> results;
};

LLMResponse Reply(const std::string& content) {
    return ScriptedProvider::Reply(content);
}

TEST(AgentLoop, CompletesAfterRunThenDone) {
    Harness harness({
        Reply(R"({"action":"run","command":"echo step-one","reason":"start"})"),
        Reply(R"({"action":"done","summary":"finished"})")
    });
    auto loop = harness.MakeLoop();
    const auto outcome = loop.Run("print something");

    EXPECT_EQ(outcome.kind, OutcomeKind::kCompleted);
    EXPECT_TRUE(outcome.Succeeded());
    EXPECT_EQ(outcome.steps, 2);
    EXPECT_EQ(outcome.summary, "finished");
    ASSERT_EQ(harness.results.size(), 1u);
    EXPECT_EQ(harness.results[0].output, "step-one");

    ASSERT_EQ(harness.provider.requests.size(), 2u);
    const auto& first = harness.provider.requests[0];
    ASSERT_EQ(first.size(), 2u);
    EXPECT_EQ(first[0].role, "system");
    EXPECT_EQ(first[1].content.rfind("Task: print something", 0), 0u);
    const auto& second = harness.provider.requests[1];
    EXPECT_EQ(second.back().role, "user");
    EXPECT_EQ(second.back().content.rfind("RESULT: SUCCESS", 0), 0u);
}

TEST(AgentLoop, PermanentGarbageHitsFailureCeiling) {
    Harness harness(std::vector<LLMResponse>{});
    auto loop = harness.MakeLoop();
    const auto outcome = loop.Run("anything");

    EXPECT_EQ(outcome.kind, OutcomeKind::kFailureCeiling);
    EXPECT_EQ(outcome.steps, 3);
    // Three turns of one attempt plus five retries each.
    EXPECT_EQ(harness.provider.requests.size(), 18u);
    EXPECT_TRUE(harness.results.empty());
}

TEST(AgentLoop, HardResetReanchorsAfterParseFailure) {
    std::vector<LLMResponse> replies(6, Reply("still not json"));
    replies.push_back(Reply(R"({"action":"done","summary":"ok"})"));
    Harness harness(replies);
    auto loop = harness.MakeLoop();
    const auto outcome = loop.Run("tidy downloads");

    EXPECT_EQ(outcome.kind, OutcomeKind::kCompleted);
    EXPECT_EQ(outcome.steps, 2);
    ASSERT_EQ(harness.provider.requests.size(), 7u);
    const auto& retry = harness.provider.requests[1];
    EXPECT_EQ(retry.back().content.rfind("BAD JSON", 0), 0u);
    const auto& after_reset = harness.provider.requests[6];
    ASSERT_EQ(after_reset.size(), 2u);
    EXPECT_EQ(after_reset[1].content.rfind("Task (resume): tidy downloads", 0), 0u);
}

TEST(AgentLoop, EmptyCommandGetsItsOwnCorrection) {
    Harness harness({
        Reply(R"({"action":"run","command":"","reason":"?"})"),
        Reply(R"({"action":"done","summary":"ok"})")
    });
    auto loop = harness.MakeLoop();
    const auto outcome = loop.Run("x");

    EXPECT_EQ(outcome.kind, OutcomeKind::kCompleted);
    EXPECT_EQ(outcome.steps, 1);
    ASSERT_EQ(harness.provider.requests.size(), 2u);
    EXPECT_EQ(harness.provider.requests[1].back().content.rfind("Empty command.", 0), 0u);
}

TEST(AgentLoop, AnswerReachesNextRequest) {
    Harness harness({
        Reply(R"({"action":"ask","question":"Which directory?"})"),
        Reply(R"({"action":"done","summary":"used /tmp"})")
    });
    std::string asked;
    harness.hooks.ask_user = [&](const std::string& question) {
        asked = question;
        return std::string("/tmp");
    };
    auto loop = harness.MakeLoop();
    const auto outcome = loop.Run("clean a directory");

    EXPECT_EQ(asked, "Which directory?");
    EXPECT_EQ(outcome.kind, OutcomeKind::kCompleted);
    ASSERT_EQ(harness.provider.requests.size(), 2u);
    const auto& next = harness.provider.requests[1];
    EXPECT_EQ(next[next.size() - 2].role, "assistant");
    EXPECT_EQ(next.back().content.rfind("/tmp\n\nContinue task now.", 0), 0u);
}

TEST(AgentLoop, StopsAtIterationCeiling) {
    Harness harness(std::vector<LLMResponse>{});
    harness.provider.fallback = R"({"action":"run","command":"true","reason":"loop"})";
    auto loop = harness.MakeLoop(4);
    const auto outcome = loop.Run("never ends");

    EXPECT_EQ(outcome.kind, OutcomeKind::kIterationCeiling);
    EXPECT_EQ(outcome.steps, 4);
    EXPECT_EQ(harness.results.size(), 4u);
}

TEST(AgentLoop, InferenceErrorsCountWithoutReset) {
    Harness harness({
        MakeErrorResponse("connection refused"),
        MakeErrorResponse("connection refused"),
        MakeErrorResponse("connection refused")
    });
    std::vector<std::string> notices;
    harness.hooks.on_notice = [&](const std::string& message) { notices.push_back(message); };
    auto loop = harness.MakeLoop();
    const auto outcome = loop.Run("x");

    EXPECT_EQ(outcome.kind, OutcomeKind::kFailureCeiling);
    EXPECT_EQ(harness.provider.requests.size(), 3u);
    ASSERT_EQ(notices.size(), 3u);
    EXPECT_NE(notices[0].find("Model call failed (1/3)"), std::string::npos);
    // No hard reset between failed calls: the task message stays in place.
    EXPECT_EQ(harness.provider.requests[2][1].content.rfind("Task: x", 0), 0u);
}

TEST(AgentLoop, SuccessResetsFailureStreak) {
    Harness harness({
        MakeErrorResponse("timeout"),
        MakeErrorResponse("timeout"),
        Reply(R"({"action":"run","command":"true","reason":"ok"})"),
        MakeErrorResponse("timeout"),
        MakeErrorResponse("timeout"),
        Reply(R"({"action":"done","summary":"done"})")
    });
    auto loop = harness.MakeLoop();
    const auto outcome = loop.Run("x");
    EXPECT_EQ(outcome.kind, OutcomeKind::kCompleted);
    EXPECT_EQ(outcome.steps, 6);
}

TEST(AgentLoop, NonUtf8CommandOutputKeepsRunGoing) {
    Harness harness({
        Reply(R"({"action":"run","command":"printf 'caf\\351\\n'","reason":"latin-1"})"),
        Reply(R"({"action":"done","summary":"printed"})")
    });
    harness.provider.serialize_as_ollama = true;
    auto loop = harness.MakeLoop();
    const auto outcome = loop.Run("print a latin-1 word");

    EXPECT_EQ(outcome.kind, OutcomeKind::kCompleted);
    EXPECT_EQ(outcome.steps, 2);
    ASSERT_EQ(harness.provider.bodies.size(), 2u);
    EXPECT_NE(harness.provider.bodies[1].find("caf\xEF\xBF\xBD"), std::string::npos);
}

}  // namespace
