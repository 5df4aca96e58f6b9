#include <memory>
#include <string>
#include <gtest/gtest.h>
#include "agent/context_builder.hpp"
#include "agent/tools/web.hpp"

namespace {

using shellpilot::agent::ContextBuilder;
using shellpilot::agent::DecisionError;
using shellpilot::agent::EnvironmentInfo;
using shellpilot::agent::tools::RegisterWebTools;
using shellpilot::agent::tools::ToolRegistry;
using shellpilot::config::WebToolsConfig;

EnvironmentInfo FixedEnvironment() {
    EnvironmentInfo info{};
    info.username = "alice";
    info.home = "/home/alice";
    info.hostname = "devbox";
    info.os = "Linux 6.1 x86_64";
    info.shell = "/bin/bash";
    info.cwd = "/home/alice/work";
    return info;
}

TEST(ContextBuilder, SystemPromptCarriesEnvironment) {
    ToolRegistry tools;
    ContextBuilder context(tools, "", FixedEnvironment());
    const auto prompt = context.BuildSystemPrompt();
    EXPECT_NE(prompt.find("{\"action\": \"run\""), std::string::npos);
    EXPECT_NE(prompt.find("home dir : /home/alice"), std::string::npos);
    EXPECT_NE(prompt.find("cwd      : /home/alice/work"), std::string::npos);
    EXPECT_EQ(prompt.find("CUSTOM INSTRUCTIONS"), std::string::npos);
}

TEST(ContextBuilder, WebActionsOnlyWhenToolsRegistered) {
    ToolRegistry none;
    ContextBuilder bare(none, "", FixedEnvironment());
    EXPECT_EQ(bare.BuildSystemPrompt().find("\"action\": \"search\""), std::string::npos);
    EXPECT_EQ(bare.BuildSystemPrompt().find("\"action\": \"fetch\""), std::string::npos);

    ToolRegistry web;
    WebToolsConfig config{};
    config.brave_api_key = "key";
    RegisterWebTools(web, config);
    ContextBuilder full(web, "", FixedEnvironment());
    EXPECT_NE(full.BuildSystemPrompt().find("\"action\": \"search\""), std::string::npos);
    EXPECT_NE(full.BuildSystemPrompt().find("\"action\": \"fetch\""), std::string::npos);
}

TEST(ContextBuilder, AppendsCustomInstructions) {
    ToolRegistry tools;
    ContextBuilder context(tools, "  Never touch /etc.  ", FixedEnvironment());
    const auto prompt = context.BuildSystemPrompt();
    EXPECT_NE(prompt.find("CUSTOM INSTRUCTIONS:\nNever touch /etc."), std::string::npos);
}

TEST(ContextBuilder, TaskAndRecoveryMessages) {
    ToolRegistry tools;
    ContextBuilder context(tools, "", FixedEnvironment());
    EXPECT_EQ(context.BuildTaskMessage("sort photos").rfind("Task: sort photos\n", 0), 0u);
    EXPECT_EQ(context.BuildReanchorMessage("sort photos").rfind("Task (resume): sort photos\n", 0), 0u);
    EXPECT_EQ(context.BuildRetryMessage(DecisionError::kNoObject).rfind("BAD JSON", 0), 0u);
    EXPECT_EQ(context.BuildRetryMessage(DecisionError::kEmptyCommand).rfind("Empty command", 0), 0u);
}

}  // namespace
