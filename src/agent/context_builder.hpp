#pragma once

#include <string>

#include "agent/response_parser.hpp"
#include "agent/tools/tool_registry.hpp"

namespace shellpilot::agent {

struct EnvironmentInfo {
    std::string username;
    std::string home;
    std::string hostname;
    std::string os;
    std::string shell;
    std::string cwd;

    static EnvironmentInfo Detect();
};

// Builds the fixed texts of a run: the system prompt and the user messages
// that open, re-anchor and correct the conversation.
class ContextBuilder {
public:
    ContextBuilder(const tools::ToolRegistry& tools,
                   std::string custom_instructions,
                   EnvironmentInfo environment = EnvironmentInfo::Detect());

    std::string BuildSystemPrompt() const;
    std::string BuildTaskMessage(const std::string& task) const;
    std::string BuildReanchorMessage(const std::string& task) const;
    std::string BuildRetryMessage(DecisionError error) const;

private:
    const tools::ToolRegistry& tools_;
    std::string custom_instructions_;
    EnvironmentInfo environment_;

    std::string BuildEnvironmentBlock() const;
};

}  // namespace shellpilot::agent
