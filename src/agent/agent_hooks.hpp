#pragma once

#include <functional>
#include <string>

#include "agent/decision.hpp"
#include "exec/command_executor.hpp"

namespace shellpilot::agent {

// Presentation and human-input callbacks. Every member is optional.
struct AgentHooks {
    std::function<void(int step, const Decision& decision)> on_decision;
    std::function<void(const std::string& command)> on_command_start;
    shellpilot::exec::LineHandler on_output_line;
    std::function<void(const shellpilot::exec::CommandResult& result)> on_command_end;
    // Blocks until the human answers.
    std::function<std::string(const std::string& question)> ask_user;
    std::function<void(const std::string& message)> on_notice;
};

}  // namespace shellpilot::agent
