#include "agent/tools/tool_registry.hpp"

#include <algorithm>
#include <iterator>

#include "utils/logging.hpp"

namespace shellpilot::agent::tools {

void ToolRegistry::Register(std::unique_ptr<Tool> tool) {
    if (!tool) {
        return;
    }
    const auto name = tool->Name();
    shellpilot::utils::Log(shellpilot::utils::LogLevel::kDebug, "tool", "registered " + name);
    tools_[name] = std::move(tool);
}

Tool* ToolRegistry::Get(const std::string& name) {
    const auto found = tools_.find(name);
    return found == tools_.end() ? nullptr : found->second.get();
}

bool ToolRegistry::Has(const std::string& name) const {
    return tools_.count(name) > 0;
}

std::string ToolRegistry::Execute(
    const std::string& name,
    const std::unordered_map<std::string, std::string>& params) {
    Tool* tool = Get(name);
    if (tool == nullptr) {
        return "Error: no tool named " + name;
    }
    const auto output = tool->Execute(params);
    shellpilot::utils::Log(shellpilot::utils::LogLevel::kDebug, "tool",
                           name + " returned " + std::to_string(output.size()) + " bytes" +
                           (IsToolError(output) ? " (error)" : ""));
    return output;
}

std::vector<std::string> ToolRegistry::List() const {
    std::vector<std::string> names;
    names.reserve(tools_.size());
    std::transform(tools_.begin(), tools_.end(), std::back_inserter(names),
                   [](const auto& entry) { return entry.first; });
    std::sort(names.begin(), names.end());
    return names;
}

}  // namespace shellpilot::agent::tools
