#pragma once

#include <string>

#include "agent/tools/tool.hpp"
#include "agent/tools/tool_registry.hpp"
#include "config/config_schema.hpp"

namespace shellpilot::agent::tools {

class WebSearchTool : public Tool {
public:
    explicit WebSearchTool(std::string api_key);

    std::string Name() const override { return "web_search"; }
    std::string Description() const override { return "Search the web (Brave Search API)."; }
    std::string Execute(const std::unordered_map<std::string, std::string>& params) override;

private:
    std::string api_key_;
};

class WebFetchTool : public Tool {
public:
    std::string Name() const override { return "web_fetch"; }
    std::string Description() const override { return "Fetch a URL as plain text."; }
    std::string Execute(const std::unordered_map<std::string, std::string>& params) override;
};

// Registers the web tools this session can offer. A tool that is not
// registered is reported to the model as unavailable.
void RegisterWebTools(ToolRegistry& registry, const shellpilot::config::WebToolsConfig& config);

std::string StripHtml(const std::string& input);

}  // namespace shellpilot::agent::tools
