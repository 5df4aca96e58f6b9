#pragma once

#include <string>
#include <unordered_map>

namespace shellpilot::agent::tools {

class Tool {
public:
    virtual ~Tool() = default;
    virtual std::string Name() const = 0;
    virtual std::string Description() const = 0;
    // Failures are reported in-band as "Error: ..." text.
    virtual std::string Execute(const std::unordered_map<std::string, std::string>& params) = 0;
};

inline bool IsToolError(const std::string& result) {
    return result.rfind("Error:", 0) == 0;
}

}  // namespace shellpilot::agent::tools
