#pragma once

#include <string>
#include <unordered_map>
#include <vector>

namespace shellpilot::providers {

struct Message {
    std::string role;
    std::string content;
};

struct ChatOptions {
    double temperature = 0.05;
    int num_predict = 400;
};

struct LLMResponse {
    std::string content;
    std::string finish_reason = "stop";
    std::unordered_map<std::string, int> usage;

    bool IsError() const { return finish_reason == "error"; }
};

class LLMProvider {
public:
    virtual ~LLMProvider() = default;
    virtual LLMResponse Chat(
        const std::vector<Message>& messages,
        const std::string& model,
        const ChatOptions& options) = 0;
    virtual std::string GetDefaultModel() const = 0;
};

LLMResponse MakeErrorResponse(const std::string& message);

// Picks the first installed model matching the preference order, falling back
// to the first installed model. Returns an empty string when none are installed.
std::string SelectModel(const std::vector<std::string>& installed);

}  // namespace shellpilot::providers
