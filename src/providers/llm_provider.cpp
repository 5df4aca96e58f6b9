#include "providers/llm_provider.hpp"

#include "utils/common.hpp"

namespace shellpilot::providers {

LLMResponse MakeErrorResponse(const std::string& message) {
    LLMResponse response{};
    response.content = "Error calling LLM: " + message;
    response.finish_reason = "error";
    return response;
}

std::string SelectModel(const std::vector<std::string>& installed) {
    static const std::vector<std::string> kPreferred = {
        "llama3",
        "mistral",
        "gemma",
        "phi",
        "qwen"
    };
    for (const auto& preferred : kPreferred) {
        for (const auto& model : installed) {
            if (shellpilot::utils::ToLower(model).find(preferred) != std::string::npos) {
                return model;
            }
        }
    }
    return installed.empty() ? std::string() : installed.front();
}

}  // namespace shellpilot::providers
