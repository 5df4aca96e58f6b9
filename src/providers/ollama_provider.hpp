#pragma once

#include <string>
#include <unordered_map>
#include <vector>

#include "providers/llm_provider.hpp"

namespace shellpilot::providers {

enum class EndpointMode {
    kChat,
    kGenerate
};

inline const char* ToString(EndpointMode mode) {
    return mode == EndpointMode::kChat ? "chat" : "generate";
}

class OllamaProvider : public LLMProvider {
public:
    OllamaProvider(std::string api_base,
                   std::string default_model,
                   int timeout_s);

    LLMResponse Chat(
        const std::vector<Message>& messages,
        const std::string& model,
        const ChatOptions& options) override;

    std::string GetDefaultModel() const override { return default_model_; }
    void SetDefaultModel(std::string model) { default_model_ = std::move(model); }

    bool IsServerRunning() const;
    std::vector<std::string> ListModels() const;

    // Probes /api/chat once per model; the answer is cached for the
    // lifetime of the provider.
    EndpointMode DetectEndpoint(const std::string& model);

    // Request JSON for /api/chat or /api/generate. Invalid UTF-8 in message
    // text is replaced with U+FFFD instead of failing the request.
    static std::string BuildRequestBody(const std::vector<Message>& messages,
                                        const std::string& model,
                                        const ChatOptions& options,
                                        EndpointMode mode);

    // Renders messages as "ROLE:\ncontent" blocks for /api/generate.
    static std::string FlattenPrompt(const std::vector<Message>& messages);

private:
    std::string api_base_;
    std::string default_model_;
    int timeout_s_ = 180;
    std::unordered_map<std::string, EndpointMode> endpoint_cache_;
};

}  // namespace shellpilot::providers
