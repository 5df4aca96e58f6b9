#include "providers/ollama_provider.hpp"

#include <algorithm>
#include <cctype>
#include <memory>
#include <sstream>
#include <string>

#include "httplib.h"
#include "nlohmann/json.hpp"
#include "utils/common.hpp"
#include "utils/http_client.hpp"
#include "utils/logging.hpp"

namespace shellpilot::providers {
namespace {

using shellpilot::utils::Log;
using shellpilot::utils::LogLevel;

shellpilot::utils::HttpClientOptions ClientOptions(int timeout_s) {
    shellpilot::utils::HttpClientOptions options{};
    options.timeout_s = timeout_s;
    return options;
}

// Command output and file names are not guaranteed to be UTF-8.
std::string Serialize(const nlohmann::json& payload) {
    return payload.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

nlohmann::json BuildOptions(const ChatOptions& options) {
    return {
        {"temperature", options.temperature},
        {"num_predict", options.num_predict}
    };
}

void ReadUsage(const nlohmann::json& json, LLMResponse& response) {
    if (json.contains("prompt_eval_count") && json["prompt_eval_count"].is_number_integer()) {
        response.usage["prompt_tokens"] = json["prompt_eval_count"].get<int>();
    }
    if (json.contains("eval_count") && json["eval_count"].is_number_integer()) {
        response.usage["completion_tokens"] = json["eval_count"].get<int>();
    }
}

}  // namespace

OllamaProvider::OllamaProvider(std::string api_base,
                               std::string default_model,
                               int timeout_s)
    : api_base_(std::move(api_base))
    , default_model_(std::move(default_model))
    , timeout_s_(timeout_s) {}

std::string OllamaProvider::BuildRequestBody(const std::vector<Message>& messages,
                                             const std::string& model,
                                             const ChatOptions& options,
                                             EndpointMode mode) {
    nlohmann::json payload;
    payload["model"] = model;
    payload["stream"] = false;
    payload["options"] = BuildOptions(options);
    if (mode == EndpointMode::kChat) {
        payload["messages"] = nlohmann::json::array();
        for (const auto& msg : messages) {
            payload["messages"].push_back({{"role", msg.role}, {"content", msg.content}});
        }
    } else {
        payload["prompt"] = FlattenPrompt(messages);
    }
    return Serialize(payload);
}

std::string OllamaProvider::FlattenPrompt(const std::vector<Message>& messages) {
    std::ostringstream prompt;
    for (const auto& msg : messages) {
        std::string tag = msg.role;
        std::transform(tag.begin(), tag.end(), tag.begin(), [](unsigned char c) {
            return static_cast<char>(std::toupper(c));
        });
        prompt << tag << ":\n" << msg.content << "\n\n";
    }
    prompt << "ASSISTANT:";
    return prompt.str();
}

bool OllamaProvider::IsServerRunning() const {
    const auto server = shellpilot::utils::ParseEndpoint(api_base_);
    if (!server.Valid()) {
        return false;
    }
    auto client = shellpilot::utils::MakeHttpClient(server, ClientOptions(2));
    const auto path = server.Resolve("/api/tags");
    auto response = client->Get(path.c_str());
    return response && response->status == 200;
}

std::vector<std::string> OllamaProvider::ListModels() const {
    std::vector<std::string> models;
    const auto server = shellpilot::utils::ParseEndpoint(api_base_);
    if (!server.Valid()) {
        return models;
    }
    auto client = shellpilot::utils::MakeHttpClient(server, ClientOptions(5));
    const auto path = server.Resolve("/api/tags");
    auto response = client->Get(path.c_str());
    if (!response || response->status != 200) {
        return models;
    }
    auto json = nlohmann::json::parse(response->body, nullptr, false);
    if (json.is_discarded() || !json.contains("models") || !json["models"].is_array()) {
        return models;
    }
    for (const auto& entry : json["models"]) {
        if (!entry.is_object()) {
            continue;
        }
        const auto name = entry.value("name", "");
        if (!name.empty()) {
            models.push_back(name);
        }
    }
    return models;
}

EndpointMode OllamaProvider::DetectEndpoint(const std::string& model) {
    const auto cached = endpoint_cache_.find(model);
    if (cached != endpoint_cache_.end()) {
        return cached->second;
    }

    EndpointMode mode = EndpointMode::kGenerate;
    const auto server = shellpilot::utils::ParseEndpoint(api_base_);
    if (server.Valid()) {
        nlohmann::json payload = {
            {"model", model},
            {"messages", nlohmann::json::array({{{"role", "user"}, {"content", "hi"}}})},
            {"stream", false},
            {"options", {{"num_predict", 1}}}
        };
        auto client = shellpilot::utils::MakeHttpClient(server, ClientOptions(20));
        const auto path = server.Resolve("/api/chat");
        auto response = client->Post(path.c_str(), Serialize(payload), "application/json");
        if (response && response->status == 200) {
            mode = EndpointMode::kChat;
        }
    }

    Log(LogLevel::kDebug, "llm", "endpoint model=" + model + " mode=" + ToString(mode));
    endpoint_cache_.emplace(model, mode);
    return mode;
}

LLMResponse OllamaProvider::Chat(
    const std::vector<Message>& messages,
    const std::string& model,
    const ChatOptions& options) {
    const auto chosen_model = model.empty() ? default_model_ : model;
    if (chosen_model.empty()) {
        return MakeErrorResponse("no model selected");
    }

    const auto server = shellpilot::utils::ParseEndpoint(api_base_);
    if (!server.Valid()) {
        return MakeErrorResponse("invalid api base " + api_base_);
    }

    const auto mode = DetectEndpoint(chosen_model);
    const auto endpoint = server.Resolve(mode == EndpointMode::kChat ? "/api/chat" : "/api/generate");
    const auto body = BuildRequestBody(messages, chosen_model, options, mode);

    Log(LogLevel::kDebug, "llm", "POST " + api_base_ + endpoint + " model=" + chosen_model +
        " messages=" + std::to_string(messages.size()));

    auto client = shellpilot::utils::MakeHttpClient(server, ClientOptions(timeout_s_));
    auto response = client->Post(endpoint.c_str(), body, "application/json");
    if (!response) {
        const auto err = response.error();
        const auto err_text = httplib::to_string(err);
        Log(LogLevel::kError, "llm", "request failed: " + err_text);
        return MakeErrorResponse("request failed (" + err_text + ")");
    }
    if (response->status < 200 || response->status >= 300) {
        Log(LogLevel::kError, "llm", "HTTP " + std::to_string(response->status) +
            " body=" + response->body.substr(0, 200));
        return MakeErrorResponse("HTTP " + std::to_string(response->status));
    }

    auto json = nlohmann::json::parse(response->body, nullptr, false);
    if (json.is_discarded() || !json.is_object()) {
        return MakeErrorResponse("invalid response");
    }

    LLMResponse reply{};
    if (mode == EndpointMode::kChat) {
        if (!json.contains("message") || !json["message"].is_object() ||
            !json["message"].contains("content") || !json["message"]["content"].is_string()) {
            return MakeErrorResponse("response has no message content");
        }
        reply.content = shellpilot::utils::Trim(json["message"]["content"].get<std::string>());
    } else {
        if (!json.contains("response") || !json["response"].is_string()) {
            return MakeErrorResponse("response has no completion text");
        }
        reply.content = shellpilot::utils::Trim(json["response"].get<std::string>());
    }

    if (json.contains("done_reason") && json["done_reason"].is_string()) {
        reply.finish_reason = json["done_reason"].get<std::string>();
    }
    ReadUsage(json, reply);
    return reply;
}

}  // namespace shellpilot::providers
