#include "agent/tools/web.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <memory>
#include <sstream>

#include "httplib.h"
#include "nlohmann/json.hpp"
#include "utils/common.hpp"
#include "utils/http_client.hpp"
#include "utils/logging.hpp"

namespace shellpilot::agent::tools {
namespace {

using shellpilot::utils::Endpoint;
using shellpilot::utils::HttpClientOptions;

constexpr const char* kBraveSearchUrl = "https://api.search.brave.com/res/v1/web/search";
constexpr std::size_t kDefaultFetchBytes = 4000;

std::string PercentEncode(const std::string& value) {
    std::string encoded;
    encoded.reserve(value.size() * 3);
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            encoded.push_back(static_cast<char>(c));
            continue;
        }
        char hex[4];
        std::snprintf(hex, sizeof(hex), "%%%02X", c);
        encoded += hex;
    }
    return encoded;
}

std::string ClipText(const std::string& text, std::size_t limit) {
    if (text.size() <= limit) {
        return text;
    }
    return shellpilot::utils::Head(text, limit) + "\n[... truncated ...]";
}

HttpClientOptions WebClientOptions(int timeout_s) {
    HttpClientOptions options{};
    options.timeout_s = timeout_s;
    options.follow_redirects = true;
    options.use_env_proxy = true;
    return options;
}

std::string FormatSearchResults(const nlohmann::json& body, std::size_t limit) {
    if (!body.contains("web") || !body["web"].is_object() ||
        !body["web"].contains("results") || !body["web"]["results"].is_array()) {
        return {};
    }
    std::ostringstream oss;
    std::size_t shown = 0;
    for (const auto& hit : body["web"]["results"]) {
        if (shown == limit) {
            break;
        }
        if (!hit.is_object()) {
            continue;
        }
        const auto title = hit.value("title", std::string());
        const auto url = hit.value("url", std::string());
        if (url.empty()) {
            continue;
        }
        ++shown;
        oss << shown << ". " << (title.empty() ? url : StripHtml(title)) << "\n   " << url << "\n";
        const auto snippet = StripHtml(hit.value("description", std::string()));
        if (!snippet.empty()) {
            oss << "   " << snippet << "\n";
        }
    }
    return oss.str();
}

}  // namespace

std::string StripHtml(const std::string& input) {
    std::string text;
    text.reserve(input.size());
    bool inside_tag = false;
    bool pending_space = false;
    for (char ch : input) {
        if (ch == '<') {
            inside_tag = true;
            pending_space = true;
        } else if (ch == '>') {
            inside_tag = false;
            pending_space = true;
        } else if (inside_tag) {
            continue;
        } else if (std::isspace(static_cast<unsigned char>(ch))) {
            pending_space = true;
        } else {
            if (pending_space && !text.empty()) {
                text.push_back(' ');
            }
            pending_space = false;
            text.push_back(ch);
        }
    }
    return text;
}

WebSearchTool::WebSearchTool(std::string api_key)
    : api_key_(std::move(api_key)) {}

std::string WebSearchTool::Execute(const std::unordered_map<std::string, std::string>& params) {
    const auto query = params.find("query");
    if (query == params.end() || shellpilot::utils::Trim(query->second).empty()) {
        return "Error: missing query";
    }
    if (api_key_.empty()) {
        return "Error: no search API key configured";
    }

    std::size_t limit = 5;
    if (const auto count = params.find("count"); count != params.end()) {
        try {
            limit = std::clamp<std::size_t>(std::stoul(count->second), 1, 10);
        } catch (const std::exception&) {
            limit = 5;
        }
    }

    const auto endpoint = shellpilot::utils::ParseEndpoint(kBraveSearchUrl);
    auto client = shellpilot::utils::MakeHttpClient(endpoint, WebClientOptions(15));
    const auto target = endpoint.Target() + "?q=" + PercentEncode(query->second) +
        "&count=" + std::to_string(limit);
    const httplib::Headers headers{
        {"Accept", "application/json"},
        {"X-Subscription-Token", api_key_}
    };
    shellpilot::utils::Log(shellpilot::utils::LogLevel::kDebug, "web", "search q=" + query->second);

    auto response = client->Get(target.c_str(), headers);
    if (!response) {
        return "Error: search request failed (" + httplib::to_string(response.error()) + ")";
    }
    if (response->status != 200) {
        return "Error: search returned HTTP " + std::to_string(response->status);
    }
    const auto body = nlohmann::json::parse(response->body, nullptr, false);
    if (body.is_discarded()) {
        return "Error: search returned invalid JSON";
    }
    const auto formatted = FormatSearchResults(body, limit);
    return formatted.empty() ? "No results." : formatted;
}

std::string WebFetchTool::Execute(const std::unordered_map<std::string, std::string>& params) {
    const auto url = params.find("url");
    if (url == params.end() || shellpilot::utils::Trim(url->second).empty()) {
        return "Error: missing url";
    }
    const auto endpoint = shellpilot::utils::ParseEndpoint(url->second);
    if (!endpoint.Valid()) {
        return "Error: invalid url " + url->second;
    }

    std::size_t limit = kDefaultFetchBytes;
    if (const auto max_bytes = params.find("maxBytes"); max_bytes != params.end()) {
        try {
            limit = std::clamp<std::size_t>(std::stoul(max_bytes->second), 1024, 20000);
        } catch (const std::exception&) {
            limit = kDefaultFetchBytes;
        }
    }

    shellpilot::utils::Log(shellpilot::utils::LogLevel::kDebug, "web", "fetch " + url->second);
    auto client = shellpilot::utils::MakeHttpClient(endpoint, WebClientOptions(20));
    auto response = client->Get(endpoint.Target().c_str());
    if (!response) {
        return "Error: fetch failed (" + httplib::to_string(response.error()) + ")";
    }
    if (response->status >= 400) {
        return "Error: HTTP " + std::to_string(response->status);
    }
    return ClipText(StripHtml(response->body), limit);
}

void RegisterWebTools(ToolRegistry& registry, const shellpilot::config::WebToolsConfig& config) {
    if (config.brave_api_key.empty()) {
        shellpilot::utils::Log(shellpilot::utils::LogLevel::kInfo, "web", "no Brave API key, search disabled");
    } else {
        registry.Register(std::make_unique<WebSearchTool>(config.brave_api_key));
    }
    if (config.fetch_enabled) {
        registry.Register(std::make_unique<WebFetchTool>());
    }
}

}  // namespace shellpilot::agent::tools
