#include "config/config_loader.hpp"

#include <fstream>
#include <limits>
#include <stdexcept>

#include "nlohmann/json.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace shellpilot::config {
namespace {

using shellpilot::utils::GetEnv;

void ApplyString(std::string& target, const nlohmann::json& source, const char* key) {
    if (source.contains(key) && source[key].is_string()) {
        target = source[key].get<std::string>();
    }
}

void WarnOutOfRange(const std::string& key, const std::string& value, int min_value) {
    shellpilot::utils::Log(shellpilot::utils::LogLevel::kWarn, "config",
                           "ignoring " + key + "=" + value + " (must be >= " + std::to_string(min_value) + ")");
}

// Integers below min_value keep the default.
void ApplyInt(int& target, const nlohmann::json& source, const char* key, int min_value = 1) {
    if (!source.contains(key)) {
        return;
    }
    const auto& value = source[key];
    if (!value.is_number_integer() || value.get<long long>() < min_value ||
        value.get<long long>() > std::numeric_limits<int>::max()) {
        WarnOutOfRange(key, value.dump(), min_value);
        return;
    }
    target = value.get<int>();
}

void ApplyConfigFromJson(Config& config, const nlohmann::json& data) {
    if (!data.is_object()) {
        return;
    }

    if (data.contains("ollama") && data["ollama"].is_object()) {
        const auto& ollama = data["ollama"];
        ApplyString(config.ollama.api_base, ollama, "apiBase");
        ApplyInt(config.ollama.timeout_s, ollama, "timeoutS");
    }

    if (data.contains("agent") && data["agent"].is_object()) {
        const auto& agent = data["agent"];
        ApplyString(config.agent.model, agent, "model");
        ApplyInt(config.agent.max_iterations, agent, "maxIterations");
        ApplyInt(config.agent.max_json_retries, agent, "maxJsonRetries", 0);
        ApplyInt(config.agent.max_consecutive_failures, agent, "maxConsecutiveFailures");
        ApplyInt(config.agent.history_window, agent, "historyWindow");
        ApplyInt(config.agent.num_predict, agent, "numPredict");
        if (agent.contains("temperature") && agent["temperature"].is_number()) {
            config.agent.temperature = agent["temperature"].get<double>();
        }
        ApplyString(config.agent.custom_instructions, agent, "customInstructions");
    }

    if (data.contains("exec") && data["exec"].is_object()) {
        const auto& exec = data["exec"];
        ApplyString(config.exec.shell, exec, "shell");
        ApplyInt(config.exec.timeout_s, exec, "timeoutS");
        ApplyInt(config.exec.stdout_tail, exec, "stdoutTail");
        ApplyInt(config.exec.stderr_tail, exec, "stderrTail");
    }

    if (data.contains("tools") && data["tools"].is_object()) {
        const auto& tools = data["tools"];
        if (tools.contains("web") && tools["web"].is_object()) {
            const auto& web = tools["web"];
            if (web.contains("search") && web["search"].is_object()) {
                ApplyString(config.web.brave_api_key, web["search"], "apiKey");
            }
            if (web.contains("fetch") && web["fetch"].is_object()) {
                const auto& fetch = web["fetch"];
                if (fetch.contains("enabled") && fetch["enabled"].is_boolean()) {
                    config.web.fetch_enabled = fetch["enabled"].get<bool>();
                }
            }
        }
    }
}

bool ParseBool(const std::string& value) {
    const auto lowered = shellpilot::utils::ToLower(value);
    return lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on";
}

int ParseInt(const char* name, const std::string& value, int fallback) {
    int parsed = 0;
    std::size_t consumed = 0;
    try {
        parsed = std::stoi(value, &consumed);
    } catch (const std::exception&) {
        consumed = 0;
    }
    if (consumed == 0 || consumed != value.size() || parsed < 1) {
        WarnOutOfRange(name, value, 1);
        return fallback;
    }
    return parsed;
}

void ApplyEnvironment(Config& config) {
    const auto api_base = GetEnv("SHELLPILOT_OLLAMA_BASE");
    if (!api_base.empty()) {
        config.ollama.api_base = api_base;
    }

    const auto model = GetEnv("SHELLPILOT_MODEL");
    if (!model.empty()) {
        config.agent.model = model;
    }

    const auto max_iterations = GetEnv("SHELLPILOT_MAX_ITERATIONS");
    if (!max_iterations.empty()) {
        config.agent.max_iterations = ParseInt("SHELLPILOT_MAX_ITERATIONS", max_iterations, config.agent.max_iterations);
    }

    const auto history_window = GetEnv("SHELLPILOT_HISTORY_WINDOW");
    if (!history_window.empty()) {
        config.agent.history_window = ParseInt("SHELLPILOT_HISTORY_WINDOW", history_window, config.agent.history_window);
    }

    const auto command_timeout = GetEnv("SHELLPILOT_COMMAND_TIMEOUT_S");
    if (!command_timeout.empty()) {
        config.exec.timeout_s = ParseInt("SHELLPILOT_COMMAND_TIMEOUT_S", command_timeout, config.exec.timeout_s);
    }

    const auto shell = GetEnv("SHELLPILOT_SHELL");
    if (!shell.empty()) {
        config.exec.shell = shell;
    }

    const auto brave_api_key = GetEnv("SHELLPILOT_BRAVE_API_KEY");
    if (!brave_api_key.empty()) {
        config.web.brave_api_key = brave_api_key;
    }

    const auto web_fetch = GetEnv("SHELLPILOT_WEB_FETCH");
    if (!web_fetch.empty()) {
        config.web.fetch_enabled = ParseBool(web_fetch);
    }
}

}  // namespace

std::filesystem::path GetConfigPath() {
    return shellpilot::utils::GetDataDir() / "config.json";
}

Config LoadConfig() {
    return LoadConfig(GetConfigPath());
}

Config LoadConfig(const std::filesystem::path& config_path) {
    Config config{};

    if (std::filesystem::exists(config_path)) {
        std::ifstream input(config_path);
        auto data = nlohmann::json::parse(input, nullptr, false);
        if (data.is_discarded()) {
            shellpilot::utils::Log(shellpilot::utils::LogLevel::kWarn, "config",
                                   "ignoring unparsable " + config_path.string());
        } else {
            ApplyConfigFromJson(config, data);
        }
    }

    ApplyEnvironment(config);
    return config;
}

}  // namespace shellpilot::config
