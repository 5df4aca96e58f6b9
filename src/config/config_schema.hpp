#pragma once

#include <string>

namespace shellpilot::config {

struct OllamaConfig {
    std::string api_base = "http://localhost:11434";
    int timeout_s = 180;
};

struct AgentDefaults {
    std::string model;
    int max_iterations = 60;
    int max_json_retries = 5;
    int max_consecutive_failures = 3;
    int history_window = 16;
    double temperature = 0.05;
    int num_predict = 400;
    std::string custom_instructions;
};

struct ExecConfig {
    std::string shell = "/bin/sh";
    int timeout_s = 120;
    int stdout_tail = 2000;
    int stderr_tail = 800;
};

struct WebToolsConfig {
    std::string brave_api_key;
    bool fetch_enabled = true;
};

struct Config {
    OllamaConfig ollama;
    AgentDefaults agent;
    ExecConfig exec;
    WebToolsConfig web;
};

}  // namespace shellpilot::config
