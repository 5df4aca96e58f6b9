#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>
#include <gtest/gtest.h>
#include "config/config_loader.hpp"

namespace {

using shellpilot::config::LoadConfig;

class TempConfig {
public:
    explicit TempConfig(const std::string& body) {
        path_ = std::filesystem::temp_directory_path() /
                ("shellpilot_config_" + std::to_string(::getpid()) + "_" +
                 std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()) + ".json");
        std::ofstream out(path_);
        out << body;
    }

    ~TempConfig() {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

class ScopedEnv {
public:
    ScopedEnv(const char* name, const char* value) : name_(name) {
        ::setenv(name, value, 1);
    }
    ~ScopedEnv() { ::unsetenv(name_); }

private:
    const char* name_;
};

TEST(ConfigLoader, DefaultsWithoutFile) {
    const auto config = LoadConfig("/nonexistent/shellpilot/config.json");
    EXPECT_EQ(config.ollama.api_base, "http://localhost:11434");
    EXPECT_EQ(config.agent.max_iterations, 60);
    EXPECT_EQ(config.agent.max_json_retries, 5);
    EXPECT_EQ(config.agent.max_consecutive_failures, 3);
    EXPECT_EQ(config.agent.history_window, 16);
    EXPECT_EQ(config.exec.timeout_s, 120);
    EXPECT_EQ(config.exec.stdout_tail, 2000);
    EXPECT_EQ(config.exec.stderr_tail, 800);
    EXPECT_TRUE(config.web.fetch_enabled);
}

TEST(ConfigLoader, ReadsJsonFile) {
    TempConfig file(R"({
        "ollama": {"apiBase": "http://gpu-box:11434", "timeoutS": 60},
        "agent": {"model": "mistral", "maxIterations": 20, "temperature": 0.2,
                  "customInstructions": "Prefer rsync."},
        "exec": {"shell": "/bin/bash", "timeoutS": 45},
        "tools": {"web": {"search": {"apiKey": "brave-key"}, "fetch": {"enabled": false}}}
    })");
    const auto config = LoadConfig(file.path());
    EXPECT_EQ(config.ollama.api_base, "http://gpu-box:11434");
    EXPECT_EQ(config.ollama.timeout_s, 60);
    EXPECT_EQ(config.agent.model, "mistral");
    EXPECT_EQ(config.agent.max_iterations, 20);
    EXPECT_DOUBLE_EQ(config.agent.temperature, 0.2);
    EXPECT_EQ(config.agent.custom_instructions, "Prefer rsync.");
    EXPECT_EQ(config.exec.shell, "/bin/bash");
    EXPECT_EQ(config.exec.timeout_s, 45);
    EXPECT_EQ(config.web.brave_api_key, "brave-key");
    EXPECT_FALSE(config.web.fetch_enabled);
}

TEST(ConfigLoader, UnparsableFileKeepsDefaults) {
    TempConfig file("{ this is not json");
    const auto config = LoadConfig(file.path());
    EXPECT_EQ(config.agent.max_iterations, 60);
}

TEST(ConfigLoader, EnvironmentOverridesFile) {
    TempConfig file(R"({"agent": {"model": "mistral", "maxIterations": 20}})");
    ScopedEnv model("SHELLPILOT_MODEL", "gemma:2b");
    ScopedEnv iterations("SHELLPILOT_MAX_ITERATIONS", "7");
    ScopedEnv fetch("SHELLPILOT_WEB_FETCH", "off");
    const auto config = LoadConfig(file.path());
    EXPECT_EQ(config.agent.model, "gemma:2b");
    EXPECT_EQ(config.agent.max_iterations, 7);
    EXPECT_FALSE(config.web.fetch_enabled);
}

TEST(ConfigLoader, BadNumericEnvKeepsValue) {
    ScopedEnv timeout("SHELLPILOT_COMMAND_TIMEOUT_S", "soon");
    const auto config = LoadConfig("/nonexistent/shellpilot/config.json");
    EXPECT_EQ(config.exec.timeout_s, 120);
}

TEST(ConfigLoader, NonPositiveValuesKeepDefaults) {
    TempConfig file(R"({
        "agent": {"historyWindow": -1, "maxIterations": 0, "maxJsonRetries": 0},
        "exec": {"timeoutS": 0, "stdoutTail": -5, "stderrTail": "big"}
    })");
    const auto config = LoadConfig(file.path());
    EXPECT_EQ(config.agent.history_window, 16);
    EXPECT_EQ(config.agent.max_iterations, 60);
    EXPECT_EQ(config.agent.max_json_retries, 0);
    EXPECT_EQ(config.exec.timeout_s, 120);
    EXPECT_EQ(config.exec.stdout_tail, 2000);
    EXPECT_EQ(config.exec.stderr_tail, 800);
}

TEST(ConfigLoader, NonPositiveEnvironmentIsIgnored) {
    ScopedEnv window("SHELLPILOT_HISTORY_WINDOW", "-3");
    ScopedEnv timeout("SHELLPILOT_COMMAND_TIMEOUT_S", "0");
    ScopedEnv iterations("SHELLPILOT_MAX_ITERATIONS", "12abc");
    const auto config = LoadConfig("/nonexistent/shellpilot/config.json");
    EXPECT_EQ(config.agent.history_window, 16);
    EXPECT_EQ(config.exec.timeout_s, 120);
    EXPECT_EQ(config.agent.max_iterations, 60);
}

}  // namespace
