#include "agent/context_builder.hpp"

#include <filesystem>
#include <sstream>
#include <utility>
#include <sys/utsname.h>
#include <unistd.h>

#include "utils/common.hpp"

namespace shellpilot::agent {
namespace {

constexpr const char* kBasePrompt =
    "You are an autonomous shell agent on Linux. Complete tasks by running shell commands.\n"
    "\n"
    "REPLY FORMAT - always output exactly one JSON object, nothing else:\n"
    "  Run a command : {\"action\": \"run\",  \"command\": \"...\", \"reason\": \"...\"}\n"
    "  Task is done  : {\"action\": \"done\", \"summary\": \"...\"}\n"
    "  Ask the user  : {\"action\": \"ask\",  \"question\": \"...\"}\n";

constexpr const char* kSearchLine =
    "  Search the web: {\"action\": \"search\", \"query\": \"...\", \"reason\": \"...\"}\n";

constexpr const char* kFetchLine =
    "  Fetch a URL   : {\"action\": \"fetch\", \"url\": \"...\", \"reason\": \"...\"}\n";

constexpr const char* kRules =
    "\n"
    "RULES:\n"
    "- Output ONLY the JSON object. Zero prose, zero markdown, zero backticks.\n"
    "- One command per reply. Keep commands simple.\n"
    "- Move files with shell for-loops, never xargs -I with -n:\n"
    "    for f in /path/*.ext; do mv \"$f\" /dest/; done\n"
    "- Write files with: printf 'text' > file.txt\n"
    "- Use full absolute paths always.\n"
    "- Commands run without a terminal; pass -y or equivalent to anything that asks for confirmation.\n"
    "- Before acting on a directory, run ls to see what's there.\n"
    "\n"
    "ON FAILURE (exit code != 0):\n"
    "- Never repeat the failed command.\n"
    "- Try a simpler alternative. Break complex steps into smaller ones.\n"
    "\n"
    "ASKING QUESTIONS:\n"
    "- Only use {\"action\":\"ask\"} when you genuinely cannot proceed without more info.\n"
    "- Do NOT ask for confirmation. Just do the task.\n"
    "\n"
    "FINISHING:\n"
    "- Verify success before marking done (ls, cat, etc.).\n"
    "- Use {\"action\":\"done\"} only when fully confirmed complete.";

std::string HostName() {
    char buffer[256] = {0};
    if (::gethostname(buffer, sizeof(buffer) - 1) != 0) {
        return "unknown";
    }
    return buffer;
}

std::string OsName() {
    struct utsname info {};
    if (::uname(&info) != 0) {
        return "Linux";
    }
    return std::string(info.sysname) + " " + info.release + " " + info.machine;
}

}  // namespace

EnvironmentInfo EnvironmentInfo::Detect() {
    EnvironmentInfo info{};
    info.username = shellpilot::utils::GetEnv("USER");
    if (info.username.empty()) {
        info.username = shellpilot::utils::GetEnv("LOGNAME");
    }
    info.home = shellpilot::utils::GetHomePath().string();
    info.hostname = HostName();
    info.os = OsName();
    info.shell = shellpilot::utils::GetEnv("SHELL");
    if (info.shell.empty()) {
        info.shell = "/bin/sh";
    }
    std::error_code ec;
    info.cwd = std::filesystem::current_path(ec).string();
    return info;
}

ContextBuilder::ContextBuilder(const tools::ToolRegistry& tools,
                               std::string custom_instructions,
                               EnvironmentInfo environment)
    : tools_(tools)
    , custom_instructions_(shellpilot::utils::Trim(custom_instructions))
    , environment_(std::move(environment)) {}

std::string ContextBuilder::BuildEnvironmentBlock() const {
    std::ostringstream oss;
    oss << "SYSTEM ENVIRONMENT (use these exact paths, never guess):\n";
    oss << "  username : " << environment_.username << "\n";
    oss << "  home dir : " << environment_.home << "\n";
    oss << "  hostname : " << environment_.hostname << "\n";
    oss << "  OS       : " << environment_.os << "\n";
    oss << "  shell    : " << environment_.shell << "\n";
    oss << "  cwd      : " << environment_.cwd;
    return oss.str();
}

std::string ContextBuilder::BuildSystemPrompt() const {
    std::ostringstream oss;
    oss << kBasePrompt;
    if (tools_.Has("web_search")) {
        oss << kSearchLine;
    }
    if (tools_.Has("web_fetch")) {
        oss << kFetchLine;
    }
    oss << kRules;
    oss << "\n\n" << BuildEnvironmentBlock();
    if (!custom_instructions_.empty()) {
        oss << "\n\nCUSTOM INSTRUCTIONS:\n" << custom_instructions_;
    }
    return oss.str();
}

std::string ContextBuilder::BuildTaskMessage(const std::string& task) const {
    return "Task: " + task + "\n\n"
        "First run ls on any target directory to see what's there. "
        "Do NOT ask for confirmation - just do the task. JSON only.";
}

std::string ContextBuilder::BuildReanchorMessage(const std::string& task) const {
    return "Task (resume): " + task + "\n"
        "Run ls on the target path first. JSON only.";
}

std::string ContextBuilder::BuildRetryMessage(DecisionError error) const {
    if (error == DecisionError::kEmptyCommand) {
        return "Empty command. Give {\"action\":\"run\",\"command\":\"...\",\"reason\":\"...\"}.";
    }
    return "BAD JSON. Reply with ONLY a raw JSON object. No text before or after. "
        "Example: {\"action\":\"run\",\"command\":\"ls /tmp\",\"reason\":\"explore\"}";
}

}  // namespace shellpilot::agent
