#include <chrono>
#include <exception>
#include <iostream>
#include <string>
#include <unistd.h>
#include <variant>
#include <vector>

#include "agent/agent_loop.hpp"
#include "agent/context_builder.hpp"
#include "agent/task_store.hpp"
#include "agent/tools/tool_registry.hpp"
#include "agent/tools/web.hpp"
#include "cli/cli_options.hpp"
#include "config/config_loader.hpp"
#include "exec/command_executor.hpp"
#include "providers/ollama_provider.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"
#include "utils/spinner.hpp"

namespace {

constexpr int kExitCompleted = 0;
constexpr int kExitStartupError = 1;
constexpr int kExitFailureCeiling = 2;
constexpr int kExitIterationCeiling = 3;

void Rule(char ch = '-') {
    std::cout << "  " << std::string(60, ch) << "\n";
}

std::string ReadLine(const std::string& prompt) {
    std::cout << prompt << std::flush;
    std::string line;
    if (!std::getline(std::cin, line)) {
        return {};
    }
    return line;
}

int RunCheck(shellpilot::providers::OllamaProvider& provider, const shellpilot::config::Config& config) {
    const bool running = provider.IsServerRunning();
    std::cout << "  Ollama server : " << (running ? "running" : "not reachable")
              << " (" << config.ollama.api_base << ")\n";
    if (!running) {
        std::cout << "  Start it with: ollama serve\n";
        return kExitStartupError;
    }
    const auto models = provider.ListModels();
    if (models.empty()) {
        std::cout << "  No models installed. Run: ollama pull llama3\n";
        return kExitStartupError;
    }
    std::cout << "  Installed models (" << models.size() << "):\n";
    for (const auto& model : models) {
        std::cout << "    - " << model << "\n";
    }
    std::cout << "  Auto-selected : " << shellpilot::providers::SelectModel(models) << "\n";
    shellpilot::agent::tools::ToolRegistry tools;
    shellpilot::agent::tools::RegisterWebTools(tools, config.web);
    std::cout << "  Web tools     :" << (tools.List().empty() ? " none" : "") << "\n";
    for (const auto& name : tools.List()) {
        std::cout << "    - " << name << ": " << tools.Get(name)->Description() << "\n";
    }
    std::cout << "  Custom instructions: "
              << (config.agent.custom_instructions.empty() ? "none" : "set") << "\n";
    return kExitCompleted;
}

int ListTasks(const shellpilot::agent::TaskStore& store) {
    const auto tasks = store.List();
    if (tasks.empty()) {
        std::cout << "No saved tasks yet. Use --save to keep a task after it completes.\n";
        return kExitCompleted;
    }
    for (std::size_t i = 0; i < tasks.size(); ++i) {
        std::cout << "  " << (i + 1) << ". " << tasks[i] << "\n";
    }
    return kExitCompleted;
}

shellpilot::agent::AgentHooks MakeConsoleHooks() {
    using shellpilot::agent::Decision;
    shellpilot::agent::AgentHooks hooks{};
    hooks.on_decision = [](int step, const Decision& decision) {
        if (const auto* run = std::get_if<shellpilot::agent::RunAction>(&decision)) {
            Rule();
            std::cout << "  Step " << step << "  " << run->reason << "\n";
        } else if (const auto* search = std::get_if<shellpilot::agent::SearchAction>(&decision)) {
            std::cout << "  Step " << step << "  search: " << search->query << "\n";
        } else if (const auto* fetch = std::get_if<shellpilot::agent::FetchAction>(&decision)) {
            std::cout << "  Step " << step << "  fetch: " << fetch->url << "\n";
        }
    };
    hooks.on_command_start = [](const std::string& command) {
        std::cout << "\n  +- $ " << command << std::endl;
    };
    hooks.on_output_line = [](shellpilot::exec::StreamKind kind, const std::string& line) {
        if (kind == shellpilot::exec::StreamKind::kStdout) {
            std::cout << "  | " << line << std::endl;
        } else {
            std::cout << "  ! " << line << std::endl;
        }
    };
    hooks.on_command_end = [](const shellpilot::exec::CommandResult& result) {
        if (result.Succeeded()) {
            std::cout << "  +- ok\n" << std::endl;
        } else {
            std::cout << "  +- failed: exit " << result.ExitLabel() << "\n" << std::endl;
        }
    };
    hooks.ask_user = [](const std::string& question) {
        std::cout << "\n  ? Agent asks: " << question << "\n";
        const auto answer = ReadLine("    Your answer: ");
        std::cout << std::endl;
        return answer;
    };
    hooks.on_notice = [](const std::string& message) {
        std::cout << "  ! " << message << std::endl;
    };
    return hooks;
}

void ReportOutcome(const shellpilot::agent::AgentOutcome& outcome) {
    using shellpilot::agent::OutcomeKind;
    Rule('=');
    switch (outcome.kind) {
        case OutcomeKind::kCompleted:
            std::cout << "  Task complete after " << outcome.steps << " step(s).\n";
            if (!outcome.summary.empty()) {
                std::cout << "\n  " << outcome.summary << "\n";
            }
            break;
        case OutcomeKind::kFailureCeiling:
            std::cout << "  Task failed: " << outcome.message << "\n";
            break;
        case OutcomeKind::kIterationCeiling:
            std::cout << "  Task incomplete: " << outcome.message << "\n";
            break;
    }
    Rule('=');
    std::cout << std::endl;
}

int RunAgent(const shellpilot::cli::CliOptions& options) {
    auto config = shellpilot::config::LoadConfig();
    if (!options.model.empty()) {
        config.agent.model = options.model;
    }
    if (options.max_iterations) {
        config.agent.max_iterations = *options.max_iterations;
    }
    if (options.command_timeout_s) {
        config.exec.timeout_s = *options.command_timeout_s;
    }

    shellpilot::agent::TaskStore store(shellpilot::agent::TaskStore::DefaultPath());
    if (options.list_tasks) {
        return ListTasks(store);
    }

    shellpilot::providers::OllamaProvider provider(
        config.ollama.api_base,
        config.agent.model,
        config.ollama.timeout_s);
    if (options.check) {
        return RunCheck(provider, config);
    }

    std::string task = options.task;
    if (options.task_index) {
        const auto tasks = store.List();
        if (*options.task_index > tasks.size()) {
            std::cout << "No saved task #" << *options.task_index << " (" << tasks.size() << " saved).\n";
            return kExitStartupError;
        }
        task = tasks[*options.task_index - 1];
    }
    if (task.empty()) {
        task = shellpilot::utils::Trim(ReadLine("  What do you want me to do?\n  > "));
        if (task.empty()) {
            std::cout << shellpilot::cli::Usage();
            return kExitStartupError;
        }
    }

    if (!provider.IsServerRunning()) {
        std::cout << "Ollama is not reachable at " << config.ollama.api_base
                  << ". Start it with: ollama serve" << std::endl;
        return kExitStartupError;
    }
    if (config.agent.model.empty()) {
        config.agent.model = shellpilot::providers::SelectModel(provider.ListModels());
        if (config.agent.model.empty()) {
            std::cout << "No models installed. Run: ollama pull llama3" << std::endl;
            return kExitStartupError;
        }
        provider.SetDefaultModel(config.agent.model);
        std::cout << "  Auto-selected: " << config.agent.model << "\n";
    }

    const bool interactive_terminal = ::isatty(STDOUT_FILENO) != 0;
    shellpilot::providers::EndpointMode mode;
    {
        shellpilot::utils::Spinner spinner(std::cout, interactive_terminal);
        shellpilot::utils::ScopedSpinner guard(spinner, "Connecting");
        mode = provider.DetectEndpoint(config.agent.model);
    }
    std::cout << "  Connected (" << shellpilot::providers::ToString(mode) << ")\n";
    Rule();
    std::cout << "  Model: " << config.agent.model << "\n";
    std::cout << "  Task:  " << task << "\n";
    Rule();
    std::cout << std::endl;

    shellpilot::agent::tools::ToolRegistry tools;
    shellpilot::agent::tools::RegisterWebTools(tools, config.web);

    shellpilot::exec::ExecOptions exec_options{};
    exec_options.shell = config.exec.shell;
    exec_options.timeout = std::chrono::seconds(config.exec.timeout_s);
    exec_options.stdout_tail = static_cast<std::size_t>(config.exec.stdout_tail);
    exec_options.stderr_tail = static_cast<std::size_t>(config.exec.stderr_tail);
    shellpilot::exec::CommandExecutor executor(exec_options);

    shellpilot::agent::ContextBuilder context(tools, config.agent.custom_instructions);

    shellpilot::agent::AgentLoopOptions loop_options{};
    loop_options.model = config.agent.model;
    loop_options.max_iterations = config.agent.max_iterations;
    loop_options.history_window = static_cast<std::size_t>(config.agent.history_window);
    loop_options.retry.max_parse_retries = config.agent.max_json_retries;
    loop_options.retry.max_consecutive_failures = config.agent.max_consecutive_failures;
    loop_options.chat.temperature = config.agent.temperature;
    loop_options.chat.num_predict = config.agent.num_predict;
    loop_options.show_spinner = interactive_terminal;

    shellpilot::agent::AgentLoop loop(provider, executor, tools, context, loop_options, MakeConsoleHooks());
    const auto outcome = loop.Run(task);
    ReportOutcome(outcome);

    if (outcome.Succeeded()) {
        bool save = options.save;
        if (!save && !options.task_index && ::isatty(STDIN_FILENO) != 0) {
            const auto answer = shellpilot::utils::ToLower(shellpilot::utils::Trim(
                ReadLine("  Save as a saved task? [y/N]: ")));
            save = answer == "y" || answer == "yes";
        }
        if (save && store.Add(task)) {
            std::cout << "  Saved.\n";
        }
        return kExitCompleted;
    }
    return outcome.kind == shellpilot::agent::OutcomeKind::kFailureCeiling
        ? kExitFailureCeiling
        : kExitIterationCeiling;
}

}  // namespace

int main(int argc, char** argv) {
    const std::vector<std::string> args(argv + 1, argv + argc);
    const auto options = shellpilot::cli::ParseArgs(args);
    if (!options.Ok()) {
        std::cerr << "shellpilot: " << options.error << "\n" << shellpilot::cli::Usage();
        return kExitStartupError;
    }
    if (options.show_help) {
        std::cout << shellpilot::cli::Usage();
        return kExitCompleted;
    }

    shellpilot::utils::LogConfig log_config{};
    log_config.min_level = options.verbose
        ? shellpilot::utils::LogLevel::kDebug
        : shellpilot::utils::LogLevel::kWarn;
    shellpilot::utils::SetLogConfig(log_config);

    try {
        return RunAgent(options);
    } catch (const std::exception& ex) {
        std::cerr << "shellpilot: " << ex.what() << std::endl;
        return kExitStartupError;
    }
}
