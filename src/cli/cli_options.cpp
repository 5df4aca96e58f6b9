#include "cli/cli_options.hpp"

#include <cstddef>
#include <stdexcept>

#include "utils/common.hpp"

namespace shellpilot::cli {
namespace {

std::optional<int> ParsePositive(const std::string& value) {
    try {
        std::size_t consumed = 0;
        const int parsed = std::stoi(value, &consumed);
        if (consumed != value.size() || parsed <= 0) {
            return std::nullopt;
        }
        return parsed;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

}  // namespace

std::string Usage() {
    return "Usage: shellpilot [options] [task...]\n"
           "  -m, --model NAME        model to use (default: config or auto-select)\n"
           "      --max-iterations N  step limit for the run\n"
           "      --timeout S         per-command timeout in seconds\n"
           "      --save              save the task after it completes\n"
           "      --list-tasks        print saved tasks\n"
           "      --task-index N      run saved task N\n"
           "      --check             check the Ollama server and installed models\n"
           "  -v, --verbose           diagnostic logging on stderr\n"
           "  -h, --help              show this help\n"
           "Without a task, one line is read from stdin.\n";
}

CliOptions ParseArgs(const std::vector<std::string>& args) {
    CliOptions options{};
    std::vector<std::string> words;

    auto take_value = [&](std::size_t& i, const std::string& flag) -> std::optional<std::string> {
        if (i + 1 >= args.size()) {
            options.error = "missing value for " + flag;
            return std::nullopt;
        }
        return args[++i];
    };

    for (std::size_t i = 0; i < args.size() && options.Ok(); ++i) {
        const auto& arg = args[i];
        if (arg == "-h" || arg == "--help") {
            options.show_help = true;
        } else if (arg == "-v" || arg == "--verbose") {
            options.verbose = true;
        } else if (arg == "--save") {
            options.save = true;
        } else if (arg == "--check") {
            options.check = true;
        } else if (arg == "--list-tasks") {
            options.list_tasks = true;
        } else if (arg == "-m" || arg == "--model") {
            if (auto value = take_value(i, arg)) {
                options.model = *value;
            }
        } else if (arg == "--max-iterations") {
            if (auto value = take_value(i, arg)) {
                options.max_iterations = ParsePositive(*value);
                if (!options.max_iterations) {
                    options.error = "invalid --max-iterations: " + *value;
                }
            }
        } else if (arg == "--timeout") {
            if (auto value = take_value(i, arg)) {
                options.command_timeout_s = ParsePositive(*value);
                if (!options.command_timeout_s) {
                    options.error = "invalid --timeout: " + *value;
                }
            }
        } else if (arg == "--task-index") {
            if (auto value = take_value(i, arg)) {
                const auto index = ParsePositive(*value);
                if (!index) {
                    options.error = "invalid --task-index: " + *value;
                } else {
                    options.task_index = static_cast<std::size_t>(*index);
                }
            }
        } else if (arg == "--") {
            words.insert(words.end(), args.begin() + static_cast<std::ptrdiff_t>(i) + 1, args.end());
            break;
        } else if (arg.size() > 1 && arg[0] == '-') {
            options.error = "unknown option: " + arg;
        } else {
            words.push_back(arg);
        }
    }

    if (options.Ok() && options.task_index && !words.empty()) {
        options.error = "--task-index cannot be combined with a task";
    }
    options.task = shellpilot::utils::Trim(shellpilot::utils::Join(words, " "));
    return options;
}

}  // namespace shellpilot::cli
